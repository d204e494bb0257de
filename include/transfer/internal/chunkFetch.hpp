#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace csw {

enum class FetchStatus {
    OK,
    NOT_FOUND,      //peer answered, doesn't have it. Connection still usable
    IO_ERROR,       //timeout, reset, short read. Connection must be dropped
    PROTOCOL_ERROR  //peer answered with garbage or FAIL. Connection must be dropped
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fetchChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sends one chunk request over an already connected socket and waits for
 *    the reply. Doesn't verify the bytes, that's up to the caller.
 *
 * Takes:
 * -> socket_fd:
 *    Connected to a peer server.
 * -> f_name / index:
 *    The location to request, as the peer advertised it.
 * -> timeout:
 *    Bound on waiting for the reply.
 * -> dest:
 *    Receives the chunk bytes on FetchStatus::OK.
 *
 * Returns:
 * -> The outcome of the exchange.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
FetchStatus fetchChunk(int                       socket_fd,
                       const std::string&        f_name,
                       uint32_t                  index,
                       std::chrono::milliseconds timeout,
                       std::vector<uint8_t>&     dest);

//keeps the connection iff the exchange left the stream in a known state
inline bool connectionReusable(FetchStatus status) {
    return status == FetchStatus::OK || status == FetchStatus::NOT_FOUND;
}

} //csw
