#include "transfer/internal/chunkFetch.hpp"
#include "networking/messageFormatting.hpp"
#include "networking/socket.hpp"

#include <iostream>

namespace csw {

FetchStatus fetchChunk(int                       socket_fd,
                       const std::string&        f_name,
                       uint32_t                  index,
                       std::chrono::milliseconds timeout,
                       std::vector<uint8_t>&     dest) {
    if (EXIT_SUCCESS != tcp::sendMessage(socket_fd, createChunkRequest(ChunkRequest{f_name, index})))
        return FetchStatus::IO_ERROR;

    std::vector<uint8_t> reply;
    ssize_t read = tcp::recvMessage(socket_fd, reply, timeout);
    if (read < 0 || reply.empty())
        return FetchStatus::IO_ERROR;

    switch (reply[0]) {
        case CHUNK_DATA: {
            auto chunk = parseChunkData(reply);
            if (!chunk)
                return FetchStatus::PROTOCOL_ERROR;
            dest = std::move(chunk.value());
            return FetchStatus::OK;
        }
        case CHUNK_NOT_FOUND:
            if (reply.size() != 1)
                return FetchStatus::PROTOCOL_ERROR;
            return FetchStatus::NOT_FOUND;
        case FAIL:
            std::cerr << "[ChunkFetch] Peer rejected request for " << f_name << "->" << index
                      << ": " << parseFailMessage(reply) << std::endl;
            return FetchStatus::PROTOCOL_ERROR;
        default:
            return FetchStatus::PROTOCOL_ERROR;
    }
}

} //csw
