#pragma once

#include <chrono>
#include <cstdint>
#include <sys/types.h>
#include <vector>

namespace csw {

using Deadline = std::chrono::steady_clock::time_point;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * msgLenToBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Writes a message length as 8 big-endian bytes.
 *
 * Takes:
 * -> val:
 *    The length to convert.
 * -> buffer:
 *    Where to write. Must have room for 8 bytes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void msgLenToBytes(const uint64_t val, uint8_t* buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesToMsgLen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above. Reads the first 8 bytes of buffer.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint64_t bytesToMsgLen(const std::vector<uint8_t>& buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * waitReadable
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Blocks until the socket has something to read or the deadline passes.
 *
 * Returns:
 * -> On success:
 *    1 if readable, 0 on timeout.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int waitReadable(int socket_fd, Deadline deadline);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads exactly try_to_recv bytes from the socket, appending them to buffer.
 *    Keeps reading until it has them all, the peer closes, or the deadline
 *    passes. A trickling peer can't extend the deadline.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to read the data from.
 * -> buffer:
 *    The container to append the read bytes to.
 * -> try_to_recv:
 *    Bytes to read.
 * -> deadline:
 *    When to give up.
 *
 * Returns:
 * -> On success:
 *    try_to_recv.
 * -> On failure:
 *    0 if the peer closed before sending anything, -1 otherwise. On failure
 *    buffer is restored to its original size.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t recvBytes(int                   socket_fd,
                  std::vector<uint8_t>& buffer,
                  size_t                try_to_recv,
                  Deadline              deadline);

} //csw
