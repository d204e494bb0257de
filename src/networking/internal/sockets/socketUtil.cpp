#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

namespace csw {

void msgLenToBytes(const uint64_t len, uint8_t* buffer) {
    uint64_t ordered = toNetworkOrder(len);
    std::memcpy(buffer, &ordered, sizeof(uint64_t));
}

uint64_t bytesToMsgLen(const std::vector<uint8_t>& buffer) {
    uint64_t ordered;
    std::memcpy(&ordered, buffer.data(), sizeof(ordered));
    return fromNetworkOrder(ordered);
}

int waitReadable(int socket_fd, Deadline deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return 0;

        struct pollfd pfd;
        pfd.fd      = socket_fd;
        pfd.events  = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            return -1;
        }
        if (ret == 0)
            return 0;
        return 1; //POLLIN, POLLHUP and POLLERR all mean recv() won't block
    }
}

ssize_t recvBytes(int                   socket_fd,
                  std::vector<uint8_t>& buffer,
                  size_t                try_to_recv,
                  Deadline              deadline) {
    if (try_to_recv == 0)
        return 0;

    size_t original_len = buffer.size();
    buffer.resize(original_len + try_to_recv);

    size_t total = 0;
    while (total < try_to_recv) {
        int ready = waitReadable(socket_fd, deadline);
        if (ready <= 0) {
            buffer.resize(original_len);
            return -1;
        }

        ssize_t bytes_read = recv(socket_fd,
                                  buffer.data() + original_len + total,
                                  try_to_recv - total,
                                  0);
        if (bytes_read < 0 && errno == EINTR)
            continue;

        if (bytes_read <= 0) {
            //orderly close before anything arrived is reported separately
            bool clean_close = (bytes_read == 0 && total == 0);
            buffer.resize(original_len);
            return clean_close ? 0 : -1;
        }

        total += bytes_read;
    }

    return static_cast<ssize_t>(total);
}

} //csw
