#include "networking/socket.hpp"
#include "networking/internal/sockets/socketUtil.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"
#include "peerAddress.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace csw {

//SHARED UTIL
std::optional<std::pair<int, uint16_t>> openSocket(bool     is_server,
                                                   uint16_t port,
                                                   bool     udp) {
    int socket_fd;
    if (udp)
        socket_fd = socket(AF_INET, SOCK_DGRAM, 0);
    else
        socket_fd = socket(AF_INET, SOCK_STREAM, 0);

    //check socket creation
    if (socket_fd < 0)
        return std::nullopt;

    if (is_server) {
        int reuse = 1;
        if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            close(socket_fd);
            return std::nullopt;
        }

        struct sockaddr_in localAddr;
        memset(&localAddr, 0, sizeof(localAddr)); // 0 out struct addr

        localAddr.sin_family        = AF_INET;
        localAddr.sin_port          = htons(port);
        localAddr.sin_addr.s_addr   = INADDR_ANY;

        if (bind(socket_fd, (struct sockaddr*)&localAddr, sizeof(localAddr)) < 0) {
            std::cerr << "[openSocket] Could not bind port " << port << ": "
                      << std::strerror(errno) << std::endl;
            close(socket_fd);
            return std::nullopt;
        }

        socklen_t socket_len = sizeof(localAddr);
        if (getsockname(socket_fd, (struct sockaddr*)&localAddr, &socket_len) < 0) {
            close(socket_fd);
            return std::nullopt;
        }

        port = ntohs(localAddr.sin_port);

    } else {
        port = 0;
    }

    return std::make_pair(socket_fd, port);
}

void closeSocket(int socket_fd) {
    if (socket_fd >= 0)
        close(socket_fd);
}

void wakeSocket(int socket_fd) {
    if (socket_fd >= 0)
        shutdown(socket_fd, SHUT_RDWR);
}

namespace tcp {

//TCP UTIL
int connect(int                                      socket_fd,
            const PeerAddress&                       connect_to,
            std::optional<std::chrono::milliseconds> timeout) {
    struct sockaddr_in server_address;
    memset(&server_address, 0, sizeof(server_address)); // 0 out struct addr

    uint32_t ip_bytes = getIpBytes(connect_to.ip_addr);
    if (ip_bytes == 0 || connect_to.port == 0)
        return -1;

    server_address.sin_family       = AF_INET;
    server_address.sin_port         = htons(connect_to.port);
    server_address.sin_addr.s_addr  = ip_bytes;

    if (!timeout) {
        //blocking connect
        if (::connect(socket_fd, (struct sockaddr*)&server_address, sizeof(server_address)) < 0)
            return -1;
        return EXIT_SUCCESS;
    }

    //set non-block
    const int flags = fcntl(socket_fd, F_GETFL);
    if (flags < 0 || fcntl(socket_fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return -1;

    bool connect_okay = true;
    int res = ::connect(socket_fd, (struct sockaddr *)&server_address, sizeof(server_address));
    if (res < 0 && errno != EINPROGRESS) {
        connect_okay = false;
    } else if (res < 0) {
        struct pollfd pfd;
        pfd.fd      = socket_fd;
        pfd.events  = POLLOUT;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, static_cast<int>(timeout->count()));
        if (ready == 1) {
            //socket writable, find out if the connect actually worked
            int so_err = 0;
            socklen_t len = sizeof(so_err);
            if (getsockopt(socket_fd, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0 || so_err != 0)
                connect_okay = false;
        } else {
            //timeout or other error
            connect_okay = false;
        }
    }

    if (fcntl(socket_fd, F_SETFL, flags) < 0)
        connect_okay = false;

    if (!connect_okay)
        return -1;
    return EXIT_SUCCESS;
}

int listen(int server_fd, int max_pending) {
    if (::listen(server_fd, max_pending) < 0)
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int accept(int server_fd, PeerAddress& client_info, std::chrono::milliseconds timeout) {
    Deadline deadline = std::chrono::steady_clock::now() + timeout;
    if (waitReadable(server_fd, deadline) != 1)
        return -1;

    struct sockaddr_in clientAddr;
    socklen_t client_len = sizeof(clientAddr);
    memset(&clientAddr, 0, client_len); // 0 out struct addr

    int client_fd = ::accept(server_fd, (struct sockaddr*)&clientAddr, &client_len);
    if (client_fd < 0)
        return -1;

    client_info.ip_addr = ipBytesToString(clientAddr.sin_addr.s_addr);
    client_info.port    = ntohs(clientAddr.sin_port);

    return client_fd;
}

int sendMessage(int socket_fd, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> data_msg;
    data_msg.resize(8+data.size());
    msgLenToBytes(data.size(), data_msg.data());
    if (!data.empty())
        std::memcpy(data_msg.data()+8, data.data(), data.size());

    size_t sent = 0;
    while (sent < data_msg.size()) {
        ssize_t bytes_sent = send(socket_fd, data_msg.data()+sent, data_msg.size()-sent, MSG_NOSIGNAL);
        if (bytes_sent < 0) {
            if (errno == EINTR)
                continue;
            return EXIT_FAILURE;
        }
        sent += bytes_sent;
    }

    return EXIT_SUCCESS;
}

ssize_t recvMessage(int                       socket_fd,
                    std::vector<uint8_t>&     buffer,
                    std::chrono::milliseconds timeout) {
    buffer.clear();
    Deadline deadline = std::chrono::steady_clock::now() + timeout;

    std::vector<uint8_t> header;
    ssize_t header_read = recvBytes(socket_fd, header, 8, deadline);
    if (header_read == 0)
        return PEER_CLOSED;
    if (header_read != 8)
        return -1;

    uint64_t data_len = bytesToMsgLen(header);
    if (data_len > MAX_TCP_MESSAGE)
        return -1;
    if (data_len == 0)
        return 0;

    if (recvBytes(socket_fd, buffer, data_len, deadline) != static_cast<ssize_t>(data_len))
        return -1;

    return static_cast<ssize_t>(data_len);
}

} //tcp

//UDP UTIL
namespace udp {

int enableBroadcast(int socket_fd) {
    int on = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0)
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int sendMessage(int                         socket_fd,
                const PeerAddress&          receiver_info,
                const std::vector<uint8_t>& buffer) {
    if (receiver_info.port == 0       ||
        receiver_info.ip_addr.empty() ||
        buffer.size() > MAX_DATAGRAM_SIZE)
        return EXIT_FAILURE;

    struct sockaddr_in destination{};
    destination.sin_family      = AF_INET;
    destination.sin_port        = htons(receiver_info.port);
    if (inet_pton(AF_INET, receiver_info.ip_addr.c_str(), &destination.sin_addr) != 1)
        return EXIT_FAILURE;

    ssize_t sent = sendto(socket_fd,
                          buffer.data(),
                          buffer.size(),
                          0,
                          (struct sockaddr*)&destination,
                          sizeof(destination));
    if (sent < 0 || static_cast<size_t>(sent) != buffer.size())
        return EXIT_FAILURE;

    return EXIT_SUCCESS;
}

int recvMessage(int                                      socket_fd,
                PeerAddress&                             sender_info,
                std::vector<uint8_t>&                    buffer,
                std::optional<std::chrono::milliseconds> timeout) {
    if (timeout) {
        Deadline deadline = std::chrono::steady_clock::now() + timeout.value();
        if (waitReadable(socket_fd, deadline) != 1)
            return EXIT_FAILURE;
    }

    struct sockaddr_in source_info{};
    socklen_t src_size = sizeof(source_info);
    buffer.resize(MAX_DATAGRAM_SIZE);

    ssize_t received = recvfrom(socket_fd,
                                buffer.data(),
                                MAX_DATAGRAM_SIZE,
                                0,
                                (struct sockaddr*)&source_info,
                                &src_size);
    if (received < 0) {
        buffer.clear();
        return EXIT_FAILURE;
    }

    buffer.resize(received);

    //extract senders info
    sender_info.ip_addr = ipBytesToString(source_info.sin_addr.s_addr);
    sender_info.port    = ntohs(source_info.sin_port);

    return EXIT_SUCCESS;
}

} //udp

} //csw
