#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace csw {

struct PeerAddress;

//anything larger can't be a single UDP datagram over IPv4
inline constexpr size_t MAX_DATAGRAM_SIZE = 65507;

//refuse to allocate for absurd length headers from a confused peer
inline constexpr uint64_t MAX_TCP_MESSAGE = 256ull * 1024 * 1024;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * openSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Opens a socket. If no port is selected, uses port 0 and the OS assigns an
 *    ephemeral port, which is returned alongside the fd for server sockets.
 *
 *    If udp is set false (DEFAULT), a TCP socket is opened. If set true, a UDP
 *    socket is created instead.
 *
 *    Server sockets are bound to INADDR_ANY with SO_REUSEADDR set, so a peer
 *    restarted on the same port doesn't have to wait out TIME_WAIT.
 *
 *    If a TCP socket, the tcp:: namespace functions should be used with it.
 *    If a UDP socket, the udp:: namespace functions should be used with it.
 *
 * Takes:
 * -> is_server
 *    A flag to indicate server socket.
 * -> port
 *    The port to open on, set to 0 if not specified.
 * -> udp
 *    Datagram socket instead of stream socket.
 *
 * Returns:
 * -> On success:
 *    A pair of the socket fd and the port it was opened on (0 for clients).
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::pair<int, uint16_t>> openSocket(bool     is_server,
                                                   uint16_t port=0,
                                                   bool     udp=false);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * closeSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Closes a socket. Negative fds are ignored.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void closeSocket(int socket_fd);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * wakeSocket
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Shuts both directions of a socket down without closing the fd, so a
 *    thread blocked on it returns immediately. The owning thread still closes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void wakeSocket(int socket_fd);

namespace tcp {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * connect
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Connect to a peer. If a timeout is given the connect is done non-blocking
 *    and abandoned once it expires. The socket is left open on failure, the
 *    caller closes it.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to connect with.
 * -> connect_to:
 *    Where to connect.
 * -> timeout:
 *    Optional bound on the connect.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int connect(int                                      socket_fd,
            const PeerAddress&                       connect_to,
            std::optional<std::chrono::milliseconds> timeout=std::nullopt);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * listen
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Start listen for incoming connections.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int listen(int server_fd, int max_pending);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * accept
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Accept an incoming connection, waiting at most timeout for one to arrive
 *    so the caller can periodically check for shutdown.
 *
 * Takes:
 * -> server_fd:
 *    Server socket that's listening for an incoming connection.
 * -> client_info:
 *    Filled with the remote address and port.
 * -> timeout:
 *    How long to wait.
 *
 * Returns:
 * -> On success:
 *    The socket file descriptor of the accepted connection.
 * -> On failure:
 *    -1 (including timeout)
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int accept(int server_fd, PeerAddress& client_info, std::chrono::milliseconds timeout);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sends data through a socket, prefixed with its length as 8 big-endian
 *    bytes so the receiver knows where the message ends.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int sendMessage(int socket_fd, const std::vector<uint8_t>& data);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Receives one message sent by sendMessage. buffer is cleared first.
 *
 * Takes:
 * -> socket_fd:
 *    The socket to read the data from.
 * -> buffer:
 *    Receives the message payload, without the length header.
 * -> timeout:
 *    Bound on receiving the whole message, header included.
 *
 * Returns:
 * -> On success:
 *    The number of payload bytes read (may be 0 for an empty message).
 * -> On failure:
 *    -1 on timeout, socket errors, oversize or truncated messages.
 *    -2 if the peer closed the connection before a new message started.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t recvMessage(int                       socket_fd,
                    std::vector<uint8_t>&     buffer,
                    std::chrono::milliseconds timeout);

inline constexpr ssize_t PEER_CLOSED = -2;

} //tcp

namespace udp {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * enableBroadcast
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Sets SO_BROADCAST so the socket may send to broadcast addresses.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int enableBroadcast(int socket_fd);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sendMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Given a UDP socket and a destination, sends the buffer as one datagram.
 *    There is ABSOLUTELY ZERO guarantee that it will be delivered.
 *
 * Takes:
 * -> socket_fd:
 *    The UDP socket to send the data from.
 * -> receiver_info:
 *    Destination IP and port.
 * -> buffer:
 *    The data to send. MAX LENGTH = MAX_DATAGRAM_SIZE bytes.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int sendMessage(int                         socket_fd,
                const PeerAddress&          receiver_info,
                const std::vector<uint8_t>& buffer);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * recvMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Receives the next UDP datagram, if one arrives in time. Puts the senders
 *    info into sender_info and the payload into buffer, resized to fit.
 *
 * Takes:
 * -> socket_fd:
 *    The bound socket to receive a datagram from.
 * -> sender_info:
 *    Stores the senders IP and source port.
 * -> buffer:
 *    The buffer to store the data in.
 * -> timeout:
 *    An optional timeout. If std::nullopt is provided this function is
 *    blocking.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE (timeouts included)
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int recvMessage(int                                      socket_fd,
                PeerAddress&                             sender_info,
                std::vector<uint8_t>&                    buffer,
                std::optional<std::chrono::milliseconds> timeout);

} //udp

} //csw
