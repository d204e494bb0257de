#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * PeerAddress
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> A struct to store where a peer serves chunks from.
 *
 * Fields:
 * -> ip_addr:
 *    Peers IPV4 address, taken from the source of its announcement datagram.
 * -> port:
 *    The TCP port the peer serves chunks on. Carried inside the announcement
 *    so multiple peers can share a host.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct PeerAddress {
    std::string ip_addr;
    uint16_t    port = 0;

    bool operator==(const PeerAddress& other) const {
        return port == other.port && ip_addr == other.ip_addr;
    }

    bool operator!=(const PeerAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const PeerAddress& other) const {
        if (ip_addr != other.ip_addr)
            return ip_addr < other.ip_addr;
        return port < other.port;
    }

    std::string toString() const {
        return ip_addr + ":" + std::to_string(port);
    }
};

struct PeerAddressHash {
    size_t operator()(const PeerAddress& addr) const {
        return std::hash<std::string>()(addr.ip_addr) ^ (size_t(addr.port) << 1);
    }
};

} //csw
