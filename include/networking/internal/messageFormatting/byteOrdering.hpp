#pragma once

#include <cstdint>
#include <endian.h>
#include <string>
#include <type_traits>

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * toNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Converts a fixed-width unsigned integer into big-endian, regardless of
 *    host ordering. uint8_t passes through untouched.
 *
 * Takes:
 * -> host_data:
 *    One of:
 *    -> uint8_t
 *    -> uint16_t
 *    -> uint32_t
 *    -> uint64_t
 *
 * Returns:
 * -> A big endian version of the input.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T toNetworkOrder(T host_data) {
    static_assert(std::is_unsigned_v<T>, "only fixed-width unsigned integers go on the wire");
    if constexpr (sizeof(T) == sizeof(uint8_t))
        return host_data;
    else if constexpr (sizeof(T) == sizeof(uint16_t))
        return htobe16(host_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return htobe32(host_data);
    else
        return htobe64(host_data);
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * fromNetworkOrder
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above operation. Takes a big-endian fixed-width integer
 *    representation and converts it to the host-machine's ordering.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
template <typename T>
T fromNetworkOrder(T network_data) {
    static_assert(std::is_unsigned_v<T>, "only fixed-width unsigned integers go on the wire");
    if constexpr (sizeof(T) == sizeof(uint8_t))
        return network_data;
    else if constexpr (sizeof(T) == sizeof(uint16_t))
        return be16toh(network_data);
    else if constexpr (sizeof(T) == sizeof(uint32_t))
        return be32toh(network_data);
    else
        return be64toh(network_data);
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * getIpBytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Takes a string representation of an IPv4 address (xxx.xxx.xxx.xxx), and
 *    converts it to a uint32_t in big-endian network ordering.
 *
 * Returns:
 * -> On success:
 *    The network ordered representation.
 * -> On failure:
 *    0
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
uint32_t getIpBytes(const std::string& ip_str);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ipBytesToString
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above, returning a string representation of the network-
 *    ordered IPv4 address.
 *
 * Takes:
 * -> ip_bytes:
 *    The address as it sits in a sockaddr_in, already network ordered.
 *
 * Returns:
 * -> On success:
 *    The string address.
 * -> On failure:
 *    An empty string.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string ipBytesToString(uint32_t ip_bytes);

} //csw
