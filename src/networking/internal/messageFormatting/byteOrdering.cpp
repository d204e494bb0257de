#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace csw {

uint32_t getIpBytes(const std::string& ip_str) {
    uint32_t ip_bytes;
    if (0 >= inet_pton(AF_INET, ip_str.c_str(), &ip_bytes))
        return 0;
    return ip_bytes;
}

std::string ipBytesToString(uint32_t ip_bytes) {
    char buff[INET_ADDRSTRLEN];
    if (nullptr == inet_ntop(AF_INET, &ip_bytes, buff, INET_ADDRSTRLEN))
        return "";
    return std::string(buff);
}

} //csw
