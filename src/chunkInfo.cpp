#include "chunkInfo.hpp"

namespace csw {

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

std::string identityToHex(const ChunkIdentity& id) {
    std::string hex;
    hex.reserve(IDENTITY_LEN * 2);
    for (uint8_t b : id) {
        hex += HEX_DIGITS[b >> 4];
        hex += HEX_DIGITS[b & 0x0F];
    }
    return hex;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<ChunkIdentity> identityFromHex(const std::string& hex) {
    if (hex.size() != IDENTITY_LEN * 2)
        return std::nullopt;

    ChunkIdentity id;
    for (size_t i = 0; i < IDENTITY_LEN; ++i) {
        int hi = hexValue(hex[2*i]);
        int lo = hexValue(hex[2*i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        id[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return id;
}

} //csw
