#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace csw {

//all in-process timestamps come from the monotonic clock
using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline constexpr size_t IDENTITY_LEN = 32; //SHA-256

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ChunkIdentity
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> The SHA-256 digest of a chunk's bytes. Two chunks are the same chunk iff
 *    their identities are equal, regardless of which file or index they were
 *    advertised under.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
using ChunkIdentity = std::array<uint8_t, IDENTITY_LEN>;

struct ChunkIdentityHash {
    size_t operator()(const ChunkIdentity& id) const {
        //already uniformly distributed, first 8 bytes are plenty
        size_t h;
        std::memcpy(&h, id.data(), sizeof(h));
        return h;
    }
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ChunkRef
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Names one chunk of one file.
 *
 * Fields:
 * -> f_name:
 *    The base name of the file the chunk belongs to.
 * -> index:
 *    Zero-based position of the chunk in the file.
 * -> identity:
 *    Digest of the chunk's bytes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct ChunkRef {
    std::string   f_name;
    uint32_t      index = 0;
    ChunkIdentity identity{};

    bool operator==(const ChunkRef& other) const {
        return index == other.index && identity == other.identity && f_name == other.f_name;
    }
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * identityToHex
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Renders an identity as 64 lowercase hex characters.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string identityToHex(const ChunkIdentity& id);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * identityFromHex
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses the above.
 *
 * Returns:
 * -> On success:
 *    The identity.
 * -> On failure:
 *    std::nullopt if the string isn't exactly 64 hex characters.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<ChunkIdentity> identityFromHex(const std::string& hex);

} //csw
