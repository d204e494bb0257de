#pragma once

#include "chunkInfo.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace csw::test {

//fresh directory under the system temp dir, removed with everything in it on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&)            = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

//deterministic bytes, different seeds give different content
std::vector<uint8_t> patternBytes(size_t size, uint8_t seed);

//identity whose every byte is fill, for tests that never hash anything
ChunkIdentity fakeIdentity(uint8_t fill);

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data);
std::vector<uint8_t> readFile(const std::filesystem::path& path);

} //csw::test
