#include "testUtil.hpp"

#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace csw::test {

TempDir::TempDir() {
    static std::atomic<uint32_t> counter = 0;
    path_ = std::filesystem::temp_directory_path() /
            ("chunkswarm_test_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::vector<uint8_t> patternBytes(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data[i] = static_cast<uint8_t>(state >> 16);
    }
    return data;
}

ChunkIdentity fakeIdentity(uint8_t fill) {
    ChunkIdentity id;
    id.fill(fill);
    return id;
}

void writeFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("could not open " + path.string());
    out.write(reinterpret_cast<const char*>(data.data()), data.size());
}

std::vector<uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return {};
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} //csw::test
