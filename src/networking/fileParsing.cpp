#include "networking/fileParsing.hpp"
#include "networking/internal/fileParsing/fileUtil.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <openssl/evp.h>
#include <system_error>

namespace csw {

static const std::string CHUNK_SEPARATOR = "->";
static const std::string TOTAL_SUFFIX    = "total";

//keeps two writers of the same chunk off each other's scratch file
static std::atomic<uint64_t> scratch_counter{0};

static std::filesystem::path scratchPath(const std::filesystem::path& target) {
    return target.string() + "." + std::to_string(scratch_counter.fetch_add(1)) + ".part";
}

bool validFileName(const std::string& f_name) {
    if (f_name.empty() || f_name.size() > std::numeric_limits<uint8_t>::max())
        return false;
    if (f_name == "." || f_name == "..")
        return false;
    return f_name.find('/') == std::string::npos && f_name.find('\0') == std::string::npos;
}

std::filesystem::path chunkPath(const std::filesystem::path& chunk_dir,
                                const std::string&           f_name,
                                const uint32_t               index) {
    return chunk_dir / (f_name + CHUNK_SEPARATOR + std::to_string(index));
}

std::optional<std::pair<std::string, uint32_t>> parseChunkName(const std::string& c_name) {
    size_t sep = c_name.rfind(CHUNK_SEPARATOR);
    if (sep == std::string::npos || sep == 0)
        return std::nullopt;

    std::string f_name = c_name.substr(0, sep);
    std::string digits = c_name.substr(sep + CHUNK_SEPARATOR.size());
    if (digits.empty() || digits.size() > 10)
        return std::nullopt;
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return std::nullopt;

    uint64_t index = std::stoull(digits);
    if (index > std::numeric_limits<uint32_t>::max())
        return std::nullopt;

    return std::make_pair(f_name, static_cast<uint32_t>(index));
}

std::vector<StoredChunk> listChunks(const std::filesystem::path& chunk_dir) {
    std::vector<StoredChunk> chunks;
    std::error_code ec;
    std::filesystem::directory_iterator it(chunk_dir, ec);
    if (ec)
        return chunks;

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        if (!it->is_regular_file(ec))
            continue;

        auto parsed = parseChunkName(it->path().filename().string());
        if (!parsed)
            continue;

        StoredChunk chunk;
        chunk.f_name = parsed->first;
        chunk.index  = parsed->second;
        chunk.path   = it->path();
        chunk.size   = it->file_size(ec);
        if (ec)
            continue;
        chunk.mtime  = it->last_write_time(ec);
        if (ec)
            continue;
        chunks.push_back(std::move(chunk));
    }

    std::sort(chunks.begin(), chunks.end(), [](const StoredChunk& a, const StoredChunk& b) {
        if (a.f_name != b.f_name)
            return a.f_name < b.f_name;
        return a.index < b.index;
    });
    return chunks;
}

std::optional<std::vector<uint8_t>> readChunk(const std::filesystem::path& chunk_dir,
                                              const std::string&           f_name,
                                              const uint32_t               index) {
    auto c_path = chunkPath(chunk_dir, f_name, index);
    ssize_t c_size = bytesInFile(c_path);
    if (c_size < 0)
        return std::nullopt;

    std::vector<uint8_t> c_data;
    auto read_bytes = readFile(c_path, static_cast<size_t>(c_size), 0, c_data);
    if (!read_bytes || read_bytes.value() != c_size)
        return std::nullopt; //didn't read entire file

    return c_data;
}

int writeChunk(const std::filesystem::path& chunk_dir,
               const std::string&           f_name,
               const uint32_t               index,
               const std::vector<uint8_t>&  data) {
    if (EXIT_SUCCESS != ensureDirectory(chunk_dir))
        return EXIT_FAILURE;

    auto c_path  = chunkPath(chunk_dir, f_name, index);
    auto scratch = scratchPath(c_path);
    if (EXIT_SUCCESS != writeWholeFile(scratch, data)) {
        deleteFile(scratch);
        return EXIT_FAILURE;
    }

    return replaceFile(scratch, c_path);
}

int writeChunkTotal(const std::filesystem::path& chunk_dir,
                    const std::string&           f_name,
                    const uint32_t               total) {
    if (EXIT_SUCCESS != ensureDirectory(chunk_dir))
        return EXIT_FAILURE;

    auto t_path  = chunk_dir / (f_name + CHUNK_SEPARATOR + TOTAL_SUFFIX);
    auto scratch = scratchPath(t_path);
    std::string text = std::to_string(total);
    if (EXIT_SUCCESS != writeWholeFile(scratch, std::vector<uint8_t>(text.begin(), text.end()))) {
        deleteFile(scratch);
        return EXIT_FAILURE;
    }

    return replaceFile(scratch, t_path);
}

std::optional<uint32_t> readChunkTotal(const std::filesystem::path& chunk_dir,
                                       const std::string&           f_name) {
    std::ifstream file(chunk_dir / (f_name + CHUNK_SEPARATOR + TOTAL_SUFFIX));
    if (!file)
        return std::nullopt;

    uint64_t total = 0;
    if (!(file >> total) || total == 0 || total > std::numeric_limits<uint32_t>::max())
        return std::nullopt;
    return static_cast<uint32_t>(total);
}

std::optional<ChunkIdentity> sha256Digest(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* mdctx;
    if ((mdctx = EVP_MD_CTX_new()) == NULL)
        return std::nullopt;

    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    bool ok = 1 == EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL)            &&
              1 == EVP_DigestUpdate(mdctx, data.data(), data.size())       &&
              1 == EVP_DigestFinal_ex(mdctx, digest, &hash_len);

    EVP_MD_CTX_free(mdctx);

    if (!ok || hash_len != IDENTITY_LEN)
        return std::nullopt;

    ChunkIdentity identity;
    std::copy(digest, digest + IDENTITY_LEN, identity.begin());
    return identity;
}

std::optional<uint32_t> splitFile(const std::filesystem::path& f_path,
                                  const std::filesystem::path& chunk_dir,
                                  const uint64_t               chunk_size) {
    if (chunk_size == 0)
        return std::nullopt;

    std::string f_name = f_path.filename().string();
    if (!validFileName(f_name)) {
        std::cerr << "[splitFile] Unusable file name: " << f_path << std::endl;
        return std::nullopt;
    }

    ssize_t f_size = bytesInFile(f_path);
    if (f_size < 0) {
        std::cerr << "[splitFile] Can't read " << f_path << std::endl;
        return std::nullopt;
    }

    //an empty file is still one (empty) chunk
    uint64_t chunks = f_size == 0 ? 1 : (static_cast<uint64_t>(f_size) + chunk_size - 1) / chunk_size;
    if (chunks > std::numeric_limits<uint32_t>::max())
        return std::nullopt;

    std::vector<uint8_t> buff;
    for (uint64_t i = 0; i < chunks; ++i) {
        auto read_bytes = readFile(f_path, chunk_size, i * chunk_size, buff);
        if (!read_bytes)
            return std::nullopt;

        if (EXIT_SUCCESS != writeChunk(chunk_dir, f_name, static_cast<uint32_t>(i), buff)) {
            std::cerr << "[splitFile] Failed to write chunk " << i << " of " << f_name << std::endl;
            return std::nullopt;
        }
    }

    if (EXIT_SUCCESS != writeChunkTotal(chunk_dir, f_name, static_cast<uint32_t>(chunks)))
        return std::nullopt;

    return static_cast<uint32_t>(chunks);
}

std::optional<std::filesystem::path> stitchChunks(const std::filesystem::path& chunk_dir,
                                                  const std::string&           f_name,
                                                  const uint32_t               chunk_count,
                                                  const std::filesystem::path& downloads_dir) {
    if (chunk_count == 0 || EXIT_SUCCESS != ensureDirectory(downloads_dir))
        return std::nullopt;

    auto f_path  = downloads_dir / f_name;
    auto scratch = scratchPath(f_path);

    {
        std::ofstream out(scratch, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return std::nullopt;

        for (uint32_t i = 0; i < chunk_count; ++i) {
            auto c_data = readChunk(chunk_dir, f_name, i);
            if (!c_data) {
                out.close();
                deleteFile(scratch);
                return std::nullopt;
            }
            out.write(reinterpret_cast<const char*>(c_data->data()), c_data->size());
            if (!out.good()) {
                out.close();
                deleteFile(scratch);
                return std::nullopt;
            }
        }

        out.flush();
        if (!out.good()) {
            out.close();
            deleteFile(scratch);
            return std::nullopt;
        }
    }

    if (EXIT_SUCCESS != replaceFile(scratch, f_path))
        return std::nullopt;
    return f_path;
}

} //csw
