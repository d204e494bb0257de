#pragma once

#include "chunkInfo.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * RECOMMENDED USAGE:
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Chunk storage is a flat directory. Chunk i of file f lives at "f->i", and
 * the number of chunks f was split into lives in "f->total" so a peer holding
 * only some of f's chunks can still advertise its chunk count.
 *
 * Seeder:
 * -> Call splitFile() to cut a source file into chunk files.
 * -> Call listChunks() to enumerate what can be served and readChunk() to load
 *    a chunk to send.
 *
 * Downloader:
 * -> Call writeChunkTotal() once the chunk count is known.
 * -> Call writeChunk() for every verified chunk. Writes go to "f->i.part" and
 *    are renamed into place, so readers never see a half written chunk.
 * -> When every chunk is present call stitchChunks() to produce the file.
 *    Chunks stay in storage afterwards so they keep being served.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * validFileName
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Checks that a name received from the network or the user can be used as a
 *    base name inside a storage directory. Rejects empty names, names longer
 *    than 255 bytes, "." and "..", and anything containing '/' or NUL.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
bool validFileName(const std::string& f_name);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * chunkPath
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Constructs a path to a chunk file.
 *
 * Takes:
 * -> chunk_dir:
 *    The chunk storage directory.
 * -> f_name:
 *    The name of the base file.
 * -> index:
 *    The chunk number, 0-indexed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::filesystem::path chunkPath(const std::filesystem::path& chunk_dir,
                                const std::string&           f_name,
                                const uint32_t               index);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseChunkName
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reverses chunkPath on a bare file name. Splits on the last "->", the part
 *    after it has to be a plain decimal index.
 *
 * Returns:
 * -> On success:
 *    The base name and index.
 * -> On failure:
 *    std::nullopt, for anything that isn't a chunk file (".part" scratch files
 *    and "->total" markers included).
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::pair<std::string, uint32_t>> parseChunkName(const std::string& c_name);

//one chunk file found on disk
struct StoredChunk {
    std::string                     f_name;
    uint32_t                        index = 0;
    std::filesystem::path           path;
    uint64_t                        size  = 0;
    std::filesystem::file_time_type mtime;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * listChunks
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Enumerates the chunk files in chunk_dir, sorted by file name then index.
 *    Entries that disappear mid-scan are skipped.
 *
 * Returns:
 * -> The chunks. Empty if the directory is missing or unreadable.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<StoredChunk> listChunks(const std::filesystem::path& chunk_dir);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * readChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads a whole chunk into memory.
 *
 * Returns:
 * -> On success:
 *    The chunk bytes.
 * -> On failure:
 *    std::nullopt if the chunk isn't there or couldn't be read entirely.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::vector<uint8_t>> readChunk(const std::filesystem::path& chunk_dir,
                                              const std::string&           f_name,
                                              const uint32_t               index);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * writeChunk
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Stores a chunk, creating chunk_dir if needed. An existing chunk with the
 *    same name is replaced.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int writeChunk(const std::filesystem::path& chunk_dir,
               const std::string&           f_name,
               const uint32_t               index,
               const std::vector<uint8_t>&  data);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * writeChunkTotal / readChunkTotal
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Store and load the number of chunks f_name was split into.
 *
 * Returns:
 * -> writeChunkTotal: EXIT_SUCCESS or EXIT_FAILURE.
 * -> readChunkTotal: the count, or std::nullopt if unknown or unreadable.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int writeChunkTotal(const std::filesystem::path& chunk_dir,
                    const std::string&           f_name,
                    const uint32_t               total);

std::optional<uint32_t> readChunkTotal(const std::filesystem::path& chunk_dir,
                                       const std::string&           f_name);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * sha256Digest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Computes the SHA-256 digest of data through OpenSSL's EVP interface.
 *
 * Returns:
 * -> On success:
 *    The 32 byte digest.
 * -> On failure:
 *    std::nullopt if OpenSSL fails.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<ChunkIdentity> sha256Digest(const std::vector<uint8_t>& data);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * splitFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Cuts the file at f_path into chunk_size pieces stored in chunk_dir under
 *    the file's base name, and records the chunk count. Every chunk but the
 *    last is exactly chunk_size bytes. An empty file produces a single empty
 *    chunk so it can still be shared.
 *
 * Takes:
 * -> f_path:
 *    The source file.
 * -> chunk_dir:
 *    Where to put the chunks.
 * -> chunk_size:
 *    Bytes per chunk, non-zero.
 *
 * Returns:
 * -> On success:
 *    The number of chunks written.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<uint32_t> splitFile(const std::filesystem::path& f_path,
                                  const std::filesystem::path& chunk_dir,
                                  const uint64_t               chunk_size);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * stitchChunks
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Concatenates chunks 0..chunk_count-1 of f_name, in order, into
 *    downloads_dir/f_name. The output is assembled under a scratch name in
 *    downloads_dir and renamed into place once complete, so a partial output
 *    is never visible. Chunks are left in chunk_dir.
 *
 * Returns:
 * -> On success:
 *    The path of the stitched file.
 * -> On failure:
 *    std::nullopt if any chunk is missing or an I/O step fails. Nothing is
 *    left in downloads_dir.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::filesystem::path> stitchChunks(const std::filesystem::path& chunk_dir,
                                                  const std::string&           f_name,
                                                  const uint32_t               chunk_count,
                                                  const std::filesystem::path& downloads_dir);

} //csw
