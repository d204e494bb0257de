#pragma once

#include <filesystem>
#include <optional>
#include <sys/types.h>
#include <vector>

// THESE FUNCTIONS MAKE ZERO EFFORT TO HANDLE CONCURRENCY.
// Callers get atomicity by writing to a scratch path and then calling
// replaceFile(), which is a rename on the same filesystem.

namespace csw {

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * bytesInFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Returns the size of a regular file, in bytes.
 *
 * Returns:
 * -> On success:
 *    The size.
 * -> On failure:
 *    -1
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
ssize_t bytesInFile(const std::filesystem::path& f_path);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * readFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Reads a file, from a specific offset byte (0-indexed), for read_size
 *    bytes, or when it reaches EOF, whichever is first. Stores the bytes in
 *    buff, which is resized to what was actually read.
 *
 * Takes:
 * -> f_path:
 *    The path to the file.
 * -> read_size:
 *    The number of bytes to read. Reading less than read_size means EOF.
 * -> offset:
 *    Where to start reading from. 0 for start of file.
 * -> buff:
 *    Where to store the read bytes.
 *
 * Returns:
 * -> On success:
 *    Bytes read.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<ssize_t> readFile(const std::filesystem::path& f_path,
                                const size_t                 read_size,
                                const size_t                 offset,
                                      std::vector<uint8_t>&  buff);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * writeWholeFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates or truncates f_path and writes data to it, flushing before
 *    returning.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int writeWholeFile(const std::filesystem::path& f_path, const std::vector<uint8_t>& data);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * replaceFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Renames from over to, replacing to if it exists.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE. from is removed so no scratch file is left behind.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int replaceFile(const std::filesystem::path& from, const std::filesystem::path& to);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * ensureDirectory
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates dir and its parents if missing.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS, dir exists and is a directory.
 * -> On failure:
 *    EXIT_FAILURE
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int ensureDirectory(const std::filesystem::path& dir);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * deleteFile
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Deletes a file.
 *
 * Returns:
 * -> On success:
 *    EXIT_SUCCESS
 * -> On failure:
 *    EXIT_FAILURE, including when the file didn't exist.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int deleteFile(const std::filesystem::path& f_path);

} //csw
