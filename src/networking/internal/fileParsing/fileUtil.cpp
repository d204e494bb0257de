#include "networking/internal/fileParsing/fileUtil.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace csw {

ssize_t bytesInFile(const std::filesystem::path& f_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(f_path, ec))
        return -1;
    auto size = std::filesystem::file_size(f_path, ec);
    if (ec)
        return -1;
    return static_cast<ssize_t>(size);
}

std::optional<ssize_t> readFile(const std::filesystem::path& f_path,
                                const size_t                 read_size,
                                const size_t                 offset,
                                      std::vector<uint8_t>&  buff) {
    std::ifstream file(f_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    file.seekg(offset);
    if (!file)
        return std::nullopt;

    //need space to write the data, otherwise read on .data() is undefined
    buff.resize(read_size);
    file.read(reinterpret_cast<char*>(buff.data()), read_size);
    if (file.bad())
        return std::nullopt;

    buff.resize(file.gcount());
    return file.gcount(); //file closed when stack frame is popped
}

int writeWholeFile(const std::filesystem::path& f_path, const std::vector<uint8_t>& data) {
    std::ofstream file(f_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return EXIT_FAILURE;

    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    file.flush();
    if (!file.good())
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int replaceFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        std::filesystem::remove(from, ec);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec))
        return EXIT_SUCCESS;

    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec))
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

int deleteFile(const std::filesystem::path& f_path) {
    std::error_code ec;
    if (std::filesystem::remove(f_path, ec))
        return EXIT_SUCCESS;
    return EXIT_FAILURE;
}

} //csw
