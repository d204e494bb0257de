#include "networking/messageFormatting.hpp"
#include "networking/internal/messageFormatting/byteOrdering.hpp"

#include <cstring>
#include <limits>
#include <type_traits>

namespace csw {

//fixed part of an announcement: code, timestamp, port, file count
static constexpr size_t ANNOUNCE_HEADER_LEN = 1 + 8 + 2 + 2;
//per file: name length byte, chunk count, ref count (name itself excluded)
static constexpr size_t FILE_HEADER_LEN     = 1 + 4 + 4;
static constexpr size_t REF_LEN             = 4 + IDENTITY_LEN;

static constexpr size_t MAX_NAME_LEN        = std::numeric_limits<uint8_t>::max();

//appends data in network-byte order (BE)
template <typename T>
void createNetworkData(std::vector<uint8_t>& dest, const T data) {
    T network_data = toNetworkOrder(data);
    size_t offset = dest.size();
    dest.resize(offset + sizeof(T));
    std::memcpy(dest.data()+offset, &network_data, sizeof(T));
}

//endian-safe read of a T at offset, advancing offset. Fails instead of reading
//past the end of the buffer.
template <typename T>
bool parseNetworkData(T* dest, const std::vector<uint8_t>& buff, size_t& offset) {
    if (buff.size() < offset || buff.size() - offset < sizeof(T))
        return false;

    T network_data;
    std::memcpy(&network_data, buff.data()+offset, sizeof(T));
    *dest = fromNetworkOrder(network_data);
    offset += sizeof(T);
    return true;
}

static bool parseBytes(uint8_t* dest, size_t len, const std::vector<uint8_t>& buff, size_t& offset) {
    if (buff.size() < offset || buff.size() - offset < len)
        return false;
    std::memcpy(dest, buff.data()+offset, len);
    offset += len;
    return true;
}

static void appendBytes(std::vector<uint8_t>& dest, const uint8_t* src, size_t len) {
    dest.insert(dest.end(), src, src+len);
}

//GENERAL MESSAGES

std::vector<uint8_t> createFailMessage(const std::string& error_message) {
    if (error_message.empty())
        return {};

    std::vector<uint8_t> message_buff = {FAIL};
    appendBytes(message_buff, reinterpret_cast<const uint8_t*>(error_message.data()), error_message.size());
    return message_buff;
}

std::string parseFailMessage(const std::vector<uint8_t>& fail_message) {
    if (fail_message.size() < 2 || fail_message.front() != FAIL)
        return "";
    return std::string(fail_message.begin()+1, fail_message.end());
}

//DISCOVERY MESSAGES

std::vector<ChunkRef> Announcement::refs() const {
    std::vector<ChunkRef> flat;
    for (const AnnouncedFile& file : files) {
        for (const auto& [index, identity] : file.chunks)
            flat.push_back(ChunkRef{file.f_name, index, identity});
    }
    return flat;
}

std::vector<uint8_t> createAnnouncement(const Announcement& announcement) {
    if (announcement.serving_port == 0 ||
        announcement.files.size() > std::numeric_limits<uint16_t>::max())
        return {};

    std::vector<uint8_t> announce_buff = {ANNOUNCE};

    //ORDER:
    //timestamp, serving port, file count, files
    createNetworkData(announce_buff, announcement.timestamp_ms);
    createNetworkData(announce_buff, announcement.serving_port);
    createNetworkData(announce_buff, static_cast<uint16_t>(announcement.files.size()));

    for (const AnnouncedFile& file : announcement.files) {
        if (file.f_name.empty() || file.f_name.size() > MAX_NAME_LEN)
            return {};
        if (file.chunks.size() > std::numeric_limits<uint32_t>::max() || file.chunk_count > MAX_CHUNK_COUNT)
            return {};

        createNetworkData(announce_buff, static_cast<uint8_t>(file.f_name.size()));
        appendBytes(announce_buff, reinterpret_cast<const uint8_t*>(file.f_name.data()), file.f_name.size());
        createNetworkData(announce_buff, file.chunk_count);
        createNetworkData(announce_buff, static_cast<uint32_t>(file.chunks.size()));

        for (const auto& [index, identity] : file.chunks) {
            if (index >= file.chunk_count)
                return {};
            createNetworkData(announce_buff, index);
            appendBytes(announce_buff, identity.data(), identity.size());
        }
    }

    return announce_buff;
}

std::optional<Announcement> parseAnnouncement(const std::vector<uint8_t>& announce_message) {
    if (announce_message.empty() || announce_message.front() != ANNOUNCE)
        return std::nullopt;

    Announcement announcement;
    size_t   offset     = 1;
    uint16_t file_count = 0;

    //pull stuff out in the same order as it was inserted by createAnnouncement
    if (!parseNetworkData(&announcement.timestamp_ms, announce_message, offset) ||
        !parseNetworkData(&announcement.serving_port, announce_message, offset) ||
        !parseNetworkData(&file_count,                announce_message, offset))
        return std::nullopt;

    if (announcement.serving_port == 0)
        return std::nullopt;

    for (uint16_t f = 0; f < file_count; ++f) {
        AnnouncedFile file;
        uint8_t  name_len  = 0;
        uint32_t ref_count = 0;

        if (!parseNetworkData(&name_len, announce_message, offset) || name_len == 0)
            return std::nullopt;

        file.f_name.resize(name_len);
        if (!parseBytes(reinterpret_cast<uint8_t*>(file.f_name.data()), name_len, announce_message, offset))
            return std::nullopt;

        if (!parseNetworkData(&file.chunk_count, announce_message, offset) ||
            !parseNetworkData(&ref_count,        announce_message, offset))
            return std::nullopt;

        if (file.chunk_count > MAX_CHUNK_COUNT)
            return std::nullopt;

        //a lying ref count can't make us reserve more than the message holds
        if ((announce_message.size() - offset) / REF_LEN < ref_count)
            return std::nullopt;
        file.chunks.reserve(ref_count);

        for (uint32_t r = 0; r < ref_count; ++r) {
            uint32_t      index = 0;
            ChunkIdentity identity;
            if (!parseNetworkData(&index, announce_message, offset) ||
                !parseBytes(identity.data(), identity.size(), announce_message, offset))
                return std::nullopt;
            if (index >= file.chunk_count)
                return std::nullopt;
            file.chunks.emplace_back(index, identity);
        }

        announcement.files.push_back(std::move(file));
    }

    //trailing bytes
    if (offset != announce_message.size())
        return std::nullopt;

    return announcement;
}

std::vector<std::vector<uint8_t>> splitAnnouncement(const Announcement& announcement,
                                                    size_t              max_size) {
    std::vector<uint8_t> whole = createAnnouncement(announcement);
    if (whole.empty())
        return {};
    if (whole.size() <= max_size)
        return {whole};

    std::vector<std::vector<uint8_t>> messages;
    Announcement current;
    current.timestamp_ms = announcement.timestamp_ms;
    current.serving_port = announcement.serving_port;
    size_t current_len   = ANNOUNCE_HEADER_LEN;

    auto flush = [&]() {
        messages.push_back(createAnnouncement(current));
        current.files.clear();
        current_len = ANNOUNCE_HEADER_LEN;
    };

    for (const AnnouncedFile& file : announcement.files) {
        const size_t file_header = FILE_HEADER_LEN + file.f_name.size();
        const size_t min_needed  = file_header + (file.chunks.empty() ? 0 : REF_LEN);
        if (ANNOUNCE_HEADER_LEN + min_needed > max_size)
            return {};

        size_t next_ref = 0;
        do {
            if (current_len + min_needed > max_size ||
                current.files.size() == std::numeric_limits<uint16_t>::max())
                flush();

            AnnouncedFile part;
            part.f_name      = file.f_name;
            part.chunk_count = file.chunk_count;
            current_len     += file_header;

            while (next_ref < file.chunks.size() && current_len + REF_LEN <= max_size) {
                part.chunks.push_back(file.chunks[next_ref++]);
                current_len += REF_LEN;
            }

            current.files.push_back(std::move(part));
        } while (next_ref < file.chunks.size());
    }

    if (!current.files.empty())
        flush();

    return messages;
}

//PEER MESSAGES

std::vector<uint8_t> createChunkRequest(const ChunkRequest& request) {
    if (request.f_name.empty() || request.f_name.size() > MAX_NAME_LEN)
        return {};

    std::vector<uint8_t> request_buff = {CHUNK_REQUEST};
    createNetworkData(request_buff, static_cast<uint8_t>(request.f_name.size()));
    appendBytes(request_buff, reinterpret_cast<const uint8_t*>(request.f_name.data()), request.f_name.size());
    createNetworkData(request_buff, request.index);
    return request_buff;
}

std::optional<ChunkRequest> parseChunkRequest(const std::vector<uint8_t>& request_message) {
    if (request_message.empty() || request_message.front() != CHUNK_REQUEST)
        return std::nullopt;

    ChunkRequest request;
    size_t  offset   = 1;
    uint8_t name_len = 0;

    if (!parseNetworkData(&name_len, request_message, offset) || name_len == 0)
        return std::nullopt;

    request.f_name.resize(name_len);
    if (!parseBytes(reinterpret_cast<uint8_t*>(request.f_name.data()), name_len, request_message, offset))
        return std::nullopt;

    if (!parseNetworkData(&request.index, request_message, offset))
        return std::nullopt;

    if (offset != request_message.size())
        return std::nullopt;

    return request;
}

std::vector<uint8_t> createChunkData(const std::vector<uint8_t>& chunk) {
    std::vector<uint8_t> data_buff = {CHUNK_DATA};
    data_buff.reserve(1 + 8 + chunk.size());
    createNetworkData(data_buff, static_cast<uint64_t>(chunk.size()));
    appendBytes(data_buff, chunk.data(), chunk.size());
    return data_buff;
}

std::optional<std::vector<uint8_t>> parseChunkData(const std::vector<uint8_t>& data_message) {
    if (data_message.empty() || data_message.front() != CHUNK_DATA)
        return std::nullopt;

    size_t   offset    = 1;
    uint64_t chunk_len = 0;
    if (!parseNetworkData(&chunk_len, data_message, offset))
        return std::nullopt;

    if (data_message.size() - offset != chunk_len)
        return std::nullopt;

    return std::vector<uint8_t>(data_message.begin()+offset, data_message.end());
}

std::vector<uint8_t> createChunkNotFound() {
    return {CHUNK_NOT_FOUND};
}

} //csw
