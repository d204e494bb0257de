#pragma once

#include "chunkInfo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace csw {

/*
 * The first byte of every message is the type.
 *
 * Based on the message type, feed it into the corresponding parse function
 * below to extract its data. Parsers check the type byte themselves, so a
 * message can be handed to one blindly and rejected if it doesn't fit.
 *
 * If the first byte is FAIL, the other side hit a protocol error and is about
 * to close the connection.
 *
 * Every integer is big-endian on the wire.
 */

//GENERAL MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t FAIL               = 0x00;

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createFailMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Creates a buffer with the error message, prepended with the FAIL code.
 *
 * Takes:
 * -> error_message:
 *    A string explaining what went wrong for the other side of the
 *    communication.
 *
 * Returns:
 * -> On success:
 *    The buffer to send over a socket.
 * -> On failure:
 *    An empty buffer, if error_message is empty.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createFailMessage(const std::string& error_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseFailMessage
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message.
 *
 * Returns:
 * -> On success:
 *    The error message.
 * -> On failure:
 *    An empty string.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::string parseFailMessage(const std::vector<uint8_t>& fail_message);

//DISCOVERY MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t ANNOUNCE           = 0x41;

//largest chunk count a file may be announced with, about 100 GB at the default chunk size
inline constexpr uint32_t MAX_CHUNK_COUNT   = 1u << 20;

//one file's worth of refs inside an announcement
struct AnnouncedFile {
    std::string f_name;
    uint32_t    chunk_count = 0;
    std::vector<std::pair<uint32_t, ChunkIdentity>> chunks; //index, identity
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Announcement
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Everything a peer advertises in one datagram. The sender's IP isn't part
 *    of the message, the receiver takes it from the datagram's source.
 *
 * Fields:
 * -> timestamp_ms:
 *    Sender's wall clock at send time, ms since the Unix epoch.
 * -> serving_port:
 *    TCP port the sender serves chunks on.
 * -> files:
 *    The chunks held, grouped by file.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
struct Announcement {
    uint64_t                   timestamp_ms = 0;
    uint16_t                   serving_port = 0;
    std::vector<AnnouncedFile> files;

    //flattened view, in message order
    std::vector<ChunkRef> refs() const;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createAnnouncement
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Encodes an announcement as:
 *
 *    ANNOUNCE | u64 timestamp | u16 port | u16 file count
 *    then per file:
 *      u8 name length | name | u32 chunk count | u32 ref count
 *      then per ref:
 *        u32 index | 32 byte identity
 *
 * Returns:
 * -> On success:
 *    The buffer to send. No size limit is applied, see splitAnnouncement.
 * -> On failure:
 *    An empty buffer. Happens on a zero port, an empty or overlong name, too
 *    many files, a chunk count above MAX_CHUNK_COUNT, or an index that isn't
 *    below its file's chunk count.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createAnnouncement(const Announcement& announcement);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseAnnouncement
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message. The message has to be consumed exactly, so
 *    truncated messages and trailing garbage are both rejected.
 *
 * Returns:
 * -> On success:
 *    The announcement.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<Announcement> parseAnnouncement(const std::vector<uint8_t>& announce_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * splitAnnouncement
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Encodes an announcement into as many messages as needed to keep each one
 *    at or below max_size bytes. Every message is a complete announcement on
 *    its own with the same timestamp and port. A file whose refs don't fit in
 *    one message is continued in the next with the same name and chunk count.
 *
 * Takes:
 * -> announcement:
 *    What to send.
 * -> max_size:
 *    Largest acceptable encoded message.
 *
 * Returns:
 * -> On success:
 *    The encoded messages. An announcement with no files yields one message.
 * -> On failure:
 *    An empty vector, if the announcement can't be encoded or max_size is too
 *    small to hold a single ref.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<std::vector<uint8_t>> splitAnnouncement(const Announcement& announcement,
                                                    size_t              max_size);

//PEER MESSAGE CODES AND FUNCTIONS
inline constexpr uint8_t CHUNK_REQUEST      = 0x42;
inline constexpr uint8_t CHUNK_DATA         = 0x43;
inline constexpr uint8_t CHUNK_NOT_FOUND    = 0x44;

struct ChunkRequest {
    std::string f_name;
    uint32_t    index = 0;
};

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createChunkRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Asks a peer for one chunk:
 *
 *    CHUNK_REQUEST | u8 name length | name | u32 index
 *
 * Returns:
 * -> On success:
 *    The buffer to send.
 * -> On failure:
 *    An empty buffer if the name is empty or longer than 255 bytes.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createChunkRequest(const ChunkRequest& request);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseChunkRequest
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above message.
 *
 * Returns:
 * -> On success:
 *    The request.
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<ChunkRequest> parseChunkRequest(const std::vector<uint8_t>& request_message);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * createChunkData
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Wraps a chunk's bytes for the reply:
 *
 *    CHUNK_DATA | u64 byte length | bytes
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::vector<uint8_t> createChunkData(const std::vector<uint8_t>& chunk);

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseChunkData
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Unpacks the above. The declared length has to match the bytes present.
 *
 * Returns:
 * -> On success:
 *    The chunk bytes (possibly empty).
 * -> On failure:
 *    std::nullopt
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
std::optional<std::vector<uint8_t>> parseChunkData(const std::vector<uint8_t>& data_message);

//single byte, no payload
std::vector<uint8_t> createChunkNotFound();

} //csw
