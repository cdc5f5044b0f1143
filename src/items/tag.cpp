#include "items/tag.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include <limits>

namespace Tags {

namespace {

void write_long(std::vector<uint8_t>& buffer, int64_t value) {
    // zig-zag, then base-128 varint
    uint64_t n = (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
    while (n & ~0x7FULL) {
        buffer.push_back(static_cast<uint8_t>((n & 0x7F) | 0x80));
        n >>= 7;
    }
    buffer.push_back(static_cast<uint8_t>(n));
}

void write_bytes(std::vector<uint8_t>& buffer, const std::string& bytes) {
    write_long(buffer, static_cast<int64_t>(bytes.size()));
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

int64_t read_long(Serializer::ByteReader& reader) {
    uint64_t n = 0;
    for (int shift = 0; shift < 64; shift += 7) {
        uint8_t byte = reader.take_u8("avro long");
        n |= static_cast<uint64_t>(byte & 0x7F) << shift;
        if (!(byte & 0x80)) {
            return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
        }
    }
    throw FormatError("avro long longer than 10 bytes");
}

std::string read_bytes(Serializer::ByteReader& reader) {
    int64_t length = read_long(reader);
    if (length < 0) {
        throw FormatError("negative avro bytes length");
    }
    const uint8_t* start = reader.take(static_cast<size_t>(length), "avro bytes");
    return std::string(reinterpret_cast<const char*>(start), static_cast<size_t>(length));
}

} // namespace

std::vector<uint8_t> serialize(const std::vector<Tag>& tags) {
    std::vector<uint8_t> buffer;
    if (tags.empty()) {
        return buffer;
    }
    write_long(buffer, static_cast<int64_t>(tags.size()));
    for (const auto& tag : tags) {
        write_bytes(buffer, tag.name);
        write_bytes(buffer, tag.value);
    }
    write_long(buffer, 0);
    return buffer;
}

std::vector<Tag> deserialize(const uint8_t* data, size_t size) {
    std::vector<Tag> tags;
    if (size == 0) {
        return tags;
    }
    Serializer::ByteReader reader(data, size);
    while (true) {
        int64_t count = read_long(reader);
        if (count == 0) {
            break;
        }
        if (count < 0) {
            if (count == std::numeric_limits<int64_t>::min()) {
                throw FormatError("avro block count out of range");
            }
            // A negative block count is followed by the block's size in bytes.
            count = -count;
            read_long(reader);
        }
        for (int64_t i = 0; i < count; ++i) {
            Tag tag;
            tag.name = read_bytes(reader);
            tag.value = read_bytes(reader);
            tags.push_back(std::move(tag));
        }
    }
    if (reader.remaining() != 0) {
        throw FormatError("trailing bytes after avro tag array");
    }
    return tags;
}

std::vector<Tag> deserialize(const std::vector<uint8_t>& data) {
    return deserialize(data.data(), data.size());
}

std::pair<std::vector<Tag>, size_t> deserialize_at(const std::vector<uint8_t>& buffer, size_t offset) {
    Serializer::ByteReader reader(buffer);
    reader.seek(offset, "tags");
    uint64_t tag_count = reader.take_le(COUNTER_SIZE, "tag count");
    uint64_t tag_bytes = reader.take_le(COUNTER_SIZE, "tag bytes length");
    const uint8_t* body = reader.take(static_cast<size_t>(tag_bytes), "tag bytes");

    std::vector<Tag> tags = deserialize(body, static_cast<size_t>(tag_bytes));
    if (tags.size() != tag_count) {
        throw FormatError("tag count " + std::to_string(tag_count) + " does not match " +
                          std::to_string(tags.size()) + " decoded tags");
    }
    return {std::move(tags), reader.offset()};
}

} // namespace Tags
