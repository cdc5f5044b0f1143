#include "common/serializer.hpp"
#include "common/errors.hpp"

namespace Serializer {

constexpr size_t NOTE_SIZE = 32;

void append_le(std::vector<uint8_t>& buffer, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        buffer.push_back(i < sizeof(uint64_t) ? static_cast<uint8_t>(value >> (8 * i)) : 0);
    }
}

uint64_t read_le(const uint8_t* data, size_t width) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        if (i >= sizeof(uint64_t)) {
            if (data[i] != 0) {
                throw FormatError("integer field exceeds 64 bits");
            }
            continue;
        }
        value |= static_cast<uint64_t>(data[i]) << (8 * i);
    }
    return value;
}

std::vector<uint8_t> encode_note(uint64_t value) {
    std::vector<uint8_t> note(NOTE_SIZE, 0);
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        note[NOTE_SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return note;
}

bool decode_note(const uint8_t* note, uint64_t& value) {
    for (size_t i = 0; i < NOTE_SIZE - sizeof(uint64_t); ++i) {
        if (note[i] != 0) {
            return false;
        }
    }
    value = 0;
    for (size_t i = NOTE_SIZE - sizeof(uint64_t); i < NOTE_SIZE; ++i) {
        value = (value << 8) | note[i];
    }
    return true;
}

void append(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
}

void append(std::vector<uint8_t>& buffer, const std::string& data) {
    buffer.insert(buffer.end(), data.begin(), data.end());
}

const uint8_t* ByteReader::take(size_t count, const char* field) {
    if (count > size_ - offset_) {
        throw FormatError(std::string("buffer too short for ") + field);
    }
    const uint8_t* start = data_ + offset_;
    offset_ += count;
    return start;
}

std::vector<uint8_t> ByteReader::take_bytes(size_t count, const char* field) {
    const uint8_t* start = take(count, field);
    return std::vector<uint8_t>(start, start + count);
}

uint8_t ByteReader::take_u8(const char* field) {
    return *take(1, field);
}

uint64_t ByteReader::take_le(size_t width, const char* field) {
    return read_le(take(width, field), width);
}

void ByteReader::seek(size_t offset, const char* field) {
    if (offset > size_) {
        throw FormatError(std::string("offset out of range for ") + field);
    }
    offset_ = offset;
}

} // namespace Serializer
