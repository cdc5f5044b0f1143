#ifndef WEAVEPACK_SERIALIZER_HPP
#define WEAVEPACK_SERIALIZER_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace Serializer {

// Width of the fixed integer fields used by the bundle header table.
constexpr size_t WIDE_INT_SIZE = 32;

/**
 * @brief Appends `value` as a little-endian integer occupying `width` bytes.
 *
 * Widths above 8 are zero-filled in the high-order bytes.
 */
void append_le(std::vector<uint8_t>& buffer, uint64_t value, size_t width);

/**
 * @brief Reads a little-endian integer of `width` bytes.
 * @throws FormatError if the value does not fit in 64 bits.
 */
uint64_t read_le(const uint8_t* data, size_t width);

/**
 * @brief Encodes an offset as a 32-byte big-endian Merkle note.
 */
std::vector<uint8_t> encode_note(uint64_t value);

/**
 * @brief Decodes a 32-byte big-endian Merkle note.
 * @return false if the note does not fit in 64 bits.
 */
bool decode_note(const uint8_t* note, uint64_t& value);

void append(std::vector<uint8_t>& buffer, const std::vector<uint8_t>& data);
void append(std::vector<uint8_t>& buffer, const std::string& data);

/**
 * @brief Bounds-checked cursor over a byte buffer used by the decoders.
 *
 * Every read that would run past the end throws FormatError naming the field.
 */
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), offset_(0) {}
    explicit ByteReader(const std::vector<uint8_t>& buffer) : ByteReader(buffer.data(), buffer.size()) {}

    const uint8_t* take(size_t count, const char* field);
    std::vector<uint8_t> take_bytes(size_t count, const char* field);
    uint8_t take_u8(const char* field);
    uint64_t take_le(size_t width, const char* field);

    size_t offset() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }
    void seek(size_t offset, const char* field);

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_;
};

} // namespace Serializer

#endif //WEAVEPACK_SERIALIZER_HPP
