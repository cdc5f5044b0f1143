#ifndef WEAVEPACK_TAG_HPP
#define WEAVEPACK_TAG_HPP

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

// Name/value metadata pair; both sides are arbitrary bytes.
struct Tag {
    std::string name;
    std::string value;

    bool operator==(const Tag& other) const { return name == other.name && value == other.value; }
    bool operator!=(const Tag& other) const { return !(*this == other); }
};

namespace Tags {

// Width of each of the two little-endian counters that precede the tag bytes.
constexpr size_t COUNTER_SIZE = 8;

/**
 * @brief Avro binary encoding of array<record{name: bytes, value: bytes}>.
 *
 * An empty tag list encodes to zero bytes.
 */
std::vector<uint8_t> serialize(const std::vector<Tag>& tags);

/**
 * @brief Decodes an Avro tag array.
 * @throws FormatError on truncated or malformed input.
 */
std::vector<Tag> deserialize(const uint8_t* data, size_t size);
std::vector<Tag> deserialize(const std::vector<uint8_t>& data);

/**
 * @brief Reads tagCount(8B LE) || tagBytesLength(8B LE) || tag bytes at `offset`.
 * @return The tags and the offset just past them.
 */
std::pair<std::vector<Tag>, size_t> deserialize_at(const std::vector<uint8_t>& buffer, size_t offset);

} // namespace Tags

#endif // WEAVEPACK_TAG_HPP
