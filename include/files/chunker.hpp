#ifndef WEAVEPACK_CHUNKER_HPP
#define WEAVEPACK_CHUNKER_HPP

#include "../crypto/hasher.hpp"
#include <vector>
#include <istream>
#include <cstdint>

// A half-open byte range [min_byte_range, max_byte_range) of a payload with its SHA-256.
struct Chunk {
    hash_t data_hash;
    uint64_t min_byte_range;
    uint64_t max_byte_range;

    uint64_t size() const { return max_byte_range - min_byte_range; }
};

class Chunker {
public:
    static constexpr uint64_t MAX_CHUNK_SIZE = 256 * 1024;
    static constexpr uint64_t MIN_CHUNK_SIZE = 32 * 1024;

    /**
     * @brief Splits a payload into chunks.
     *
     * Full MAX_CHUNK_SIZE chunks are taken while at least that much remains,
     * except that a split which would leave a tail strictly between 0 and
     * MIN_CHUNK_SIZE halves the remainder instead. A final chunk holding
     * whatever is left is always appended, even when it is empty.
     */
    static std::vector<Chunk> chunk_data(const std::vector<uint8_t>& data);

    /**
     * @brief Same chunking over `size` bytes read from a stream, one chunk in memory at a time.
     * @throws IOError if the stream fails or ends before `size` bytes.
     */
    static std::vector<Chunk> chunk_stream(std::istream& in, uint64_t size);

    // Size of the next chunk to take when `remaining` bytes are left and remaining >= MAX_CHUNK_SIZE.
    static uint64_t next_chunk_size(uint64_t remaining);
};

#endif //WEAVEPACK_CHUNKER_HPP
