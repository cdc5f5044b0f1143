#include "files/chunker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

uint64_t Chunker::next_chunk_size(uint64_t remaining) {
    uint64_t next = remaining - MAX_CHUNK_SIZE;
    if (next > 0 && next < MIN_CHUNK_SIZE) {
        // ceil(remaining / 2)
        return (remaining + 1) / 2;
    }
    return MAX_CHUNK_SIZE;
}

std::vector<Chunk> Chunker::chunk_data(const std::vector<uint8_t>& data) {
    std::vector<Chunk> chunks;
    uint64_t cursor = 0;
    uint64_t total = data.size();

    while (total - cursor >= MAX_CHUNK_SIZE) {
        uint64_t chunk_size = next_chunk_size(total - cursor);
        chunks.push_back({Hasher::sha256(data.data() + cursor, chunk_size), cursor, cursor + chunk_size});
        cursor += chunk_size;
    }

    chunks.push_back({Hasher::sha256(data.data() + cursor, total - cursor), cursor, total});
    LOG_DEBUG("Chunked ", total, " bytes into ", chunks.size(), " chunks");
    return chunks;
}

std::vector<Chunk> Chunker::chunk_stream(std::istream& in, uint64_t size) {
    std::vector<Chunk> chunks;
    std::vector<uint8_t> piece_buffer;
    uint64_t cursor = 0;

    auto read_chunk = [&](uint64_t chunk_size) {
        piece_buffer.resize(chunk_size);
        in.read(reinterpret_cast<char*>(piece_buffer.data()), static_cast<std::streamsize>(chunk_size));
        if (static_cast<uint64_t>(in.gcount()) != chunk_size) {
            throw IOError("stream ended at byte " + std::to_string(cursor + in.gcount()) +
                          " of declared " + std::to_string(size));
        }
        chunks.push_back({Hasher::sha256(piece_buffer), cursor, cursor + chunk_size});
        cursor += chunk_size;
    };

    while (size - cursor >= MAX_CHUNK_SIZE) {
        read_chunk(next_chunk_size(size - cursor));
    }
    read_chunk(size - cursor);

    LOG_DEBUG("Chunked stream of ", size, " bytes into ", chunks.size(), " chunks");
    return chunks;
}
