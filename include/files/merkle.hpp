#ifndef WEAVEPACK_MERKLE_HPP
#define WEAVEPACK_MERKLE_HPP

#include "chunker.hpp"
#include <memory>
#include <vector>
#include <istream>

namespace Merkle {

constexpr size_t NOTE_SIZE = 32;

enum class NodeType { LEAF, BRANCH };

/**
 * @brief Node of the binary chunk tree. A branch owns both of its children.
 *
 * For a leaf, data_hash is the chunk hash. For a branch, byte_range is the
 * split point (the left child's max_byte_range).
 */
struct Node {
    hash_t id;
    NodeType type;
    hash_t data_hash{};
    uint64_t byte_range = 0;
    uint64_t max_byte_range = 0;
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
};

// Inclusion proof for one chunk; offset is the chunk's last byte.
struct Proof {
    uint64_t offset;
    std::vector<uint8_t> proof;
};

struct ChunkData {
    hash_t data_root;
    std::vector<Chunk> chunks;
    std::vector<Proof> proofs;
};

struct ValidatePathResult {
    uint64_t offset;
    uint64_t left_bound;
    uint64_t right_bound;
    uint64_t chunk_size;
};

std::vector<std::unique_ptr<Node>> generate_leaves(const std::vector<Chunk>& chunks);

/**
 * @brief Pairs adjacent nodes layer by layer until one root remains.
 *
 * An odd node at the end of a layer is carried into the next layer unchanged.
 */
std::unique_ptr<Node> build_layers(std::vector<std::unique_ptr<Node>> nodes);

std::unique_ptr<Node> generate_tree(const std::vector<uint8_t>& data);

// Depth-first, left to right, so proofs line up with the chunk list.
std::vector<Proof> generate_proofs(const Node& root);

/**
 * @brief Chunks a payload, builds its tree and derives one proof per chunk.
 *
 * A trailing zero-length chunk still contributes to the root, but it is
 * dropped from the returned chunks and proofs.
 */
ChunkData generate_transaction_chunks(const std::vector<uint8_t>& data);
ChunkData generate_transaction_chunks(std::istream& in, uint64_t size);

/**
 * @brief Checks that `path` proves a chunk containing byte `dest` under `root_id`.
 * @throws InvalidProof on any hash mismatch or malformed path.
 */
ValidatePathResult validate_path(const hash_t& root_id, uint64_t dest, uint64_t left_bound,
                                 uint64_t right_bound, const std::vector<uint8_t>& path);

} // namespace Merkle

#endif // WEAVEPACK_MERKLE_HPP
