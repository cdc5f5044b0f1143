#include "files/merkle.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/base64.hpp"
#include <algorithm>
#include <cstring>

namespace Merkle {

namespace {

hash_t note_hash(uint64_t value) {
    return Hasher::sha256(Serializer::encode_note(value));
}

std::unique_ptr<Node> hash_branch(std::unique_ptr<Node> left, std::unique_ptr<Node> right) {
    auto node = std::make_unique<Node>();
    node->id = Hasher::sha256_concat(Hasher::sha256(left->id.data(), HASH_SIZE),
                                     Hasher::sha256(right->id.data(), HASH_SIZE),
                                     note_hash(left->max_byte_range));
    node->type = NodeType::BRANCH;
    node->byte_range = left->max_byte_range;
    node->max_byte_range = right->max_byte_range;
    node->left = std::move(left);
    node->right = std::move(right);
    return node;
}

void collect_proofs(const Node& node, const std::vector<uint8_t>& prefix, std::vector<Proof>& proofs) {
    std::vector<uint8_t> path = prefix;
    if (node.type == NodeType::LEAF) {
        path.insert(path.end(), node.data_hash.begin(), node.data_hash.end());
        Serializer::append(path, Serializer::encode_note(node.max_byte_range));
        proofs.push_back({node.max_byte_range - 1, std::move(path)});
        return;
    }
    path.insert(path.end(), node.left->id.begin(), node.left->id.end());
    path.insert(path.end(), node.right->id.begin(), node.right->id.end());
    Serializer::append(path, Serializer::encode_note(node.byte_range));
    collect_proofs(*node.left, path, proofs);
    collect_proofs(*node.right, path, proofs);
}

ChunkData finish_chunks(std::vector<Chunk> chunks) {
    std::unique_ptr<Node> root = build_layers(generate_leaves(chunks));
    std::vector<Proof> proofs = generate_proofs(*root);

    if (chunks.back().size() == 0) {
        chunks.pop_back();
        proofs.pop_back();
    }
    LOG_DEBUG("Data root ", Base64::url_encode(root->id), " over ", chunks.size(), " chunks");
    return ChunkData{root->id, std::move(chunks), std::move(proofs)};
}

hash_t to_hash(const uint8_t* data) {
    hash_t hash;
    std::memcpy(hash.data(), data, HASH_SIZE);
    return hash;
}

} // namespace

std::vector<std::unique_ptr<Node>> generate_leaves(const std::vector<Chunk>& chunks) {
    std::vector<std::unique_ptr<Node>> leaves;
    leaves.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        auto leaf = std::make_unique<Node>();
        leaf->id = Hasher::sha256_concat(Hasher::sha256(chunk.data_hash.data(), HASH_SIZE),
                                         note_hash(chunk.max_byte_range));
        leaf->type = NodeType::LEAF;
        leaf->data_hash = chunk.data_hash;
        leaf->max_byte_range = chunk.max_byte_range;
        leaves.push_back(std::move(leaf));
    }
    return leaves;
}

std::unique_ptr<Node> build_layers(std::vector<std::unique_ptr<Node>> nodes) {
    if (nodes.empty()) {
        throw FormatError("cannot build a tree without leaves");
    }
    while (nodes.size() > 1) {
        std::vector<std::unique_ptr<Node>> next_layer;
        next_layer.reserve((nodes.size() + 1) / 2);
        for (size_t i = 0; i < nodes.size(); i += 2) {
            if (i + 1 < nodes.size()) {
                next_layer.push_back(hash_branch(std::move(nodes[i]), std::move(nodes[i + 1])));
            } else {
                next_layer.push_back(std::move(nodes[i]));
            }
        }
        nodes = std::move(next_layer);
    }
    return std::move(nodes.front());
}

std::unique_ptr<Node> generate_tree(const std::vector<uint8_t>& data) {
    return build_layers(generate_leaves(Chunker::chunk_data(data)));
}

std::vector<Proof> generate_proofs(const Node& root) {
    std::vector<Proof> proofs;
    collect_proofs(root, {}, proofs);
    return proofs;
}

ChunkData generate_transaction_chunks(const std::vector<uint8_t>& data) {
    return finish_chunks(Chunker::chunk_data(data));
}

ChunkData generate_transaction_chunks(std::istream& in, uint64_t size) {
    return finish_chunks(Chunker::chunk_stream(in, size));
}

ValidatePathResult validate_path(const hash_t& root_id, uint64_t dest, uint64_t left_bound,
                                 uint64_t right_bound, const std::vector<uint8_t>& path) {
    hash_t id = root_id;
    size_t position = 0;

    if (right_bound == 0) {
        throw InvalidProof("right bound must be positive");
    }
    if (dest >= right_bound) {
        dest = 0;
        left_bound = right_bound - 1;
    }

    // Each step consumes one branch record (left id, right id, note) and narrows the bounds.
    while (path.size() - position != HASH_SIZE + NOTE_SIZE) {
        if (path.size() - position < 2 * HASH_SIZE + NOTE_SIZE) {
            throw InvalidProof("path too short");
        }
        const uint8_t* left = path.data() + position;
        const uint8_t* right = left + HASH_SIZE;
        const uint8_t* note = right + HASH_SIZE;

        uint64_t offset = 0;
        if (!Serializer::decode_note(note, offset)) {
            throw InvalidProof("offset note out of range");
        }

        hash_t path_hash = Hasher::sha256_concat(Hasher::sha256(left, HASH_SIZE),
                                                 Hasher::sha256(right, HASH_SIZE),
                                                 Hasher::sha256(note, NOTE_SIZE));
        if (path_hash != id) {
            throw InvalidProof("branch hash mismatch");
        }

        if (dest < offset) {
            id = to_hash(left);
            right_bound = std::min(right_bound, offset);
        } else {
            id = to_hash(right);
            left_bound = std::max(left_bound, offset);
        }
        position += 2 * HASH_SIZE + NOTE_SIZE;
    }

    const uint8_t* path_data = path.data() + position;
    const uint8_t* end_offset = path_data + HASH_SIZE;
    hash_t leaf_hash = Hasher::sha256_concat(Hasher::sha256(path_data, HASH_SIZE),
                                             Hasher::sha256(end_offset, NOTE_SIZE));
    if (leaf_hash != id) {
        throw InvalidProof("leaf hash mismatch");
    }
    if (right_bound <= left_bound) {
        throw InvalidProof("empty byte range");
    }
    return ValidatePathResult{right_bound - 1, left_bound, right_bound, right_bound - left_bound};
}

} // namespace Merkle
