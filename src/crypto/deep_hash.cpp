#include "crypto/deep_hash.hpp"
#include <algorithm>

namespace DeepHash {

namespace {

hash384_t tag_hash(const char* tag, uint64_t length) {
    return Hasher::sha384(std::string(tag) + std::to_string(length));
}

hash384_t combine(const hash384_t& left, const hash384_t& right) {
    std::vector<uint8_t> pair;
    pair.reserve(2 * HASH384_SIZE);
    pair.insert(pair.end(), left.begin(), left.end());
    pair.insert(pair.end(), right.begin(), right.end());
    return Hasher::sha384(pair);
}

hash384_t to_hash384(const std::vector<uint8_t>& digest) {
    hash384_t out;
    std::copy(digest.begin(), digest.end(), out.begin());
    return out;
}

hash384_t fold(const DeepHashItem::List& items, hash384_t acc) {
    for (const auto& item : items) {
        acc = combine(acc, hash(item));
    }
    return acc;
}

} // namespace

hash384_t hash(const DeepHashItem& item) {
    if (const auto* blob = std::get_if<DeepHashItem::Blob>(&item.value)) {
        return combine(tag_hash("blob", blob->size()), Hasher::sha384(*blob));
    }
    const auto& list = std::get<DeepHashItem::List>(item.value);
    return fold(list, tag_hash("list", list.size()));
}

hash384_t hash_blob_stream(std::istream& in, uint64_t size) {
    Hasher::Digest digest(Hasher::Digest::Algorithm::SHA384);
    digest.update(in, size);
    return combine(tag_hash("blob", size), to_hash384(digest.finalize()));
}

hash384_t hash_list_with_stream(const DeepHashItem::List& head, std::istream& in, uint64_t size) {
    hash384_t acc = fold(head, tag_hash("list", head.size() + 1));
    return combine(acc, hash_blob_stream(in, size));
}

} // namespace DeepHash
