#ifndef WEAVEPACK_DEEP_HASH_HPP
#define WEAVEPACK_DEEP_HASH_HPP

#include "hasher.hpp"
#include <variant>
#include <vector>
#include <string>
#include <istream>

/**
 * @brief A deep hash input: either a byte blob or an ordered list of further items.
 */
struct DeepHashItem {
    using Blob = std::vector<uint8_t>;
    using List = std::vector<DeepHashItem>;

    std::variant<Blob, List> value;

    static DeepHashItem blob(std::vector<uint8_t> bytes) { return DeepHashItem{std::move(bytes)}; }
    static DeepHashItem blob(const std::string& text) { return DeepHashItem{Blob(text.begin(), text.end())}; }
    static DeepHashItem list(List items) { return DeepHashItem{std::move(items)}; }
};

namespace DeepHash {

/**
 * @brief Canonical SHA-384 digest of a nested blob/list structure.
 *
 * blob(b)  = H(H("blob" || len(b)) || H(b))
 * list(L)  = fold over L starting at H("list" || len(L)) with acc = H(acc || deep_hash(e))
 *
 * Lengths are rendered as decimal ASCII.
 */
hash384_t hash(const DeepHashItem& item);

/**
 * @brief Blob component for `size` bytes read from `in`, computed without buffering them.
 * @throws IOError if the stream yields fewer than `size` bytes.
 */
hash384_t hash_blob_stream(std::istream& in, uint64_t size);

/**
 * @brief Deep hash of a list whose final element is streamed.
 *
 * Equal to hash(list(head + [blob(contents of in)])) for the same bytes.
 */
hash384_t hash_list_with_stream(const DeepHashItem::List& head, std::istream& in, uint64_t size);

} // namespace DeepHash

#endif // WEAVEPACK_DEEP_HASH_HPP
