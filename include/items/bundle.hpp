#ifndef WEAVEPACK_BUNDLE_HPP
#define WEAVEPACK_BUNDLE_HPP

#include "data_item.hpp"
#include <array>
#include <vector>
#include <ostream>

// One entry of the bundle header table.
struct BundleHeader {
    hash_t id;
    uint64_t size;
    std::array<uint8_t, 64> raw;
};

/**
 * @brief ANS-104 container: N(32B LE) || N x (size(32B LE) || id(32B)) || items.
 */
class Bundle {
public:
    static constexpr size_t HEADER_ENTRY_SIZE = 64;

    /**
     * @brief Builds a bundle from signed items; streamed payloads are read into memory.
     * @throws FormatError if an item is unsigned, IOError on a stream failure.
     */
    static Bundle create(const std::vector<DataItem>& items);

    /**
     * @brief Splits and decodes every item.
     * @throws FormatError ("malformed bundle") on any inconsistency.
     */
    static Bundle decode(const std::vector<uint8_t>& raw);

    // Cheap structural check: the header table and the declared sizes account for every byte.
    static bool verify(const std::vector<uint8_t>& raw);

    // Same bytes as create(items).raw(), written item by item.
    static void write_to(const std::vector<DataItem>& items, std::ostream& out);

    const std::vector<BundleHeader>& headers() const { return headers_; }
    const std::vector<DataItem>& items() const { return items_; }
    const std::vector<uint8_t>& raw() const { return raw_; }

private:
    Bundle() = default;

    std::vector<BundleHeader> headers_;
    std::vector<DataItem> items_;
    std::vector<uint8_t> raw_;
};

#endif // WEAVEPACK_BUNDLE_HPP
