#ifndef WEAVEPACK_DATA_ITEM_HPP
#define WEAVEPACK_DATA_ITEM_HPP

#include "tag.hpp"
#include "../crypto/hasher.hpp"
#include "../crypto/signature.hpp"
#include <vector>
#include <string>
#include <memory>
#include <variant>
#include <istream>
#include <ostream>

struct InMemoryPayload {
    std::vector<uint8_t> data;
};

// A payload read from a seekable stream. The stream is rewound before every pass,
// so one handle must not be used by two passes at the same time.
struct StreamedPayload {
    std::shared_ptr<std::istream> source;
    uint64_t size;
};

using Payload = std::variant<InMemoryPayload, StreamedPayload>;

/**
 * @brief A single signed ANS-104 record.
 *
 * Binary layout:
 *   signature type (2B LE) | signature | owner | target flag | [target 32B]
 *   | anchor flag | [anchor 32B] | tag count (8B LE) | tag bytes (8B LE) | tags | payload
 */
class DataItem {
public:
    static constexpr size_t MAX_TAGS = 128;
    static constexpr size_t MAX_TAG_KEY_LENGTH = 1024;
    static constexpr size_t MAX_TAG_VALUE_LENGTH = 3072;
    static constexpr size_t MAX_ANCHOR_LENGTH = 32;
    static constexpr size_t TARGET_LENGTH = 32;

    explicit DataItem(std::vector<uint8_t> data, std::vector<uint8_t> target = {},
                      std::vector<uint8_t> anchor = {}, std::vector<Tag> tags = {});

    DataItem(std::shared_ptr<std::istream> source, uint64_t size, std::vector<uint8_t> target = {},
             std::vector<uint8_t> anchor = {}, std::vector<Tag> tags = {});

    /**
     * @brief Parses a complete binary data item. The payload is everything after the tags.
     * @throws FormatError, UnsupportedSignatureType
     */
    static DataItem decode(const std::vector<uint8_t>& raw);

    /**
     * @brief Sets the owner from `signer`, signs the deep hash of the item and derives the id.
     *
     * For a streamed payload only the header is kept in raw().
     */
    void sign(const Signer& signer);

    /**
     * @brief Checks id, signature and the tag/anchor limits.
     * @throws InvalidSignature, ValidationError, IOError
     */
    void verify() const;

    // Header followed by payload; for streamed items the payload is read now.
    std::vector<uint8_t> get_raw_with_data() const;

    // Writes header then payload to `out` without holding a streamed payload in memory.
    void write_raw_to(std::ostream& out) const;

    const hash_t& id() const { return id_; }
    std::string id_b64() const;
    uint16_t signature_type() const { return signature_type_; }
    const std::vector<uint8_t>& signature() const { return signature_; }
    const std::vector<uint8_t>& owner() const { return owner_; }
    const std::vector<uint8_t>& target() const { return target_; }
    const std::vector<uint8_t>& anchor() const { return anchor_; }
    const std::vector<Tag>& tags() const { return tags_; }
    const Payload& payload() const { return payload_; }

    bool is_signed() const { return !signature_.empty(); }
    bool is_streamed() const { return std::holds_alternative<StreamedPayload>(payload_); }

    // In-memory payload bytes; throws LedgerError for a streamed item.
    const std::vector<uint8_t>& data() const;
    uint64_t data_size() const;

    // Header only for a streamed item, the full record otherwise.
    const std::vector<uint8_t>& raw() const { return raw_; }

    // Length of the full binary record, payload included.
    uint64_t raw_size() const;

    // Deep hash that the signature covers.
    hash384_t signature_digest() const;

private:
    DataItem() = default;

    std::vector<uint8_t> encode_header() const;
    std::istream& rewound_source() const;

    hash_t id_{};
    uint16_t signature_type_ = static_cast<uint16_t>(SignatureType::ARWEAVE);
    std::vector<uint8_t> signature_;
    std::vector<uint8_t> owner_;
    std::vector<uint8_t> target_;
    std::vector<uint8_t> anchor_;
    std::vector<Tag> tags_;
    Payload payload_;
    std::vector<uint8_t> raw_;
};

#endif // WEAVEPACK_DATA_ITEM_HPP
