#ifndef WEAVEPACK_TRANSACTION_HPP
#define WEAVEPACK_TRANSACTION_HPP

#include "../items/tag.hpp"
#include "../files/merkle.hpp"
#include "../crypto/signature.hpp"
#include "nlohmann/json.hpp"
#include <optional>
#include <string>
#include <vector>

// Body of POST /chunk. Binary fields are base64url, numbers are decimal strings.
struct ChunkUpload {
    std::string data_root;
    std::string data_size;
    std::string data_path;
    std::string offset;
    std::string chunk;
};

void to_json(nlohmann::json& j, const ChunkUpload& chunk);

/**
 * @brief Format 2 base-layer transaction. The payload is committed to by its Merkle data root.
 */
class Transaction {
public:
    static constexpr int FORMAT = 2;

    explicit Transaction(std::vector<uint8_t> data = {}, std::vector<uint8_t> target = {},
                         std::string quantity = "0", std::vector<Tag> tags = {});

    // Computes chunks, proofs, data_root and data_size for `data`.
    void prepare_chunks(const std::vector<uint8_t>& data);

    /**
     * @brief Upload body for chunk `index` of `data`; prepare_chunks must have run on the same bytes.
     * @throws LedgerError if chunks are not prepared or `index` is out of range.
     */
    ChunkUpload get_chunk(size_t index, const std::vector<uint8_t>& data) const;

    /**
     * @brief Signs with an RSA-PSS signer; the id becomes SHA-256 of the signature.
     * @throws UnsupportedSignatureType for any other signer.
     */
    void sign(const Signer& signer);

    // @throws InvalidSignature
    void verify() const;

    hash384_t signature_digest() const;

    nlohmann::json to_json(bool include_data = true) const;
    static Transaction from_json(const nlohmann::json& j);

    void set_last_tx(std::vector<uint8_t> last_tx) { last_tx_ = std::move(last_tx); }
    void set_reward(std::string reward) { reward_ = std::move(reward); }
    void add_tag(const std::string& name, const std::string& value) { tags_.push_back({name, value}); }

    const std::vector<uint8_t>& id() const { return id_; }
    std::string id_b64() const;
    const std::vector<uint8_t>& owner() const { return owner_; }
    const std::vector<uint8_t>& signature() const { return signature_; }
    const std::vector<uint8_t>& target() const { return target_; }
    const std::vector<uint8_t>& last_tx() const { return last_tx_; }
    const std::vector<uint8_t>& data() const { return data_; }
    const std::vector<uint8_t>& data_root() const { return data_root_; }
    const std::vector<Tag>& tags() const { return tags_; }
    const std::string& quantity() const { return quantity_; }
    const std::string& reward() const { return reward_; }
    uint64_t data_size() const { return data_size_; }
    bool is_signed() const { return !signature_.empty(); }

    // Set by prepare_chunks.
    const std::optional<Merkle::ChunkData>& chunk_data() const { return chunks_; }

private:
    std::vector<uint8_t> id_;
    std::vector<uint8_t> last_tx_;
    std::vector<uint8_t> owner_;
    std::vector<Tag> tags_;
    std::vector<uint8_t> target_;
    std::string quantity_;
    std::vector<uint8_t> data_;
    uint64_t data_size_ = 0;
    std::vector<uint8_t> data_root_;
    std::string reward_ = "0";
    std::vector<uint8_t> signature_;

    std::optional<Merkle::ChunkData> chunks_;
};

#endif // WEAVEPACK_TRANSACTION_HPP
