#include "tx/transaction.hpp"
#include "crypto/deep_hash.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {

std::vector<uint8_t> b64_field(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    return Base64::url_decode(j.at(key).get<std::string>());
}

std::string string_field(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return fallback;
    }
    return j.at(key).get<std::string>();
}

std::string b64_string(const std::string& text) {
    return Base64::url_encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string text_from_b64(const std::string& encoded) {
    std::vector<uint8_t> bytes = Base64::url_decode(encoded);
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

void to_json(json& j, const ChunkUpload& chunk) {
    j = json{
        {"data_root", chunk.data_root},
        {"data_size", chunk.data_size},
        {"data_path", chunk.data_path},
        {"offset", chunk.offset},
        {"chunk", chunk.chunk}
    };
}

Transaction::Transaction(std::vector<uint8_t> data, std::vector<uint8_t> target,
                         std::string quantity, std::vector<Tag> tags)
    : tags_(std::move(tags)), target_(std::move(target)), quantity_(std::move(quantity)),
      data_(std::move(data)) {
    data_size_ = data_.size();
    if (!data_.empty()) {
        prepare_chunks(data_);
    }
}

void Transaction::prepare_chunks(const std::vector<uint8_t>& data) {
    chunks_ = Merkle::generate_transaction_chunks(data);
    data_size_ = data.size();
    if (data.empty()) {
        data_root_.clear();
    } else {
        data_root_.assign(chunks_->data_root.begin(), chunks_->data_root.end());
    }
    LOG_DEBUG("Prepared ", chunks_->chunks.size(), " chunks for ", data.size(), " bytes");
}

ChunkUpload Transaction::get_chunk(size_t index, const std::vector<uint8_t>& data) const {
    if (!chunks_) {
        throw LedgerError("chunks have not been prepared");
    }
    if (index >= chunks_->chunks.size()) {
        throw LedgerError("chunk index " + std::to_string(index) + " out of range");
    }
    const Chunk& chunk = chunks_->chunks[index];
    if (chunk.max_byte_range > data.size()) {
        throw LedgerError("data is shorter than the prepared chunks");
    }

    ChunkUpload upload;
    upload.data_root = Base64::url_encode(data_root_);
    upload.data_size = std::to_string(data_size_);
    upload.data_path = Base64::url_encode(chunks_->proofs[index].proof);
    upload.offset = std::to_string(chunks_->proofs[index].offset);
    upload.chunk = Base64::url_encode(data.data() + chunk.min_byte_range, chunk.size());
    return upload;
}

hash384_t Transaction::signature_digest() const {
    DeepHashItem::List tag_list;
    tag_list.reserve(tags_.size());
    for (const auto& tag : tags_) {
        tag_list.push_back(DeepHashItem::list({DeepHashItem::blob(tag.name), DeepHashItem::blob(tag.value)}));
    }

    return DeepHash::hash(DeepHashItem::list({
        DeepHashItem::blob(std::to_string(FORMAT)),
        DeepHashItem::blob(owner_),
        DeepHashItem::blob(target_),
        DeepHashItem::blob(quantity_),
        DeepHashItem::blob(reward_),
        DeepHashItem::blob(last_tx_),
        DeepHashItem::list(std::move(tag_list)),
        DeepHashItem::blob(std::to_string(data_size_)),
        DeepHashItem::blob(data_root_),
    }));
}

void Transaction::sign(const Signer& signer) {
    if (signer.signature_type() != static_cast<uint16_t>(SignatureType::ARWEAVE)) {
        throw UnsupportedSignatureType(signer.signature_type(), "transactions cannot be signed with type");
    }
    if (!data_.empty()) {
        prepare_chunks(data_);
    }

    owner_ = signer.public_key();
    hash384_t digest = signature_digest();
    signature_ = signer.sign(std::vector<uint8_t>(digest.begin(), digest.end()));

    hash_t id = Hasher::sha256(signature_);
    id_.assign(id.begin(), id.end());
    LOG_DEBUG("Signed transaction ", id_b64());
}

void Transaction::verify() const {
    hash_t expected_id = Hasher::sha256(signature_);
    if (id_.size() != expected_id.size() || !std::equal(id_.begin(), id_.end(), expected_id.begin())) {
        LOG_WARN("Transaction ", id_b64(), ": id does not match signature");
        throw InvalidSignature("id does not match signature");
    }

    if (!data_.empty()) {
        Merkle::ChunkData recomputed = Merkle::generate_transaction_chunks(data_);
        if (data_.size() != data_size_ ||
            !std::equal(data_root_.begin(), data_root_.end(), recomputed.data_root.begin(), recomputed.data_root.end())) {
            LOG_WARN("Transaction ", id_b64(), ": data does not match data_root");
            throw InvalidSignature("data does not match data_root");
        }
    }

    hash384_t digest = signature_digest();
    if (!Signature::verify(static_cast<uint16_t>(SignatureType::ARWEAVE),
                           std::vector<uint8_t>(digest.begin(), digest.end()), signature_, owner_)) {
        LOG_WARN("Transaction ", id_b64(), ": signature verification failed");
        throw InvalidSignature("signature does not match transaction");
    }
}

std::string Transaction::id_b64() const {
    return Base64::url_encode(id_);
}

json Transaction::to_json(bool include_data) const {
    json tags = json::array();
    for (const auto& tag : tags_) {
        tags.push_back({{"name", b64_string(tag.name)}, {"value", b64_string(tag.value)}});
    }

    return json{
        {"format", FORMAT},
        {"id", Base64::url_encode(id_)},
        {"last_tx", Base64::url_encode(last_tx_)},
        {"owner", Base64::url_encode(owner_)},
        {"tags", tags},
        {"target", Base64::url_encode(target_)},
        {"quantity", quantity_},
        {"data", include_data ? Base64::url_encode(data_) : std::string()},
        {"data_size", std::to_string(data_size_)},
        {"data_root", Base64::url_encode(data_root_)},
        {"reward", reward_},
        {"signature", Base64::url_encode(signature_)}
    };
}

Transaction Transaction::from_json(const json& j) {
    try {
        if (j.contains("format") && j.at("format").get<int>() != FORMAT) {
            throw FormatError("unsupported transaction format " + j.at("format").dump());
        }

        Transaction tx;
        tx.id_ = b64_field(j, "id");
        tx.last_tx_ = b64_field(j, "last_tx");
        tx.owner_ = b64_field(j, "owner");
        tx.target_ = b64_field(j, "target");
        tx.quantity_ = string_field(j, "quantity", "0");
        tx.data_ = b64_field(j, "data");
        tx.data_root_ = b64_field(j, "data_root");
        tx.reward_ = string_field(j, "reward", "0");
        tx.signature_ = b64_field(j, "signature");

        std::string size = string_field(j, "data_size", "0");
        if (size.empty() || size.find_first_not_of("0123456789") != std::string::npos) {
            throw FormatError("bad data_size '" + size + "'");
        }
        tx.data_size_ = std::stoull(size);

        if (j.contains("tags")) {
            for (const auto& tag : j.at("tags")) {
                tx.tags_.push_back({text_from_b64(tag.at("name").get<std::string>()),
                                    text_from_b64(tag.at("value").get<std::string>())});
            }
        }
        if (!tx.data_.empty()) {
            tx.chunks_ = Merkle::generate_transaction_chunks(tx.data_);
        }
        return tx;
    } catch (const json::exception& e) {
        throw FormatError(std::string("transaction json: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw FormatError(std::string("transaction data_size: ") + e.what());
    }
}
