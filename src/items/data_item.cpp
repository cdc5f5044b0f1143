#include "items/data_item.hpp"
#include "crypto/deep_hash.hpp"
#include "common/serializer.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace {

// Bytes copied per read when a streamed payload is emitted.
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

void check_encodable(const std::vector<uint8_t>& target, const std::vector<uint8_t>& anchor) {
    if (!target.empty() && target.size() != DataItem::TARGET_LENGTH) {
        throw ValidationError(ValidationRule::TARGET_LENGTH,
                              "target must be empty or 32 bytes, got " + std::to_string(target.size()));
    }
    if (!anchor.empty() && anchor.size() != DataItem::MAX_ANCHOR_LENGTH) {
        throw ValidationError(ValidationRule::ANCHOR_LENGTH,
                              "anchor must be empty or 32 bytes, got " + std::to_string(anchor.size()));
    }
}

std::vector<uint8_t> read_optional_field(Serializer::ByteReader& reader, size_t width, const char* field) {
    uint8_t present = reader.take_u8(field);
    if (present == 0) {
        return {};
    }
    if (present != 1) {
        throw FormatError(std::string("bad presence flag for ") + field + ": " + std::to_string(present));
    }
    return reader.take_bytes(width, field);
}

} // namespace

DataItem::DataItem(std::vector<uint8_t> data, std::vector<uint8_t> target,
                   std::vector<uint8_t> anchor, std::vector<Tag> tags)
    : target_(std::move(target)), anchor_(std::move(anchor)), tags_(std::move(tags)),
      payload_(InMemoryPayload{std::move(data)}) {}

DataItem::DataItem(std::shared_ptr<std::istream> source, uint64_t size, std::vector<uint8_t> target,
                   std::vector<uint8_t> anchor, std::vector<Tag> tags)
    : target_(std::move(target)), anchor_(std::move(anchor)), tags_(std::move(tags)),
      payload_(StreamedPayload{std::move(source), size}) {
    if (!std::get<StreamedPayload>(payload_).source) {
        throw IOError("streamed payload has no source");
    }
}

DataItem DataItem::decode(const std::vector<uint8_t>& raw) {
    Serializer::ByteReader reader(raw);
    DataItem item;

    item.signature_type_ = static_cast<uint16_t>(reader.take_le(2, "signature type"));
    const SignatureMeta& meta = signature_meta(item.signature_type_);

    item.signature_ = reader.take_bytes(meta.signature_length, "signature");
    item.owner_ = reader.take_bytes(meta.public_key_length, "owner");
    item.target_ = read_optional_field(reader, TARGET_LENGTH, "target");
    item.anchor_ = read_optional_field(reader, MAX_ANCHOR_LENGTH, "anchor");

    auto tags = Tags::deserialize_at(raw, reader.offset());
    item.tags_ = std::move(tags.first);
    reader.seek(tags.second, "tags");

    item.payload_ = InMemoryPayload{reader.take_bytes(reader.remaining(), "data")};
    item.id_ = Hasher::sha256(item.signature_);
    item.raw_ = raw;
    return item;
}

std::vector<uint8_t> DataItem::encode_header() const {
    std::vector<uint8_t> tag_bytes = Tags::serialize(tags_);

    std::vector<uint8_t> header;
    header.reserve(2 + signature_.size() + owner_.size() + 2 + target_.size() + anchor_.size()
                   + 2 * Tags::COUNTER_SIZE + tag_bytes.size());

    Serializer::append_le(header, signature_type_, 2);
    Serializer::append(header, signature_);
    Serializer::append(header, owner_);

    header.push_back(target_.empty() ? 0 : 1);
    Serializer::append(header, target_);
    header.push_back(anchor_.empty() ? 0 : 1);
    Serializer::append(header, anchor_);

    Serializer::append_le(header, tags_.size(), Tags::COUNTER_SIZE);
    Serializer::append_le(header, tag_bytes.size(), Tags::COUNTER_SIZE);
    Serializer::append(header, tag_bytes);
    return header;
}

std::istream& DataItem::rewound_source() const {
    std::istream& in = *std::get<StreamedPayload>(payload_).source;
    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) {
        throw IOError("cannot rewind payload stream");
    }
    return in;
}

hash384_t DataItem::signature_digest() const {
    DeepHashItem::List head = {
        DeepHashItem::blob("dataitem"),
        DeepHashItem::blob("1"),
        DeepHashItem::blob("1"),
        DeepHashItem::blob(owner_),
        DeepHashItem::blob(target_),
        DeepHashItem::blob(anchor_),
        DeepHashItem::blob(Tags::serialize(tags_)),
    };

    if (const auto* streamed = std::get_if<StreamedPayload>(&payload_)) {
        return DeepHash::hash_list_with_stream(head, rewound_source(), streamed->size);
    }
    head.push_back(DeepHashItem::blob(std::get<InMemoryPayload>(payload_).data));
    return DeepHash::hash(DeepHashItem::list(std::move(head)));
}

void DataItem::sign(const Signer& signer) {
    check_encodable(target_, anchor_);

    signature_type_ = signer.signature_type();
    const SignatureMeta& meta = signature_meta(signature_type_);
    owner_ = signer.public_key();
    if (owner_.size() != meta.public_key_length) {
        throw CryptoError(std::string("signer public key has wrong length for ") + meta.name);
    }

    hash384_t digest = signature_digest();
    signature_ = signer.sign(std::vector<uint8_t>(digest.begin(), digest.end()));
    if (signature_.size() != meta.signature_length) {
        throw CryptoError(std::string("signer produced wrong signature length for ") + meta.name);
    }
    id_ = Hasher::sha256(signature_);

    raw_ = encode_header();
    if (const auto* in_memory = std::get_if<InMemoryPayload>(&payload_)) {
        Serializer::append(raw_, in_memory->data);
    }
    LOG_DEBUG("Signed data item ", id_b64(), " (", data_size(), " bytes, type ", signature_type_, ")");
}

void DataItem::verify() const {
    if (Hasher::sha256(signature_) != id_) {
        LOG_WARN("Data item ", id_b64(), ": id does not match signature");
        throw InvalidSignature("id does not match signature");
    }

    hash384_t digest = signature_digest();
    if (!Signature::verify(signature_type_, std::vector<uint8_t>(digest.begin(), digest.end()),
                           signature_, owner_)) {
        LOG_WARN("Data item ", id_b64(), ": signature verification failed");
        throw InvalidSignature("signature does not match item contents");
    }

    if (tags_.size() > MAX_TAGS) {
        throw ValidationError(ValidationRule::TAG_COUNT,
                              std::to_string(tags_.size()) + " tags, at most " + std::to_string(MAX_TAGS));
    }
    for (const auto& tag : tags_) {
        if (tag.name.empty() || tag.name.size() > MAX_TAG_KEY_LENGTH) {
            throw ValidationError(ValidationRule::TAG_NAME_LENGTH,
                                  "name of " + std::to_string(tag.name.size()) + " bytes");
        }
        if (tag.value.empty() || tag.value.size() > MAX_TAG_VALUE_LENGTH) {
            throw ValidationError(ValidationRule::TAG_VALUE_LENGTH,
                                  "value of " + std::to_string(tag.value.size()) + " bytes");
        }
    }
    if (anchor_.size() > MAX_ANCHOR_LENGTH) {
        throw ValidationError(ValidationRule::ANCHOR_LENGTH, std::to_string(anchor_.size()) + " bytes");
    }
}

std::vector<uint8_t> DataItem::get_raw_with_data() const {
    if (!is_streamed()) {
        return raw_;
    }
    std::vector<uint8_t> result = raw_;
    uint64_t size = std::get<StreamedPayload>(payload_).size;
    std::istream& in = rewound_source();
    size_t header_size = result.size();
    result.resize(header_size + size);
    if (size > 0 && !in.read(reinterpret_cast<char*>(result.data() + header_size), static_cast<std::streamsize>(size))) {
        throw IOError("payload stream ended before " + std::to_string(size) + " bytes");
    }
    return result;
}

void DataItem::write_raw_to(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(raw_.data()), static_cast<std::streamsize>(raw_.size()));

    if (is_streamed()) {
        uint64_t remaining = std::get<StreamedPayload>(payload_).size;
        std::istream& in = rewound_source();
        std::vector<char> buffer(COPY_BUFFER_SIZE);
        while (remaining > 0) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
            if (!in.read(buffer.data(), static_cast<std::streamsize>(want))) {
                throw IOError("payload stream ended early");
            }
            out.write(buffer.data(), static_cast<std::streamsize>(want));
            remaining -= want;
        }
    }

    if (!out) {
        throw IOError("failed writing data item " + id_b64());
    }
}

std::string DataItem::id_b64() const {
    return Base64::url_encode(id_);
}

const std::vector<uint8_t>& DataItem::data() const {
    if (is_streamed()) {
        throw LedgerError("payload of data item is streamed");
    }
    return std::get<InMemoryPayload>(payload_).data;
}

uint64_t DataItem::data_size() const {
    if (const auto* streamed = std::get_if<StreamedPayload>(&payload_)) {
        return streamed->size;
    }
    return std::get<InMemoryPayload>(payload_).data.size();
}

uint64_t DataItem::raw_size() const {
    return raw_.size() + (is_streamed() ? data_size() : 0);
}
