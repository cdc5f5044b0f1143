#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace Hasher {

namespace {

// Bytes pulled from a stream per read while digesting it.
constexpr size_t STREAM_BUFFER_SIZE = 64 * 1024;

template <size_t N>
std::array<uint8_t, N> one_shot(const EVP_MD* md, const uint8_t* data, size_t size) {
    std::array<uint8_t, N> hash;
    unsigned int len = 0;
    if (!EVP_Digest(data, size, hash.data(), &len, md, NULL) || len != N) {
        throw CryptoError("EVP_Digest failed");
    }
    return hash;
}

} // namespace

hash_t sha256(const uint8_t* data, size_t size) {
    return one_shot<HASH_SIZE>(EVP_sha256(), data, size);
}

hash_t sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

hash384_t sha384(const uint8_t* data, size_t size) {
    return one_shot<HASH384_SIZE>(EVP_sha384(), data, size);
}

hash384_t sha384(const std::vector<uint8_t>& data) {
    return sha384(data.data(), data.size());
}

hash384_t sha384(const std::string& data) {
    return sha384(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void Digest::Deleter::operator()(evp_md_ctx_st* c) const { EVP_MD_CTX_free(c); }

Digest::Digest(Algorithm algorithm) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw CryptoError("EVP_MD_CTX_new failed");
    }
    const EVP_MD* md = algorithm == Algorithm::SHA256 ? EVP_sha256() : EVP_sha384();
    if (!EVP_DigestInit_ex(ctx_.get(), md, NULL)) {
        throw CryptoError("EVP_DigestInit_ex failed");
    }
}

Digest::~Digest() = default;

void Digest::update(const uint8_t* data, size_t size) {
    if (!EVP_DigestUpdate(ctx_.get(), data, size)) {
        throw CryptoError("EVP_DigestUpdate failed");
    }
}

void Digest::update(std::istream& in, uint64_t size) {
    std::vector<uint8_t> buffer(STREAM_BUFFER_SIZE);
    uint64_t left = size;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(left, buffer.size()));
        in.read(reinterpret_cast<char*>(buffer.data()), want);
        std::streamsize got = in.gcount();
        if (got <= 0) {
            throw IOError("stream ended " + std::to_string(left) + " bytes before its declared size");
        }
        update(buffer.data(), static_cast<size_t>(got));
        left -= static_cast<uint64_t>(got);
    }
}

std::vector<uint8_t> Digest::finalize() {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx_.get(), out.data(), &len)) {
        throw CryptoError("EVP_DigestFinal_ex failed");
    }
    out.resize(len);
    return out;
}

hash_t hex_to_hash(const std::string& hex_str) {
    if (hex_str.size() != HASH_SIZE * 2) {
        throw FormatError("hex hash must be 64 characters");
    }
    for (char c : hex_str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw FormatError("hex hash contains a non-hex character");
        }
    }
    hash_t hash;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        hash[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

std::string hash_to_hex(const uint8_t* data, size_t size) {
    std::stringstream ss;
    for (size_t i = 0; i < size; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

std::string hash_to_hex(const hash_t& hash) {
    return hash_to_hex(hash.data(), hash.size());
}

std::string hash_to_hex(const hash384_t& hash) {
    return hash_to_hex(hash.data(), hash.size());
}

} // namespace Hasher
