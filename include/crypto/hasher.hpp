#ifndef WEAVEPACK_HASHER_HPP
#define WEAVEPACK_HASHER_HPP

#include <vector>
#include <string>
#include <array>
#include <memory>
#include <cstdint>
#include <istream>

// SHA-256 produces a 32-byte hash; SHA-384 (used by the deep hash) a 48-byte one.
constexpr size_t HASH_SIZE = 32;
constexpr size_t HASH384_SIZE = 48;
using hash_t = std::array<uint8_t, HASH_SIZE>;
using hash384_t = std::array<uint8_t, HASH384_SIZE>;

struct evp_md_ctx_st;

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 */
hash_t sha256(const std::vector<uint8_t>& data);
hash_t sha256(const uint8_t* data, size_t size);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

/**
 * @brief Calculates the SHA-384 hash of a data buffer.
 */
hash384_t sha384(const uint8_t* data, size_t size);
hash384_t sha384(const std::vector<uint8_t>& data);
hash384_t sha384(const std::string& data);

/**
 * @brief Incremental digest over an OpenSSL EVP context.
 *
 * Used wherever a payload is streamed instead of held in memory.
 */
class Digest {
public:
    enum class Algorithm { SHA256, SHA384 };

    explicit Digest(Algorithm algorithm);
    ~Digest();
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /**
     * @brief Feeds exactly `size` bytes from `in` into the digest.
     * @throws IOError if the stream fails or ends early.
     */
    void update(std::istream& in, uint64_t size);

    std::vector<uint8_t> finalize();

private:
    struct Deleter { void operator()(evp_md_ctx_st* c) const; };
    std::unique_ptr<evp_md_ctx_st, Deleter> ctx_;
};

    // Helpers
    hash_t hex_to_hash(const std::string& hex);
    std::string hash_to_hex(const uint8_t* data, size_t size);
    std::string hash_to_hex(const hash_t& hash);
    std::string hash_to_hex(const hash384_t& hash);

    // Concatenates any number of hashes or byte vectors and hashes the result with SHA-256.
    template<typename... Parts>
    hash_t sha256_concat(const Parts&... parts) {
        std::vector<uint8_t> buffer;
        (buffer.insert(buffer.end(), parts.begin(), parts.end()), ...);
        return sha256(buffer);
    }

} // namespace Hasher

#endif //WEAVEPACK_HASHER_HPP
