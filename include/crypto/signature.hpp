#ifndef WEAVEPACK_SIGNATURE_HPP
#define WEAVEPACK_SIGNATURE_HPP

#include <vector>
#include <string>
#include <memory>
#include <cstdint>

struct evp_pkey_st;

// Signature scheme tags carried in the first two bytes of a data item.
enum class SignatureType : uint16_t {
    ARWEAVE = 1,
    ED25519 = 2,
    ETHEREUM = 3,
    SOLANA = 4
};

struct SignatureMeta {
    size_t signature_length;
    size_t public_key_length;
    const char* name;
};

/**
 * @brief Field widths for a registered signature type.
 * @throws UnsupportedSignatureType for unregistered tags.
 */
const SignatureMeta& signature_meta(uint16_t signature_type);

/**
 * @brief Capability used to sign deep hash digests.
 */
class Signer {
public:
    virtual ~Signer() = default;

    virtual uint16_t signature_type() const = 0;

    // Owner bytes exactly as embedded in a data item or transaction.
    virtual std::vector<uint8_t> public_key() const = 0;

    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const = 0;

    virtual std::string private_key_pem() const = 0;
};

struct PKeyDeleter { void operator()(evp_pkey_st* p) const; };
using pkey_ptr = std::unique_ptr<evp_pkey_st, PKeyDeleter>;

// RSA-PSS with SHA-256 over a 4096-bit key; the owner is the 512-byte modulus.
class RsaPssSigner : public Signer {
public:
    static constexpr int KEY_BITS = 4096;

    explicit RsaPssSigner(pkey_ptr key);

    static std::unique_ptr<RsaPssSigner> generate();
    static std::unique_ptr<RsaPssSigner> from_pem(const std::string& private_key_pem);

    uint16_t signature_type() const override { return static_cast<uint16_t>(SignatureType::ARWEAVE); }
    std::vector<uint8_t> public_key() const override;
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const override;
    std::string private_key_pem() const override;

private:
    pkey_ptr key_;
};

class Ed25519Signer : public Signer {
public:
    explicit Ed25519Signer(pkey_ptr key);

    static std::unique_ptr<Ed25519Signer> generate();
    static std::unique_ptr<Ed25519Signer> from_pem(const std::string& private_key_pem);

    uint16_t signature_type() const override { return static_cast<uint16_t>(SignatureType::ED25519); }
    std::vector<uint8_t> public_key() const override;
    std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const override;
    std::string private_key_pem() const override;

private:
    pkey_ptr key_;
};

class Signature {
public:
    // Verify `signature` over `message` against the owner bytes of the given scheme.
    // Returns false on a cryptographic mismatch or an owner of the wrong shape.
    static bool verify(uint16_t signature_type, const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature, const std::vector<uint8_t>& owner);

    // Load an RSA or Ed25519 private key from PEM, choosing the signer by key type.
    static std::unique_ptr<Signer> load_signer(const std::string& private_key_pem);

    // Wallet address: base64url(SHA-256(owner)).
    static std::string address_from_owner(const std::vector<uint8_t>& owner);
};

#endif // WEAVEPACK_SIGNATURE_HPP
