#include "crypto/signature.hpp"
#include "crypto/hasher.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>
#include <map>

// Helper deleters for unique_ptr
struct BIO_Deleter { void operator()(BIO* b) { BIO_free_all(b); } };
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
struct EVP_PKEY_CTX_Deleter { void operator()(EVP_PKEY_CTX* c) { EVP_PKEY_CTX_free(c); } };
struct BN_Deleter { void operator()(BIGNUM* b) { BN_free(b); } };
struct OSSL_PARAM_BLD_Deleter { void operator()(OSSL_PARAM_BLD* b) { OSSL_PARAM_BLD_free(b); } };
struct OSSL_PARAM_Deleter { void operator()(OSSL_PARAM* p) { OSSL_PARAM_free(p); } };

void PKeyDeleter::operator()(evp_pkey_st* p) const { EVP_PKEY_free(p); }

namespace {

constexpr unsigned long RSA_PUBLIC_EXPONENT = 65537;

const std::map<uint16_t, SignatureMeta>& signature_table() {
    static const std::map<uint16_t, SignatureMeta> table = {
        {static_cast<uint16_t>(SignatureType::ARWEAVE),  {512, 512, "arweave"}},
        {static_cast<uint16_t>(SignatureType::ED25519),  {64, 32, "ed25519"}},
        {static_cast<uint16_t>(SignatureType::ETHEREUM), {65, 65, "ethereum"}},
        {static_cast<uint16_t>(SignatureType::SOLANA),   {64, 32, "solana"}},
    };
    return table;
}

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return what + ": " + buffer;
}

pkey_ptr generate_key(int type, int rsa_bits) {
    std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter> ctx(EVP_PKEY_CTX_new_id(type, NULL));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw CryptoError(openssl_error("error initializing keygen"));
    }
    if (type == EVP_PKEY_RSA && EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), rsa_bits) <= 0) {
        throw CryptoError(openssl_error("error setting RSA key size"));
    }

    EVP_PKEY* pkey_raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey_raw) <= 0) {
        throw CryptoError(openssl_error("error generating key"));
    }
    return pkey_ptr(pkey_raw);
}

pkey_ptr read_private_key(const std::string& private_key_pem) {
    std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size())));
    pkey_ptr pkey(PEM_read_bio_PrivateKey(bio.get(), NULL, NULL, NULL));
    if (!pkey) {
        throw CryptoError(openssl_error("error loading private key"));
    }
    return pkey;
}

std::string write_private_key(EVP_PKEY* pkey) {
    std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey, NULL, NULL, 0, NULL, NULL) <= 0) {
        throw CryptoError(openssl_error("error exporting private key"));
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, len);
}

std::vector<uint8_t> digest_sign(EVP_PKEY* pkey, const EVP_MD* md, bool pss,
                                 const std::vector<uint8_t>& message) {
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestSignInit(ctx.get(), &pctx, md, NULL, pkey) <= 0) {
        throw CryptoError(openssl_error("EVP_DigestSignInit failed"));
    }
    if (pss && (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
                EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0)) {
        throw CryptoError(openssl_error("error configuring RSA-PSS"));
    }

    size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), NULL, &sig_len, message.data(), message.size()) <= 0) {
        throw CryptoError(openssl_error("EVP_DigestSign failed"));
    }
    std::vector<uint8_t> signature(sig_len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) <= 0) {
        throw CryptoError(openssl_error("EVP_DigestSign failed"));
    }
    signature.resize(sig_len);
    return signature;
}

bool digest_verify(EVP_PKEY* pkey, const EVP_MD* md, bool pss, const std::vector<uint8_t>& message,
                   const std::vector<uint8_t>& signature) {
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), &pctx, md, NULL, pkey) <= 0) {
        return false;
    }
    if (pss && (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
                EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_AUTO) <= 0)) {
        return false;
    }
    bool ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
    // A failed verification leaves an entry on the OpenSSL error queue
    ERR_clear_error();
    return ok;
}

// Rebuilds an RSA public key from a raw big-endian modulus and the fixed exponent.
pkey_ptr rsa_public_from_modulus(const std::vector<uint8_t>& modulus) {
    std::unique_ptr<BIGNUM, BN_Deleter> n(BN_bin2bn(modulus.data(), static_cast<int>(modulus.size()), NULL));
    std::unique_ptr<BIGNUM, BN_Deleter> e(BN_new());
    std::unique_ptr<OSSL_PARAM_BLD, OSSL_PARAM_BLD_Deleter> bld(OSSL_PARAM_BLD_new());
    if (!n || !e || !bld || !BN_set_word(e.get(), RSA_PUBLIC_EXPONENT) ||
        !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) ||
        !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get())) {
        throw CryptoError(openssl_error("error building RSA parameters"));
    }
    std::unique_ptr<OSSL_PARAM, OSSL_PARAM_Deleter> params(OSSL_PARAM_BLD_to_param(bld.get()));
    std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter> ctx(EVP_PKEY_CTX_new_from_name(NULL, "RSA", NULL));
    EVP_PKEY* pkey_raw = nullptr;
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
        EVP_PKEY_fromdata(ctx.get(), &pkey_raw, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0) {
        throw CryptoError(openssl_error("error importing RSA public key"));
    }
    return pkey_ptr(pkey_raw);
}

} // namespace

const SignatureMeta& signature_meta(uint16_t signature_type) {
    const auto& table = signature_table();
    auto it = table.find(signature_type);
    if (it == table.end()) {
        throw UnsupportedSignatureType(signature_type);
    }
    return it->second;
}

RsaPssSigner::RsaPssSigner(pkey_ptr key) : key_(std::move(key)) {
    if (EVP_PKEY_get_base_id(key_.get()) != EVP_PKEY_RSA) {
        throw CryptoError("key is not an RSA key");
    }
    if (static_cast<size_t>(EVP_PKEY_get_size(key_.get())) != signature_meta(signature_type()).signature_length) {
        throw CryptoError("RSA key must be " + std::to_string(KEY_BITS) + " bits");
    }
}

std::unique_ptr<RsaPssSigner> RsaPssSigner::generate() {
    return std::make_unique<RsaPssSigner>(generate_key(EVP_PKEY_RSA, KEY_BITS));
}

std::unique_ptr<RsaPssSigner> RsaPssSigner::from_pem(const std::string& private_key_pem) {
    return std::make_unique<RsaPssSigner>(read_private_key(private_key_pem));
}

std::vector<uint8_t> RsaPssSigner::public_key() const {
    BIGNUM* n_raw = nullptr;
    if (!EVP_PKEY_get_bn_param(key_.get(), OSSL_PKEY_PARAM_RSA_N, &n_raw)) {
        throw CryptoError(openssl_error("error reading RSA modulus"));
    }
    std::unique_ptr<BIGNUM, BN_Deleter> n(n_raw);
    std::vector<uint8_t> modulus(signature_meta(signature_type()).public_key_length);
    if (BN_bn2binpad(n.get(), modulus.data(), static_cast<int>(modulus.size())) < 0) {
        throw CryptoError("RSA modulus does not fit the owner field");
    }
    return modulus;
}

std::vector<uint8_t> RsaPssSigner::sign(const std::vector<uint8_t>& message) const {
    return digest_sign(key_.get(), EVP_sha256(), true, message);
}

std::string RsaPssSigner::private_key_pem() const {
    return write_private_key(key_.get());
}

Ed25519Signer::Ed25519Signer(pkey_ptr key) : key_(std::move(key)) {
    if (EVP_PKEY_get_base_id(key_.get()) != EVP_PKEY_ED25519) {
        throw CryptoError("key is not an Ed25519 key");
    }
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::generate() {
    return std::make_unique<Ed25519Signer>(generate_key(EVP_PKEY_ED25519, 0));
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::from_pem(const std::string& private_key_pem) {
    return std::make_unique<Ed25519Signer>(read_private_key(private_key_pem));
}

std::vector<uint8_t> Ed25519Signer::public_key() const {
    std::vector<uint8_t> key(signature_meta(signature_type()).public_key_length);
    size_t len = key.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), key.data(), &len) <= 0 || len != key.size()) {
        throw CryptoError(openssl_error("error reading Ed25519 public key"));
    }
    return key;
}

std::vector<uint8_t> Ed25519Signer::sign(const std::vector<uint8_t>& message) const {
    // Ed25519 hashes internally, so no message digest is configured.
    return digest_sign(key_.get(), NULL, false, message);
}

std::string Ed25519Signer::private_key_pem() const {
    return write_private_key(key_.get());
}

bool Signature::verify(uint16_t signature_type, const std::vector<uint8_t>& message,
                       const std::vector<uint8_t>& signature, const std::vector<uint8_t>& owner) {
    const SignatureMeta& meta = signature_meta(signature_type);
    if (signature.size() != meta.signature_length || owner.size() != meta.public_key_length) {
        LOG_WARN("Signature or owner length does not match scheme ", meta.name);
        return false;
    }

    switch (static_cast<SignatureType>(signature_type)) {
        case SignatureType::ARWEAVE: {
            pkey_ptr pkey;
            try {
                pkey = rsa_public_from_modulus(owner);
            } catch (const CryptoError& e) {
                LOG_WARN("Owner is not a usable RSA modulus: ", e.what());
                ERR_clear_error();
                return false;
            }
            return digest_verify(pkey.get(), EVP_sha256(), true, message, signature);
        }
        case SignatureType::ED25519:
        case SignatureType::SOLANA: {
            pkey_ptr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, owner.data(), owner.size()));
            if (!pkey) {
                ERR_clear_error();
                return false;
            }
            return digest_verify(pkey.get(), NULL, false, message, signature);
        }
        case SignatureType::ETHEREUM:
            break;
    }
    throw UnsupportedSignatureType(signature_type, "verification not supported for signature type");
}

std::unique_ptr<Signer> Signature::load_signer(const std::string& private_key_pem) {
    pkey_ptr pkey = read_private_key(private_key_pem);
    switch (EVP_PKEY_get_base_id(pkey.get())) {
        case EVP_PKEY_RSA:
            return std::make_unique<RsaPssSigner>(std::move(pkey));
        case EVP_PKEY_ED25519:
            return std::make_unique<Ed25519Signer>(std::move(pkey));
        default:
            throw CryptoError("unsupported private key type");
    }
}

std::string Signature::address_from_owner(const std::vector<uint8_t>& owner) {
    return Base64::url_encode(Hasher::sha256(owner));
}
