#ifndef WEAVEPACK_ERRORS_HPP
#define WEAVEPACK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstdint>

// Base of every failure raised by the library.
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

// Buffer too short or structurally malformed.
class FormatError : public LedgerError {
public:
    explicit FormatError(const std::string& what) : LedgerError("format error: " + what) {}
};

class UnsupportedSignatureType : public LedgerError {
public:
    explicit UnsupportedSignatureType(uint16_t type)
        : LedgerError("unsupported signature type: " + std::to_string(type)), type_(type) {}
    UnsupportedSignatureType(uint16_t type, const std::string& what)
        : LedgerError(what + ": " + std::to_string(type)), type_(type) {}

    uint16_t type() const { return type_; }

private:
    uint16_t type_;
};

class InvalidSignature : public LedgerError {
public:
    explicit InvalidSignature(const std::string& what) : LedgerError("invalid signature: " + what) {}
};

class InvalidProof : public LedgerError {
public:
    explicit InvalidProof(const std::string& what) : LedgerError("invalid proof: " + what) {}
};

enum class ValidationRule {
    TAG_COUNT,
    TAG_NAME_LENGTH,
    TAG_VALUE_LENGTH,
    ANCHOR_LENGTH,
    TARGET_LENGTH
};

inline const char* validation_rule_name(ValidationRule rule) {
    switch (rule) {
        case ValidationRule::TAG_COUNT:        return "tag count";
        case ValidationRule::TAG_NAME_LENGTH:  return "tag name length";
        case ValidationRule::TAG_VALUE_LENGTH: return "tag value length";
        case ValidationRule::ANCHOR_LENGTH:    return "anchor length";
        case ValidationRule::TARGET_LENGTH:    return "target length";
    }
    return "unknown";
}

class ValidationError : public LedgerError {
public:
    ValidationError(ValidationRule rule, const std::string& what)
        : LedgerError(std::string("invalid data item - ") + validation_rule_name(rule) + ": " + what),
          rule_(rule) {}

    ValidationRule rule() const { return rule_; }

private:
    ValidationRule rule_;
};

// Stream read/seek failure during a pass over a payload.
class IOError : public LedgerError {
public:
    explicit IOError(const std::string& what) : LedgerError("io error: " + what) {}
};

// Failure inside an OpenSSL primitive (key load, keygen, sign).
class CryptoError : public LedgerError {
public:
    explicit CryptoError(const std::string& what) : LedgerError("crypto error: " + what) {}
};

class NetworkError : public LedgerError {
public:
    explicit NetworkError(const std::string& what) : LedgerError("network error: " + what) {}
};

// Gateway answered with a non-success status.
class UploadError : public NetworkError {
public:
    UploadError(int status, const std::string& body)
        : NetworkError("gateway responded " + std::to_string(status) + ": " + body),
          status_(status), body_(body) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

#endif // WEAVEPACK_ERRORS_HPP
