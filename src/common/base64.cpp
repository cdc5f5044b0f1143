#include "common/base64.hpp"
#include "common/errors.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace Base64 {

std::string url_encode(const uint8_t* data, size_t size) {
    if (size == 0) {
        return "";
    }
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(size));
    out.resize(written);

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::string url_encode(const std::vector<uint8_t>& data) {
    return url_encode(data.data(), data.size());
}

std::vector<uint8_t> url_decode(const std::string& text) {
    std::string padded = text;
    while (!padded.empty() && padded.back() == '=') {
        padded.pop_back();
    }
    if (padded.empty()) {
        return {};
    }
    for (char& c : padded) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/') {
            throw FormatError("invalid base64url character");
        }
    }
    if (padded.size() % 4 == 1) {
        throw FormatError("invalid base64url length");
    }
    size_t pad = (4 - padded.size() % 4) % 4;
    padded.append(pad, '=');

    std::vector<uint8_t> out(padded.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (written < 0) {
        throw FormatError("invalid base64url input");
    }
    // EVP_DecodeBlock counts the padding positions as zero bytes
    out.resize(static_cast<size_t>(written) - pad);
    return out;
}

} // namespace Base64
