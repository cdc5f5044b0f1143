#ifndef WEAVEPACK_BASE64_HPP
#define WEAVEPACK_BASE64_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <array>

namespace Base64 {

/**
 * @brief Unpadded base64url (RFC 4648 section 5) as used for ids, owners and roots.
 */
std::string url_encode(const uint8_t* data, size_t size);
std::string url_encode(const std::vector<uint8_t>& data);

template <size_t N>
std::string url_encode(const std::array<uint8_t, N>& data) {
    return url_encode(data.data(), data.size());
}

/**
 * @brief Decodes unpadded (or padded) base64url.
 * @throws FormatError on characters outside the alphabet or impossible lengths.
 */
std::vector<uint8_t> url_decode(const std::string& text);

} // namespace Base64

#endif // WEAVEPACK_BASE64_HPP
