#ifndef CTVERIFY_ENCODING_HPP
#define CTVERIFY_ENCODING_HPP

#include "utilities/digest.hpp"
#include <string>

namespace ctverify {

std::string toBase64(const uint8_t *data, size_t size);
inline std::string toBase64(const Bytes &data) {
    return toBase64(data.data(), data.size());
}

/**
 * @brief Decode standard (RFC 4648) base64.
 * @throws VerifyError (Encoding) on malformed input.
 */
Bytes fromBase64(const std::string &text);

/** Unpadded base32 (RFC 4648 alphabet), as used in DNS labels. */
std::string toBase32Unpadded(const uint8_t *data, size_t size);

std::string toHex(const uint8_t *data, size_t size);
template <size_t N> std::string toHex(const std::array<uint8_t, N> &a) {
    return toHex(a.data(), a.size());
}

/**
 * @brief Decode a lower or upper case hex string.
 * @throws VerifyError (Encoding) on malformed input.
 */
Bytes fromHex(const std::string &text);

/**
 * @brief Decode exactly DIGEST_SIZE base64 bytes.
 * @throws VerifyError (Encoding) if the length is wrong.
 */
DigestArray digestFromBase64(const std::string &text);

} // namespace ctverify

#endif // CTVERIFY_ENCODING_HPP
