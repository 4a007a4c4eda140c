#include "utilities/encoding.hpp"
#include "utilities/verify_error.h"
#include <algorithm>
#include <cctype>
#include <cppcodec/base32_rfc4648.hpp>
#include <cppcodec/base64_rfc4648.hpp>
#include <cppcodec/hex_lower.hpp>

namespace ctverify {

std::string toBase64(const uint8_t *data, size_t size) {
    return cppcodec::base64_rfc4648::encode(data, size);
}

Bytes fromBase64(const std::string &text) {
    try {
        return cppcodec::base64_rfc4648::decode(text);
    } catch (const std::exception &e) {
        throw VerifyError(ErrorKind::Encoding, "", "base64 decode", e.what());
    }
}

std::string toBase32Unpadded(const uint8_t *data, size_t size) {
    std::string out = cppcodec::base32_rfc4648::encode(data, size);
    out.erase(std::find(out.begin(), out.end(), '='), out.end());
    return out;
}

std::string toHex(const uint8_t *data, size_t size) {
    return cppcodec::hex_lower::encode(data, size);
}

Bytes fromHex(const std::string &text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    try {
        return cppcodec::hex_lower::decode(lower);
    } catch (const std::exception &e) {
        throw VerifyError(ErrorKind::Encoding, "", "hex decode", e.what());
    }
}

DigestArray digestFromBase64(const std::string &text) {
    Bytes raw = fromBase64(text);
    if (raw.size() != DIGEST_SIZE) {
        throw VerifyError(ErrorKind::Encoding, "", "digest decode",
                          "expected " + std::to_string(DIGEST_SIZE) +
                              " bytes, got " + std::to_string(raw.size()));
    }
    DigestArray out{};
    std::copy(raw.begin(), raw.end(), out.begin());
    return out;
}

} // namespace ctverify
