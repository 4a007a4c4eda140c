#ifndef CTVERIFY_DIGEST_HPP
#define CTVERIFY_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>
#include <vector>

namespace ctverify {

/// Digest size of SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;
using Bytes = std::vector<uint8_t>;

/// SHA-256 of a log's DER public key; identifies the log.
using KeyHash = DigestArray;

/**
 * @brief Incremental SHA-256 built on libsodium.
 */
class Sha256Hasher {
public:
    Sha256Hasher();

    void update(const uint8_t *data, size_t size);
    void update(const Bytes &data) { update(data.data(), data.size()); }
    void update(uint8_t byte) { update(&byte, 1); }

    /** Finish the hash. The hasher is reset and may be reused. */
    DigestArray finalize();

    static DigestArray digest(const Bytes &data);

private:
    crypto_hash_sha256_state state_;
};

/** Initialise libsodium once per process. Throws std::runtime_error on failure. */
void ensureSodium();

/** Key hash (SHA-256) of a DER encoded public key. */
KeyHash keyHash(const Bytes &derPublicKey);

} // namespace ctverify

#endif // CTVERIFY_DIGEST_HPP
