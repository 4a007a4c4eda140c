#include "utilities/digest.hpp"
#include <mutex>
#include <stdexcept>

namespace ctverify {

void ensureSodium() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, []() { ok = sodium_init() >= 0; });
    if (!ok) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

Sha256Hasher::Sha256Hasher() {
    ensureSodium();
    crypto_hash_sha256_init(&state_);
}

void Sha256Hasher::update(const uint8_t *data, size_t size) {
    if (size == 0)
        return;
    crypto_hash_sha256_update(&state_, data, size);
}

DigestArray Sha256Hasher::finalize() {
    DigestArray out{};
    crypto_hash_sha256_final(&state_, out.data());
    crypto_hash_sha256_init(&state_);
    return out;
}

DigestArray Sha256Hasher::digest(const Bytes &data) {
    Sha256Hasher h;
    h.update(data);
    return h.finalize();
}

KeyHash keyHash(const Bytes &derPublicKey) {
    return Sha256Hasher::digest(derPublicKey);
}

} // namespace ctverify
