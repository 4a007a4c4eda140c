#pragma once
#ifndef CTVERIFY_SIGNATURE_VERIFIER_H
#define CTVERIFY_SIGNATURE_VERIFIER_H

#include "ct/types.h"
#include <memory>
#include <openssl/evp.h>

namespace ctverify::ct {

/**
 * @brief Verifies log signatures with one pinned public key.
 *
 * Accepts ECDSA keys and RSA keys of at least 2048 bits; signatures must use
 * SHA-256 and the signature algorithm matching the key type. Instances are
 * immutable and may be shared across threads.
 */
class SignatureVerifier {
public:
    /**
     * @brief Build a verifier from a DER SubjectPublicKeyInfo.
     * @throws VerifyError (LogConfig) if the key cannot be parsed or is of an
     *         unsupported type.
     */
    explicit SignatureVerifier(const Bytes &derPublicKey);

    /**
     * @brief Check @p signature over @p data.
     * @throws VerifyError (SignatureInvalid) on failure.
     */
    void verifySignature(const Bytes &data, const DigitallySigned &signature) const;

    /**
     * @brief Check an SCT signature over @p leaf as timestamped by @p sct.
     *
     * The leaf's own timestamp is ignored; the SCT timestamp is what the log
     * signed.
     * @throws VerifyError (Encoding) if the leaf cannot be encoded,
     *         (SignatureInvalid) if the signature does not verify.
     */
    void verifySCTSignature(const SignedCertificateTimestamp &sct,
                            const MerkleTreeLeaf &leaf) const;

    /** @throws VerifyError (SignatureInvalid) if the STH signature is bad. */
    void verifySTHSignature(const SignedTreeHead &sth) const;

    DigitallySigned::SignatureAlgorithm signatureAlgorithm() const noexcept {
        return algorithm_;
    }

    const KeyHash &keyId() const noexcept { return keyId_; }

private:
    std::shared_ptr<EVP_PKEY> key_;
    DigitallySigned::SignatureAlgorithm algorithm_;
    KeyHash keyId_;
};

} // namespace ctverify::ct

#endif // CTVERIFY_SIGNATURE_VERIFIER_H
