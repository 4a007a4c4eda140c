#pragma once
#ifndef CTVERIFY_LOG_INFO_H
#define CTVERIFY_LOG_INFO_H

#include "ct/signature_verifier.h"
#include "ct/types.h"
#include "transport/log_client.h"
#include "utilities/request_context.h"
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace ctverify {

class VerifyError;

/**
 * @brief Per-log verification state.
 *
 * Holds the identity of one trusted log (description, DER public key,
 * maximum merge delay), the transport used to reach it, a SignatureVerifier
 * pinned to its key, and the last Signed Tree Head observed from it.
 *
 * Every public member is safe to call concurrently. The cached STH is the
 * only mutable state and is guarded by a reader/writer lock; transport calls
 * are made without holding it.
 */
class LogInfo {
public:
    LogInfo(std::string description, Bytes publicKey, std::chrono::seconds mmd,
            std::unique_ptr<LogClient> client, ct::SignatureVerifier verifier);

    LogInfo(const LogInfo &) = delete;
    LogInfo &operator=(const LogInfo &) = delete;

    const std::string &description() const noexcept { return description_; }
    const Bytes &publicKey() const noexcept { return publicKey_; }
    std::chrono::seconds maximumMergeDelay() const noexcept { return mmd_; }

    /** SHA-256 of the DER public key. */
    const KeyHash &keyHash() const noexcept { return verifier_.keyId(); }

    const ct::SignatureVerifier &verifier() const noexcept { return verifier_; }
    LogClient &client() const noexcept { return *client_; }

    /** Cached tree head, empty until one has been fetched or set. */
    std::optional<ct::SignedTreeHead> lastSTH() const;

    /** Replace the cached tree head unconditionally. */
    void setSTH(const ct::SignedTreeHead &sth);

    /**
     * @brief Check that @p sct was signed by this log over @p leaf.
     *
     * The leaf is stamped with the SCT timestamp before encoding; the caller's
     * copy is untouched.
     * @throws VerifyError (SignatureInvalid) for any failure.
     */
    void verifySCTSignature(const ct::SignedCertificateTimestamp &sct,
                            ct::MerkleTreeLeaf leaf) const;

    /**
     * @brief Verify inclusion against the cached STH, fetching one only when
     * nothing is cached yet.
     * @return Index of the leaf in the log.
     */
    int64_t verifyInclusionLatest(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                                  uint64_t timestamp);

    /**
     * @brief Fetch a fresh STH, cache it and verify inclusion against it.
     *
     * The cache is overwritten even if the new tree is smaller than the
     * cached one.
     * @return Index of the leaf in the log.
     */
    int64_t verifyInclusion(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                            uint64_t timestamp);

    /**
     * @brief Verify inclusion of @p leaf, stamped with @p timestamp, in the
     * tree of @p treeSize leaves with root @p rootHash.
     *
     * @throws VerifyError Encoding if the leaf cannot be encoded, Transport if
     *         the proof cannot be fetched (including an unknown leaf), and
     *         ProofInvalid if the proof does not lead to @p rootHash.
     * @return Index of the leaf reported by the log.
     */
    int64_t verifyInclusionAt(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                              uint64_t timestamp, uint64_t treeSize,
                              const DigestArray &rootHash) const;

    /** Same as verifyInclusionAt for an already computed leaf hash. */
    int64_t verifyInclusionByHash(const RequestContext &ctx, const DigestArray &leafHash,
                                  uint64_t treeSize, const DigestArray &rootHash) const;

    /**
     * @brief Fetch the current STH and cache it.
     * @throws VerifyError Transport or SignatureInvalid; the cache is left
     *         unchanged on failure.
     */
    ct::SignedTreeHead refreshSTH(const RequestContext &ctx);

private:
    [[noreturn]] void fail(const VerifyError &error, const std::string &operation) const;

    const std::string description_;
    const Bytes publicKey_;
    const std::chrono::seconds mmd_;
    std::unique_ptr<LogClient> client_;
    const ct::SignatureVerifier verifier_;

    mutable std::shared_mutex sthMutex_;
    std::optional<ct::SignedTreeHead> sth_;
};

} // namespace ctverify

#endif // CTVERIFY_LOG_INFO_H
