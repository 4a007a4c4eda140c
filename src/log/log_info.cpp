#include "log/log_info.h"
#include "ct/serialization.h"
#include "merkle/merkle_verifier.h"
#include "utilities/encoding.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/verify_error.h"
#include <mutex>

namespace ctverify {

LogInfo::LogInfo(std::string description, Bytes publicKey, std::chrono::seconds mmd,
                 std::unique_ptr<LogClient> client, ct::SignatureVerifier verifier)
    : description_(std::move(description)), publicKey_(std::move(publicKey)), mmd_(mmd),
      client_(std::move(client)), verifier_(std::move(verifier)) {
    if (!client_) {
        throw VerifyError(ErrorKind::LogConfig, description_, "create log state",
                          "no transport client");
    }
}

std::optional<ct::SignedTreeHead> LogInfo::lastSTH() const {
    std::shared_lock<std::shared_mutex> lock(sthMutex_);
    return sth_;
}

void LogInfo::setSTH(const ct::SignedTreeHead &sth) {
    {
        std::unique_lock<std::shared_mutex> lock(sthMutex_);
        sth_ = sth;
    }
    MetricsRegistry::instance().setGauge("ctverify_tree_size",
                                         static_cast<double>(sth.treeSize),
                                         {{"log", description_}});
    Logger::getInstance().log(LogLevel::DEBUG, "Cached tree head",
                              {{"log", description_},
                               {"tree_size", std::to_string(sth.treeSize)},
                               {"timestamp", std::to_string(sth.timestamp)}});
}

void LogInfo::fail(const VerifyError &error, const std::string &operation) const {
    MetricsRegistry::instance().incrementCounter(
        "ctverify_verification_failures", 1.0,
        {{"log", description_}, {"kind", errorKindToString(error.kind())}});
    Logger::getInstance().log(error.isLogMisbehaviour() ? LogLevel::ERROR : LogLevel::WARN,
                              operation + " failed",
                              {{"log", description_},
                               {"kind", errorKindToString(error.kind())},
                               {"error", error.what()}});
    throw error.withLog(description_);
}

void LogInfo::verifySCTSignature(const ct::SignedCertificateTimestamp &sct,
                                 ct::MerkleTreeLeaf leaf) const {
    leaf.timestampedEntry.timestamp = sct.timestamp;
    try {
        verifier_.verifySCTSignature(sct, leaf);
    } catch (const VerifyError &e) {
        if (e.kind() == ErrorKind::SignatureInvalid)
            fail(e, "SCT signature check");
        fail(VerifyError(ErrorKind::SignatureInvalid, description_, "verify SCT signature",
                         e.what()),
             "SCT signature check");
    }
}

ct::SignedTreeHead LogInfo::refreshSTH(const RequestContext &ctx) {
    MetricsRegistry::instance().incrementCounter("ctverify_sth_fetches", 1.0,
                                                 {{"log", description_}});
    Logger::getInstance().log(LogLevel::DEBUG, "Fetching tree head",
                              {{"log", description_}, {"endpoint", client_->endpoint()}});
    ct::SignedTreeHead sth;
    try {
        sth = client_->getSTH(ctx);
    } catch (const VerifyError &e) {
        fail(e, "get-sth");
    } catch (const std::exception &e) {
        fail(VerifyError(ErrorKind::Transport, description_, "get-sth", e.what()),
             "get-sth");
    }
    setSTH(sth);
    return sth;
}

int64_t LogInfo::verifyInclusionLatest(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                                       uint64_t timestamp) {
    std::optional<ct::SignedTreeHead> sth = lastSTH();
    if (sth) {
        MetricsRegistry::instance().incrementCounter("ctverify_sth_cache_hits", 1.0,
                                                     {{"log", description_}});
    } else {
        sth = refreshSTH(ctx);
    }
    return verifyInclusionAt(ctx, std::move(leaf), timestamp, sth->treeSize,
                             sth->sha256RootHash);
}

int64_t LogInfo::verifyInclusion(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                                 uint64_t timestamp) {
    ct::SignedTreeHead sth = refreshSTH(ctx);
    return verifyInclusionAt(ctx, std::move(leaf), timestamp, sth.treeSize,
                             sth.sha256RootHash);
}

int64_t LogInfo::verifyInclusionAt(const RequestContext &ctx, ct::MerkleTreeLeaf leaf,
                                   uint64_t timestamp, uint64_t treeSize,
                                   const DigestArray &rootHash) const {
    leaf.timestampedEntry.timestamp = timestamp;
    DigestArray leafHash{};
    try {
        leafHash = ct::leafHashForLeaf(leaf);
    } catch (const VerifyError &e) {
        fail(e, "leaf hash");
    }
    return verifyInclusionByHash(ctx, leafHash, treeSize, rootHash);
}

int64_t LogInfo::verifyInclusionByHash(const RequestContext &ctx,
                                       const DigestArray &leafHash, uint64_t treeSize,
                                       const DigestArray &rootHash) const {
    MetricsRegistry::instance().incrementCounter("ctverify_inclusion_checks", 1.0,
                                                 {{"log", description_}});
    ct::InclusionProof proof;
    try {
        proof = client_->getProofByHash(ctx, leafHash, treeSize);
    } catch (const VerifyError &e) {
        if (e.kind() == ErrorKind::Transport)
            fail(e, "get-proof-by-hash");
        fail(VerifyError(ErrorKind::Transport, description_, "get-proof-by-hash",
                         e.what()),
             "get-proof-by-hash");
    } catch (const std::exception &e) {
        fail(VerifyError(ErrorKind::Transport, description_, "get-proof-by-hash",
                         e.what()),
             "get-proof-by-hash");
    }

    try {
        merkle::LogVerifier::verifyInclusionProof(proof.leafIndex,
                                                  static_cast<int64_t>(treeSize),
                                                  proof.auditPath, rootHash, leafHash);
    } catch (const VerifyError &e) {
        fail(e, "inclusion proof check");
    }

    Logger::getInstance().log(LogLevel::DEBUG, "Inclusion verified",
                              {{"log", description_},
                               {"leaf_hash", toHex(leafHash)},
                               {"leaf_index", std::to_string(proof.leafIndex)},
                               {"tree_size", std::to_string(treeSize)}});
    return proof.leafIndex;
}

} // namespace ctverify
