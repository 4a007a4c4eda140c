#pragma once
#ifndef TESTS_MOCKS_FAKE_LOG_CLIENT_H
#define TESTS_MOCKS_FAKE_LOG_CLIENT_H

#include "ct/signature_verifier.h"
#include "merkle/merkle_verifier.h"
#include "mocks/test_log_key.h"
#include "transport/log_client.h"
#include "utilities/verify_error.h"
#include <atomic>
#include <gmock/gmock.h>
#include <mutex>
#include <optional>

/**
 * @brief In-memory CT log: a real RFC 6962 tree signed by a TestLogKey.
 *
 * Shared between the test and any number of FakeLogClient instances so the
 * test can grow the tree and inspect request counters after handing a client
 * to the code under test.
 */
class FakeLog {
public:
    explicit FakeLog(TestLogKey::Type type = TestLogKey::Type::EcP256) : key(type) {}

    TestLogKey key;
    std::atomic<int> sthFetches{0};
    std::atomic<int> proofFetches{0};

    /** Serve audit paths computed for this size instead of the requested one. */
    std::optional<uint64_t> proofSizeOverride;
    /** Flip a byte of every served STH signature. */
    bool corruptSTHSignature = false;
    uint64_t sthTimestamp = 1700000000000;

    uint64_t addLeafHash(const ctverify::DigestArray &hash) {
        std::lock_guard<std::mutex> lock(mtx_);
        leaves_.push_back(hash);
        return leaves_.size() - 1;
    }

    uint64_t addLeaf(const ctverify::ct::MerkleTreeLeaf &leaf) {
        return addLeafHash(ctverify::ct::leafHashForLeaf(leaf));
    }

    /** Add @p count leaves with distinct filler certificates. */
    void addFillerLeaves(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            ctverify::Bytes cert{0x30, 0x03, static_cast<uint8_t>(i & 0xFF),
                                 static_cast<uint8_t>(i >> 8), 0x01};
            addLeaf(ctverify::ct::makeX509Leaf(cert, 1000 + i));
        }
    }

    uint64_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return leaves_.size();
    }

    ctverify::DigestArray root(uint64_t size) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return rootOf(0, size);
    }

    std::vector<ctverify::DigestArray> auditPath(uint64_t index, uint64_t size) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return pathOf(index, 0, size);
    }

    ctverify::ct::SignedTreeHead currentSTH() const {
        uint64_t n = size();
        ctverify::ct::SignedTreeHead sth = key.signSTH(n, sthTimestamp, root(n));
        if (corruptSTHSignature)
            sth.treeHeadSignature.signature[4] ^= 0x01;
        return sth;
    }

    std::optional<uint64_t> indexOf(const ctverify::DigestArray &hash, uint64_t size) const {
        std::lock_guard<std::mutex> lock(mtx_);
        for (uint64_t i = 0; i < size && i < leaves_.size(); ++i) {
            if (leaves_[i] == hash)
                return i;
        }
        return std::nullopt;
    }

private:
    static uint64_t splitPoint(uint64_t n) {
        uint64_t k = 1;
        while (k << 1 < n)
            k <<= 1;
        return k;
    }

    ctverify::DigestArray rootOf(uint64_t begin, uint64_t end) const {
        uint64_t n = end - begin;
        if (n == 0)
            return ctverify::merkle::Rfc6962Hasher::emptyRoot();
        if (n == 1)
            return leaves_[begin];
        uint64_t k = splitPoint(n);
        return ctverify::merkle::Rfc6962Hasher::hashChildren(rootOf(begin, begin + k),
                                                             rootOf(begin + k, end));
    }

    std::vector<ctverify::DigestArray> pathOf(uint64_t index, uint64_t begin,
                                              uint64_t end) const {
        uint64_t n = end - begin;
        if (n <= 1)
            return {};
        uint64_t k = splitPoint(n);
        std::vector<ctverify::DigestArray> path;
        if (index < k) {
            path = pathOf(index, begin, begin + k);
            path.push_back(rootOf(begin + k, end));
        } else {
            path = pathOf(index - k, begin + k, end);
            path.push_back(rootOf(begin, begin + k));
        }
        return path;
    }

    mutable std::mutex mtx_;
    std::vector<ctverify::DigestArray> leaves_;
};

/**
 * @brief LogClient serving a FakeLog.
 *
 * Behaves like the real transports: checks the request context first,
 * verifies tree head signatures against the pinned key and reports an
 * unknown leaf as a Transport error.
 */
class FakeLogClient : public ctverify::LogClient {
public:
    explicit FakeLogClient(std::shared_ptr<FakeLog> log)
        : log_(std::move(log)), verifier_(log_->key.publicKeyDer()) {}

    ctverify::ct::SignedTreeHead getSTH(const ctverify::RequestContext &ctx) override {
        ctx.throwIfDone("get-sth");
        ++log_->sthFetches;
        ctverify::ct::SignedTreeHead sth = log_->currentSTH();
        verifier_.verifySTHSignature(sth);
        return sth;
    }

    ctverify::ct::InclusionProof getProofByHash(const ctverify::RequestContext &ctx,
                                                const ctverify::DigestArray &leafHash,
                                                uint64_t treeSize) override {
        ctx.throwIfDone("get-proof-by-hash");
        ++log_->proofFetches;
        std::optional<uint64_t> index = log_->indexOf(leafHash, treeSize);
        if (!index) {
            throw ctverify::VerifyError(ctverify::ErrorKind::Transport, "",
                                        "get-proof-by-hash", "leaf not found");
        }
        ctverify::ct::InclusionProof proof;
        proof.leafIndex = static_cast<int64_t>(*index);
        proof.auditPath =
            log_->auditPath(*index, log_->proofSizeOverride.value_or(treeSize));
        return proof;
    }

    std::string endpoint() const override { return "fake://log"; }

private:
    std::shared_ptr<FakeLog> log_;
    ctverify::ct::SignatureVerifier verifier_;
};

/** Scripted LogClient for error injection. */
class MockLogClient : public ctverify::LogClient {
public:
    MOCK_METHOD(ctverify::ct::SignedTreeHead, getSTH, (const ctverify::RequestContext &ctx),
                (override));
    MOCK_METHOD(ctverify::ct::InclusionProof, getProofByHash,
                (const ctverify::RequestContext &ctx, const ctverify::DigestArray &leafHash,
                 uint64_t treeSize),
                (override));
    MOCK_METHOD(std::string, endpoint, (), (const, override));
};

#endif // TESTS_MOCKS_FAKE_LOG_CLIENT_H
