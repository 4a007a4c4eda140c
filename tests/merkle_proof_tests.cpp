#include <gtest/gtest.h>
#include "merkle/merkle_verifier.h"
#include "mocks/fake_log_client.h"
#include "utilities/encoding.hpp"
#include "utilities/verify_error.h"
#include <functional>

using namespace ctverify;
using merkle::LogVerifier;
using merkle::Rfc6962Hasher;

namespace {

// Leaf inputs of the RFC 6962 reference tree.
std::vector<Bytes> referenceLeaves() {
    return {{},
            {0x00},
            {0x10},
            {0x20, 0x21},
            {0x30, 0x31},
            {0x40, 0x41, 0x42, 0x43},
            {0x50, 0x51, 0x52, 0x53, 0x54, 0x55, 0x56, 0x57},
            {0x60, 0x61, 0x62, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69, 0x6a, 0x6b,
             0x6c, 0x6d, 0x6e, 0x6f}};
}

std::shared_ptr<FakeLog> referenceTree(size_t leaves) {
    auto log = std::make_shared<FakeLog>();
    auto data = referenceLeaves();
    for (size_t i = 0; i < leaves; ++i)
        log->addLeafHash(Rfc6962Hasher::hashLeaf(data[i % data.size()]));
    return log;
}

ErrorKind kindOf(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const VerifyError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "no VerifyError thrown";
    return ErrorKind::LogConfig;
}

} // namespace

TEST(MerkleVerifier, HasherMatchesReferenceVectors) {
    EXPECT_EQ(toHex(Rfc6962Hasher::emptyRoot()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(toHex(Rfc6962Hasher::hashLeaf({})),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");

    auto log = referenceTree(8);
    EXPECT_EQ(toHex(log->root(1)),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
    EXPECT_EQ(toHex(log->root(8)),
              "5dc9da79a70659a9ad559cb701ded9a2ab9d823aad2f4960cfe370eff4604328");
}

TEST(MerkleVerifier, ProofLength) {
    EXPECT_EQ(merkle::inclusionProofLength(0, 1), 0u);
    EXPECT_EQ(merkle::inclusionProofLength(0, 8), 3u);
    EXPECT_EQ(merkle::inclusionProofLength(5, 10), 4u);
    EXPECT_EQ(merkle::inclusionProofLength(8, 9), 1u);
    EXPECT_EQ(merkle::inclusionProofLength(9, 9), 0u);
}

TEST(MerkleVerifier, GenuinePathsVerifyForEveryLeaf) {
    auto log = referenceTree(17);
    for (uint64_t size = 1; size <= 17; ++size) {
        DigestArray root = log->root(size);
        for (uint64_t index = 0; index < size; ++index) {
            auto path = log->auditPath(index, size);
            EXPECT_EQ(path.size(), merkle::inclusionProofLength(index, size));
            DigestArray leaf = Rfc6962Hasher::hashLeaf(referenceLeaves()[index % 8]);
            EXPECT_NO_THROW(LogVerifier::verifyInclusionProof(
                static_cast<int64_t>(index), static_cast<int64_t>(size), path, root, leaf))
                << "index " << index << " size " << size;
        }
    }
}

TEST(MerkleVerifier, CorruptedRootOrPathIsProofInvalid) {
    auto log = referenceTree(10);
    DigestArray root = log->root(10);
    DigestArray leaf = Rfc6962Hasher::hashLeaf(referenceLeaves()[5]);
    auto path = log->auditPath(5, 10);
    ASSERT_NO_THROW(LogVerifier::verifyInclusionProof(5, 10, path, root, leaf));

    for (size_t b = 0; b < root.size(); ++b) {
        DigestArray bad = root;
        bad[b] ^= 0x80;
        EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(5, 10, path, bad, leaf); }),
                  ErrorKind::ProofInvalid);
    }
    for (size_t i = 0; i < path.size(); ++i) {
        auto bad = path;
        bad[i][0] ^= 0x01;
        EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(5, 10, bad, root, leaf); }),
                  ErrorKind::ProofInvalid);
    }
}

TEST(MerkleVerifier, WrongShapeIsProofInvalid) {
    auto log = referenceTree(10);
    DigestArray root = log->root(10);
    DigestArray leaf = Rfc6962Hasher::hashLeaf(referenceLeaves()[5]);
    auto path = log->auditPath(5, 10);

    auto longer = path;
    longer.push_back(root);
    EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(5, 10, longer, root, leaf); }),
              ErrorKind::ProofInvalid);
    // Path of the 8-leaf tree checked against the 10-leaf root.
    EXPECT_EQ(kindOf([&] {
                  LogVerifier::verifyInclusionProof(5, 10, log->auditPath(5, 8), root, leaf);
              }),
              ErrorKind::ProofInvalid);
    EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(10, 10, path, root, leaf); }),
              ErrorKind::ProofInvalid);
    EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(-1, 10, path, root, leaf); }),
              ErrorKind::ProofInvalid);
    EXPECT_EQ(kindOf([&] { LogVerifier::verifyInclusionProof(0, 0, {}, root, leaf); }),
              ErrorKind::ProofInvalid);
}
