#include "merkle/merkle_verifier.h"
#include "utilities/encoding.hpp"
#include "utilities/verify_error.h"
#include <bit>

namespace ctverify::merkle {

DigestArray Rfc6962Hasher::hashLeaf(const Bytes &leafData) {
    Sha256Hasher h;
    h.update(kLeafPrefix);
    h.update(leafData);
    return h.finalize();
}

DigestArray Rfc6962Hasher::hashChildren(const DigestArray &left,
                                        const DigestArray &right) {
    Sha256Hasher h;
    h.update(kNodePrefix);
    h.update(left.data(), left.size());
    h.update(right.data(), right.size());
    return h.finalize();
}

DigestArray Rfc6962Hasher::emptyRoot() { return Sha256Hasher::digest(Bytes{}); }

// The path splits into "inner" nodes, below the point where the leaf's
// branch and the tree's right border diverge, and "border" nodes above it.
static void decomposeInclusionProof(uint64_t index, uint64_t size,
                                    uint64_t &inner, uint64_t &border) {
    inner = static_cast<uint64_t>(std::bit_width(index ^ (size - 1)));
    border = static_cast<uint64_t>(std::popcount(index >> inner));
}

uint64_t inclusionProofLength(uint64_t leafIndex, uint64_t treeSize) {
    if (leafIndex >= treeSize)
        return 0;
    uint64_t inner = 0;
    uint64_t border = 0;
    decomposeInclusionProof(leafIndex, treeSize, inner, border);
    return inner + border;
}

DigestArray LogVerifier::rootFromInclusionProof(int64_t leafIndex, int64_t treeSize,
                                                const std::vector<DigestArray> &proof,
                                                const DigestArray &leafHash) {
    if (leafIndex < 0 || treeSize <= 0 || leafIndex >= treeSize) {
        throw VerifyError(ErrorKind::ProofInvalid, "", "inclusion proof",
                          "index " + std::to_string(leafIndex) +
                              " out of range for tree size " +
                              std::to_string(treeSize));
    }
    const auto index = static_cast<uint64_t>(leafIndex);
    uint64_t inner = 0;
    uint64_t border = 0;
    decomposeInclusionProof(index, static_cast<uint64_t>(treeSize), inner, border);
    if (proof.size() != inner + border) {
        throw VerifyError(ErrorKind::ProofInvalid, "", "inclusion proof",
                          "wrong proof size " + std::to_string(proof.size()) +
                              ", want " + std::to_string(inner + border));
    }

    DigestArray node = leafHash;
    for (uint64_t i = 0; i < inner; ++i) {
        if (((index >> i) & 1) == 0)
            node = Rfc6962Hasher::hashChildren(node, proof[i]);
        else
            node = Rfc6962Hasher::hashChildren(proof[i], node);
    }
    for (uint64_t i = inner; i < proof.size(); ++i) {
        node = Rfc6962Hasher::hashChildren(proof[i], node);
    }
    return node;
}

void LogVerifier::verifyInclusionProof(int64_t leafIndex, int64_t treeSize,
                                       const std::vector<DigestArray> &proof,
                                       const DigestArray &rootHash,
                                       const DigestArray &leafHash) {
    DigestArray calculated = rootFromInclusionProof(leafIndex, treeSize, proof, leafHash);
    if (calculated != rootHash) {
        throw VerifyError(ErrorKind::ProofInvalid, "", "inclusion proof",
                          "calculated root " + toHex(calculated) +
                              " does not match expected root " + toHex(rootHash));
    }
}

} // namespace ctverify::merkle
