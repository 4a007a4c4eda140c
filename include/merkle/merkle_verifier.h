#ifndef CTVERIFY_MERKLE_VERIFIER_H
#define CTVERIFY_MERKLE_VERIFIER_H

#include "utilities/digest.hpp"
#include <cstdint>
#include <vector>

namespace ctverify::merkle {

/**
 * @brief RFC 6962 tree hashing with domain separation between leaves
 * (prefix 0x00) and interior nodes (prefix 0x01).
 */
class Rfc6962Hasher {
public:
    static constexpr uint8_t kLeafPrefix = 0x00;
    static constexpr uint8_t kNodePrefix = 0x01;

    static DigestArray hashLeaf(const Bytes &leafData);
    static DigestArray hashChildren(const DigestArray &left, const DigestArray &right);
    /** Root of the empty tree: SHA-256 of the empty string. */
    static DigestArray emptyRoot();
};

/**
 * @brief Number of nodes in the audit path of @p leafIndex in a tree of
 * @p treeSize leaves.
 *
 * Requires leafIndex < treeSize.
 */
uint64_t inclusionProofLength(uint64_t leafIndex, uint64_t treeSize);

/**
 * @brief Verifies Merkle audit paths against a tree head.
 */
class LogVerifier {
public:
    /**
     * @brief Recompute the root hash from an audit path.
     * @throws VerifyError (ProofInvalid) if the index is out of range or the
     *         path has the wrong length for (leafIndex, treeSize).
     */
    static DigestArray rootFromInclusionProof(int64_t leafIndex, int64_t treeSize,
                                              const std::vector<DigestArray> &proof,
                                              const DigestArray &leafHash);

    /**
     * @brief Check that @p leafHash sits at @p leafIndex of the tree with
     * @p rootHash.
     * @throws VerifyError (ProofInvalid) on any mismatch.
     */
    static void verifyInclusionProof(int64_t leafIndex, int64_t treeSize,
                                     const std::vector<DigestArray> &proof,
                                     const DigestArray &rootHash,
                                     const DigestArray &leafHash);
};

} // namespace ctverify::merkle

#endif // CTVERIFY_MERKLE_VERIFIER_H
