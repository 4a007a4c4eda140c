#pragma once
#ifndef CTVERIFY_CT_TYPES_H
#define CTVERIFY_CT_TYPES_H

#include "utilities/digest.hpp"
#include <cstdint>
#include <optional>

namespace ctverify::ct {

/// Log entry types (RFC 6962 section 3.1).
enum class LogEntryType : uint16_t { X509 = 0, Precert = 1 };

/// Leaf types of a MerkleTreeLeaf.
enum class MerkleLeafType : uint8_t { TimestampedEntry = 0 };

enum class Version : uint8_t { V1 = 0 };

enum class SignatureType : uint8_t { CertificateTimestamp = 0, TreeHash = 1 };

/**
 * @brief TLS DigitallySigned structure (RFC 5246 section 4.7).
 */
struct DigitallySigned {
    enum HashAlgorithm : uint8_t {
        HASH_NONE = 0,
        HASH_MD5 = 1,
        HASH_SHA1 = 2,
        HASH_SHA224 = 3,
        HASH_SHA256 = 4,
        HASH_SHA384 = 5,
        HASH_SHA512 = 6
    };
    enum SignatureAlgorithm : uint8_t {
        SIG_ANONYMOUS = 0,
        SIG_RSA = 1,
        SIG_DSA = 2,
        SIG_ECDSA = 3
    };

    HashAlgorithm hashAlgorithm{HASH_NONE};
    SignatureAlgorithm signatureAlgorithm{SIG_ANONYMOUS};
    Bytes signature;

    bool operator==(const DigitallySigned &other) const {
        return hashAlgorithm == other.hashAlgorithm &&
               signatureAlgorithm == other.signatureAlgorithm &&
               signature == other.signature;
    }
};

/// Pre-certificate entry: issuer key hash and the TBSCertificate.
struct PreCert {
    DigestArray issuerKeyHash{};
    Bytes tbsCertificate;
};

/**
 * @brief Entry as timestamped by the log; the body of a MerkleTreeLeaf.
 *
 * Exactly one of x509Entry / precertEntry is meaningful, selected by
 * entryType.
 */
struct TimestampedEntry {
    uint64_t timestamp{0}; ///< Milliseconds since the epoch.
    LogEntryType entryType{LogEntryType::X509};
    Bytes x509Entry;       ///< DER certificate for X509 entries.
    PreCert precertEntry;  ///< For Precert entries.
    Bytes extensions;
};

struct MerkleTreeLeaf {
    Version version{Version::V1};
    MerkleLeafType leafType{MerkleLeafType::TimestampedEntry};
    TimestampedEntry timestampedEntry;
};

struct SignedCertificateTimestamp {
    Version sctVersion{Version::V1};
    KeyHash logId{};
    uint64_t timestamp{0};
    Bytes extensions;
    DigitallySigned signature;
};

struct SignedTreeHead {
    Version version{Version::V1};
    uint64_t treeSize{0};
    uint64_t timestamp{0};
    DigestArray sha256RootHash{};
    DigitallySigned treeHeadSignature;
    KeyHash logId{};

    bool operator==(const SignedTreeHead &other) const {
        return version == other.version && treeSize == other.treeSize &&
               timestamp == other.timestamp &&
               sha256RootHash == other.sha256RootHash &&
               treeHeadSignature == other.treeHeadSignature &&
               logId == other.logId;
    }
    bool operator!=(const SignedTreeHead &other) const { return !(*this == other); }
};

/// Response of a get-proof-by-hash request.
struct InclusionProof {
    int64_t leafIndex{-1};
    std::vector<DigestArray> auditPath;
};

/** Build an X509 leaf for the given certificate DER. */
MerkleTreeLeaf makeX509Leaf(const Bytes &certDer, uint64_t timestamp = 0);

/** Build a Precert leaf for the given TBSCertificate and issuer key hash. */
MerkleTreeLeaf makePrecertLeaf(const Bytes &tbsCertificate,
                               const DigestArray &issuerKeyHash,
                               uint64_t timestamp = 0);

} // namespace ctverify::ct

#endif // CTVERIFY_CT_TYPES_H
