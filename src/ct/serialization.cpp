#include "ct/serialization.h"
#include "merkle/merkle_verifier.h"
#include "utilities/verify_error.h"

namespace ctverify::ct {

namespace {

// Field widths in bytes.
const size_t kVersionLength = 1;
const size_t kSignatureTypeLength = 1;
const size_t kTimestampLength = 8;
const size_t kSignedEntryTypeLength = 2;
const size_t kAsn1CertificateLengthBytes = 3;
const size_t kTbsCertificateLengthBytes = 3;
const size_t kExtensionsLengthBytes = 2;
const size_t kMerkleLeafTypeLength = 1;
const size_t kTreeSizeLength = 8;
const size_t kHashAlgorithmLength = 1;
const size_t kSigAlgorithmLength = 1;
const size_t kSignatureLengthBytes = 2;

[[noreturn]] void encodingFailure(const std::string &what) {
    throw VerifyError(ErrorKind::Encoding, "", "TLS encoding", what);
}

// Big-endian, |length| bytes wide.
void writeUint(size_t length, uint64_t value, Bytes &out) {
    for (; length > 0; --length) {
        out.push_back(static_cast<uint8_t>((value >> ((length - 1) * 8)) & 0xFF));
    }
}

void writeVariableBytes(size_t prefixLength, const Bytes &data, Bytes &out,
                        const char *field) {
    const uint64_t max = (uint64_t{1} << (prefixLength * 8)) - 1;
    if (data.size() > max) {
        encodingFailure(std::string(field) + " exceeds " +
                        std::to_string(max) + " bytes");
    }
    writeUint(prefixLength, data.size(), out);
    out.insert(out.end(), data.begin(), data.end());
}

void writeSignedEntry(const TimestampedEntry &entry, Bytes &out) {
    writeUint(kSignedEntryTypeLength, static_cast<uint16_t>(entry.entryType), out);
    switch (entry.entryType) {
    case LogEntryType::X509:
        if (entry.x509Entry.empty())
            encodingFailure("empty X509 certificate");
        writeVariableBytes(kAsn1CertificateLengthBytes, entry.x509Entry, out,
                           "certificate");
        return;
    case LogEntryType::Precert:
        if (entry.precertEntry.tbsCertificate.empty())
            encodingFailure("empty TBSCertificate");
        out.insert(out.end(), entry.precertEntry.issuerKeyHash.begin(),
                   entry.precertEntry.issuerKeyHash.end());
        writeVariableBytes(kTbsCertificateLengthBytes,
                           entry.precertEntry.tbsCertificate, out,
                           "TBSCertificate");
        return;
    }
    encodingFailure("unknown entry type " +
                    std::to_string(static_cast<uint16_t>(entry.entryType)));
}

uint64_t readUint(size_t length, const Bytes &in, size_t &pos) {
    if (in.size() - pos < length)
        encodingFailure("truncated integer");
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | in[pos++];
    }
    return value;
}

} // namespace

Bytes serializeMerkleTreeLeaf(const MerkleTreeLeaf &leaf) {
    if (leaf.version != Version::V1)
        encodingFailure("unsupported leaf version");
    if (leaf.leafType != MerkleLeafType::TimestampedEntry)
        encodingFailure("unsupported leaf type");

    Bytes out;
    writeUint(kVersionLength, static_cast<uint8_t>(leaf.version), out);
    writeUint(kMerkleLeafTypeLength, static_cast<uint8_t>(leaf.leafType), out);
    writeUint(kTimestampLength, leaf.timestampedEntry.timestamp, out);
    writeSignedEntry(leaf.timestampedEntry, out);
    writeVariableBytes(kExtensionsLengthBytes, leaf.timestampedEntry.extensions,
                       out, "extensions");
    return out;
}

DigestArray leafHashForLeaf(const MerkleTreeLeaf &leaf) {
    return merkle::Rfc6962Hasher::hashLeaf(serializeMerkleTreeLeaf(leaf));
}

Bytes serializeSCTSignatureInput(const SignedCertificateTimestamp &sct,
                                 const MerkleTreeLeaf &leaf) {
    if (sct.sctVersion != Version::V1)
        encodingFailure("unsupported SCT version");

    Bytes out;
    writeUint(kVersionLength, static_cast<uint8_t>(sct.sctVersion), out);
    writeUint(kSignatureTypeLength,
              static_cast<uint8_t>(SignatureType::CertificateTimestamp), out);
    writeUint(kTimestampLength, sct.timestamp, out);
    writeSignedEntry(leaf.timestampedEntry, out);
    writeVariableBytes(kExtensionsLengthBytes, sct.extensions, out,
                       "SCT extensions");
    return out;
}

Bytes serializeSTHSignatureInput(const SignedTreeHead &sth) {
    if (sth.version != Version::V1)
        encodingFailure("unsupported STH version");

    Bytes out;
    writeUint(kVersionLength, static_cast<uint8_t>(sth.version), out);
    writeUint(kSignatureTypeLength, static_cast<uint8_t>(SignatureType::TreeHash),
              out);
    writeUint(kTimestampLength, sth.timestamp, out);
    writeUint(kTreeSizeLength, sth.treeSize, out);
    out.insert(out.end(), sth.sha256RootHash.begin(), sth.sha256RootHash.end());
    return out;
}

Bytes encodeDigitallySigned(const DigitallySigned &ds) {
    Bytes out;
    writeUint(kHashAlgorithmLength, ds.hashAlgorithm, out);
    writeUint(kSigAlgorithmLength, ds.signatureAlgorithm, out);
    writeVariableBytes(kSignatureLengthBytes, ds.signature, out, "signature");
    return out;
}

DigitallySigned decodeDigitallySigned(const Bytes &data) {
    size_t pos = 0;
    DigitallySigned ds;
    uint64_t hash = readUint(kHashAlgorithmLength, data, pos);
    if (hash > DigitallySigned::HASH_SHA512)
        encodingFailure("unknown hash algorithm " + std::to_string(hash));
    uint64_t sig = readUint(kSigAlgorithmLength, data, pos);
    if (sig > DigitallySigned::SIG_ECDSA)
        encodingFailure("unknown signature algorithm " + std::to_string(sig));
    uint64_t length = readUint(kSignatureLengthBytes, data, pos);
    if (data.size() - pos != length)
        encodingFailure("signature length mismatch");

    ds.hashAlgorithm = static_cast<DigitallySigned::HashAlgorithm>(hash);
    ds.signatureAlgorithm = static_cast<DigitallySigned::SignatureAlgorithm>(sig);
    ds.signature.assign(data.begin() + static_cast<std::ptrdiff_t>(pos), data.end());
    return ds;
}

MerkleTreeLeaf makeX509Leaf(const Bytes &certDer, uint64_t timestamp) {
    MerkleTreeLeaf leaf;
    leaf.timestampedEntry.timestamp = timestamp;
    leaf.timestampedEntry.entryType = LogEntryType::X509;
    leaf.timestampedEntry.x509Entry = certDer;
    return leaf;
}

MerkleTreeLeaf makePrecertLeaf(const Bytes &tbsCertificate,
                               const DigestArray &issuerKeyHash,
                               uint64_t timestamp) {
    MerkleTreeLeaf leaf;
    leaf.timestampedEntry.timestamp = timestamp;
    leaf.timestampedEntry.entryType = LogEntryType::Precert;
    leaf.timestampedEntry.precertEntry.issuerKeyHash = issuerKeyHash;
    leaf.timestampedEntry.precertEntry.tbsCertificate = tbsCertificate;
    return leaf;
}

} // namespace ctverify::ct
