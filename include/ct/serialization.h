#pragma once
#ifndef CTVERIFY_CT_SERIALIZATION_H
#define CTVERIFY_CT_SERIALIZATION_H

#include "ct/types.h"

namespace ctverify::ct {

/**
 * Canonical TLS encodings of CT v1 structures (RFC 6962 section 3).
 *
 * Every encoder throws VerifyError with ErrorKind::Encoding when a field
 * does not fit its TLS length prefix or an enum holds an unknown value.
 */

/** TLS encoding of a MerkleTreeLeaf, the input of the leaf hash. */
Bytes serializeMerkleTreeLeaf(const MerkleTreeLeaf &leaf);

/** RFC 6962 leaf hash: SHA-256(0x00 || serializeMerkleTreeLeaf(leaf)). */
DigestArray leafHashForLeaf(const MerkleTreeLeaf &leaf);

/**
 * @brief Data covered by an SCT signature.
 *
 * Entry type and signed entry come from @p leaf; timestamp and extensions
 * from @p sct.
 */
Bytes serializeSCTSignatureInput(const SignedCertificateTimestamp &sct,
                                 const MerkleTreeLeaf &leaf);

/** Data covered by an STH signature. */
Bytes serializeSTHSignatureInput(const SignedTreeHead &sth);

Bytes encodeDigitallySigned(const DigitallySigned &ds);

/**
 * @brief Parse a TLS DigitallySigned structure.
 *
 * The whole input must be consumed. Unknown hash or signature algorithms
 * are rejected.
 */
DigitallySigned decodeDigitallySigned(const Bytes &data);

} // namespace ctverify::ct

#endif // CTVERIFY_CT_SERIALIZATION_H
