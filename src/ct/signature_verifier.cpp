#include "ct/signature_verifier.h"
#include "ct/serialization.h"
#include "utilities/verify_error.h"
#include <new>
#include <openssl/err.h>
#include <openssl/x509.h>

namespace ctverify::ct {

namespace {

const int kMinRsaKeyBits = 2048;

std::string opensslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0)
        return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

SignatureVerifier::SignatureVerifier(const Bytes &derPublicKey)
    : keyId_(keyHash(derPublicKey)) {
    const unsigned char *ptr = derPublicKey.data();
    EVP_PKEY *raw = d2i_PUBKEY(nullptr, &ptr, static_cast<long>(derPublicKey.size()));
    if (!raw) {
        throw VerifyError(ErrorKind::LogConfig, "", "parse public key", opensslError());
    }
    key_.reset(raw, EVP_PKEY_free);
    if (ptr != derPublicKey.data() + derPublicKey.size()) {
        throw VerifyError(ErrorKind::LogConfig, "", "parse public key",
                          "trailing data after SubjectPublicKeyInfo");
    }

    switch (EVP_PKEY_base_id(raw)) {
    case EVP_PKEY_EC:
        algorithm_ = DigitallySigned::SIG_ECDSA;
        break;
    case EVP_PKEY_RSA:
        if (EVP_PKEY_bits(raw) < kMinRsaKeyBits) {
            throw VerifyError(ErrorKind::LogConfig, "", "parse public key",
                              "RSA key too small: " +
                                  std::to_string(EVP_PKEY_bits(raw)) + " bits");
        }
        algorithm_ = DigitallySigned::SIG_RSA;
        break;
    default:
        throw VerifyError(ErrorKind::LogConfig, "", "parse public key",
                          "unsupported key type " +
                              std::to_string(EVP_PKEY_base_id(raw)));
    }
}

void SignatureVerifier::verifySignature(const Bytes &data,
                                        const DigitallySigned &signature) const {
    if (signature.hashAlgorithm != DigitallySigned::HASH_SHA256) {
        throw VerifyError(ErrorKind::SignatureInvalid, "", "verify signature",
                          "unsupported hash algorithm " +
                              std::to_string(signature.hashAlgorithm));
    }
    if (signature.signatureAlgorithm != algorithm_) {
        throw VerifyError(ErrorKind::SignatureInvalid, "", "verify signature",
                          "signature algorithm " +
                              std::to_string(signature.signatureAlgorithm) +
                              " does not match key type");
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::bad_alloc();
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1) {
        throw VerifyError(ErrorKind::SignatureInvalid, "", "verify signature",
                          opensslError());
    }
    int rc = EVP_DigestVerify(ctx.get(), signature.signature.data(),
                              signature.signature.size(), data.data(), data.size());
    if (rc != 1) {
        std::string cause = rc == 0 ? "signature mismatch" : opensslError();
        ERR_clear_error();
        throw VerifyError(ErrorKind::SignatureInvalid, "", "verify signature", cause);
    }
}

void SignatureVerifier::verifySCTSignature(const SignedCertificateTimestamp &sct,
                                           const MerkleTreeLeaf &leaf) const {
    verifySignature(serializeSCTSignatureInput(sct, leaf), sct.signature);
}

void SignatureVerifier::verifySTHSignature(const SignedTreeHead &sth) const {
    verifySignature(serializeSTHSignatureInput(sth), sth.treeHeadSignature);
}

} // namespace ctverify::ct
