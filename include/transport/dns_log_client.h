#pragma once
#ifndef CTVERIFY_DNS_LOG_CLIENT_H
#define CTVERIFY_DNS_LOG_CLIENT_H

#include "ct/signature_verifier.h"
#include "transport/log_client.h"
#include <functional>
#include <vector>

namespace ctverify {

/**
 * @brief Resolves the TXT records of a name.
 *
 * Returns one string per TXT record, the record's character-strings
 * concatenated. Throws VerifyError (Transport) on failure.
 */
using TxtResolver = std::function<std::vector<std::string>(
    const std::string &name, const RequestContext &ctx)>;

/**
 * @brief TxtResolver backed by ldns and the system resolver configuration.
 * @param timeout Per-query timeout when the context has no earlier deadline.
 */
TxtResolver makeLdnsResolver(std::chrono::milliseconds timeout);

/**
 * @brief LogClient using the CT-over-DNS TXT interface.
 *
 * Names queried below the log's zone:
 *   sth                               "<size>.<timestamp>.<b64 root>.<b64 sig>"
 *   <b32 leaf hash>.hash              "<leaf index>"
 *   <start>.<index>.<size>.tree       audit path nodes from <start>, raw bytes
 */
class DnsLogClient : public LogClient {
public:
    DnsLogClient(const std::string &zone, ct::SignatureVerifier verifier,
                 TxtResolver resolver);

    ct::SignedTreeHead getSTH(const RequestContext &ctx) override;
    ct::InclusionProof getProofByHash(const RequestContext &ctx,
                                      const DigestArray &leafHash,
                                      uint64_t treeSize) override;
    std::string endpoint() const override { return "dns:" + zone_; }

    /** Parse an "sth" TXT record; the signature is not checked. */
    static ct::SignedTreeHead parseSTHRecord(const std::string &record);

    /** Name of the leaf-index query for @p leafHash. */
    static std::string hashQueryName(const DigestArray &leafHash, const std::string &zone);

    /** Name of the audit path query starting at node @p start. */
    static std::string treeQueryName(uint64_t start, uint64_t leafIndex,
                                     uint64_t treeSize, const std::string &zone);

    /** Split concatenated raw node hashes. */
    static std::vector<DigestArray> splitAuditPath(const std::string &raw);

private:
    std::string lookupJoined(const std::string &name, const RequestContext &ctx);

    std::string zone_;
    ct::SignatureVerifier verifier_;
    TxtResolver resolver_;
};

} // namespace ctverify

#endif // CTVERIFY_DNS_LOG_CLIENT_H
