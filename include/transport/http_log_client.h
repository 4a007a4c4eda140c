#pragma once
#ifndef CTVERIFY_HTTP_LOG_CLIENT_H
#define CTVERIFY_HTTP_LOG_CLIENT_H

#include "ct/signature_verifier.h"
#include "transport/log_client.h"
#include <map>
#include <utility>

namespace ctverify {

/**
 * @brief LogClient speaking the RFC 6962 JSON API over HTTPS.
 */
class HttpLogClient : public LogClient {
public:
    /**
     * @param url      Log base URL including scheme, e.g.
     *                 "https://ct.example.com/log".
     * @param options  User agent and default timeout.
     * @param verifier Verifier for the log's pinned key.
     * @throws VerifyError (LogConfig) if the URL cannot be parsed.
     */
    HttpLogClient(const std::string &url, HttpClientOptions options,
                  ct::SignatureVerifier verifier);

    ct::SignedTreeHead getSTH(const RequestContext &ctx) override;
    ct::InclusionProof getProofByHash(const RequestContext &ctx,
                                      const DigestArray &leafHash,
                                      uint64_t treeSize) override;
    std::string endpoint() const override { return url_; }

    /** Parse a get-sth JSON body; the signature is not checked. */
    static ct::SignedTreeHead parseSTHResponse(const std::string &body);

    /** Parse a get-proof-by-hash JSON body. */
    static ct::InclusionProof parseProofResponse(const std::string &body);

    /** Split "scheme://host[:port]/path" into origin and path prefix. */
    static std::pair<std::string, std::string> splitUrl(const std::string &url);

private:
    std::string get(const RequestContext &ctx, const std::string &path,
                    const std::multimap<std::string, std::string> &params);

    std::string url_;
    std::string origin_;
    std::string basePath_;
    HttpClientOptions options_;
    ct::SignatureVerifier verifier_;
};

} // namespace ctverify

#endif // CTVERIFY_HTTP_LOG_CLIENT_H
