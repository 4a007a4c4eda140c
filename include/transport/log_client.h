#pragma once
#ifndef CTVERIFY_LOG_CLIENT_H
#define CTVERIFY_LOG_CLIENT_H

#include "ct/types.h"
#include "utilities/request_context.h"
#include <chrono>
#include <string>

namespace ctverify {

/**
 * @brief Read access to a CT log, independent of the wire transport.
 *
 * Implementations throw VerifyError: Transport for network and log-side
 * failures (including an unknown leaf hash and a cancelled context),
 * SignatureInvalid when a tree head is not signed by the pinned key.
 * Implementations must be safe to call from several threads at once.
 */
class LogClient {
public:
    virtual ~LogClient() = default;

    /** Fetch the log's current signed tree head, signature checked. */
    virtual ct::SignedTreeHead getSTH(const RequestContext &ctx) = 0;

    /** Fetch the index and audit path of @p leafHash in the tree of @p treeSize. */
    virtual ct::InclusionProof getProofByHash(const RequestContext &ctx,
                                              const DigestArray &leafHash,
                                              uint64_t treeSize) = 0;

    /** Where the client talks to, for diagnostics. */
    virtual std::string endpoint() const = 0;
};

/** Options for HTTP transports. */
struct HttpClientOptions {
    std::string userAgent = "ctverify-logclient";
    std::chrono::milliseconds timeout{30000};
};

} // namespace ctverify

#endif // CTVERIFY_LOG_CLIENT_H
