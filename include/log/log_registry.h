#pragma once
#ifndef CTVERIFY_LOG_REGISTRY_H
#define CTVERIFY_LOG_REGISTRY_H

#include "log/log_info.h"
#include "log/log_list.h"
#include "transport/dns_log_client.h"
#include <functional>
#include <map>
#include <memory>

namespace ctverify {

/// Log states indexed by SHA-256 of the log's DER public key.
using LogInfoByHash = std::map<KeyHash, std::shared_ptr<LogInfo>>;

/// Builds the state of one log-list entry.
using LogInfoFactory = std::function<std::unique_ptr<LogInfo>(
    const LogListEntry &entry, const HttpClientOptions &options)>;

/** Prefix "https://" to @p url unless it already carries a scheme. */
std::string normalizeLogUrl(const std::string &url);

/**
 * @brief Build a log state reached over the HTTP JSON API.
 * @throws VerifyError (LogConfig) carrying the entry's description.
 */
std::unique_ptr<LogInfo> newLogInfo(const LogListEntry &entry,
                                    const HttpClientOptions &options = {});

/**
 * @brief Build a log state reached over CT-over-DNS.
 *
 * An empty @p resolver selects the ldns system resolver.
 * @throws VerifyError (LogConfig) if the entry has no DNS endpoint or cannot
 *         be used.
 */
std::unique_ptr<LogInfo> newLogInfoOverDNS(const LogListEntry &entry,
                                           TxtResolver resolver = {});

/**
 * @brief newLogInfoOverDNS with the signature of newLogInfo.
 *
 * Only the timeout of @p options is used, for the DNS queries.
 */
std::unique_ptr<LogInfo> newLogInfoOverDNSWrapper(const LogListEntry &entry,
                                                  const HttpClientOptions &options);

/**
 * @brief Build a log state around an existing transport client.
 * @throws VerifyError (LogConfig) if the key is unusable.
 */
std::unique_ptr<LogInfo> newLogInfoWithClient(const LogListEntry &entry,
                                              std::unique_ptr<LogClient> client);

/**
 * @brief Build the state of every log in @p list with @p factory.
 *
 * All or nothing: the first entry that fails aborts the whole build.
 * @throws VerifyError (LogConfig)
 */
LogInfoByHash logInfoByKeyHash(const LogList &list, const HttpClientOptions &options,
                               const LogInfoFactory &factory);

/** logInfoByKeyHash over HTTP. */
LogInfoByHash logInfoByKeyHash(const LogList &list, const HttpClientOptions &options = {});

/** logInfoByKeyHash over DNS; entries without a DNS endpoint fail the build. */
LogInfoByHash logInfoByKeyHashOverDNS(const LogList &list,
                                      const HttpClientOptions &options = {});

} // namespace ctverify

#endif // CTVERIFY_LOG_REGISTRY_H
