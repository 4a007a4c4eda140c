#include "log/log_registry.h"
#include "transport/http_log_client.h"
#include "utilities/encoding.hpp"
#include "utilities/logger.h"
#include "utilities/verify_error.h"

namespace ctverify {

namespace {

[[noreturn]] void configError(const LogListEntry &entry, const std::string &operation,
                              const VerifyError &cause) {
    throw VerifyError(ErrorKind::LogConfig, entry.description, operation,
                      cause.kind() == ErrorKind::LogConfig ? cause.cause() : cause.what());
}

ct::SignatureVerifier verifierFor(const LogListEntry &entry) {
    try {
        return ct::SignatureVerifier(entry.key);
    } catch (const VerifyError &e) {
        configError(entry, "parse public key", e);
    }
}

} // namespace

std::string normalizeLogUrl(const std::string &url) {
    if (url.find("://") != std::string::npos)
        return url;
    return "https://" + url;
}

std::unique_ptr<LogInfo> newLogInfoWithClient(const LogListEntry &entry,
                                              std::unique_ptr<LogClient> client) {
    if (entry.maximumMergeDelay < 0) {
        throw VerifyError(ErrorKind::LogConfig, entry.description, "create log state",
                          "negative maximum merge delay");
    }
    return std::make_unique<LogInfo>(entry.description, entry.key,
                                     std::chrono::seconds(entry.maximumMergeDelay),
                                     std::move(client), verifierFor(entry));
}

std::unique_ptr<LogInfo> newLogInfo(const LogListEntry &entry,
                                    const HttpClientOptions &options) {
    ct::SignatureVerifier verifier = verifierFor(entry);
    std::unique_ptr<LogClient> client;
    try {
        client = std::make_unique<HttpLogClient>(normalizeLogUrl(entry.url), options,
                                                 std::move(verifier));
    } catch (const VerifyError &e) {
        configError(entry, "create HTTP client", e);
    }
    return newLogInfoWithClient(entry, std::move(client));
}

std::unique_ptr<LogInfo> newLogInfoOverDNS(const LogListEntry &entry,
                                           TxtResolver resolver) {
    if (entry.dnsApiEndpoint.empty()) {
        throw VerifyError(ErrorKind::LogConfig, entry.description, "create DNS client",
                          "no DNS endpoint available");
    }
    if (!resolver)
        resolver = makeLdnsResolver(HttpClientOptions{}.timeout);

    ct::SignatureVerifier verifier = verifierFor(entry);
    std::unique_ptr<LogClient> client;
    try {
        client = std::make_unique<DnsLogClient>(entry.dnsApiEndpoint, std::move(verifier),
                                                std::move(resolver));
    } catch (const VerifyError &e) {
        configError(entry, "create DNS client", e);
    }
    return newLogInfoWithClient(entry, std::move(client));
}

std::unique_ptr<LogInfo> newLogInfoOverDNSWrapper(const LogListEntry &entry,
                                                  const HttpClientOptions &options) {
    return newLogInfoOverDNS(entry, makeLdnsResolver(options.timeout));
}

LogInfoByHash logInfoByKeyHash(const LogList &list, const HttpClientOptions &options,
                               const LogInfoFactory &factory) {
    LogInfoByHash result;
    for (const auto &entry : list.logs) {
        std::unique_ptr<LogInfo> info;
        try {
            info = factory(entry, options);
        } catch (const VerifyError &e) {
            Logger::getInstance().log(LogLevel::ERROR, "Failed to build log state",
                                      {{"log", entry.description}, {"error", e.what()}});
            if (e.kind() == ErrorKind::LogConfig && e.logDescription() == entry.description)
                throw;
            configError(entry, "build log state", e);
        } catch (const std::exception &e) {
            Logger::getInstance().log(LogLevel::ERROR, "Failed to build log state",
                                      {{"log", entry.description}, {"error", e.what()}});
            throw VerifyError(ErrorKind::LogConfig, entry.description, "build log state",
                              e.what());
        }
        if (!info) {
            throw VerifyError(ErrorKind::LogConfig, entry.description, "build log state",
                              "factory returned no log state");
        }
        const KeyHash hash = keyHash(entry.key);
        if (result.count(hash)) {
            Logger::getInstance().log(LogLevel::WARN, "Duplicate log key, later entry wins",
                                      {{"log", entry.description},
                                       {"key_hash", toHex(hash)}});
        }
        result[hash] = std::move(info);
    }
    Logger::getInstance().log(LogLevel::INFO, "Built log registry",
                              {{"logs", std::to_string(result.size())}});
    return result;
}

LogInfoByHash logInfoByKeyHash(const LogList &list, const HttpClientOptions &options) {
    return logInfoByKeyHash(list, options, newLogInfo);
}

LogInfoByHash logInfoByKeyHashOverDNS(const LogList &list,
                                      const HttpClientOptions &options) {
    return logInfoByKeyHash(list, options, newLogInfoOverDNSWrapper);
}

} // namespace ctverify
