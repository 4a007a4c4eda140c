#pragma once
#ifndef CTVERIFY_LOG_LIST_H
#define CTVERIFY_LOG_LIST_H

#include "utilities/digest.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ctverify {

/**
 * @brief One log of a log list.
 */
struct LogListEntry {
    std::string description;
    Bytes key;                  ///< DER SubjectPublicKeyInfo.
    std::string url;            ///< May omit the scheme.
    int maximumMergeDelay{0};   ///< Seconds.
    std::string dnsApiEndpoint; ///< Empty if the log has no DNS interface.
    std::vector<std::string> operatedBy;
};

/**
 * @brief Collection of logs loaded from a JSON log list.
 *
 * Both the flat layout ({"logs": [...]} with "maximum_merge_delay" and
 * "dns_api_endpoint") and the per-operator layout ({"operators": [{"name",
 * "logs": [...]}]} with "mmd" and "dns") are accepted.
 */
class LogList {
public:
    std::vector<LogListEntry> logs;

    /**
     * @brief Parse a JSON log list.
     * @throws VerifyError (LogConfig) on malformed input.
     */
    static LogList parse(const std::string &json);

    /** @throws VerifyError (LogConfig) if the file is unreadable or malformed. */
    static LogList loadFromFile(const std::string &path);

    const LogListEntry *findByKeyHash(const KeyHash &hash) const;

    /** Match ignoring scheme and trailing slashes. */
    const LogListEntry *findByUrl(const std::string &url) const;
};

} // namespace ctverify

#endif // CTVERIFY_LOG_LIST_H
