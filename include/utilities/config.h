#pragma once
#ifndef CTVERIFY_CONFIG_H
#define CTVERIFY_CONFIG_H

#include "transport/log_client.h"
#include "utilities/logger.h"
#include <string>

namespace ctverify {

enum class TransportKind { Http, Dns };

/** Parse "http" or "dns". @throws VerifyError (LogConfig) otherwise. */
TransportKind transportFromString(const std::string &name);
std::string transportToString(TransportKind kind);

/**
 * @brief Client settings.
 *
 * YAML keys: log_list, transport, timeout_ms, user_agent, log_file,
 * log_level. Environment variables CTVERIFY_LOG_LIST, CTVERIFY_TRANSPORT and
 * CTVERIFY_TIMEOUT_MS override the file.
 */
struct ClientConfig {
    std::string logList = "log_list.json";
    TransportKind transport = TransportKind::Http;
    HttpClientOptions http;
    std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
    LogLevel logLevel = LogLevel::INFO;

    /**
     * @brief Read settings from a YAML file; missing keys keep their defaults.
     * @throws VerifyError (LogConfig) if the file is unreadable or malformed.
     */
    static ClientConfig loadFromFile(const std::string &path);

    /**
     * @brief Load from $CTVERIFY_CONFIG (default "ctverify_config.yaml") and
     * apply the environment.
     *
     * The default file may be absent; an explicitly named one may not.
     */
    static ClientConfig load();

    /** Apply CTVERIFY_* overrides from the environment. */
    void applyEnvironment();
};

} // namespace ctverify

#endif // CTVERIFY_CONFIG_H
