#include "utilities/config.h"
#include "utilities/verify_error.h"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace ctverify {

namespace {

const char kDefaultConfigPath[] = "ctverify_config.yaml";

std::chrono::milliseconds parseTimeout(long long ms, const std::string &source) {
    if (ms <= 0) {
        throw VerifyError(ErrorKind::LogConfig, "", "load configuration",
                          source + ": timeout must be positive");
    }
    return std::chrono::milliseconds(ms);
}

} // namespace

TransportKind transportFromString(const std::string &name) {
    if (name == "http" || name == "https")
        return TransportKind::Http;
    if (name == "dns")
        return TransportKind::Dns;
    throw VerifyError(ErrorKind::LogConfig, "", "load configuration",
                      "unknown transport \"" + name + "\"");
}

std::string transportToString(TransportKind kind) {
    return kind == TransportKind::Dns ? "dns" : "http";
}

ClientConfig ClientConfig::loadFromFile(const std::string &path) {
    ClientConfig cfg;
    try {
        YAML::Node node = YAML::LoadFile(path);
        if (node["log_list"])
            cfg.logList = node["log_list"].as<std::string>();
        if (node["transport"])
            cfg.transport = transportFromString(node["transport"].as<std::string>());
        if (node["timeout_ms"])
            cfg.http.timeout = parseTimeout(node["timeout_ms"].as<long long>(), path);
        if (node["user_agent"])
            cfg.http.userAgent = node["user_agent"].as<std::string>();
        if (node["log_file"])
            cfg.logFile = node["log_file"].as<std::string>();
        if (node["log_level"])
            cfg.logLevel = logLevelFromString(node["log_level"].as<std::string>());
    } catch (const YAML::Exception &e) {
        throw VerifyError(ErrorKind::LogConfig, "", "load configuration " + path, e.what());
    } catch (const std::invalid_argument &e) {
        throw VerifyError(ErrorKind::LogConfig, "", "load configuration " + path, e.what());
    }
    return cfg;
}

ClientConfig ClientConfig::load() {
    ClientConfig cfg;
    const char *path = std::getenv("CTVERIFY_CONFIG");
    if (path)
        cfg = loadFromFile(path);
    else if (std::filesystem::exists(kDefaultConfigPath))
        cfg = loadFromFile(kDefaultConfigPath);
    cfg.applyEnvironment();
    return cfg;
}

void ClientConfig::applyEnvironment() {
    if (const char *env = std::getenv("CTVERIFY_LOG_LIST"))
        logList = env;
    if (const char *env = std::getenv("CTVERIFY_TRANSPORT"))
        transport = transportFromString(env);
    if (const char *env = std::getenv("CTVERIFY_TIMEOUT_MS")) {
        char *end = nullptr;
        long long ms = std::strtoll(env, &end, 10);
        if (end == env || *end != '\0') {
            throw VerifyError(ErrorKind::LogConfig, "", "load configuration",
                              "CTVERIFY_TIMEOUT_MS is not a number");
        }
        http.timeout = parseTimeout(ms, "CTVERIFY_TIMEOUT_MS");
    }
}

} // namespace ctverify
