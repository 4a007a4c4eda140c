#include "log/log_list.h"
#include "utilities/encoding.hpp"
#include "utilities/verify_error.h"
#include <fstream>
#include <map>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace ctverify {

namespace {

std::string stripUrl(std::string url) {
    auto scheme = url.find("://");
    if (scheme != std::string::npos)
        url.erase(0, scheme + 3);
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

LogListEntry parseEntry(const YAML::Node &node, const std::vector<std::string> &operators) {
    LogListEntry entry;
    entry.description = node["description"].as<std::string>();
    entry.url = node["url"].as<std::string>();
    try {
        entry.key = fromBase64(node["key"].as<std::string>());
    } catch (const VerifyError &e) {
        throw VerifyError(ErrorKind::LogConfig, entry.description, "decode log key",
                          e.cause());
    }
    if (node["maximum_merge_delay"])
        entry.maximumMergeDelay = node["maximum_merge_delay"].as<int>();
    else if (node["mmd"])
        entry.maximumMergeDelay = node["mmd"].as<int>();

    if (node["dns_api_endpoint"])
        entry.dnsApiEndpoint = node["dns_api_endpoint"].as<std::string>();
    else if (node["dns"] && node["dns"].IsScalar())
        entry.dnsApiEndpoint = node["dns"].as<std::string>();

    entry.operatedBy = operators;
    return entry;
}

} // namespace

LogList LogList::parse(const std::string &json) {
    LogList list;
    try {
        const YAML::Node root = YAML::Load(json);
        if (!root.IsMap())
            throw VerifyError(ErrorKind::LogConfig, "", "parse log list",
                              "not a JSON object");

        std::map<std::string, std::string> operatorNames;
        const YAML::Node operators = root["operators"];
        if (operators && operators.IsSequence()) {
            for (const auto &op : operators) {
                std::string name = op["name"] ? op["name"].as<std::string>() : "";
                if (op["id"])
                    operatorNames[op["id"].as<std::string>()] = name;
                if (op["logs"]) {
                    for (const auto &log : op["logs"])
                        list.logs.push_back(parseEntry(log, {name}));
                }
            }
        }

        const YAML::Node logs = root["logs"];
        if (logs) {
            if (!logs.IsSequence())
                throw VerifyError(ErrorKind::LogConfig, "", "parse log list",
                                  "\"logs\" is not an array");
            for (const auto &log : logs) {
                std::vector<std::string> ops;
                if (log["operated_by"]) {
                    for (const auto &id : log["operated_by"]) {
                        auto it = operatorNames.find(id.as<std::string>());
                        ops.push_back(it != operatorNames.end() ? it->second
                                                                : id.as<std::string>());
                    }
                }
                list.logs.push_back(parseEntry(log, ops));
            }
        }
    } catch (const YAML::Exception &e) {
        throw VerifyError(ErrorKind::LogConfig, "", "parse log list", e.what());
    }
    return list;
}

LogList LogList::loadFromFile(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw VerifyError(ErrorKind::LogConfig, "", "load log list",
                          "cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

const LogListEntry *LogList::findByKeyHash(const KeyHash &hash) const {
    for (const auto &log : logs) {
        if (keyHash(log.key) == hash)
            return &log;
    }
    return nullptr;
}

const LogListEntry *LogList::findByUrl(const std::string &url) const {
    const std::string wanted = stripUrl(url);
    for (const auto &log : logs) {
        if (stripUrl(log.url) == wanted)
            return &log;
    }
    return nullptr;
}

} // namespace ctverify
