#include "transport/http_log_client.h"
#include "ct/serialization.h"
#include "utilities/encoding.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/verify_error.h"
#include <httplib.h>
#include <tuple>
#include <yaml-cpp/yaml.h>

namespace ctverify {

namespace {

const char kGetSTHPath[] = "/ct/v1/get-sth";
const char kGetProofByHashPath[] = "/ct/v1/get-proof-by-hash";
const size_t kMaxErrorBody = 256;

[[noreturn]] void malformed(const std::string &what, const std::string &cause) {
    throw VerifyError(ErrorKind::Transport, "", "malformed " + what + " response",
                      cause);
}

} // namespace

HttpLogClient::HttpLogClient(const std::string &url, HttpClientOptions options,
                             ct::SignatureVerifier verifier)
    : url_(url), options_(std::move(options)), verifier_(std::move(verifier)) {
    std::tie(origin_, basePath_) = splitUrl(url);
}

std::pair<std::string, std::string> HttpLogClient::splitUrl(const std::string &url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw VerifyError(ErrorKind::LogConfig, "", "parse log URL",
                          "missing scheme in \"" + url + "\"");
    }
    auto pathStart = url.find('/', schemeEnd + 3);
    std::string origin = url.substr(0, pathStart);
    if (origin.size() == schemeEnd + 3) {
        throw VerifyError(ErrorKind::LogConfig, "", "parse log URL",
                          "missing host in \"" + url + "\"");
    }
    std::string path = pathStart == std::string::npos ? "" : url.substr(pathStart);
    while (!path.empty() && path.back() == '/')
        path.pop_back();
    return {origin, path};
}

std::string HttpLogClient::get(const RequestContext &ctx, const std::string &path,
                               const std::multimap<std::string, std::string> &params) {
    const std::string operation = "GET " + url_ + path;
    ctx.throwIfDone(operation);

    auto timeout = ctx.remaining(options_.timeout);
    httplib::Client cli(origin_);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers{{"User-Agent", options_.userAgent},
                             {"Accept", "application/json"}};
    auto progress = [&ctx](uint64_t, uint64_t) { return !ctx.done(); };

    Logger::getInstance().log(LogLevel::DEBUG, operation);
    MetricsRegistry::instance().incrementCounter("ctverify_http_requests", 1.0,
                                                 {{"path", path}});

    httplib::Result res = params.empty()
                              ? cli.Get(basePath_ + path, headers, progress)
                              : cli.Get(basePath_ + path, params, headers, progress);
    if (!res) {
        ctx.throwIfDone(operation);
        throw VerifyError(ErrorKind::Transport, "", operation,
                          httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        std::string body = res->body.substr(0, kMaxErrorBody);
        throw VerifyError(ErrorKind::Transport, "", operation,
                          "HTTP status " + std::to_string(res->status) + ": " + body);
    }
    return res->body;
}

ct::SignedTreeHead HttpLogClient::getSTH(const RequestContext &ctx) {
    ct::SignedTreeHead sth = parseSTHResponse(get(ctx, kGetSTHPath, {}));
    sth.logId = verifier_.keyId();
    verifier_.verifySTHSignature(sth);
    return sth;
}

ct::InclusionProof HttpLogClient::getProofByHash(const RequestContext &ctx,
                                                 const DigestArray &leafHash,
                                                 uint64_t treeSize) {
    std::multimap<std::string, std::string> params{
        {"hash", toBase64(leafHash.data(), leafHash.size())},
        {"tree_size", std::to_string(treeSize)}};
    return parseProofResponse(get(ctx, kGetProofByHashPath, params));
}

ct::SignedTreeHead HttpLogClient::parseSTHResponse(const std::string &body) {
    ct::SignedTreeHead sth;
    try {
        const YAML::Node root = YAML::Load(body);
        if (!root.IsMap())
            malformed("get-sth", "not a JSON object");
        sth.treeSize = root["tree_size"].as<uint64_t>();
        sth.timestamp = root["timestamp"].as<uint64_t>();
        sth.sha256RootHash = digestFromBase64(root["sha256_root_hash"].as<std::string>());
        sth.treeHeadSignature = ct::decodeDigitallySigned(
            fromBase64(root["tree_head_signature"].as<std::string>()));
    } catch (const YAML::Exception &e) {
        malformed("get-sth", e.what());
    } catch (const VerifyError &e) {
        if (e.kind() != ErrorKind::Encoding)
            throw;
        malformed("get-sth", e.what());
    }
    return sth;
}

ct::InclusionProof HttpLogClient::parseProofResponse(const std::string &body) {
    ct::InclusionProof proof;
    try {
        const YAML::Node root = YAML::Load(body);
        if (!root.IsMap())
            malformed("get-proof-by-hash", "not a JSON object");
        proof.leafIndex = root["leaf_index"].as<int64_t>();
        const YAML::Node path = root["audit_path"];
        if (!path.IsSequence())
            malformed("get-proof-by-hash", "audit_path is not an array");
        for (const auto &node : path) {
            proof.auditPath.push_back(digestFromBase64(node.as<std::string>()));
        }
    } catch (const YAML::Exception &e) {
        malformed("get-proof-by-hash", e.what());
    } catch (const VerifyError &e) {
        if (e.kind() != ErrorKind::Encoding)
            throw;
        malformed("get-proof-by-hash", e.what());
    }
    if (proof.leafIndex < 0)
        malformed("get-proof-by-hash", "negative leaf_index");
    return proof;
}

} // namespace ctverify
