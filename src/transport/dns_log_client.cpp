#include "transport/dns_log_client.h"
#include "ct/serialization.h"
#include "merkle/merkle_verifier.h"
#include "utilities/encoding.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/verify_error.h"
#include <algorithm>
#include <charconv>
#include <ldns/ldns.h>
#include <memory>
#include <sstream>

namespace ctverify {

namespace {

[[noreturn]] void malformed(const std::string &name, const std::string &cause) {
    throw VerifyError(ErrorKind::Transport, "", "malformed TXT response for " + name,
                      cause);
}

template <typename T> bool parseNumber(const std::string &text, T &out) {
    if (text.empty())
        return false;
    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc() && res.ptr == text.data() + text.size();
}

std::vector<std::string> split(const std::string &text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, sep))
        parts.push_back(part);
    if (!text.empty() && text.back() == sep)
        parts.emplace_back();
    return parts;
}

struct ResolverDeleter {
    void operator()(ldns_resolver *r) const { ldns_resolver_deep_free(r); }
};
struct RdfDeleter {
    void operator()(ldns_rdf *r) const { ldns_rdf_deep_free(r); }
};
struct PktDeleter {
    void operator()(ldns_pkt *p) const { ldns_pkt_free(p); }
};
struct RrListDeleter {
    void operator()(ldns_rr_list *l) const { ldns_rr_list_deep_free(l); }
};

std::vector<std::string> ldnsLookupTxt(const std::string &name, const RequestContext &ctx,
                                       std::chrono::milliseconds timeout) {
    const std::string operation = "DNS TXT lookup " + name;
    ctx.throwIfDone(operation);

    ldns_resolver *rawRes = nullptr;
    if (ldns_resolver_new_frm_file(&rawRes, nullptr) != LDNS_STATUS_OK || !rawRes) {
        throw VerifyError(ErrorKind::Transport, "", operation,
                          "cannot load resolver configuration");
    }
    std::unique_ptr<ldns_resolver, ResolverDeleter> res(rawRes);

    auto left = ctx.remaining(timeout);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(left.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((left.count() % 1000) * 1000);
    ldns_resolver_set_timeout(res.get(), tv);
    ldns_resolver_set_retry(res.get(), 1);

    std::unique_ptr<ldns_rdf, RdfDeleter> dname(ldns_dname_new_frm_str(name.c_str()));
    if (!dname) {
        throw VerifyError(ErrorKind::Transport, "", operation, "invalid domain name");
    }

    std::unique_ptr<ldns_pkt, PktDeleter> pkt(ldns_resolver_query(
        res.get(), dname.get(), LDNS_RR_TYPE_TXT, LDNS_RR_CLASS_IN, LDNS_RD));
    ctx.throwIfDone(operation);
    if (!pkt) {
        throw VerifyError(ErrorKind::Transport, "", operation, "no response");
    }
    if (ldns_pkt_get_rcode(pkt.get()) != LDNS_RCODE_NOERROR) {
        throw VerifyError(ErrorKind::Transport, "", operation,
                          "rcode " + std::to_string(ldns_pkt_get_rcode(pkt.get())));
    }

    std::unique_ptr<ldns_rr_list, RrListDeleter> txt(
        ldns_pkt_rr_list_by_type(pkt.get(), LDNS_RR_TYPE_TXT, LDNS_SECTION_ANSWER));
    if (!txt) {
        throw VerifyError(ErrorKind::Transport, "", operation, "no TXT records");
    }

    std::vector<std::string> records;
    for (size_t i = 0; i < ldns_rr_list_rr_count(txt.get()); ++i) {
        ldns_rr *rr = ldns_rr_list_rr(txt.get(), i);
        std::string record;
        for (size_t j = 0; j < ldns_rr_rd_count(rr); ++j) {
            ldns_rdf *rdf = ldns_rr_rdf(rr, j);
            const uint8_t *data = ldns_rdf_data(rdf);
            size_t size = ldns_rdf_size(rdf);
            // Each rdf is a <character-string>: one length byte, then data.
            if (size == 0)
                continue;
            size_t len = std::min<size_t>(data[0], size - 1);
            record.append(reinterpret_cast<const char *>(data + 1), len);
        }
        records.push_back(record);
    }
    return records;
}

} // namespace

TxtResolver makeLdnsResolver(std::chrono::milliseconds timeout) {
    return [timeout](const std::string &name, const RequestContext &ctx) {
        return ldnsLookupTxt(name, ctx, timeout);
    };
}

DnsLogClient::DnsLogClient(const std::string &zone, ct::SignatureVerifier verifier,
                           TxtResolver resolver)
    : zone_(zone), verifier_(std::move(verifier)), resolver_(std::move(resolver)) {
    while (!zone_.empty() && zone_.back() == '.')
        zone_.pop_back();
    if (zone_.empty()) {
        throw VerifyError(ErrorKind::LogConfig, "", "DNS client", "empty zone");
    }
}

std::string DnsLogClient::lookupJoined(const std::string &name, const RequestContext &ctx) {
    Logger::getInstance().log(LogLevel::DEBUG, "DNS TXT lookup " + name);
    MetricsRegistry::instance().incrementCounter("ctverify_dns_queries");
    std::vector<std::string> records = resolver_(name, ctx);
    if (records.empty()) {
        throw VerifyError(ErrorKind::Transport, "", "DNS TXT lookup " + name,
                          "no TXT records");
    }
    std::string joined;
    for (const auto &r : records)
        joined += r;
    return joined;
}

ct::SignedTreeHead DnsLogClient::getSTH(const RequestContext &ctx) {
    ct::SignedTreeHead sth = parseSTHRecord(lookupJoined("sth." + zone_, ctx));
    sth.logId = verifier_.keyId();
    verifier_.verifySTHSignature(sth);
    return sth;
}

ct::InclusionProof DnsLogClient::getProofByHash(const RequestContext &ctx,
                                                const DigestArray &leafHash,
                                                uint64_t treeSize) {
    const std::string hashName = hashQueryName(leafHash, zone_);
    const std::string indexText = lookupJoined(hashName, ctx);
    uint64_t index = 0;
    if (!parseNumber(indexText, index))
        malformed(hashName, "leaf index \"" + indexText + "\" is not a number");
    if (index >= treeSize) {
        throw VerifyError(ErrorKind::Transport, "", "get proof by hash",
                          "leaf index " + std::to_string(index) +
                              " not within tree size " + std::to_string(treeSize));
    }

    ct::InclusionProof proof;
    proof.leafIndex = static_cast<int64_t>(index);
    const uint64_t expected = merkle::inclusionProofLength(index, treeSize);
    while (proof.auditPath.size() < expected) {
        const std::string name =
            treeQueryName(proof.auditPath.size(), index, treeSize, zone_);
        std::vector<DigestArray> nodes = splitAuditPath(lookupJoined(name, ctx));
        if (nodes.empty())
            malformed(name, "no audit path nodes");
        proof.auditPath.insert(proof.auditPath.end(), nodes.begin(), nodes.end());
    }
    return proof;
}

ct::SignedTreeHead DnsLogClient::parseSTHRecord(const std::string &record) {
    std::vector<std::string> parts = split(record, '.');
    if (parts.size() != 4)
        malformed("sth", "expected 4 fields, got " + std::to_string(parts.size()));

    ct::SignedTreeHead sth;
    if (!parseNumber(parts[0], sth.treeSize))
        malformed("sth", "bad tree size \"" + parts[0] + "\"");
    if (!parseNumber(parts[1], sth.timestamp))
        malformed("sth", "bad timestamp \"" + parts[1] + "\"");
    try {
        sth.sha256RootHash = digestFromBase64(parts[2]);
        sth.treeHeadSignature = ct::decodeDigitallySigned(fromBase64(parts[3]));
    } catch (const VerifyError &e) {
        malformed("sth", e.what());
    }
    return sth;
}

std::string DnsLogClient::hashQueryName(const DigestArray &leafHash,
                                        const std::string &zone) {
    return toBase32Unpadded(leafHash.data(), leafHash.size()) + ".hash." + zone;
}

std::string DnsLogClient::treeQueryName(uint64_t start, uint64_t leafIndex,
                                        uint64_t treeSize, const std::string &zone) {
    return std::to_string(start) + "." + std::to_string(leafIndex) + "." +
           std::to_string(treeSize) + ".tree." + zone;
}

std::vector<DigestArray> DnsLogClient::splitAuditPath(const std::string &raw) {
    if (raw.size() % DIGEST_SIZE != 0) {
        malformed("tree", "audit path length " + std::to_string(raw.size()) +
                              " is not a multiple of " + std::to_string(DIGEST_SIZE));
    }
    std::vector<DigestArray> nodes(raw.size() / DIGEST_SIZE);
    for (size_t i = 0; i < nodes.size(); ++i) {
        std::copy(raw.begin() + static_cast<std::ptrdiff_t>(i * DIGEST_SIZE),
                  raw.begin() + static_cast<std::ptrdiff_t>((i + 1) * DIGEST_SIZE),
                  nodes[i].begin());
    }
    return nodes;
}

} // namespace ctverify
