#include "log/log_registry.h"
#include "utilities/config.h"
#include "utilities/encoding.hpp"
#include "utilities/logger.h"
#include "utilities/verify_error.h"
#include <algorithm>
#include <iostream>
#include <string>

using namespace ctverify;

static void usage() {
  std::cout << "Usage: ctverify_ctl <config.yaml> sth";
  std::cout << "\n       ctverify_ctl <config.yaml> keyhash <b64 public key>";
  std::cout << "\n       ctverify_ctl <config.yaml> inclusion <log key hash hex> "
               "<leaf hash b64> <tree size>\n";
}

static LogInfoByHash buildRegistry(const ClientConfig &cfg) {
  LogList list = LogList::loadFromFile(cfg.logList);
  if (cfg.transport == TransportKind::Dns)
    return logInfoByKeyHashOverDNS(list, cfg.http);
  return logInfoByKeyHash(list, cfg.http);
}

static int sth_command(const ClientConfig &cfg) {
  LogInfoByHash logs = buildRegistry(cfg);
  int failures = 0;
  std::cout << "Log\tTreeSize\tTimestamp\tRootHash" << std::endl;
  for (const auto &kv : logs) {
    auto ctx = RequestContext::withTimeout(cfg.http.timeout);
    try {
      ct::SignedTreeHead sth = kv.second->refreshSTH(ctx);
      std::cout << kv.second->description() << '\t' << sth.treeSize << '\t'
                << sth.timestamp << '\t' << toBase64(sth.sha256RootHash.data(),
                                                      sth.sha256RootHash.size())
                << std::endl;
    } catch (const VerifyError &e) {
      std::cout << kv.second->description() << "\tERROR\t" << e.what()
                << std::endl;
      ++failures;
    }
  }
  return failures == 0 ? 0 : 1;
}

static int keyhash_command(const std::string &b64Key) {
  KeyHash hash = keyHash(fromBase64(b64Key));
  std::cout << toHex(hash) << std::endl;
  return 0;
}

static int inclusion_command(const ClientConfig &cfg, const std::string &hashHex,
                             const std::string &leafB64,
                             const std::string &sizeText) {
  Bytes wanted = fromHex(hashHex);
  LogInfoByHash logs = buildRegistry(cfg);
  auto it = std::find_if(logs.begin(), logs.end(), [&](const auto &kv) {
    return Bytes(kv.first.begin(), kv.first.end()) == wanted;
  });
  if (it == logs.end()) {
    std::cout << "No log with key hash " << hashHex << std::endl;
    return 1;
  }
  uint64_t treeSize = std::stoull(sizeText);
  DigestArray leafHash = digestFromBase64(leafB64);

  auto ctx = RequestContext::withTimeout(cfg.http.timeout);
  LogInfo &log = *it->second;
  ct::SignedTreeHead sth = log.refreshSTH(ctx);
  if (treeSize > sth.treeSize) {
    std::cout << "Tree size " << treeSize << " exceeds current STH size "
              << sth.treeSize << std::endl;
    return 1;
  }
  if (treeSize != sth.treeSize) {
    std::cout << "Only the current tree (size " << sth.treeSize
              << ") has a known root" << std::endl;
    return 1;
  }
  int64_t index = log.verifyInclusionByHash(ctx, leafHash, sth.treeSize,
                                            sth.sha256RootHash);
  std::cout << "Leaf included at index " << index << " of " << sth.treeSize
            << std::endl;
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 1;
  }
  std::string cmd = argv[2];
  try {
    if (cmd == "keyhash" && argc >= 4)
      return keyhash_command(argv[3]);

    ClientConfig cfg = ClientConfig::loadFromFile(argv[1]);
    cfg.applyEnvironment();
    Logger::init(cfg.logFile, cfg.logLevel);

    if (cmd == "sth")
      return sth_command(cfg);
    if (cmd == "inclusion" && argc >= 6)
      return inclusion_command(cfg, argv[3], argv[4], argv[5]);
  } catch (const VerifyError &e) {
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }
  std::cout << "Unknown command" << std::endl;
  usage();
  return 1;
}
