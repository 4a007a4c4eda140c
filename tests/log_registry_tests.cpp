#include <gtest/gtest.h>
#include "log/log_registry.h"
#include "mocks/fake_log_client.h"
#include "utilities/verify_error.h"
#include <functional>

using namespace ctverify;

namespace {

LogListEntry entryFor(const std::string &description, const Bytes &key) {
    LogListEntry entry;
    entry.description = description;
    entry.url = "log.example.com/ct";
    entry.key = key;
    entry.maximumMergeDelay = 86400;
    return entry;
}

VerifyError captureError(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const VerifyError &e) {
        return e;
    }
    ADD_FAILURE() << "no VerifyError thrown";
    return VerifyError(ErrorKind::Transport, "", "none");
}

} // namespace

TEST(LogRegistry, NormalizeLogUrl) {
    EXPECT_EQ(normalizeLogUrl("log.example.com/ct"), "https://log.example.com/ct");
    EXPECT_EQ(normalizeLogUrl("https://log.example.com/ct/"), "https://log.example.com/ct/");
    EXPECT_EQ(normalizeLogUrl("http://localhost:8080"), "http://localhost:8080");
}

TEST(LogRegistry, SingleEntryKeyedByKeyHash) {
    TestLogKey key;
    LogList list;
    list.logs.push_back(entryFor("Test Log", key.publicKeyDer()));

    LogInfoByHash logs = logInfoByKeyHash(list);
    ASSERT_EQ(logs.size(), 1u);
    auto it = logs.find(Sha256Hasher::digest(key.publicKeyDer()));
    ASSERT_NE(it, logs.end());
    EXPECT_EQ(it->second->description(), "Test Log");
    EXPECT_EQ(it->second->client().endpoint(), "https://log.example.com/ct");
    EXPECT_EQ(it->second->maximumMergeDelay(), std::chrono::seconds(86400));
}

TEST(LogRegistry, InvalidKeyFailsWholeBatch) {
    TestLogKey good;
    LogList list;
    list.logs.push_back(entryFor("Good Log", good.publicKeyDer()));
    list.logs.push_back(entryFor("Broken Log", {0x30, 0x03, 0x01, 0x02, 0x03}));
    list.logs.push_back(entryFor("Other Good Log", TestLogKey().publicKeyDer()));

    LogInfoByHash logs;
    VerifyError e = captureError([&] { logs = logInfoByKeyHash(list); });
    EXPECT_EQ(e.kind(), ErrorKind::LogConfig);
    EXPECT_EQ(e.logDescription(), "Broken Log");
    EXPECT_TRUE(logs.empty());
}

TEST(LogRegistry, DnsRequiresEndpoint) {
    TestLogKey key;
    LogListEntry entry = entryFor("No DNS Log", key.publicKeyDer());

    VerifyError e = captureError([&] { newLogInfoOverDNS(entry); });
    EXPECT_EQ(e.kind(), ErrorKind::LogConfig);
    EXPECT_EQ(e.logDescription(), "No DNS Log");

    LogList list;
    list.logs.push_back(entry);
    EXPECT_EQ(captureError([&] { logInfoByKeyHashOverDNS(list); }).kind(),
              ErrorKind::LogConfig);

    entry.dnsApiEndpoint = "log.ct.example.com.";
    auto info = newLogInfoOverDNSWrapper(entry, HttpClientOptions{});
    EXPECT_EQ(info->client().endpoint(), "dns:log.ct.example.com");
}

TEST(LogRegistry, NegativeMergeDelayRejected) {
    LogListEntry entry = entryFor("Odd Log", TestLogKey().publicKeyDer());
    entry.maximumMergeDelay = -1;
    EXPECT_EQ(captureError([&] { newLogInfo(entry); }).kind(), ErrorKind::LogConfig);
}

TEST(LogRegistry, BadUrlIsLogConfigError) {
    LogListEntry entry = entryFor("Hostless Log", TestLogKey().publicKeyDer());
    entry.url = "https:///ct";
    VerifyError e = captureError([&] { newLogInfo(entry); });
    EXPECT_EQ(e.kind(), ErrorKind::LogConfig);
    EXPECT_EQ(e.logDescription(), "Hostless Log");
}

TEST(LogRegistry, DuplicateKeysLaterEntryWins) {
    TestLogKey key;
    LogList list;
    list.logs.push_back(entryFor("First", key.publicKeyDer()));
    list.logs.push_back(entryFor("Second", key.publicKeyDer()));
    LogInfoByHash logs = logInfoByKeyHash(list);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs.begin()->second->description(), "Second");
}

/**
 * @brief Registry built with a custom factory, then used end to end against
 * a ten leaf log holding the leaf at index 5.
 */
TEST(LogRegistry, CustomFactoryEndToEnd) {
    auto fake = std::make_shared<FakeLog>();
    ct::MerkleTreeLeaf leaf = ct::makeX509Leaf({0x30, 0x0a, 0x55}, 0);
    ct::MerkleTreeLeaf logged = leaf;
    logged.timestampedEntry.timestamp = 777;
    fake->addFillerLeaves(5);
    fake->addLeaf(logged);
    fake->addFillerLeaves(4);

    LogList list;
    list.logs.push_back(entryFor("Test Log", fake->key.publicKeyDer()));
    LogInfoFactory factory = [fake](const LogListEntry &entry, const HttpClientOptions &) {
        return newLogInfoWithClient(entry, std::make_unique<FakeLogClient>(fake));
    };
    LogInfoByHash logs = logInfoByKeyHash(list, HttpClientOptions{}, factory);
    ASSERT_EQ(logs.size(), 1u);
    LogInfo &info = *logs.at(keyHash(fake->key.publicKeyDer()));

    RequestContext ctx;
    EXPECT_EQ(info.verifyInclusionLatest(ctx, leaf, 777), 5);
    ASSERT_TRUE(info.lastSTH().has_value());
    EXPECT_EQ(info.lastSTH()->treeSize, 10u);

    fake->proofSizeOverride = 8;
    EXPECT_EQ(captureError([&] { info.verifyInclusionLatest(ctx, leaf, 777); }).kind(),
              ErrorKind::ProofInvalid);
}

TEST(LogRegistry, FactoryErrorsBecomeLogConfigErrors) {
    LogList list;
    list.logs.push_back(entryFor("Flaky Log", TestLogKey().publicKeyDer()));
    LogInfoFactory factory = [](const LogListEntry &,
                                const HttpClientOptions &) -> std::unique_ptr<LogInfo> {
        throw VerifyError(ErrorKind::Transport, "", "probe", "unreachable");
    };
    VerifyError e = captureError([&] { logInfoByKeyHash(list, HttpClientOptions{}, factory); });
    EXPECT_EQ(e.kind(), ErrorKind::LogConfig);
    EXPECT_EQ(e.logDescription(), "Flaky Log");
}
