#include <gtest/gtest.h>
#include <nanoclaw/core/pairing_store.hpp>
#include <nanoclaw/core/utils.hpp>
#include "test_helpers.hpp"

#include <cctype>

using namespace nanoclaw;
using namespace nanoclaw::test_support;

static const int64_t NOW = 1760000000000LL;
static const int64_t HOUR = 60 * 60 * 1000;

TEST(PairingStoreTest, CodesAreSixDigits) {
    for (int i = 0; i < 200; ++i) {
        std::string code = PairingStore::generate_code();
        ASSERT_EQ(6u, code.size());
        EXPECT_NE('0', code[0]);
        for (size_t k = 0; k < code.size(); ++k) {
            EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(code[k])));
        }
    }
}

TEST(PairingStoreTest, IssueIsStablePerChat) {
    PairingStore store;
    std::string a = store.issue("telegram:1", 1, "Family", NOW);
    std::string b = store.issue("telegram:1", 1, "Family", NOW + 1000);
    EXPECT_EQ(a, b);
    EXPECT_EQ(1u, store.size());

    store.issue("telegram:2", 2, "Work", NOW);
    EXPECT_EQ(2u, store.size());
}

TEST(PairingStoreTest, VerifyConsumesCode) {
    PairingStore store;
    std::string code = store.issue("telegram:1", 1, "Family", NOW);

    PendingPairing p;
    ASSERT_TRUE(store.verify(code, NOW + 1000, p));
    EXPECT_EQ("telegram:1", p.jid);
    EXPECT_EQ(1, p.chat_id);
    EXPECT_EQ("Family", p.chat_title);

    EXPECT_FALSE(store.verify(code, NOW + 2000, p));
    EXPECT_EQ(0u, store.size());
}

TEST(PairingStoreTest, UnknownCodeRejected) {
    PairingStore store;
    store.issue("telegram:1", 1, "Family", NOW);
    PendingPairing p;
    EXPECT_FALSE(store.verify("not-a-code", NOW, p));
    EXPECT_EQ(1u, store.size());
}

TEST(PairingStoreTest, ExpiredCodeRejected) {
    PairingStore store;
    std::string code = store.issue("telegram:1", 1, "Family", NOW);
    PendingPairing p;
    EXPECT_FALSE(store.verify(code, NOW + HOUR + 1, p));
    EXPECT_EQ(0u, store.size());
}

TEST(PairingStoreTest, ExpiredChatGetsFreshEntry) {
    PairingStore store(1000);
    store.issue("telegram:1", 1, "Family", NOW);
    std::string code = store.issue("telegram:1", 1, "Family", NOW + 5000);

    PendingPairing p;
    ASSERT_TRUE(store.verify(code, NOW + 5500, p));
}

TEST(PairingStoreTest, PendingListsMinutesToExpiry) {
    PairingStore store;
    std::string code = store.issue("telegram:1", 1, "Family", NOW);

    std::vector<PendingSummary> pending = store.pending(NOW + 15 * 60 * 1000);
    ASSERT_EQ(1u, pending.size());
    EXPECT_EQ(code, pending[0].code);
    EXPECT_EQ("Family", pending[0].chat_title);
    EXPECT_EQ(45, pending[0].expires_in_minutes);

    EXPECT_TRUE(store.pending(NOW + 2 * HOUR).empty());
}

TEST(PairingStoreTest, PendingCodesSurviveSaveAndLoad) {
    TempDir tmp;
    std::string path = tmp.sub("data/pending_pairings.json");
    std::string error;

    PairingStore first;
    std::string code = first.issue("telegram:7", 7, "Book Club", NOW);
    ASSERT_TRUE(first.save(path, error)) << error;

    PairingStore second;
    ASSERT_TRUE(second.load(path, error)) << error;
    EXPECT_EQ(code, second.issue("telegram:7", 7, "Book Club", NOW + 1000));

    PendingPairing p;
    ASSERT_TRUE(second.verify(code, NOW + 2000, p));
    EXPECT_EQ("telegram:7", p.jid);
    EXPECT_EQ(7, p.chat_id);
    EXPECT_EQ("Book Club", p.chat_title);
    EXPECT_EQ(NOW + HOUR, p.expires_at_ms);
}

TEST(PairingStoreTest, LoadHandlesMissingAndMalformedFiles) {
    TempDir tmp;
    std::string error;
    PairingStore store;
    EXPECT_TRUE(store.load(tmp.sub("absent.json"), error));
    EXPECT_EQ(0u, store.size());

    std::string bad = tmp.sub("bad.json");
    write_text(bad, "{ nope");
    EXPECT_FALSE(store.load(bad, error));
    EXPECT_FALSE(error.empty());

    write_text(bad, "{\"123456\":{\"jid\":\"telegram:1\",\"expiresAt\":1},\"654321\":{\"chatTitle\":\"x\"}}");
    ASSERT_TRUE(store.load(bad, error)) << error;
    EXPECT_EQ(1u, store.size());
}
