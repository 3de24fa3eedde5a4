#include <gtest/gtest.h>
#include "dnsgate/matcher.hpp"
#include "dnsgate/state_file.hpp"

#include <cstdio>
#include <fstream>

using namespace dnsgate;

TEST(StateFileTest, ParseRules) {
    const std::string text = R"({
        "rules": [
            {"pattern": "*.ads.example.", "ip": "REFUSED", "start": "00:00", "end": "00:00", "enabled": true},
            {"pattern": "tracker.example.", "ip": "0.0.0.0", "start": "08:00", "end": "20:00", "enabled": false}
        ],
        "maintenance": true
    })";

    PersistedState state;
    ASSERT_EQ(StateFile::parse(text, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 2u);
    EXPECT_TRUE(state.maintenance);

    EXPECT_EQ(state.rules[0].pattern, "*.ads.example.");
    EXPECT_EQ(state.rules[0].ip, "REFUSED");
    EXPECT_TRUE(state.rules[0].enabled);

    EXPECT_EQ(state.rules[1].ip, "0.0.0.0");
    EXPECT_EQ(state.rules[1].start, "08:00");
    EXPECT_EQ(state.rules[1].end, "20:00");
    EXPECT_FALSE(state.rules[1].enabled);
}

TEST(StateFileTest, LegacyKeyAndDefaults) {
    const std::string text = R"({
        "bloqueos": [
            {"pattern": "old.example", "ip": "10.1.1.1"}
        ]
    })";

    PersistedState state;
    ASSERT_EQ(StateFile::parse(text, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 1u);
    EXPECT_FALSE(state.maintenance);
    EXPECT_TRUE(state.rules[0].enabled);
    EXPECT_TRUE(state.rules[0].start.empty());
    EXPECT_TRUE(state.rules[0].end.empty());
}

TEST(StateFileTest, EmptyObject) {
    PersistedState state;
    ASSERT_EQ(StateFile::parse("{}", &state), Error::Success);
    EXPECT_TRUE(state.rules.empty());
    EXPECT_FALSE(state.maintenance);
}

TEST(StateFileTest, InvalidDocuments) {
    PersistedState state;
    EXPECT_EQ(StateFile::parse("{\"rules\": [", &state), Error::StateFileInvalid);
    EXPECT_EQ(StateFile::parse("[1, 2, 3]", &state), Error::StateFileInvalid);
    EXPECT_EQ(StateFile::parse("{\"rules\": 5}", &state), Error::StateFileInvalid);
    EXPECT_EQ(StateFile::parse("{\"rules\": [\"x\"]}", &state), Error::StateFileInvalid);
    EXPECT_EQ(StateFile::parse("{\"maintenance\": \"maybe\"}", &state), Error::StateFileInvalid);
}

TEST(StateFileTest, BuildSnapshotSkipsInvalidRules) {
    PersistedState state;
    state.rules.push_back({"good.example", "REFUSED", "", "", true});
    state.rules.push_back({"", "REFUSED", "", "", true});
    state.rules.push_back({"bad-ip.example", "999.1.1.1", "", "", true});
    state.rules.push_back({"bad-time.example", "REFUSED", "25:00", "01:00", true});
    state.rules.push_back({"night.example", "10.0.0.1", "22:00", "06:00", false});

    std::vector<RejectedRule> rejected;
    auto snapshot = StateFile::buildSnapshot(state, &rejected);

    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->rules()[0].pattern(), "good.example.");
    EXPECT_EQ(snapshot->rules()[1].pattern(), "night.example.");
    EXPECT_FALSE(snapshot->rules()[1].enabled());
    EXPECT_EQ(snapshot->rules()[1].window().start, 22 * 60);

    ASSERT_EQ(rejected.size(), 3u);
    EXPECT_EQ(rejected[0].error, Error::InvalidPattern);
    EXPECT_EQ(rejected[1].error, Error::InvalidTarget);
    EXPECT_EQ(rejected[2].error, Error::InvalidWindow);
    EXPECT_EQ(rejected[2].rule.pattern, "bad-time.example");
}

TEST(StateFileTest, SerializeRoundTrip) {
    PersistedState original;
    original.rules.push_back({"*.ads.example", "refused", "", "", true});
    original.rules.push_back({"shop.example", "1.2.3.4", "09:00", "17:30", false});
    original.rules.push_back({"v6.example", "2001:db8::1", "", "", true});
    auto snapshot = StateFile::buildSnapshot(original, nullptr);
    ASSERT_EQ(snapshot->size(), 3u);

    std::string text = StateFile::serialize(*snapshot, true);
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text[0], '{');

    PersistedState state;
    ASSERT_EQ(StateFile::parse(text, &state), Error::Success);
    EXPECT_TRUE(state.maintenance);
    ASSERT_EQ(state.rules.size(), 3u);

    EXPECT_EQ(state.rules[0].pattern, "*.ads.example.");
    EXPECT_EQ(state.rules[0].ip, "REFUSED");
    EXPECT_EQ(state.rules[0].start, "00:00");
    EXPECT_EQ(state.rules[0].end, "00:00");

    EXPECT_EQ(state.rules[1].ip, "1.2.3.4");
    EXPECT_EQ(state.rules[1].start, "09:00");
    EXPECT_EQ(state.rules[1].end, "17:30");
    EXPECT_FALSE(state.rules[1].enabled);

    EXPECT_EQ(state.rules[2].ip, "2001:db8::1");
}

TEST(StateFileTest, SaveAndLoad) {
    std::string path = ::testing::TempDir() + "dnsgate_state_test.json";
    std::remove(path.c_str());

    RuleStore store;
    ASSERT_EQ(store.addRule("saved.example", "REFUSED", TimeWindow()), Error::Success);

    ASSERT_EQ(StateFile::save(path, *store.currentSnapshot(), false), Error::Success);

    PersistedState state;
    ASSERT_EQ(StateFile::load(path, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 1u);
    EXPECT_EQ(state.rules[0].pattern, "saved.example.");

    auto snapshot = StateFile::buildSnapshot(state, nullptr);
    EXPECT_TRUE(Matcher::decide("saved.example.", *snapshot, 0).isBlock());

    // 临时文件已被重命名
    std::ifstream tmp(path + ".tmp");
    EXPECT_FALSE(tmp.is_open());

    std::remove(path.c_str());
}

TEST(StateFileTest, UnloadedRulesSurviveRewrite) {
    std::string path = ::testing::TempDir() + "dnsgate_state_retained.json";
    std::remove(path.c_str());

    const std::string text = R"({"bloqueos": [
        {"pattern": "*ads*.", "ip": "REFUSED", "start": "", "end": "", "enabled": true},
        {"pattern": "ok.example.", "ip": "REFUSED", "start": "", "end": "", "enabled": true}
    ]})";

    PersistedState state;
    ASSERT_EQ(StateFile::parse(text, &state), Error::Success);

    std::vector<RejectedRule> rejected;
    auto snapshot = StateFile::buildSnapshot(state, &rejected);
    ASSERT_EQ(snapshot->size(), 1u);
    ASSERT_EQ(rejected.size(), 1u);

    std::vector<PersistedRule> retained;
    for (const auto& r : rejected) {
        retained.push_back(r.rule);
    }
    ASSERT_EQ(StateFile::save(path, *snapshot, false, retained), Error::Success);

    PersistedState again;
    ASSERT_EQ(StateFile::load(path, &again), Error::Success);
    ASSERT_EQ(again.rules.size(), 2u);
    EXPECT_EQ(again.rules[0].pattern, "ok.example.");
    EXPECT_EQ(again.rules[1].pattern, "*ads*.");
    EXPECT_EQ(again.rules[1].ip, "REFUSED");
    EXPECT_EQ(again.rules[1].start, "");
    EXPECT_TRUE(again.rules[1].enabled);

    std::remove(path.c_str());
}

TEST(StateFileTest, MissingFile) {
    PersistedState state;
    EXPECT_EQ(StateFile::load("/nonexistent/dnsgate/state.json", &state), Error::StateFileUnreadable);
}

TEST(StateFileTest, UnwritablePath) {
    RuleSnapshot snapshot;
    EXPECT_EQ(StateFile::save("/nonexistent/dnsgate/state.json", snapshot, false),
              Error::StateFileWriteFailed);
}
