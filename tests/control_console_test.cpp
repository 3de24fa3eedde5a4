#include <gtest/gtest.h>
#include "dnsgate/control_console.hpp"
#include "dnsgate/state_file.hpp"

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <sstream>
#include <thread>

using namespace dnsgate;

class ControlConsoleTest : public ::testing::Test {
protected:
    ControlConsoleTest()
        : path(::testing::TempDir() + "dnsgate_console_test.json"),
          console(store, stats, log, path, out) {
        std::remove(path.c_str());
    }

    ~ControlConsoleTest() override {
        std::remove(path.c_str());
    }

    std::string run(const std::string& line) {
        out.str("");
        EXPECT_TRUE(console.handleCommand(line));
        return out.str();
    }

    RuleStore store;
    StatsRecorder stats;
    QueryLog log;
    std::string path;
    std::ostringstream out;
    ControlConsole console;
};

TEST_F(ControlConsoleTest, AddListRemove) {
    EXPECT_NE(run("add ads.example REFUSED").find("Added"), std::string::npos);
    EXPECT_NE(run("add night.example 10.0.0.1 22:00 06:00").find("Added"), std::string::npos);

    auto snapshot = store.currentSnapshot();
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->rules()[1].window().start, 22 * 60);
    EXPECT_EQ(snapshot->rules()[1].window().end, 6 * 60);

    std::string listing = run("list");
    EXPECT_NE(listing.find("ads.example. -> REFUSED 00:00-00:00"), std::string::npos);
    EXPECT_NE(listing.find("night.example. -> 10.0.0.1 22:00-06:00"), std::string::npos);

    EXPECT_NE(run("remove ads.example").find("Removed"), std::string::npos);
    EXPECT_EQ(store.currentSnapshot()->size(), 1u);

    EXPECT_NE(run("remove ads.example").find("not found"), std::string::npos);
}

TEST_F(ControlConsoleTest, RejectsInvalidRules) {
    EXPECT_NE(run("add bad..example REFUSED").find("Rejected"), std::string::npos);
    EXPECT_NE(run("add ok.example nowhere").find("Rejected"), std::string::npos);
    EXPECT_NE(run("add ok.example REFUSED 9am 5pm").find("Rejected"), std::string::npos);
    EXPECT_NE(run("add ok.example").find("Usage"), std::string::npos);
    EXPECT_TRUE(store.currentSnapshot()->empty());
}

TEST_F(ControlConsoleTest, Toggle) {
    run("add t.example REFUSED");

    EXPECT_NE(run("toggle t.example").find("Disabled"), std::string::npos);
    EXPECT_FALSE(store.currentSnapshot()->rules()[0].enabled());
    EXPECT_NE(run("list").find("(disabled)"), std::string::npos);

    EXPECT_NE(run("toggle t.example").find("Enabled"), std::string::npos);
    EXPECT_TRUE(store.currentSnapshot()->rules()[0].enabled());
}

TEST_F(ControlConsoleTest, Maintenance) {
    run("maintenance on");
    EXPECT_TRUE(store.maintenance());
    run("maintenance toggle");
    EXPECT_FALSE(store.maintenance());
    run("maintenance");
    EXPECT_TRUE(store.maintenance());
    run("maintenance off");
    EXPECT_FALSE(store.maintenance());
    EXPECT_NE(run("maintenance sometimes").find("Usage"), std::string::npos);
}

TEST_F(ControlConsoleTest, MutationsArePersisted) {
    run("add persisted.example 10.0.0.7 08:00 20:00");
    run("maintenance on");

    PersistedState state;
    ASSERT_EQ(StateFile::load(path, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 1u);
    EXPECT_EQ(state.rules[0].pattern, "persisted.example.");
    EXPECT_EQ(state.rules[0].ip, "10.0.0.7");
    EXPECT_EQ(state.rules[0].start, "08:00");
    EXPECT_TRUE(state.maintenance);
}

TEST_F(ControlConsoleTest, StatsAndReset) {
    stats.recordMatch("ads.example.", std::chrono::system_clock::now());
    stats.recordOutcome(Outcome::Refused);

    std::string output = run("stats");
    EXPECT_NE(output.find("queries=1"), std::string::npos);
    EXPECT_NE(output.find("refused=1"), std::string::npos);
    EXPECT_NE(output.find("ads.example. 1"), std::string::npos);

    run("reset-stats");
    EXPECT_TRUE(stats.snapshot().empty());
    EXPECT_EQ(stats.counters().queries, 0u);
}

TEST_F(ControlConsoleTest, Logs) {
    EXPECT_NE(run("logs").find("No queries"), std::string::npos);

    QueryLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.client = "192.0.2.1:4000";
    entry.name = "ads.example.";
    entry.qtype = dns_type::AAAA;
    entry.action = "refused @ ads.example.";
    log.append(entry);

    std::string output = run("logs");
    EXPECT_NE(output.find("192.0.2.1:4000 ads.example. (AAAA) refused @ ads.example."), std::string::npos);
}

TEST_F(ControlConsoleTest, HelpAndUnknown) {
    EXPECT_NE(run("help").find("maintenance on|off|toggle"), std::string::npos);
    EXPECT_NE(run("bogus").find("Unknown command"), std::string::npos);
    EXPECT_EQ(run("   "), "");
}

TEST_F(ControlConsoleTest, UnloadedRulesAreKeptUntilRemoved) {
    console.setRetainedRules({{"*ads*.", "REFUSED", "", "", true}});

    EXPECT_NE(run("list").find("*ads*. -> REFUSED"), std::string::npos);

    // 其他变更写回文件时保留未加载的规则
    run("add ok.example REFUSED");
    PersistedState state;
    ASSERT_EQ(StateFile::load(path, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 2u);
    EXPECT_EQ(state.rules[0].pattern, "ok.example.");
    EXPECT_EQ(state.rules[1].pattern, "*ads*.");

    EXPECT_NE(run("remove *ads*.").find("Removed"), std::string::npos);
    ASSERT_EQ(StateFile::load(path, &state), Error::Success);
    ASSERT_EQ(state.rules.size(), 1u);
    EXPECT_EQ(state.rules[0].pattern, "ok.example.");
}

TEST_F(ControlConsoleTest, QuitStopsRun) {
    bool quit_called = false;
    console.setQuitHandler([&quit_called]() { quit_called = true; });

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    std::string input = "add a.example REFUSED\nquit\nadd b.example REFUSED\n";
    ASSERT_EQ(::write(fds[1], input.data(), input.size()), static_cast<ssize_t>(input.size()));

    console.run(fds[0]);
    ::close(fds[0]);
    ::close(fds[1]);

    EXPECT_TRUE(quit_called);
    EXPECT_EQ(store.currentSnapshot()->size(), 1u);
}

TEST_F(ControlConsoleTest, EndOfInputRunsLastLine) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    std::string input = "add a.example REFUSED\nadd b.example REFUSED";
    ASSERT_EQ(::write(fds[1], input.data(), input.size()), static_cast<ssize_t>(input.size()));
    ::close(fds[1]);

    console.run(fds[0]);
    ::close(fds[0]);

    EXPECT_EQ(store.currentSnapshot()->size(), 2u);
}

// 没有输入时 stop() 也能让 run() 返回, 线程可以回收
TEST_F(ControlConsoleTest, StopEndsIdleRun) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    std::thread thread([this, &fds]() { console.run(fds[0]); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    console.stop();
    thread.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
    ::close(fds[0]);
    ::close(fds[1]);
}
