#include "../test_utils.hpp"

#include <agentmux/errors.hpp>
#include <agentmux/logging.hpp>
#include <agentmux/manager.hpp>
#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <set>

using namespace agentmux;
using namespace agentmux::test;

namespace
{

ManagerConfig fake_config(FakeFactory& factory)
{
    ManagerConfig config = fast_config("agent");
    config.transport_factory = factory.make();
    return config;
}

SpawnOptions workers(int count, const std::string& label = "")
{
    SpawnOptions options;
    options.worker_count = count;
    options.label = label;
    return options;
}

} // namespace

TEST(SessionManagerTest, SpawnAssignsIdsAndLabels)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));

    auto ids = manager.spawn(std::string("review the code"), workers(3));
    ASSERT_EQ(ids.size(), 3u);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 3u);

    for (size_t i = 0; i < ids.size(); ++i)
    {
        // Canonical UUID v4 text
        ASSERT_EQ(ids[i].size(), 36u);
        EXPECT_EQ(ids[i][8], '-');
        EXPECT_EQ(ids[i][14], '4');

        auto info = manager.get_session_info(ids[i]);
        EXPECT_EQ(info.session_id, ids[i]);
        EXPECT_EQ(info.label, "Agent-" + std::to_string(i + 1));
        EXPECT_EQ(info.state, SessionState::Initializing);
    }
    EXPECT_EQ(factory.calls, 3);

    auto labelled = manager.spawn(std::string("check tests"), workers(1, "Reviewer"));
    EXPECT_EQ(manager.get_session_info(labelled[0]).label, "Reviewer-1");
}

TEST(SessionManagerTest, LaunchRequestCarriesOptions)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));

    SpawnOptions options;
    options.max_turns = 3;
    options.working_directory = "/srv/project";
    options.environment = {{"PROJECT", "demo"}};
    manager.spawn(std::string("hello"), options);

    const auto& request = factory.peer(0)->launches.at(0);
    EXPECT_EQ(request.working_directory, "/srv/project");
    EXPECT_EQ(request.environment.at("PROJECT"), "demo");
    auto it = std::find(request.args.begin(), request.args.end(), "--max-turns");
    ASSERT_NE(it, request.args.end());
    EXPECT_EQ(*(it + 1), "3");
}

TEST(SessionManagerTest, CapacityCheckedBeforeLaunch)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.max_sessions = 2;
    SessionManager manager(config);

    auto ids = manager.spawn(std::string("one"), workers(2));
    ASSERT_EQ(factory.calls, 2);

    try
    {
        manager.spawn(std::string("three"), workers(1));
        FAIL() << "expected CapacityExceededError";
    }
    catch (const CapacityExceededError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::CapacityExceeded);
        EXPECT_EQ(e.limit(), 2u);
    }
    EXPECT_EQ(factory.calls, 2);

    // Terminal sessions do not count
    manager.terminate_session(ids[0]);
    EXPECT_NO_THROW(manager.spawn(std::string("three"), workers(1)));
    EXPECT_EQ(factory.calls, 3);
}

TEST(SessionManagerTest, MultiWorkerSpawnIsAllOrNothing)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.max_sessions = 3;
    SessionManager manager(config);

    EXPECT_THROW(manager.spawn(std::string("too many"), workers(4)), CapacityExceededError);
    EXPECT_EQ(factory.calls, 0);
    EXPECT_EQ(manager.list_sessions().total_active, 0u);
}

TEST(SessionManagerTest, SpawnValidation)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));

    EXPECT_THROW(manager.spawn(std::string("")), SpawnFailedError);
    EXPECT_THROW(manager.spawn(std::vector<json>{}), SpawnFailedError);

    SpawnOptions options;
    options.max_turns = 0;
    EXPECT_THROW(manager.spawn(std::string("x"), options), SpawnFailedError);

    EXPECT_THROW(manager.spawn(std::string("x"), workers(0)), SpawnFailedError);
    EXPECT_THROW(manager.spawn(std::string("x"), workers(11)), SpawnFailedError);

    SpawnOptions env;
    env.environment = {{"LD_PRELOAD", "/tmp/evil.so"}};
    EXPECT_THROW(manager.spawn(std::string("x"), env), SpawnFailedError);

    SpawnOptions args;
    args.extra_args = {{"dangerously-skip-permissions", ""}};
    EXPECT_THROW(manager.spawn(std::string("x"), args), SpawnFailedError);

    EXPECT_EQ(factory.calls, 0);
}

TEST(SessionManagerTest, FailedWorkerRollsBackSpawn)
{
    std::vector<std::shared_ptr<FakePeer>> peers;
    auto config = fast_config("agent");
    config.max_sessions = 3;
    config.transport_factory = [&peers](const LaunchRequest&) -> std::unique_ptr<Transport>
    {
        auto peer = std::make_shared<FakePeer>();
        peer->fail_start = peers.size() == 1;
        peers.push_back(peer);
        return std::make_unique<FakeTransport>(peer);
    };
    SessionManager manager(config);

    EXPECT_THROW(manager.spawn(std::string("pair"), workers(2)), SpawnFailedError);
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_GE(peers[0]->terminate_calls, 1);
    EXPECT_TRUE(peers[0]->exited);

    auto listing = manager.list_sessions();
    EXPECT_EQ(listing.total_active + listing.total_completed, 0u);

    // The reservation was released; the next launch starts cleanly
    peers.clear();
    EXPECT_NO_THROW(manager.spawn(std::string("retry"), workers(1)));
}

TEST(SessionManagerTest, UnknownSessionId)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));

    EXPECT_THROW(manager.get_session_info("nope"), SessionNotFoundError);
    EXPECT_THROW(manager.get_session_output("nope", 0, 10), SessionNotFoundError);
    EXPECT_THROW(manager.send_prompt("nope", std::string("hi")), SessionNotFoundError);
    EXPECT_THROW(manager.interrupt_session("nope"), SessionNotFoundError);
    EXPECT_THROW(manager.terminate_session("nope"), SessionNotFoundError);
    EXPECT_THROW(manager.remove_session("nope"), SessionNotFoundError);
}

TEST(SessionManagerTest, OutputPaging)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));
    auto id = manager.spawn(std::string("talk"))[0];

    for (int i = 0; i < 5; ++i)
        factory.peer(0)->emit(assistant_text("msg " + std::to_string(i)));

    auto page = manager.get_session_output(id, 0, 2);
    ASSERT_EQ(page.messages.size(), 2u);
    EXPECT_TRUE(page.has_more);

    auto rest = manager.get_session_output(id, page.next_offset, 10);
    ASSERT_EQ(rest.messages.size(), 3u);
    EXPECT_EQ(rest.messages[0].seq, 2u);
    EXPECT_FALSE(rest.has_more);

    EXPECT_THROW(manager.get_session_output(id, 0, 0), std::invalid_argument);
}

TEST(SessionManagerTest, SendPromptRules)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));
    auto id = manager.spawn(std::string("start"))[0];

    EXPECT_THROW(manager.send_prompt(id, std::string("")), std::invalid_argument);

    manager.send_prompt(id, std::string("continue"));
    EXPECT_EQ(manager.get_session_info(id).prompt_count, 2u);

    manager.terminate_session(id);
    size_t writes = factory.peer(0)->write_count();
    EXPECT_THROW(manager.send_prompt(id, std::string("late")), SessionNotActiveError);
    EXPECT_EQ(factory.peer(0)->write_count(), writes);
}

TEST(SessionManagerTest, TerminateTwice)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));
    auto id = manager.spawn(std::string("start"))[0];

    manager.terminate_session(id);
    EXPECT_NO_THROW(manager.terminate_session(id));
    EXPECT_EQ(manager.get_session_info(id).state, SessionState::Terminated);
}

TEST(SessionManagerTest, ListSessionsSortsAndCounts)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.working_threshold = std::chrono::milliseconds(100);
    SessionManager manager(config);

    auto ids = manager.spawn(std::string("go"), workers(3));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Only the second session has recent output
    factory.peer(1)->emit(assistant_text("still going"));
    manager.terminate_session(ids[2]);

    auto listing = manager.list_sessions();
    EXPECT_EQ(listing.total_active, 2u);
    EXPECT_EQ(listing.total_completed, 1u);
    ASSERT_EQ(listing.active.size(), 2u);
    EXPECT_EQ(listing.active[0].session_id, ids[1]);
    EXPECT_TRUE(listing.active[0].working);
    EXPECT_FALSE(listing.active[1].working);
    ASSERT_EQ(listing.completed.size(), 1u);
    EXPECT_EQ(listing.completed[0].session_id, ids[2]);

    auto active_only = manager.list_sessions(false);
    EXPECT_TRUE(active_only.completed.empty());
    EXPECT_EQ(active_only.total_completed, 1u);

    json j = listing.to_json();
    EXPECT_EQ(j["total_active"], 2);
    EXPECT_EQ(j["active_sessions"].size(), 2u);
    EXPECT_EQ(j["completed_sessions"][0]["state"], "terminated");
}

TEST(SessionManagerTest, ListingAgreesWithReportedStateUnderChurn)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));

    std::atomic<bool> done{false};
    std::atomic<int> mismatches{0};
    std::atomic<int> listings{0};

    std::thread lister(
        [&]
        {
            while (!done.load())
            {
                auto listing = manager.list_sessions();
                for (const auto& info : listing.active)
                {
                    if (is_terminal(info.state))
                        ++mismatches;
                }
                for (const auto& info : listing.completed)
                {
                    if (!is_terminal(info.state))
                        ++mismatches;
                }
                if (listing.active.size() != listing.total_active ||
                    listing.completed.size() != listing.total_completed)
                    ++mismatches;
                ++listings;
            }
        });

    for (size_t i = 0; i < 2000; ++i)
    {
        auto id = manager.spawn(std::string("go"))[0];
        factory.peer(i)->emit(assistant_text("tick"));
        manager.terminate_session(id);
        manager.remove_session(id);
    }

    done = true;
    lister.join();
    EXPECT_GT(listings.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
}

TEST(SessionManagerTest, ConstructionLeavesLogLevelAlone)
{
    set_log_level(spdlog::level::err);

    FakeFactory factory;
    auto config = fake_config(factory);
    config.log_level = "trace";
    SessionManager manager(config);
    EXPECT_EQ(logger()->level(), spdlog::level::err);

    set_log_level(spdlog::level::info);
}

TEST(SessionManagerTest, RemoveSession)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));
    auto id = manager.spawn(std::string("go"))[0];

    EXPECT_THROW(manager.remove_session(id), std::invalid_argument);

    factory.peer(0)->emit(result_frame(1));
    factory.peer(0)->exit_with(0);
    ASSERT_EQ(manager.get_session_info(id).state, SessionState::Completed);

    manager.remove_session(id);
    EXPECT_THROW(manager.get_session_info(id), SessionNotFoundError);
}

TEST(SessionManagerTest, CleanupEvictsExpiredSessions)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.retention = std::chrono::milliseconds(0);
    SessionManager manager(config);

    auto ids = manager.spawn(std::string("go"), workers(2));
    manager.terminate_session(ids[0]);

    EXPECT_EQ(manager.cleanup_expired(), 1u);
    EXPECT_THROW(manager.get_session_info(ids[0]), SessionNotFoundError);
    EXPECT_EQ(manager.get_session_info(ids[1]).state, SessionState::Initializing);
    EXPECT_EQ(manager.cleanup_expired(), 0u);
}

TEST(SessionManagerTest, RetentionKeepsRecentSessions)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.retention = std::chrono::milliseconds(60000);
    SessionManager manager(config);

    auto id = manager.spawn(std::string("go"))[0];
    manager.terminate_session(id);

    EXPECT_EQ(manager.cleanup_expired(), 0u);
    EXPECT_EQ(manager.get_session_info(id).state, SessionState::Terminated);
}

TEST(SessionManagerTest, BackgroundCleanup)
{
    FakeFactory factory;
    auto config = fake_config(factory);
    config.retention = std::chrono::milliseconds(0);
    config.cleanup_interval = std::chrono::milliseconds(20);
    SessionManager manager(config);

    auto id = manager.spawn(std::string("go"))[0];
    manager.terminate_session(id);

    EXPECT_TRUE(wait_until(
        [&]()
        {
            try
            {
                manager.get_session_info(id);
                return false;
            }
            catch (const SessionNotFoundError&)
            {
                return true;
            }
        }));
}

TEST(SessionManagerTest, ShutdownTerminatesEverything)
{
    FakeFactory factory;
    SessionManager manager(fake_config(factory));
    manager.spawn(std::string("go"), workers(3));

    manager.shutdown();

    for (size_t i = 0; i < 3; ++i)
        EXPECT_TRUE(factory.peer(i)->exited);
    EXPECT_EQ(manager.list_sessions().total_active, 0u);
    EXPECT_THROW(manager.spawn(std::string("again")), SpawnFailedError);

    // Second shutdown is a no-op
    EXPECT_NO_THROW(manager.shutdown());
}

// End to end against small shell scripts standing in for the agent CLI

TEST(SessionManagerProcessTest, PingAgentProducesOutput)
{
    TempDir dir;
    SessionManager manager(fast_config(dir.write_script("agent", PING_AGENT)));

    auto id = manager.spawn(std::string("ping"))[0];

    ASSERT_TRUE(wait_until(
        [&]
        {
            return manager.get_session_info(id).state == SessionState::Active &&
                   manager.get_session_output(id, 0, 10).messages.size() == 1;
        }));

    auto output = manager.get_session_output(id, 0, 10);
    ASSERT_EQ(output.messages.size(), 1u);
    EXPECT_EQ(output.messages[0].seq, 0u);
    EXPECT_EQ(output.messages[0].kind, MessageKind::Assistant);
    EXPECT_FALSE(output.truncated);

    auto info = manager.get_session_info(id);
    EXPECT_GT(info.pid, 0);
    ASSERT_FALSE(info.last_output.empty());
    EXPECT_EQ(info.last_output[0], "pong");

    manager.terminate_session(id);
    EXPECT_EQ(manager.get_session_info(id).state, SessionState::Terminated);
}

TEST(SessionManagerProcessTest, SpawnThenTerminateSilentAgent)
{
    TempDir dir;
    SessionManager manager(fast_config(dir.write_script("agent", SILENT_AGENT)));

    auto id = manager.spawn(std::string("anything"))[0];
    manager.terminate_session(id);

    auto info = manager.get_session_info(id);
    EXPECT_EQ(info.state, SessionState::Terminated);

    auto output = manager.get_session_output(id, 0, 10);
    EXPECT_TRUE(output.messages.empty());
    EXPECT_FALSE(output.truncated);

    EXPECT_THROW(manager.send_prompt(id, std::string("hello?")), SessionNotActiveError);
}

TEST(SessionManagerProcessTest, AgentExitWithoutResultFails)
{
    TempDir dir;
    SessionManager manager(fast_config(dir.write_script("agent", "exit 1\n")));

    auto id = manager.spawn(std::string("anything"))[0];
    ASSERT_TRUE(
        wait_until([&] { return is_terminal(manager.get_session_info(id).state); }));

    auto info = manager.get_session_info(id);
    EXPECT_EQ(info.state, SessionState::Failed);
    ASSERT_TRUE(info.exit_code.has_value());
    EXPECT_EQ(*info.exit_code, 1);
}

TEST(SessionManagerProcessTest, StalledWriteTimesOutAndFailsSession)
{
    TempDir dir;
    auto config = fast_config(dir.write_script("agent", STALLED_AGENT));
    config.io_timeout = std::chrono::milliseconds(300);
    SessionManager manager(config);

    auto id = manager.spawn(std::string("small first prompt"))[0];

    std::string huge(512 * 1024, 'x');
    EXPECT_THROW(manager.send_prompt(id, huge), TimeoutError);

    ASSERT_TRUE(wait_until([&] { return is_terminal(manager.get_session_info(id).state); }));
    auto info = manager.get_session_info(id);
    EXPECT_EQ(info.state, SessionState::Failed);
    EXPECT_NE(info.error.find("timed out"), std::string::npos);
}

TEST(SessionManagerProcessTest, MissingExecutableFailsSpawn)
{
    SessionManager manager(fast_config("/this/path/does/not/exist/agent"));
    EXPECT_THROW(manager.spawn(std::string("hello")), SpawnFailedError);
    EXPECT_EQ(manager.list_sessions().total_active, 0u);
}
