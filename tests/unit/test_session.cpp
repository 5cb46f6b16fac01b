#include "../test_utils.hpp"

#include <agentmux/errors.hpp>
#include <agentmux/session.hpp>
#include <gtest/gtest.h>

using namespace agentmux;
using namespace agentmux::test;

namespace
{

json can_use_tool(const std::string& request_id, const std::string& tool_name,
                  const json& input = json{{"command", "ls"}})
{
    return {{"type", "control_request"},
            {"request_id", request_id},
            {"request", {{"subtype", "can_use_tool"}, {"tool_name", tool_name}, {"input", input}}}};
}

json control_success(const std::string& request_id)
{
    return {{"type", "control_response"},
            {"response",
             {{"subtype", "success"}, {"request_id", request_id}, {"response", json::object()}}}};
}

// Replies the session wrote back, keyed by request id
std::optional<json> reply_for(FakePeer& peer, const std::string& request_id)
{
    for (const auto& frame : peer.written_frames())
    {
        if (frame.value("type", "") == "control_response" &&
            frame["response"].value("request_id", "") == request_id)
            return frame["response"];
    }
    return std::nullopt;
}

} // namespace

class SessionTest : public ::testing::Test
{
  protected:
    std::unique_ptr<Session> make_session(SpawnOptions options = {})
    {
        return std::make_unique<Session>("session-1", "Agent-1", std::move(options), config,
                                         std::make_unique<FakeTransport>(peer));
    }

    std::unique_ptr<Session> start_session(SpawnOptions options = {})
    {
        auto session = make_session(std::move(options));
        session->start(std::string("hello"));
        return session;
    }

    std::shared_ptr<FakePeer> peer = std::make_shared<FakePeer>();
    ManagerConfig config = fast_config("agent");
};

TEST_F(SessionTest, StartQueuesInitThenPrompt)
{
    auto session = start_session();

    EXPECT_EQ(session->state(), SessionState::Initializing);
    EXPECT_TRUE(peer->started);

    auto frames = peer->written_frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]["type"], "control_request");
    EXPECT_EQ(frames[0]["request"]["subtype"], "initialize");
    EXPECT_EQ(frames[1]["type"], "user");
    EXPECT_EQ(frames[1]["message"]["content"], "hello");

    EXPECT_EQ(session->info().prompt_count, 1u);
    EXPECT_EQ(session->info().pid, 4242);
}

TEST_F(SessionTest, FirstFrameActivatesAndIsBuffered)
{
    auto session = start_session();
    peer->emit(assistant_text("hi there"));

    EXPECT_EQ(session->state(), SessionState::Active);

    auto result = session->read(0, 10);
    ASSERT_EQ(result.messages.size(), 1u);
    EXPECT_EQ(result.messages[0].seq, 0u);
    EXPECT_EQ(result.messages[0].kind, MessageKind::Assistant);
    EXPECT_EQ(result.messages[0].raw["message"]["content"][0]["text"], "hi there");
    EXPECT_FALSE(result.truncated);
}

TEST_F(SessionTest, CompletesAfterResultAndCleanExit)
{
    auto session = start_session();
    peer->emit(assistant_text("working"));
    peer->emit(result_frame(1));
    EXPECT_EQ(session->state(), SessionState::Active);

    peer->exit_with(0);
    EXPECT_EQ(session->state(), SessionState::Completed);

    auto info = session->info();
    EXPECT_EQ(info.turn_count, 1);
    ASSERT_TRUE(info.exit_code.has_value());
    EXPECT_EQ(*info.exit_code, 0);
    EXPECT_TRUE(info.error.empty());
    EXPECT_TRUE(info.ended_at.has_value());
    EXPECT_TRUE(session->ended_at().has_value());
    EXPECT_FALSE(info.working);
}

TEST_F(SessionTest, CleanExitWithoutResultFails)
{
    auto session = start_session();
    peer->emit(assistant_text("partial"));
    peer->exit_with(0);

    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->info().error, "Process exited without a result");
}

TEST_F(SessionTest, NonZeroExitFails)
{
    auto session = start_session();
    peer->emit(result_frame(1));
    peer->exit_with(2);

    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->info().error, "Process exited with code 2");
}

TEST_F(SessionTest, TerminateIsIdempotentAndFinal)
{
    auto session = start_session();
    peer->emit(assistant_text("busy"));

    session->terminate();
    EXPECT_EQ(session->state(), SessionState::Terminated);
    auto first_end = session->ended_at();

    session->terminate();
    EXPECT_EQ(session->state(), SessionState::Terminated);
    EXPECT_EQ(session->ended_at(), first_end);

    // Buffer survives termination
    EXPECT_EQ(session->read(0, 10).messages.size(), 1u);
}

TEST_F(SessionTest, TerminalStateIsNotOverwritten)
{
    auto session = start_session();
    peer->emit(result_frame(1));
    peer->exit_with(0);
    ASSERT_EQ(session->state(), SessionState::Completed);

    session->terminate();
    EXPECT_EQ(session->state(), SessionState::Completed);
}

TEST_F(SessionTest, SendOnTerminalSessionWritesNothing)
{
    auto session = start_session();
    session->terminate();
    size_t writes = peer->write_count();

    try
    {
        session->send(std::string("anyone there?"));
        FAIL() << "expected SessionNotActiveError";
    }
    catch (const SessionNotActiveError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::SessionNotActive);
        EXPECT_EQ(e.session_id(), "session-1");
    }
    EXPECT_EQ(peer->write_count(), writes);
    EXPECT_THROW(session->interrupt(), SessionNotActiveError);
}

TEST_F(SessionTest, SendWritesPromptFrame)
{
    auto session = start_session();
    peer->emit(assistant_text("ready"));

    session->send(std::string("next step"));

    auto frames = peer->written_frames();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[2]["type"], "user");
    EXPECT_EQ(frames[2]["message"]["content"], "next step");
    EXPECT_EQ(session->info().prompt_count, 2u);
}

TEST_F(SessionTest, StartFailureMarksFailed)
{
    peer->fail_start = true;
    auto session = make_session();

    EXPECT_THROW(session->start(std::string("hello")), SpawnFailedError);
    EXPECT_EQ(session->state(), SessionState::Failed);
    EXPECT_EQ(session->info().error, "fake spawn failure");
    EXPECT_EQ(peer->write_count(), 0u);
}

TEST_F(SessionTest, DefaultPolicyAllowsTool)
{
    auto session = start_session();
    peer->emit(can_use_tool("cli_1", "Bash"));

    auto reply = reply_for(*peer, "cli_1");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["subtype"], "success");
    EXPECT_EQ((*reply)["response"]["behavior"], "allow");
    EXPECT_EQ((*reply)["response"]["updatedInput"]["command"], "ls");

    // The request itself is part of the session output
    auto output = session->read(0, 10);
    ASSERT_EQ(output.messages.size(), 1u);
    EXPECT_EQ(output.messages[0].kind, MessageKind::ControlRequest);
}

TEST_F(SessionTest, DefaultPolicyDeniesDisallowedTool)
{
    SpawnOptions options;
    options.disallowed_tools = {"Bash(rm:*)", "Write"};
    auto session = start_session(options);

    peer->emit(can_use_tool("cli_1", "Write"));
    peer->emit(can_use_tool("cli_2", "Bash"));

    auto write_reply = reply_for(*peer, "cli_1");
    ASSERT_TRUE(write_reply.has_value());
    EXPECT_EQ((*write_reply)["response"]["behavior"], "deny");
    EXPECT_FALSE((*write_reply)["response"]["message"].get<std::string>().empty());

    auto bash_reply = reply_for(*peer, "cli_2");
    ASSERT_TRUE(bash_reply.has_value());
    EXPECT_EQ((*bash_reply)["response"]["behavior"], "deny");
}

TEST(DefaultToolPermissionTest, AllowedListAndBypass)
{
    SpawnOptions options;
    options.allowed_tools = {"Read", "Bash(git:*)"};

    EXPECT_TRUE(std::holds_alternative<PermissionResultAllow>(
        default_tool_permission(options, "Read")));
    EXPECT_TRUE(std::holds_alternative<PermissionResultAllow>(
        default_tool_permission(options, "Bash")));
    EXPECT_TRUE(std::holds_alternative<PermissionResultDeny>(
        default_tool_permission(options, "Write")));
    // Prefix alone is not a match
    EXPECT_TRUE(std::holds_alternative<PermissionResultDeny>(
        default_tool_permission(options, "Rea")));

    options.permission_mode = "bypassPermissions";
    EXPECT_TRUE(std::holds_alternative<PermissionResultAllow>(
        default_tool_permission(options, "Write")));

    options.disallowed_tools = {"Write"};
    EXPECT_TRUE(std::holds_alternative<PermissionResultDeny>(
        default_tool_permission(options, "Write")));
}

TEST_F(SessionTest, PermissionCallbackDecides)
{
    std::string seen_tool;
    std::string seen_session;
    config.permission_callback = [&](const std::string& tool_name, const json& input,
                                     const ToolPermissionContext& context) -> PermissionResult
    {
        seen_tool = tool_name;
        seen_session = context.session_id;
        PermissionResultAllow allow;
        allow.updated_input = json{{"command", input["command"].get<std::string>() + " -la"}};
        return allow;
    };

    auto session = start_session();
    peer->emit(can_use_tool("cli_7", "Bash"));

    EXPECT_EQ(seen_tool, "Bash");
    EXPECT_EQ(seen_session, "session-1");
    auto reply = reply_for(*peer, "cli_7");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["response"]["behavior"], "allow");
    EXPECT_EQ((*reply)["response"]["updatedInput"]["command"], "ls -la");
}

TEST_F(SessionTest, ThrowingPermissionCallbackDenies)
{
    config.permission_callback = [](const std::string&, const json&,
                                    const ToolPermissionContext&) -> PermissionResult
    { throw std::runtime_error("policy store offline"); };

    auto session = start_session();
    peer->emit(can_use_tool("cli_1", "Read"));

    auto reply = reply_for(*peer, "cli_1");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["subtype"], "success");
    EXPECT_EQ((*reply)["response"]["behavior"], "deny");
    EXPECT_NE((*reply)["response"]["message"].get<std::string>().find("policy store offline"),
              std::string::npos);
    EXPECT_EQ(session->state(), SessionState::Active);
}

TEST_F(SessionTest, CanUseToolWithoutToolNameIsAnError)
{
    auto session = start_session();
    peer->emit(json{{"type", "control_request"},
                    {"request_id", "cli_1"},
                    {"request", {{"subtype", "can_use_tool"}}}});

    auto reply = reply_for(*peer, "cli_1");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["subtype"], "error");
}

TEST_F(SessionTest, UnsupportedControlRequestsGetErrorReplies)
{
    auto session = start_session();
    peer->emit(json{{"type", "control_request"},
                    {"request_id", "cli_1"},
                    {"request", {{"subtype", "hook_callback"}, {"callback_id", "h1"}}}});
    peer->emit(json{{"type", "control_request"},
                    {"request_id", "cli_2"},
                    {"request", {{"subtype", "mcp_message"}}}});

    auto hook = reply_for(*peer, "cli_1");
    ASSERT_TRUE(hook.has_value());
    EXPECT_EQ((*hook)["subtype"], "error");

    auto mcp = reply_for(*peer, "cli_2");
    ASSERT_TRUE(mcp.has_value());
    EXPECT_EQ((*mcp)["subtype"], "error");
    EXPECT_EQ((*mcp)["error"], "Unsupported control request: mcp_message");

    EXPECT_EQ(session->read(0, 10).messages.size(), 2u);
    EXPECT_EQ(session->state(), SessionState::Active);
}

TEST_F(SessionTest, DecodeErrorsAreCountedNotBuffered)
{
    auto session = start_session();
    peer->emit(std::string("this is not json"));
    peer->emit(std::string("{\"no_type\": true}"));

    EXPECT_EQ(session->info().decode_errors, 2u);
    EXPECT_EQ(session->state(), SessionState::Initializing);
    EXPECT_TRUE(session->read(0, 10).messages.empty());

    peer->emit(assistant_text("recovered"));
    EXPECT_EQ(session->state(), SessionState::Active);
    EXPECT_EQ(session->read(0, 10).messages.size(), 1u);
}

TEST_F(SessionTest, MaxTurnsClosesInput)
{
    SpawnOptions options;
    options.max_turns = 2;
    auto session = start_session(options);

    peer->emit(result_frame(1));
    EXPECT_FALSE(peer->input_ended);

    peer->emit(result_frame(2));
    EXPECT_TRUE(peer->input_ended);
    EXPECT_EQ(session->info().turn_count, 2);
}

TEST_F(SessionTest, InterruptWaitsForAcknowledgement)
{
    auto session = start_session();
    peer->emit(assistant_text("long task"));

    std::thread responder(
        [this]()
        {
            std::string request_id;
            wait_until(
                [&]()
                {
                    for (const auto& frame : peer->written_frames())
                    {
                        if (frame.value("type", "") == "control_request" &&
                            frame["request"].value("subtype", "") == "interrupt")
                        {
                            request_id = frame["request_id"].get<std::string>();
                            return true;
                        }
                    }
                    return false;
                });
            if (!request_id.empty())
                peer->emit(control_success(request_id));
        });

    EXPECT_NO_THROW(session->interrupt());
    responder.join();
    EXPECT_EQ(session->state(), SessionState::Active);
}

TEST_F(SessionTest, InterruptTimesOut)
{
    config.control_timeout = std::chrono::milliseconds(50);
    auto session = start_session();

    EXPECT_THROW(session->interrupt(), TimeoutError);
    EXPECT_NE(session->state(), SessionState::Failed);
}

TEST_F(SessionTest, InitAcknowledgementIsIgnored)
{
    auto session = start_session();
    auto init_id = peer->written_frames()[0]["request_id"].get<std::string>();

    peer->emit(control_success(init_id));
    EXPECT_EQ(session->state(), SessionState::Active);
    EXPECT_EQ(session->read(0, 10).messages[0].kind, MessageKind::ControlResponse);
}

TEST_F(SessionTest, InfoToJson)
{
    SpawnOptions options;
    options.max_turns = 4;
    auto session = start_session(options);
    peer->emit(assistant_text("line one"));
    peer->emit(assistant_text("line two"));

    auto info = session->info(1);
    EXPECT_TRUE(info.working);
    EXPECT_EQ(info.max_turns, 4);
    EXPECT_EQ(info.message_count, 2u);
    ASSERT_EQ(info.last_output.size(), 1u);
    EXPECT_EQ(info.last_output[0], "line two");

    json j = info.to_json();
    EXPECT_EQ(j["session_id"], "session-1");
    EXPECT_EQ(j["label"], "Agent-1");
    EXPECT_EQ(j["state"], "active");
    EXPECT_EQ(j["is_complete"], false);
    EXPECT_EQ(j["pid"], 4242);
    EXPECT_TRUE(j["exit_code"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["completion_time"].is_null());
    EXPECT_GE(j["runtime_ms"].get<long long>(), 0);

    session->terminate();
    json ended = session->info().to_json();
    EXPECT_EQ(ended["state"], "terminated");
    EXPECT_EQ(ended["is_complete"], true);
    EXPECT_EQ(ended["exit_code"], 143);
    EXPECT_FALSE(ended["completion_time"].is_null());
}

TEST_F(SessionTest, LastOutputLooksPastQuietTail)
{
    auto session = start_session();
    peer->emit(assistant_text("early answer"));
    for (int i = 0; i < 40; ++i)
        peer->emit(json{{"type", "system"}, {"subtype", "status"}});

    auto info = session->info(2);
    ASSERT_EQ(info.last_output.size(), 1u);
    EXPECT_EQ(info.last_output[0], "early answer");
    EXPECT_EQ(info.message_count, 41u);
}

TEST_F(SessionTest, LastOutputNewestFirst)
{
    auto session = start_session();
    for (int i = 0; i < 30; ++i)
        peer->emit(assistant_text("line " + std::to_string(i)));

    auto info = session->info(3);
    ASSERT_EQ(info.last_output.size(), 3u);
    EXPECT_EQ(info.last_output[0], "line 29");
    EXPECT_EQ(info.last_output[2], "line 27");
}

TEST(SessionStateTest, Names)
{
    EXPECT_STREQ(to_string(SessionState::Initializing), "initializing");
    EXPECT_STREQ(to_string(SessionState::Completed), "completed");
    EXPECT_TRUE(is_terminal(SessionState::Failed));
    EXPECT_FALSE(is_terminal(SessionState::Active));
}
