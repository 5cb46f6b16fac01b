#include <agentmux/errors.hpp>
#include <agentmux/logging.hpp>
#include <agentmux/session.hpp>
#include <algorithm>

namespace agentmux
{

namespace
{

// Messages scanned first when building the last-output preview
constexpr size_t kPreviewWindow = 16;

long long steady_now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

// "Bash" matches both "Bash" and scoped entries such as "Bash(git:*)"
bool tool_listed(const std::vector<std::string>& tools, const std::string& tool_name)
{
    return std::any_of(tools.begin(), tools.end(),
                       [&](const std::string& entry)
                       {
                           return entry == tool_name ||
                                  (entry.size() > tool_name.size() &&
                                   entry.compare(0, tool_name.size(), tool_name) == 0 &&
                                   entry[tool_name.size()] == '(');
                       });
}

} // namespace

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Active:
        return "active";
    case SessionState::Completed:
        return "completed";
    case SessionState::Failed:
        return "failed";
    case SessionState::Terminated:
        return "terminated";
    }
    return "unknown";
}

json SessionInfo::to_json() const
{
    json j = {{"session_id", session_id},
              {"label", label},
              {"state", to_string(state)},
              {"working", working},
              {"is_complete", is_terminal(state)},
              {"turn_count", turn_count},
              {"max_turns", max_turns},
              {"prompt_count", prompt_count},
              {"runtime_ms", runtime_ms},
              {"message_count", message_count},
              {"last_output", last_output},
              {"decode_errors", decode_errors},
              {"created_at", format_timestamp(created_at)}};

    j["pid"] = pid > 0 ? json(pid) : json(nullptr);
    j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
    j["error"] = error.empty() ? json(nullptr) : json(error);
    j["completion_time"] = ended_at ? json(format_timestamp(*ended_at)) : json(nullptr);
    return j;
}

PermissionResult default_tool_permission(const SpawnOptions& options,
                                         const std::string& tool_name)
{
    if (tool_listed(options.disallowed_tools, tool_name))
    {
        PermissionResultDeny deny;
        deny.message = "Tool " + tool_name + " is not permitted for this session";
        return deny;
    }

    if (!options.allowed_tools.empty() && !tool_listed(options.allowed_tools, tool_name) &&
        options.permission_mode != "bypassPermissions")
    {
        PermissionResultDeny deny;
        deny.message = "Tool " + tool_name + " is not in the allowed tools for this session";
        return deny;
    }

    return PermissionResultAllow{};
}

Session::Session(std::string id, std::string label, SpawnOptions options,
                 const ManagerConfig& config, std::unique_ptr<Transport> transport)
    : id_(std::move(id)), label_(std::move(label)), options_(std::move(options)),
      control_timeout_(config.control_timeout), working_threshold_(config.working_threshold),
      permission_callback_(config.permission_callback), transport_(std::move(transport)),
      buffer_(config.buffer_capacity, config.buffer_max_bytes), last_activity_ms_(steady_now_ms()),
      started_(std::chrono::steady_clock::now()), created_at_(std::chrono::system_clock::now())
{
    if (!transport_)
        throw std::invalid_argument("Session requires a transport");
}

Session::~Session()
{
    // Joins the transport threads before the buffer they write to goes away
    transport_->terminate(false);
}

void Session::start(const PromptInput& prompt)
{
    init_request_id_ = control_.generate_request_id();

    try
    {
        transport_->start([this](protocol::DecodedFrame frame) { on_frame(std::move(frame)); },
                          [this](const TransportExit& exit) { on_exit(exit); });
    }
    catch (const AgentmuxError& e)
    {
        finish(SessionState::Failed, e.what());
        throw;
    }

    protocol::InitCommand init;
    init.request_id = init_request_id_;

    protocol::PromptCommand first;
    first.prompt = prompt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++prompt_count_;
    }

    try
    {
        // Queued only; a failed write surfaces through the exit report
        transport_->submit(protocol::encode(init) + protocol::encode(first));
    }
    catch (const AgentmuxError& e)
    {
        logger()->warn("[{}] initial prompt not queued: {}", label_, e.what());
    }

    logger()->info("[{}] session {} started (pid {})", label_, id_, transport_->get_pid());
}

void Session::send(const PromptInput& prompt)
{
    auto current = state();
    if (is_terminal(current))
        throw SessionNotActiveError(id_, to_string(current));

    protocol::PromptCommand command;
    command.prompt = prompt;

    try
    {
        transport_->write(protocol::encode(command));
    }
    catch (const TransportIoError&)
    {
        current = state();
        if (is_terminal(current))
            throw SessionNotActiveError(id_, to_string(current));
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++prompt_count_;
}

ReadResult Session::read(uint64_t offset, size_t limit) const
{
    return buffer_.read(offset, limit);
}

void Session::interrupt()
{
    auto current = state();
    if (is_terminal(current))
        throw SessionNotActiveError(id_, to_string(current));

    protocol::InterruptCommand command;
    command.request_id = control_.generate_request_id();
    auto future = control_.register_request(command.request_id);

    try
    {
        transport_->write(protocol::encode(command));
    }
    catch (const AgentmuxError&)
    {
        control_.cancel_request(command.request_id);
        throw;
    }

    control_.wait_for_response(future, command.request_id, "interrupt", control_timeout_);
    logger()->info("[{}] interrupted", label_);
}

void Session::terminate()
{
    transport_->terminate(true);

    // The exit report normally did this already; covers transports that never started
    finish(SessionState::Terminated, "");
}

SessionInfo Session::info(size_t last_output_lines) const
{
    SessionInfo info;
    info.session_id = id_;
    info.label = label_;
    info.state = state();
    info.turn_count = turn_count_.load();
    info.max_turns = options_.max_turns;
    info.message_count = buffer_.next_sequence();
    info.decode_errors = decode_errors_.load();
    info.pid = transport_->get_pid();
    info.created_at = created_at_;

    // Widen the tail window only while it keeps coming up short
    for (size_t window = kPreviewWindow; last_output_lines > 0; window *= 2)
    {
        auto recent = buffer_.tail(window);
        info.last_output = extract_last_output_lines(recent, last_output_lines);
        if (info.last_output.size() >= last_output_lines || recent.size() < window ||
            window >= buffer_.capacity())
            break;
    }

    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info.prompt_count = prompt_count_;
        info.exit_code = exit_code_;
        info.error = error_;
        info.ended_at = ended_at_;
        if (ended_steady_)
            now = *ended_steady_;
    }

    info.runtime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - started_).count();

    if (!is_terminal(info.state))
        info.working = steady_now_ms() - last_activity_ms_.load() < working_threshold_.count();

    return info;
}

std::optional<std::chrono::steady_clock::time_point> Session::ended_at() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_steady_;
}

void Session::on_frame(protocol::DecodedFrame frame)
{
    last_activity_ms_ = steady_now_ms();

    if (!frame.ok())
    {
        ++decode_errors_;
        logger()->warn("[{}] dropped frame: {}", label_, frame.error);
        return;
    }

    activate();

    const Message& message = *frame.message;
    buffer_.append(message, frame.raw, frame.size);

    if (const auto* request = std::get_if<protocol::ControlRequest>(&message))
    {
        handle_control_request(*request);
    }
    else if (const auto* response = std::get_if<protocol::ControlResponse>(&message))
    {
        handle_control_response(*response);
    }
    else if (const auto* result = std::get_if<ResultMessage>(&message))
    {
        result_seen_ = true;
        turn_count_ = result->num_turns;

        if (result->num_turns >= options_.max_turns)
        {
            logger()->info("[{}] reached {} turns, closing input", label_, result->num_turns);
            transport_->end_input();
        }
    }
}

void Session::on_exit(const TransportExit& exit)
{
    control_.fail_all_pending("Session process exited");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_code_ = exit.exit_code;
    }

    if (exit.terminated)
    {
        finish(SessionState::Terminated, "");
    }
    else if (!exit.error.empty())
    {
        finish(SessionState::Failed, exit.error);
    }
    else if (!exit.exit_code)
    {
        finish(SessionState::Failed, "Process exit status unknown");
    }
    else if (*exit.exit_code != 0)
    {
        finish(SessionState::Failed, "Process exited with code " + std::to_string(*exit.exit_code));
    }
    else if (!result_seen_)
    {
        finish(SessionState::Failed, "Process exited without a result");
    }
    else
    {
        finish(SessionState::Completed, "");
    }
}

void Session::handle_control_request(const protocol::ControlRequest& request)
{
    if (request.request_id.empty())
    {
        logger()->warn("[{}] control request without request_id ignored", label_);
        return;
    }

    protocol::ControlResponseCommand reply;
    reply.request_id = request.request_id;

    const std::string subtype = request.subtype();
    if (subtype == "can_use_tool")
    {
        try
        {
            reply.response = evaluate_permission(request.request);
        }
        catch (const std::invalid_argument& e)
        {
            reply.success = false;
            reply.error = e.what();
        }
    }
    else if (subtype == "hook_callback")
    {
        reply.success = false;
        reply.error = "Hook callbacks are not configured";
    }
    else
    {
        reply.success = false;
        reply.error = subtype.empty() ? "Malformed control request"
                                      : "Unsupported control request: " + subtype;
        logger()->debug("[{}] {}", label_, reply.error);
    }

    send_reply(reply);
}

void Session::handle_control_response(const protocol::ControlResponse& response)
{
    const auto& resp = response.response;

    if (resp.request_id == init_request_id_)
    {
        if (resp.subtype == "success")
            logger()->debug("[{}] initialized", label_);
        else
            logger()->warn("[{}] initialize rejected: {}", label_, resp.error);
        return;
    }

    if (!control_.handle_response(response))
        logger()->debug("[{}] control response for unknown request {}", label_, resp.request_id);
}

json Session::evaluate_permission(const json& request)
{
    auto tool_it = request.find("tool_name");
    if (tool_it == request.end() || !tool_it->is_string() || tool_it->get<std::string>().empty())
        throw std::invalid_argument("can_use_tool request without tool_name");

    std::string tool_name = tool_it->get<std::string>();
    json input = request.contains("input") ? request["input"] : json::object();

    ToolPermissionContext context;
    context.session_id = id_;
    context.permission_mode = options_.permission_mode;
    if (request.contains("permission_suggestions") && request["permission_suggestions"].is_array())
        context.suggestions = request["permission_suggestions"];

    PermissionResult result;
    if (permission_callback_)
    {
        try
        {
            result = (*permission_callback_)(tool_name, input, context);
        }
        catch (const std::exception& e)
        {
            logger()->error("[{}] permission callback failed for {}: {}", label_, tool_name,
                            e.what());
            PermissionResultDeny deny;
            deny.message = std::string("Permission check failed: ") + e.what();
            result = deny;
        }
    }
    else
    {
        result = default_tool_permission(options_, tool_name);
    }

    if (const auto* deny = std::get_if<PermissionResultDeny>(&result))
        logger()->info("[{}] denied {}: {}", label_, tool_name, deny->message);

    return permission_result_to_json(result, input);
}

void Session::send_reply(const protocol::ControlResponseCommand& reply)
{
    try
    {
        // Not awaited: this runs on the reader thread
        transport_->submit(protocol::encode(reply));
    }
    catch (const AgentmuxError& e)
    {
        logger()->warn("[{}] could not answer control request {}: {}", label_, reply.request_id,
                       e.what());
    }
}

void Session::activate()
{
    auto expected = SessionState::Initializing;
    if (state_.compare_exchange_strong(expected, SessionState::Active))
        logger()->debug("[{}] active", label_);
}

bool Session::finish(SessionState target, const std::string& error)
{
    auto current = state_.load();
    do
    {
        if (is_terminal(current))
            return false;
    } while (!state_.compare_exchange_weak(current, target));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = error;
        ended_steady_ = std::chrono::steady_clock::now();
        ended_at_ = std::chrono::system_clock::now();
    }

    if (target == SessionState::Failed)
        logger()->error("[{}] session {} failed: {}", label_, id_, error);
    else
        logger()->info("[{}] session {} {}", label_, id_, to_string(target));
    return true;
}

} // namespace agentmux
