#include <agentmux/errors.hpp>
#include <agentmux/protocol/control.hpp>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentmux
{
namespace protocol
{

namespace
{

json build_user_frame(const json& content, const std::string& session_id)
{
    return {{"type", "user"},
            {"message", {{"role", "user"}, {"content", content}}},
            {"parent_tool_use_id", nullptr},
            {"session_id", session_id}};
}

json structured_turn_frame(const json& turn, const std::string& session_id)
{
    // Already a complete user frame
    if (turn.is_object() && turn.value("type", "") == "user")
    {
        json frame = turn;
        if (!frame.contains("session_id"))
            frame["session_id"] = session_id;
        if (!frame.contains("parent_tool_use_id"))
            frame["parent_tool_use_id"] = nullptr;
        return frame;
    }

    // A {"role": ..., "content": ...} message object
    if (turn.is_object() && turn.contains("content"))
    {
        json message = turn;
        if (!message.contains("role"))
            message["role"] = "user";
        return {{"type", "user"},
                {"message", message},
                {"parent_tool_use_id", nullptr},
                {"session_id", session_id}};
    }

    return build_user_frame(turn, session_id);
}

struct CommandEncoder
{
    std::string operator()(const InitCommand& cmd) const
    {
        json request = {{"subtype", "initialize"}, {"hooks", cmd.hooks}, {"agents", cmd.agents}};
        json msg = {
            {"type", "control_request"}, {"request_id", cmd.request_id}, {"request", request}};
        return msg.dump() + "\n";
    }

    std::string operator()(const PromptCommand& cmd) const
    {
        if (const auto* text = std::get_if<std::string>(&cmd.prompt))
            return build_user_frame(*text, cmd.session_id).dump() + "\n";

        std::string frames;
        for (const auto& turn : std::get<std::vector<json>>(cmd.prompt))
            frames += structured_turn_frame(turn, cmd.session_id).dump() + "\n";
        return frames;
    }

    std::string operator()(const InterruptCommand& cmd) const
    {
        json msg = {{"type", "control_request"},
                    {"request_id", cmd.request_id},
                    {"request", {{"subtype", "interrupt"}}}};
        return msg.dump() + "\n";
    }

    std::string operator()(const ControlResponseCommand& cmd) const
    {
        json response;
        if (cmd.success)
        {
            response = {{"subtype", "success"},
                        {"request_id", cmd.request_id},
                        {"response", cmd.response}};
        }
        else
        {
            response = {
                {"subtype", "error"}, {"request_id", cmd.request_id}, {"error", cmd.error}};
        }

        json msg = {{"type", "control_response"}, {"response", response}};
        return msg.dump() + "\n";
    }
};

} // namespace

std::string encode(const Command& command)
{
    return std::visit(CommandEncoder{}, command);
}

ControlProtocol::ControlProtocol() {}

ControlProtocol::~ControlProtocol()
{
    fail_all_pending("Control protocol shutting down");
}

std::string ControlProtocol::generate_request_id()
{
    // Generate: req_{counter}_{random}
    int counter = request_counter_++;

    // Random hex string (4 bytes = 8 hex chars)
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << "req_" << counter << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

std::future<json> ControlProtocol::register_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    std::promise<json> promise;
    auto future = promise.get_future();

    pending_requests_[request_id] = std::move(promise);

    return future;
}

json ControlProtocol::wait_for_response(std::future<json>& future, const std::string& request_id,
                                        const std::string& subtype,
                                        std::chrono::milliseconds timeout)
{
    auto status = future.wait_for(timeout);
    if (status == std::future_status::timeout)
    {
        cancel_request(request_id);
        throw TimeoutError("Control request timed out: " + subtype);
    }

    return future.get();
}

bool ControlProtocol::handle_response(const ControlResponse& response)
{
    const auto& resp = response.response;

    if (resp.subtype == "success")
        return resolve_request(resp.request_id, resp.response);
    if (resp.subtype == "error")
        return reject_request(resp.request_id, resp.error);

    // Unknown subtype, reject
    return reject_request(resp.request_id, "Unknown response subtype: " + resp.subtype);
}

void ControlProtocol::cancel_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    pending_requests_.erase(request_id);
}

void ControlProtocol::fail_all_pending(const std::string& error)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    for (auto& [id, promise] : pending_requests_)
        promise.set_exception(std::make_exception_ptr(ControlRequestError(error)));
    pending_requests_.clear();
}

size_t ControlProtocol::pending_count() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

bool ControlProtocol::resolve_request(const std::string& request_id, const json& data)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
        return false;

    it->second.set_value(data);
    pending_requests_.erase(it);
    return true;
}

bool ControlProtocol::reject_request(const std::string& request_id, const std::string& error)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
        return false;

    it->second.set_exception(std::make_exception_ptr(ControlRequestError(error)));
    pending_requests_.erase(it);
    return true;
}

} // namespace protocol
} // namespace agentmux
