#include "internal/transport/launch_policy.hpp"

#include <agentmux/errors.hpp>
#include <agentmux/logging.hpp>
#include <agentmux/manager.hpp>
#include <algorithm>
#include <cstdio>
#include <openssl/rand.h>

namespace agentmux
{

namespace
{

// Random (version 4) UUID in canonical text form
std::string generate_session_id()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        throw SpawnFailedError("Could not generate a session id");

    bytes[6] = (bytes[6] & 0x0f) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3f) | 0x80; // RFC 4122 variant

    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14],
                  bytes[15]);
    return text;
}

bool prompt_is_empty(const PromptInput& prompt)
{
    if (const auto* text = std::get_if<std::string>(&prompt))
        return text->empty();
    return std::get<std::vector<json>>(prompt).empty();
}

// Working sessions first, then the longest running
bool listing_order(const SessionInfo& a, const SessionInfo& b)
{
    if (a.working != b.working)
        return a.working;
    return a.runtime_ms > b.runtime_ms;
}

} // namespace

json ListSessionsResult::to_json() const
{
    json active_json = json::array();
    for (const auto& info : active)
        active_json.push_back(info.to_json());

    json completed_json = json::array();
    for (const auto& info : completed)
        completed_json.push_back(info.to_json());

    return {{"active_sessions", active_json},
            {"completed_sessions", completed_json},
            {"total_active", total_active},
            {"total_completed", total_completed}};
}

SessionManager::SessionManager(ManagerConfig config) : config_(std::move(config))
{
    if (config_.cleanup_interval.count() > 0)
        cleanup_thread_ = std::thread(&SessionManager::cleanup_loop, this);
}

SessionManager::~SessionManager()
{
    shutdown();
}

std::vector<std::string> SessionManager::spawn(const PromptInput& prompt,
                                               const SpawnOptions& options)
{
    if (prompt_is_empty(prompt))
        throw SpawnFailedError("Prompt is empty");

    if (options.max_turns < 1 || options.max_turns > config_.max_turns_ceiling)
    {
        throw SpawnFailedError("max_turns must be between 1 and " +
                               std::to_string(config_.max_turns_ceiling));
    }

    if (options.worker_count < 1 ||
        static_cast<size_t>(options.worker_count) > config_.max_workers_per_spawn)
    {
        throw SpawnFailedError("worker_count must be between 1 and " +
                               std::to_string(config_.max_workers_per_spawn));
    }

    // Policy checks run before any capacity is taken or process created
    internal::validate_environment(config_.environment, options.environment);
    const auto args = internal::build_command(options, config_.arguments);

    const size_t count = static_cast<size_t>(options.worker_count);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_)
            throw SpawnFailedError("Session manager is shutting down");
        if (count_active_locked() + count > config_.max_sessions)
            throw CapacityExceededError(config_.max_sessions);
        reserved_ += count;
    }

    TransportFactory factory = config_.transport_factory;
    if (!factory)
    {
        factory = [this](const LaunchRequest& request)
        { return create_subprocess_transport(config_, request); };
    }

    std::vector<std::shared_ptr<Session>> started;
    try
    {
        for (size_t i = 0; i < count; ++i)
        {
            LaunchRequest request;
            request.session_id = generate_session_id();
            request.label = (options.label.empty() ? std::string("Agent") : options.label) + "-" +
                            std::to_string(i + 1);
            request.args = args;
            request.environment = options.environment;
            request.working_directory = options.working_directory.value_or("");

            auto transport = factory(request);
            if (!transport)
                throw SpawnFailedError("Transport factory returned no transport");

            auto session = std::make_shared<Session>(request.session_id, request.label, options,
                                                     config_, std::move(transport));
            session->start(prompt);
            started.push_back(std::move(session));
        }
    }
    catch (const std::exception& e)
    {
        logger()->error("spawn failed after {} of {} sessions: {}", started.size(), count,
                        e.what());
        for (auto& session : started)
            session->terminate();

        std::lock_guard<std::mutex> lock(mutex_);
        reserved_ -= count;
        throw;
    }

    std::vector<std::string> ids;
    ids.reserve(count);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_ -= count;
        for (auto& session : started)
        {
            ids.push_back(session->id());
            sessions_.emplace(session->id(), session);
        }
    }

    return ids;
}

void SessionManager::send_prompt(const std::string& session_id, const PromptInput& prompt)
{
    if (prompt_is_empty(prompt))
        throw std::invalid_argument("Prompt is empty");

    find(session_id)->send(prompt);
}

ReadResult SessionManager::get_session_output(const std::string& session_id, uint64_t offset,
                                              size_t limit) const
{
    if (limit == 0)
        throw std::invalid_argument("limit must be at least 1");

    return find(session_id)->read(offset, limit);
}

SessionInfo SessionManager::get_session_info(const std::string& session_id,
                                             size_t last_output_lines) const
{
    return find(session_id)->info(last_output_lines);
}

ListSessionsResult SessionManager::list_sessions(bool include_completed,
                                                 size_t last_output_lines) const
{
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(sessions_.size());
        for (const auto& entry : sessions_)
            snapshot.push_back(entry.second);
    }

    ListSessionsResult result;
    for (const auto& session : snapshot)
    {
        // Bucket on the state captured in the info itself
        auto info = session->info(last_output_lines);
        if (is_terminal(info.state))
        {
            ++result.total_completed;
            if (include_completed)
                result.completed.push_back(std::move(info));
        }
        else
        {
            ++result.total_active;
            result.active.push_back(std::move(info));
        }
    }

    std::sort(result.active.begin(), result.active.end(), listing_order);
    std::sort(result.completed.begin(), result.completed.end(), listing_order);
    return result;
}

void SessionManager::interrupt_session(const std::string& session_id)
{
    find(session_id)->interrupt();
}

void SessionManager::terminate_session(const std::string& session_id)
{
    find(session_id)->terminate();
}

void SessionManager::remove_session(const std::string& session_id)
{
    std::shared_ptr<Session> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
            throw SessionNotFoundError(session_id);
        if (!is_terminal(it->second->state()))
            throw std::invalid_argument("Session " + session_id + " is still running");
        evicted = std::move(it->second);
        sessions_.erase(it);
    }

    logger()->debug("[{}] removed session {}", evicted->label(), session_id);
}

size_t SessionManager::cleanup_expired()
{
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<Session>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto ended = it->second->ended_at();
            if (ended && now - *ended >= config_.retention)
            {
                evicted.push_back(std::move(it->second));
                it = sessions_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (const auto& session : evicted)
        logger()->debug("[{}] evicted expired session {}", session->label(), session->id());

    return evicted.size();
}

void SessionManager::shutdown()
{
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        sessions.swap(sessions_);
    }
    cleanup_cv_.notify_all();

    if (cleanup_thread_.joinable())
        cleanup_thread_.join();

    if (sessions.empty())
        return;

    logger()->info("shutting down {} sessions", sessions.size());

    // Graceful stops wait out the grace window; run them side by side
    std::vector<std::thread> stoppers;
    stoppers.reserve(sessions.size());
    for (auto& entry : sessions)
    {
        auto session = entry.second;
        stoppers.emplace_back([session] { session->terminate(); });
    }
    for (auto& stopper : stoppers)
        stopper.join();
}

std::shared_ptr<Session> SessionManager::find(const std::string& session_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        throw SessionNotFoundError(session_id);
    return it->second;
}

size_t SessionManager::count_active_locked() const
{
    size_t active = reserved_;
    for (const auto& entry : sessions_)
        if (!is_terminal(entry.second->state()))
            ++active;
    return active;
}

void SessionManager::cleanup_loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutting_down_)
    {
        cleanup_cv_.wait_for(lock, config_.cleanup_interval, [this] { return shutting_down_; });
        if (shutting_down_)
            break;

        lock.unlock();
        size_t evicted = cleanup_expired();
        if (evicted > 0)
            logger()->debug("cleanup evicted {} sessions", evicted);
        lock.lock();
    }
}

} // namespace agentmux
