#include <agentmux/agentmux.hpp>
#include <chrono>
#include <iostream>
#include <thread>

constexpr int WORKERS = 2;
constexpr bool VERBOSE = false;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(500);

int main(int argc, char** argv)
{
    std::cout << "agentmux version: " << agentmux::version_string() << "\n\n";

    agentmux::ManagerConfig config;
    try
    {
        // Optional JSON config file, then AGENTMUX_* variables on top
        if (argc > 1)
            config = agentmux::load_config_file(argv[1]);
        agentmux::apply_environment_overrides(config);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Error: bad configuration - " << e.what() << "\n";
        return 1;
    }
    agentmux::init_logging(agentmux::parse_log_level(config.log_level));

    agentmux::SessionManager manager(config);

    agentmux::SpawnOptions opts;
    opts.permission_mode = "bypassPermissions";
    opts.max_turns = 1;
    opts.worker_count = WORKERS;
    opts.label = "Quick";

    std::vector<std::string> ids;
    try
    {
        ids = manager.spawn(std::string("What is 2+2? Be very brief."), opts);
    }
    catch (const agentmux::CapacityExceededError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    catch (const agentmux::SpawnFailedError& e)
    {
        std::cerr << "Error: could not start the agent CLI - " << e.what() << "\n";
        std::cerr << "Set AGENTMUX_CLI_PATH or pass a config file with \"executable\".\n";
        return 1;
    }

    std::cout << "Spawned " << ids.size() << " sessions\n\n";

    // Page through each session's output until every session has ended
    std::vector<uint64_t> offsets(ids.size(), 0);
    auto start = std::chrono::steady_clock::now();
    while (true)
    {
        bool running = false;
        for (size_t i = 0; i < ids.size(); ++i)
        {
            auto page = manager.get_session_output(ids[i], offsets[i], 50);
            if (page.truncated)
                std::cout << "  (some messages were evicted before they were read)\n";

            for (const auto& entry : page.messages)
            {
                if (const auto* assistant = std::get_if<agentmux::AssistantMessage>(&entry.message))
                {
                    auto text = agentmux::get_text_content(assistant->content);
                    if (!text.empty())
                        std::cout << "[" << manager.get_session_info(ids[i], 0).label << "] "
                                  << text << "\n";
                }
                else if (VERBOSE)
                {
                    std::cout << "  [" << entry.seq << "] " << agentmux::to_string(entry.kind)
                              << "\n";
                }
            }
            offsets[i] = page.next_offset;

            if (!agentmux::is_terminal(manager.get_session_info(ids[i], 0).state))
                running = true;
        }

        if (!running)
            break;
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "\n=== Sessions ===\n";
    std::cout << manager.list_sessions().to_json().dump(2) << "\n";
    std::cout << "\nTotal time: " << elapsed.count() << " ms\n";

    manager.shutdown();
    return 0;
}
