#include <agentmux/agentmux.hpp>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>

int main()
{
    // Allow only specific tools
    std::set<std::string> allowed_tools = {"Read", "Glob", "Grep"};

    agentmux::ManagerConfig config;
    agentmux::apply_environment_overrides(config);
    agentmux::init_logging(agentmux::parse_log_level(config.log_level));

    config.permission_callback =
        [&allowed_tools](const std::string& tool_name, const agentmux::json& input,
                         const agentmux::ToolPermissionContext& context) -> agentmux::PermissionResult
    {
        bool allowed = allowed_tools.count(tool_name) > 0;

        std::cout << "[TOOL] " << context.session_id.substr(0, 8) << " " << tool_name
                  << (allowed ? " [ALLOWED]" : " [DENIED]") << "\n";

        if (allowed)
            return agentmux::PermissionResultAllow{};

        return agentmux::PermissionResultDeny{"deny", "Tool '" + tool_name +
                                                          "' is not in the allowed list"};
    };

    try
    {
        agentmux::SessionManager manager(config);

        std::cout << "Tool Permissions Example\n";
        std::cout << "Allowed tools: Read, Glob, Grep\n";
        std::cout << "All other tools will be denied\n\n";

        agentmux::SpawnOptions opts;
        opts.permission_mode = "default";
        opts.max_turns = 5;

        auto id = manager.spawn(std::string("Search for all .cpp files, read one, "
                                            "and then try to write a new file"),
                                opts)[0];

        uint64_t offset = 0;
        while (true)
        {
            auto page = manager.get_session_output(id, offset, 100);
            for (const auto& entry : page.messages)
            {
                if (const auto* assistant = std::get_if<agentmux::AssistantMessage>(&entry.message))
                    std::cout << agentmux::get_text_content(assistant->content) << std::flush;
            }
            offset = page.next_offset;

            auto info = manager.get_session_info(id, 0);
            if (agentmux::is_terminal(info.state))
            {
                std::cout << "\nSession " << agentmux::to_string(info.state) << " after "
                          << info.turn_count << " turns\n";
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
