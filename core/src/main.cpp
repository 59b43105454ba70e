// tether-cli
// Config-based MCP client with CLI argument parsing

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/process_supervisor.hpp"
#include "client/reliable_client.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace
{

    void print_usage()
    {
        std::cerr << "Usage: tether-cli [OPTIONS] COMMAND [ARGS]\n\n";
        std::cerr << "Options:\n";
        std::cerr << "  --config=PATH        Path to config file (default: tether.yaml)\n";
        std::cerr << "  --server=NAME        Server to talk to (default: first configured server)\n";
        std::cerr << "  --log-level=LEVEL    debug, info, warn or error (overrides config)\n";
        std::cerr << "  --help, -h           Show this help\n\n";
        std::cerr << "Commands:\n";
        std::cerr << "  list-tools                   List the server's tools\n";
        std::cerr << "  call-tool NAME [JSON_ARGS]   Invoke a tool\n";
        std::cerr << "  call METHOD [JSON_PARAMS]    Send a raw request\n";
        std::cerr << "  status                       Show supervised server status\n";
    }

    nlohmann::json parse_json_arg(const std::vector<std::string> &args, size_t index)
    {
        if (index >= args.size())
        {
            return nlohmann::json::object();
        }
        auto parsed = nlohmann::json::parse(args[index], nullptr, false);
        if (parsed.is_discarded())
        {
            throw tether::client::InvalidArgumentError("Invalid JSON argument: " + args[index]);
        }
        return parsed;
    }

    nlohmann::json status_to_json(const std::vector<tether::client::ServerStatus> &statuses)
    {
        nlohmann::json result = nlohmann::json::array();
        for (const auto &status : statuses)
        {
            result.push_back({{"name", status.name},
                              {"connected", status.connected},
                              {"running", status.running},
                              {"restart_attempts", status.restart_attempts},
                              {"max_restart_attempts", status.max_restart_attempts},
                              {"state", tether::client::server_state_to_string(status.state)},
                              {"pid", status.pid},
                              {"last_error", status.last_error}});
        }
        return result;
    }

} // namespace

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "tether.yaml"; // Default
    std::string server_name;
    std::string log_level;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg.substr(0, 9) == "--server=")
        {
            server_name = arg.substr(9);
        }
        else if (arg.substr(0, 12) == "--log-level=")
        {
            log_level = arg.substr(12);
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (arg.size() > 2 && arg.substr(0, 2) == "--")
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    if (!log_level.empty())
    {
        tether::logging::Logger::set_level(tether::logging::string_to_level(log_level));
    }

    LOG_INFO("Loading config: " << config_path);

    tether::runtime::RuntimeConfig config;
    std::string error;

    if (!tether::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    tether::logging::Logger::set_level(
        tether::logging::string_to_level(log_level.empty() ? config.logging.level : log_level));

    const tether::client::ServerConfig *server =
        server_name.empty() ? &config.servers.front() : tether::runtime::find_server(config, server_name);
    if (server == nullptr)
    {
        LOG_ERROR("Unknown server: " << server_name);
        return 1;
    }

    const std::string command = positional.empty() ? "status" : positional.front();

    auto supervisor = std::make_shared<tether::client::ProcessSupervisor>(config.client);
    tether::client::ReliableClient client(supervisor, *server, config.reliability);

    // Install signal handler for graceful shutdown
    tether::runtime::SignalHandler::install();
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&supervisor, &finished]()
                               {
        while (!finished.load()) {
            if (tether::runtime::SignalHandler::is_shutdown_requested()) {
                LOG_INFO("Signal received, stopping servers...");
                supervisor->stop_all();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        } });

    int exit_code = 0;
    try
    {
        client.connect();

        nlohmann::json output;
        if (command == "list-tools")
        {
            output = nlohmann::json(client.list_tools());
        }
        else if (command == "call-tool")
        {
            if (positional.size() < 2)
            {
                throw tether::client::InvalidArgumentError("call-tool requires a tool name");
            }
            tether::client::ToolRequest request;
            request.name = positional[1];
            request.arguments = parse_json_arg(positional, 2);
            output = nlohmann::json(client.call_tool(request));
        }
        else if (command == "call")
        {
            if (positional.size() < 2)
            {
                throw tether::client::InvalidArgumentError("call requires a method name");
            }
            output = client.call(positional[1], parse_json_arg(positional, 2));
        }
        else if (command == "status")
        {
            output = status_to_json(supervisor->status());
        }
        else
        {
            throw tether::client::InvalidArgumentError("Unknown command: " + command);
        }

        std::cout << output.dump(2) << std::endl;
    }
    catch (const tether::client::ClientError &e)
    {
        LOG_ERROR("[" << tether::client::error_code_to_string(e.code()) << "] " << e.what());
        exit_code = 1;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Unexpected error: " << e.what());
        exit_code = 1;
    }

    finished.store(true);
    signal_watcher.join();
    supervisor->stop_all();

    LOG_INFO("Shutdown complete");
    return exit_code;
}
