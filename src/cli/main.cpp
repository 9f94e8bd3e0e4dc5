#include "boswell/client/backend.hpp"
#include "boswell/exceptions.hpp"
#include "boswell/mcp/handler.hpp"
#include "boswell/server/http_server.hpp"
#include "boswell/server/stdio_server.hpp"
#include "boswell/settings.hpp"
#include "boswell/tools/dispatcher.hpp"
#include "boswell/tools/registry.hpp"
#include "boswell/util/log.hpp"
#include "boswell/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_shutdown{false};

void on_signal(int)
{
    g_shutdown = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "boswell-mcp " << boswell::SERVER_VERSION << "\n";
    std::cout << "MCP gateway for the Boswell memory API\n";
    std::cout << "Usage:\n";
    std::cout << "  boswell-mcp [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --help                  Show this help\n";
    std::cout << "  --config <file.json>    Load settings from a JSON file\n";
    std::cout << "  --stdio                 Serve MCP over stdin/stdout instead of HTTP\n";
    std::cout << "  --host <addr>           HTTP bind address\n";
    std::cout << "  --port <n>              HTTP port\n";
    std::cout << "  --api-url <url>         Boswell API base URL\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  BOSWELL_API_URL, BOSWELL_HOST, BOSWELL_PORT (or PORT), BOSWELL_TIMEOUT,\n";
    std::cout << "  BOSWELL_LOG_LEVEL, BOSWELL_TRANSPORT\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            throw boswell::ValidationError("Missing value for " + flag);
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<long long>(i),
                   args.begin() + static_cast<long long>(i) + 2);
        return value;
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int parse_port(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos == s.size())
            return v;
    }
    catch (const std::logic_error&)
    {
    }
    throw boswell::ValidationError("Invalid port: " + s);
}

static boswell::Settings load_settings(std::vector<std::string>& args)
{
    auto settings = boswell::Settings::from_env();
    if (auto config = consume_flag_value(args, "--config"))
        settings = boswell::Settings::from_file(*config, settings);
    if (auto host = consume_flag_value(args, "--host"))
        settings.host = *host;
    if (auto port = consume_flag_value(args, "--port"))
        settings.port = parse_port(*port);
    if (auto url = consume_flag_value(args, "--api-url"))
        settings.api_url = *url;
    if (consume_flag(args, "--stdio"))
        settings.transport = "stdio";

    if (!args.empty())
        throw boswell::ValidationError("Unknown option: " + args.front());
    settings.validate();
    return settings;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace boswell;

    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    Settings settings;
    std::unique_ptr<client::HttpBackendClient> backend;
    try
    {
        settings = load_settings(args);
        backend = std::make_unique<client::HttpBackendClient>(settings.api_url,
                                                              settings.timeout_seconds);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    util::log::set_level(util::log::level_from_string(settings.log_level));
    util::log::info(std::string(SERVER_NAME) + " " + SERVER_VERSION + " -> " + settings.api_url);

    const auto& registry = tools::Registry::instance();
    tools::Dispatcher dispatcher(registry, *backend);
    auto handler = std::make_shared<const mcp::Handler>(registry, dispatcher);

    if (settings.transport == "stdio")
    {
        server::StdioServerWrapper stdio(handler);
        return stdio.run() ? 0 : 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    server::HttpServerWrapper http(handler, settings.host, settings.port);
    if (!http.start())
    {
        std::cerr << "Error: failed to start HTTP server on " << settings.host << ":"
                  << settings.port << "\n";
        return 1;
    }

    while (!g_shutdown && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    http.stop();
    return 0;
}
