#include "boswell/server/stdio_server.hpp"

#include "boswell/util/json.hpp"
#include "boswell/util/log.hpp"

#include <string>

namespace boswell::server
{

StdioServerWrapper::StdioServerWrapper(std::shared_ptr<const mcp::Handler> handler,
                                       std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), in_(in), out_(out)
{
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && std::getline(in_, line))
    {
        // Skip empty lines
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        mcp::Reply reply;
        try
        {
            reply = handler_->handle_body(line);
        }
        catch (const std::exception& e)
        {
            util::log::error(std::string("request failed: ") + e.what());
            reply = mcp::Reply{500, Json{{"error", e.what()}}};
        }

        // Notifications produce no output
        if (!reply.body)
            continue;
        out_ << util::json::dump(*reply.body) << std::endl;
        out_.flush();
    }
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    util::log::info("serving MCP over stdio");
    run_loop();
    running_ = false;
    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;
}

} // namespace boswell::server
