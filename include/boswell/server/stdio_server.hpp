#pragma once
#include "boswell/mcp/handler.hpp"

#include <atomic>
#include <iostream>
#include <memory>

namespace boswell::server
{

/**
 * STDIO transport for line-delimited JSON-RPC.
 *
 * Reads one request per line from `in` and writes the reply body, if any, as
 * one line to `out`. Requests go through the same front end as HTTP, so the
 * body shapes match; HTTP status codes have no stdio counterpart and are
 * dropped. Logging must go to stderr while this transport owns stdout.
 *
 * Usage:
 *   StdioServerWrapper server(handler);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    explicit StdioServerWrapper(std::shared_ptr<const mcp::Handler> handler,
                                std::istream& in = std::cin, std::ostream& out = std::cout);

    /// Process requests until EOF or stop(). Returns false if already running.
    bool run();

    /// Ask the loop to exit after the current line.
    void stop();

    bool running() const
    {
        return running_.load();
    }

  private:
    void run_loop();

    std::shared_ptr<const mcp::Handler> handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace boswell::server
