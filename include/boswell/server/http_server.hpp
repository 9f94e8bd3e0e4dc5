#pragma once
#include "boswell/mcp/handler.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace boswell::server
{

class HttpServerWrapper
{
  public:
    /**
     * Construct an HTTP server around the MCP front end.
     *
     * Every path is served: OPTIONS answers the CORS preflight, GET returns the
     * health check and POST carries JSON-RPC. Permissive CORS headers are set on
     * every response.
     *
     * @param handler Front end shared by all request threads
     * @param host Host address to bind to (default: "127.0.0.1")
     * @param port Port to listen on (default: 8080)
     */
    HttpServerWrapper(std::shared_ptr<const mcp::Handler> handler, std::string host = "127.0.0.1",
                      int port = 8080);
    ~HttpServerWrapper();

    /// Bind and start serving on a background thread. False if already running or bind fails.
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

  private:
    std::shared_ptr<const mcp::Handler> handler_;
    std::string host_;
    int port_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace boswell::server
