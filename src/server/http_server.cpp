#include "boswell/server/http_server.hpp"

#include "boswell/util/json.hpp"
#include "boswell/util/log.hpp"

#include <chrono>
#include <httplib.h>

namespace boswell::server
{

HttpServerWrapper::HttpServerWrapper(std::shared_ptr<const mcp::Handler> handler, std::string host,
                                     int port)
    : handler_(std::move(handler)), host_(std::move(host)), port_(port)
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

bool HttpServerWrapper::start()
{
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    // Applied to every response, error responses included
    svr_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                               {"Access-Control-Allow-Methods", "POST, GET, OPTIONS"},
                               {"Access-Control-Allow-Headers", "Content-Type"}});

    // CORS preflight
    svr_->Options(R"(.*)",
                  [](const httplib::Request&, httplib::Response& res) { res.status = 200; });

    // Health check
    svr_->Get(R"(.*)",
              [this](const httplib::Request&, httplib::Response& res)
              {
                  res.status = 200;
                  res.set_content(util::json::dump(handler_->health()), "application/json");
              });

    svr_->Post(R"(.*)",
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   try
                   {
                       auto reply = handler_->handle_body(req.body);
                       res.status = reply.status;
                       if (reply.body)
                           res.set_content(util::json::dump(*reply.body), "application/json");
                   }
                   catch (const std::exception& e)
                   {
                       util::log::error(std::string("request failed: ") + e.what());
                       res.status = 500;
                       res.set_content(util::json::dump(Json{{"error", e.what()}}),
                                       "application/json");
                   }
               });

    if (!svr_->bind_to_port(host_.c_str(), port_))
    {
        util::log::error("cannot bind " + host_ + ":" + std::to_string(port_));
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    // Give the listen loop a moment to come up so an early stop() is not lost
    for (int i = 0; i < 200 && !svr_->is_running(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    util::log::info("listening on http://" + host_ + ":" + std::to_string(port_));
    return true;
}

void HttpServerWrapper::stop()
{
    // Safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    if (svr_)
        util::log::info("stopped http://" + host_ + ":" + std::to_string(port_));
    running_ = false;
    svr_.reset();
}

} // namespace boswell::server
