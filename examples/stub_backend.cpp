// Minimal in-memory stand-in for the Boswell API, for trying the gateway locally:
//
//   ./boswell_stub_backend 5000 &
//   BOSWELL_API_URL=http://127.0.0.1:5000/v2 ./boswell-mcp --port 8080
//
// Keeps commits per branch in memory and answers the read endpoints from them.
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include "boswell/types.hpp"

int main(int argc, char** argv) {
  using boswell::Json;
  int port = argc > 1 ? std::atoi(argv[1]) : 5000;

  std::mutex mu;
  std::string current = "command-center";
  std::map<std::string, std::vector<Json>> commits;
  std::vector<Json> links;

  auto reply = [](httplib::Response& res, const Json& j, int status = 200) {
    res.status = status;
    res.set_content(j.dump(), "application/json");
  };

  httplib::Server svr;
  svr.Get("/v2/branches", [&](const httplib::Request&, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(mu);
    Json out = Json::array();
    for (const auto& kv : commits) out.push_back(kv.first);
    reply(res, Json{{"branches", out}, {"current", current}});
  });
  svr.Get("/v2/head", [&](const httplib::Request& req, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(mu);
    auto it = commits.find(req.get_param_value("branch"));
    if (it == commits.end() || it->second.empty())
      return reply(res, Json{{"error", "branch not found"}}, 404);
    reply(res, it->second.back());
  });
  svr.Get("/v2/log", [&](const httplib::Request& req, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(mu);
    auto& log = commits[req.get_param_value("branch")];
    size_t limit = req.has_param("limit") ? std::stoul(req.get_param_value("limit")) : 10;
    Json out = Json::array();
    for (auto it = log.rbegin(); it != log.rend() && out.size() < limit; ++it) out.push_back(*it);
    reply(res, Json{{"commits", out}});
  });
  svr.Get("/v2/quick-brief", [&](const httplib::Request& req, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(mu);
    auto branch = req.get_param_value("branch");
    reply(res, Json{{"branch", branch}, {"commits", commits[branch].size()}, {"current", current}});
  });
  svr.Get("/v2/links", [&](const httplib::Request&, httplib::Response& res) {
    std::lock_guard<std::mutex> lock(mu);
    reply(res, Json{{"links", links}});
  });
  svr.Post("/v2/commit", [&](const httplib::Request& req, httplib::Response& res) {
    auto body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.contains("branch"))
      return reply(res, Json{{"error", "bad commit"}}, 400);
    std::lock_guard<std::mutex> lock(mu);
    auto& log = commits[body["branch"].get<std::string>()];
    body["commit_hash"] = "c" + std::to_string(log.size() + 1);
    log.push_back(body);
    reply(res, body, 201);
  });
  svr.Post("/v2/link", [&](const httplib::Request& req, httplib::Response& res) {
    auto body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded()) return reply(res, Json{{"error", "bad link"}}, 400);
    std::lock_guard<std::mutex> lock(mu);
    links.push_back(body);
    reply(res, body, 201);
  });
  svr.Post("/v2/checkout", [&](const httplib::Request& req, httplib::Response& res) {
    auto body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.contains("branch") || !body["branch"].is_string())
      return reply(res, Json{{"error", "bad checkout"}}, 400);
    std::lock_guard<std::mutex> lock(mu);
    current = body["branch"].get<std::string>();
    reply(res, Json{{"current", current}});
  });

  std::cout << "Stub Boswell API on http://127.0.0.1:" << port << "/v2" << std::endl;
  if (!svr.listen("127.0.0.1", port)) {
    std::cerr << "Failed to listen on port " << port << std::endl;
    return 1;
  }
  return 0;
}
