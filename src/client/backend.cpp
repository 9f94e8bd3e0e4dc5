#include "boswell/client/backend.hpp"

#include "boswell/exceptions.hpp"
#include "boswell/util/json.hpp"
#include "boswell/util/log.hpp"

#include <httplib.h>
#include <regex>
#include <sstream>

namespace boswell::client
{

const char* to_string(HttpMethod method)
{
    switch (method)
    {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    }
    return "GET";
}

Json BackendResult::to_json() const
{
    if (ok())
        return value();
    return Json{{"error", error().error}, {"details", error().details}};
}

std::string url_encode_component(const std::string& value)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value)
    {
        const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved)
        {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[(c >> 4) & 0x0F]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}

std::string build_query_string(const QueryParams& params)
{
    std::ostringstream query;
    bool first = true;
    for (const auto& [key, value] : params)
    {
        if (!first)
            query << "&";
        first = false;
        query << url_encode_component(key) << "=" << url_encode_component(value);
    }
    return query.str();
}

HttpBackendClient::HttpBackendClient(std::string base_url, int timeout_seconds)
    : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds)
{
    std::regex pattern(R"(^(https?)://([^/:]+)(?::(\d+))?(/.*)?$)");
    std::smatch match;
    if (!std::regex_match(base_url_, match, pattern))
        throw ValidationError("Boswell API URL must look like http(s)://host[:port][/path], got: " +
                              base_url_);

    scheme_ = match[1].str();
    host_ = match[2].str();
    port_ = match[3].matched ? std::stoi(match[3].str()) : (scheme_ == "https" ? 443 : 80);
    base_path_ = match[4].matched ? match[4].str() : std::string();
    if (!base_path_.empty() && base_path_.back() == '/')
        base_path_.pop_back();

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme_ == "https")
        throw ValidationError("https:// Boswell API URL requires CPPHTTPLIB_OPENSSL_SUPPORT at "
                              "build time");
#endif
    if (timeout_seconds_ <= 0)
        throw ValidationError("backend timeout must be positive");
}

BackendResult HttpBackendClient::call(const BackendRequest& request) const
{
    std::string target = base_path_ + request.endpoint;
    if (target.empty() || target.front() != '/')
        target = "/" + target;
    if (request.method == HttpMethod::Get && !request.query.empty())
        target += "?" + build_query_string(request.query);

    // The scheme prefix selects the TLS implementation when OpenSSL support is compiled in
    httplib::Client client(scheme_ + "://" + host_ + ":" + std::to_string(port_));
    client.set_connection_timeout(timeout_seconds_, 0);
    client.set_read_timeout(timeout_seconds_, 0);
    client.set_write_timeout(timeout_seconds_, 0);

    auto response = request.method == HttpMethod::Post
                        ? client.Post(target.c_str(),
                                      util::json::dump(request.body.value_or(Json())),
                                      "application/json")
                        : client.Get(target.c_str());

    if (!response)
    {
        auto reason = httplib::to_string(response.error());
        util::log::warning(std::string("backend ") + to_string(request.method) + " " + target +
                           " failed: " + reason);
        return BackendResult::failure(BackendError{"HTTP 0", reason});
    }

    const int status = response->status;
    util::log::debug(std::string("backend ") + to_string(request.method) + " " + target + " -> " +
                     std::to_string(status));

    if (status >= 200 && status < 300)
    {
        auto parsed = util::json::try_parse(response->body);
        if (parsed.is_discarded())
            return BackendResult::success(Json(response->body));
        return BackendResult::success(std::move(parsed));
    }

    util::log::warning(std::string("backend ") + to_string(request.method) + " " + target +
                       " returned HTTP " + std::to_string(status));
    return BackendResult::failure(BackendError{"HTTP " + std::to_string(status), response->body});
}

} // namespace boswell::client
