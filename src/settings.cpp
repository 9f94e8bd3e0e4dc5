#include "boswell/settings.hpp"

#include "boswell/exceptions.hpp"
#include "boswell/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace boswell
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static int parse_int_env(const char* key, const std::string& text)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(text, &pos, 10);
        if (pos != text.size())
            throw ValidationError(std::string(key) + " must be an integer: " + text);
        return v;
    }
    catch (const std::logic_error&)
    {
        throw ValidationError(std::string(key) + " must be an integer: " + text);
    }
}

static void apply_json(Settings& s, const Json& j)
{
    if (!j.is_object())
        throw ValidationError("settings must be a JSON object");

    auto read_string = [&j](const char* key, std::string& out)
    {
        if (!j.contains(key))
            return;
        if (!j.at(key).is_string())
            throw ValidationError(std::string("setting '") + key + "' must be a string");
        out = j.at(key).get<std::string>();
    };
    auto read_int = [&j](const char* key, int& out)
    {
        if (!j.contains(key))
            return;
        if (!j.at(key).is_number_integer())
            throw ValidationError(std::string("setting '") + key + "' must be an integer");
        out = j.at(key).get<int>();
    };

    read_string("api_url", s.api_url);
    read_string("host", s.host);
    read_int("port", s.port);
    read_int("timeout_seconds", s.timeout_seconds);
    read_string("log_level", s.log_level);
    read_string("transport", s.transport);
    s.log_level = to_upper(s.log_level);
    s.transport = to_lower(s.transport);
}

Settings Settings::from_env()
{
    Settings s;
    s.api_url = getenv_str("BOSWELL_API_URL", s.api_url);
    s.host = getenv_str("BOSWELL_HOST", s.host);

    // PORT is what most container platforms inject
    auto port = getenv_str("BOSWELL_PORT", getenv_str("PORT", ""));
    if (!port.empty())
        s.port = parse_int_env("BOSWELL_PORT", port);

    auto timeout = getenv_str("BOSWELL_TIMEOUT", "");
    if (!timeout.empty())
        s.timeout_seconds = parse_int_env("BOSWELL_TIMEOUT", timeout);

    s.log_level = to_upper(getenv_str("BOSWELL_LOG_LEVEL", s.log_level));
    s.transport = to_lower(getenv_str("BOSWELL_TRANSPORT", s.transport));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    apply_json(s, j);
    return s;
}

Settings Settings::from_file(const std::string& path, Settings base)
{
    std::ifstream in(path);
    if (!in)
        throw ValidationError("cannot open settings file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto j = util::json::try_parse(buffer.str());
    if (j.is_discarded())
        throw ValidationError("settings file is not valid JSON: " + path);
    apply_json(base, j);
    return base;
}

void Settings::validate() const
{
    if (api_url.empty())
        throw ValidationError("api_url must not be empty");
    if (port <= 0 || port > 65535)
        throw ValidationError("port out of range: " + std::to_string(port));
    if (timeout_seconds <= 0)
        throw ValidationError("timeout_seconds must be positive");
    if (transport != "http" && transport != "stdio")
        throw ValidationError("transport must be 'http' or 'stdio', got '" + transport + "'");
    if (log_level != "DEBUG" && log_level != "INFO" && log_level != "WARNING" &&
        log_level != "ERROR")
        throw ValidationError("unknown log_level: " + log_level);
}

} // namespace boswell
