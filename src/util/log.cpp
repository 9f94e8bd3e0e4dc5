#include "boswell/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace boswell::util::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::atomic<std::ostream*> g_sink{nullptr};
std::mutex g_write_mutex;
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level = static_cast<int>(level);
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

bool enabled(Level level)
{
    return static_cast<int>(level) >= g_level.load();
}

void set_sink(std::ostream* sink)
{
    g_sink = sink;
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;
    std::ostream* out = g_sink.load();
    if (!out)
        out = &std::cerr;

    // Worker threads log concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(g_write_mutex);
    *out << "[boswell-mcp] " << to_string(level) << " " << message << std::endl;
}

} // namespace boswell::util::log
