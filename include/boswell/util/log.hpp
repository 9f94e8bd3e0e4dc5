#pragma once
#include <ostream>
#include <string>

namespace boswell::util::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

/// Accepts DEBUG, INFO, WARNING (or WARN), ERROR in any case. Unknown names map to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Redirects output (default std::cerr). The stream must outlive all logging calls.
void set_sink(std::ostream* sink);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace boswell::util::log
