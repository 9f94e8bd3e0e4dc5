#pragma once
#include "boswell/types.hpp"

#include <string>

namespace boswell
{

struct Settings
{
    std::string api_url{"https://stevekrontz.com/boswell/v2"};
    std::string host{"0.0.0.0"};
    int port{8080};
    int timeout_seconds{30};
    std::string log_level{"INFO"};
    std::string transport{"http"};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Reads a JSON settings file. Keys missing from the file keep the values in `base`.
    static Settings from_file(const std::string& path, Settings base);
    static Settings from_file(const std::string& path);

    /// Throws ValidationError when a value is out of range.
    void validate() const;
};

inline Settings Settings::from_file(const std::string& path)
{
    return from_file(path, Settings{});
}

} // namespace boswell
