#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace boswell
{

using Json = nlohmann::json;

/// Ordered query parameters. Order is preserved on the wire.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

} // namespace boswell
