#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace boswell::util::json {

using json = nlohmann::json;

// Backend bodies are passed through as strings and need not be valid UTF-8;
// invalid sequences are written as U+FFFD instead of throwing.
inline std::string dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// Parse without throwing; discarded value on malformed input.
inline json try_parse(const std::string& s) { return json::parse(s, nullptr, false); }

// Text form of a scalar as it goes into a query string. Booleans go out as 1/0.
inline std::string to_query_value(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_boolean()) return value.get<bool>() ? "1" : "0";
  return dump(value);
}

} // namespace boswell::util::json
