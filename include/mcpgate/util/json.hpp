#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace mcpgate::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

// JSON-RPC ids are strings or numbers; strings print bare in messages.
inline std::string id_to_string(const json& id) {
  return id.is_string() ? id.get<std::string>() : id.dump();
}

inline bool is_valid_id(const json& id) { return id.is_string() || id.is_number(); }

} // namespace mcpgate::util::json
