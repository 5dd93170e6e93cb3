#include "network/dial_config.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace peerdial {
namespace network {

namespace {

constexpr const char* OPT_MAX_PARALLEL_DIALS = "--maxparalleldials=";
constexpr const char* OPT_MAX_COLD_CALLS = "--maxcoldcalls=";
constexpr const char* OPT_CLEAN_INTERVAL = "--dialcleaninterval=";

// Read an optional unsigned field within [min, max]; false on type/range error
bool ReadBounded(const json& root, const char* key, int64_t min, int64_t max,
                 std::optional<int64_t>& out) {
  if (!root.contains(key)) {
    return true;
  }
  const json& value = root[key];
  if (!value.is_number_integer()) {
    LOG_NET_WARN("Dial config: '{}' must be an integer", key);
    return false;
  }
  int64_t v = value.get<int64_t>();
  if (v < min || v > max) {
    LOG_NET_WARN("Dial config: '{}' = {} out of range [{}, {}]", key, v, min, max);
    return false;
  }
  out = v;
  return true;
}

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // namespace

std::optional<DialConfig> ParseDialConfig(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    LOG_NET_WARN("Dial config: parse error: {}", e.what());
    return std::nullopt;
  }

  if (!root.is_object()) {
    LOG_NET_WARN("Dial config: top-level value must be an object");
    return std::nullopt;
  }

  std::optional<int64_t> max_parallel, max_cold, interval;
  if (!ReadBounded(root, "max_parallel_dials", 1, DialConfig::MAX_LIMIT, max_parallel) ||
      !ReadBounded(root, "max_cold_calls", 0, DialConfig::MAX_LIMIT, max_cold) ||
      !ReadBounded(root, "clean_interval_sec", 1, DialConfig::MAX_CLEAN_INTERVAL_SEC, interval)) {
    return std::nullopt;
  }

  DialConfig config;
  if (max_parallel) config.max_parallel_dials = static_cast<size_t>(*max_parallel);
  if (max_cold) config.max_cold_calls = static_cast<size_t>(*max_cold);
  if (interval) config.clean_interval = std::chrono::seconds(*interval);
  return config;
}

std::optional<DialConfig> LoadDialConfig(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LOG_NET_DEBUG("No dial config found at {}, using defaults", filepath);
    return DialConfig{};
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = ParseDialConfig(buffer.str());
  if (!config) {
    LOG_NET_ERROR("Failed to load dial config from {}", filepath);
    return std::nullopt;
  }

  LOG_NET_INFO("Loaded dial config from {} (max_parallel_dials={}, max_cold_calls={}, clean_interval={}s)",
               filepath, config->max_parallel_dials, config->max_cold_calls,
               config->clean_interval.count());
  return config;
}

bool ApplyDialOption(DialConfig& config, const std::string& arg) {
  if (StartsWith(arg, OPT_MAX_PARALLEL_DIALS)) {
    auto v = util::SafeParseInt64(arg.substr(std::char_traits<char>::length(OPT_MAX_PARALLEL_DIALS)),
                                  1, DialConfig::MAX_LIMIT);
    if (!v) return false;
    config.max_parallel_dials = static_cast<size_t>(*v);
    return true;
  }
  if (StartsWith(arg, OPT_MAX_COLD_CALLS)) {
    auto v = util::SafeParseInt64(arg.substr(std::char_traits<char>::length(OPT_MAX_COLD_CALLS)),
                                  0, DialConfig::MAX_LIMIT);
    if (!v) return false;
    config.max_cold_calls = static_cast<size_t>(*v);
    return true;
  }
  if (StartsWith(arg, OPT_CLEAN_INTERVAL)) {
    auto v = util::SafeParseInt64(arg.substr(std::char_traits<char>::length(OPT_CLEAN_INTERVAL)),
                                  1, DialConfig::MAX_CLEAN_INTERVAL_SEC);
    if (!v) return false;
    config.clean_interval = std::chrono::seconds(*v);
    return true;
  }
  return false;
}

} // namespace network
} // namespace peerdial
