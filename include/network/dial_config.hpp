#pragma once

/*
 DialConfig - limits consumed by the DialScheduler

 Owned by the hosting component and read-only from the scheduler's view.

 Sources
 - Defaults from the constructor
 - JSON document (LoadDialConfig / ParseDialConfig):
     {
       "max_parallel_dials": 100,
       "max_cold_calls": 50,
       "clean_interval_sec": 900
     }
   Missing keys keep their defaults; any invalid value rejects the document.
 - Command-line style options (ApplyDialOption):
     --maxparalleldials=<n>     (1..100000)
     --maxcoldcalls=<n>         (0..100000)
     --dialcleaninterval=<sec>  (1..604800)
*/

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace peerdial {
namespace network {

struct DialConfig {
  static constexpr size_t DEFAULT_MAX_PARALLEL_DIALS = 100;
  static constexpr size_t DEFAULT_MAX_COLD_CALLS = 50;
  static constexpr std::chrono::seconds DEFAULT_CLEAN_INTERVAL{15 * 60};

  static constexpr int64_t MAX_LIMIT = 100000;
  static constexpr int64_t MAX_CLEAN_INTERVAL_SEC = 7 * 24 * 60 * 60;

  size_t max_parallel_dials;              // Global cap on simultaneously active dials
  size_t max_cold_calls;                  // Cap on pending cold calls
  std::chrono::seconds clean_interval;    // Period of the queue cleanup sweep

  DialConfig()
      : max_parallel_dials(DEFAULT_MAX_PARALLEL_DIALS),
        max_cold_calls(DEFAULT_MAX_COLD_CALLS),
        clean_interval(DEFAULT_CLEAN_INTERVAL) {}
};

// Parse a JSON document; std::nullopt (and a log line) on any error
std::optional<DialConfig> ParseDialConfig(const std::string& json_text);

// Load from a JSON file. A missing file yields the defaults.
std::optional<DialConfig> LoadDialConfig(const std::string& filepath);

/**
 * Apply one --key=value option to config
 * @return true if the option was recognized and valid; config is left
 *         unchanged otherwise
 */
bool ApplyDialOption(DialConfig& config, const std::string& arg);

} // namespace network
} // namespace peerdial
