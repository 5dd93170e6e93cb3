// Copyright (c) 2025 The peerdial developers
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <array>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace peerdial {
namespace util {

namespace {

constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr std::array<const char *, 4> COMPONENTS = {"default", "network",
                                                    "dial", "app"};

std::once_flag s_init_flag;

// Guards s_loggers (all reads and writes)
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

spdlog::sink_ptr MakeConsoleSink() {
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(LOG_PATTERN);
  return console_sink;
}

spdlog::sink_ptr MakeFileSink(const std::string &log_file_path) {
  namespace fs = std::filesystem;
  fs::path p = log_file_path.empty() ? fs::path("dial.log") : fs::path(log_file_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      std::cerr << "Could not create log directory " << p.parent_path()
                << ": " << ec.message() << "\n";
    }
  }
  // 5MB per file, 3 files
  auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      p.string(), 5 * 1024 * 1024, 3);
  file_sink->set_pattern(LOG_PATTERN);
  return file_sink;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    if (log_to_file) {
      try {
        sinks.push_back(MakeFileSink(log_file_path));
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to open log file (" << ex.what()
                  << "), logging to console\n";
        sinks.push_back(MakeConsoleSink());
      }
    } else {
      sinks.push_back(MakeConsoleSink());
    }

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const char *component : COMPONENTS) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct access: LOG_INFO would re-enter GetLogger() and deadlock
    if (log_level != "off") {
      s_loggers["default"]->info("Logging system initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Init failed or Shutdown() ran: install a silent console logger so the
  // macros never dereference null
  if (s_loggers.empty()) {
    auto logger = spdlog::get("default");
    if (!logger) {
      logger = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
      logger->set_level(spdlog::level::off);
      spdlog::register_logger(logger);
    }
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  if (level != "off") {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    if (s_loggers["default"]->level() != spdlog::level::off) {
      s_loggers["default"]->warn("Unknown log component: {}", component);
    }
    return;
  }

  it->second->set_level(spdlog::level::from_str(level));
  if (level != "off") {
    s_loggers["default"]->info("Component '{}' log level set to: {}", component, level);
  }
}

} // namespace util
} // namespace peerdial
