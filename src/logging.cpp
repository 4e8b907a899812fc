#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

void setup_logging(const LoggingConfig& cfg) {
  auto level = spdlog::level::from_str(cfg.level);

  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_level(level);
  std::vector<spdlog::sink_ptr> sinks{console};

  std::string file_error;
  if (!cfg.file.empty()) {
    try {
      auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, /*truncate=*/false);
      file->set_level(spdlog::level::debug);
      sinks.push_back(file);
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("ccr", sinks.begin(), sinks.end());
  logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %n: %v");
  // sinks filter on their own levels; the logger must let the lowest through
  logger->set_level(sinks.size() > 1 ? std::min(level, spdlog::level::debug) : level);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) spdlog::warn("cannot open log file {}: {}", cfg.file, file_error);
}
