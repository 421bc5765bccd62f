#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <string>

#include "../control/config.hpp"

namespace tally::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output == "stdout") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("tally_console");
    logger = quill::Frontend::create_or_get_logger("tally", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/tally.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("tally", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("tally", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_log_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.exchange(nullptr, std::memory_order_acq_rel)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() noexcept {
  return g_logger.load(std::memory_order_acquire);
}

static bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

quill::LogLevel parse_log_level(std::string_view level) noexcept {
  if (iequals(level, "debug")) {
    return quill::LogLevel::Debug;
  } else if (iequals(level, "info")) {
    return quill::LogLevel::Info;
  } else if (iequals(level, "warning") || iequals(level, "warn")) {
    return quill::LogLevel::Warning;
  } else if (iequals(level, "error")) {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

}  // namespace tally::logging
