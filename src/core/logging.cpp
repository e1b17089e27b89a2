#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace headlamp::logging {

static quill::Logger* g_current_logger = nullptr;

namespace {

constexpr const char* LOGGER_NAME = "headlamp";

quill::LogLevel parse_level(std::string_view level) {
  std::string level_lower{level};
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  } else if (level_lower == "info") {
    return quill::LogLevel::Info;
  } else if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  } else if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* create_file_logger(const LogConfig& log_config) {
  std::error_code ec;
  std::filesystem::create_directories(log_config.output, ec);
  if (ec) {
    return nullptr;
  }

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  std::string log_path = fmt::format("{}/headlamp-server.log", log_config.output);

  if (log_config.format == "json") {
    auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
        log_path, config);
    return quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(json_sink));
  }

  auto file_sink =
      quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
  return quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(file_sink));
}

}  // namespace

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_logger(const LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (!log_config.output.empty()) {
    logger = create_file_logger(log_config);
  }

  bool fell_back = false;
  if (logger == nullptr) {
    fell_back = !log_config.output.empty();
    auto console_sink =
        quill::Frontend::create_or_get_sink<quill::ConsoleSink>("headlamp_console");
    logger = quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(console_sink));
  }

  logger->set_log_level(parse_level(log_config.level));
  g_current_logger = logger;

  if (fell_back) {
    LOG_WARNING(logger, "Could not create log directory {}, logging to console",
                log_config.output);
  }
  return logger;
}

void set_log_level(std::string_view level) {
  if (g_current_logger == nullptr) {
    return;
  }
  g_current_logger->set_log_level(parse_level(level));
}

void shutdown_logging() {
  if (g_current_logger != nullptr) {
    g_current_logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger;
}

}  // namespace headlamp::logging
