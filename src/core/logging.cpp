#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <mutex>

#include "../control/config.hpp"
#include "encoding.hpp"

namespace tether::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};
static std::once_flag g_backend_started;

void init_logging_system() {
  std::call_once(g_backend_started, [] { quill::Backend::start(); });
}

static quill::LogLevel parse_level(std::string level) {
  std::transform(level.begin(), level.end(), level.begin(), ::tolower);

  if (level == "debug") {
    return quill::LogLevel::Debug;
  } else if (level == "warning" || level == "warn") {
    return quill::LogLevel::Warning;
  } else if (level == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  init_logging_system();

  quill::Logger* logger = nullptr;

  if (log_config.output == "stdout") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    logger = quill::Frontend::create_or_get_logger("tether", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/tether.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("tether", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("tether", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_level(log_config.level));

  g_logger.store(logger);
  return logger;
}

void shutdown_logging() {
  quill::Backend::stop();
}

quill::Logger* logger() {
  quill::Logger* current = g_logger.load();
  if (current) {
    return current;
  }

  // Nobody configured logging (library use, tests): default to the console
  static std::once_flag fallback_once;
  std::call_once(fallback_once, [] {
    init_logging_system();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    quill::Logger* fallback =
        quill::Frontend::create_or_get_logger("tether", std::move(console_sink));
    quill::Logger* expected = nullptr;
    g_logger.compare_exchange_strong(expected, fallback);
  });
  return g_logger.load();
}

std::string generate_correlation_id() {
  // Format: {base_uuid}#{counter}, base drawn once per thread
  static thread_local std::string base_uuid = core::generate_stream_id();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view uuid) {
  // Example: 550e8400-e29b-41d4-a716-446655440000#42
  size_t hash_pos = uuid.rfind('#');
  if (hash_pos != 36) {
    return false;
  }

  std::string_view counter_part = uuid.substr(hash_pos + 1);
  if (counter_part.empty() ||
      !std::all_of(counter_part.begin(), counter_part.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }

  for (size_t i = 0; i < 36; ++i) {
    char c = uuid[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  // Version 4, RFC 4122 variant
  char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(uuid[19])));
  return uuid[14] == '4' && (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

}  // namespace tether::logging
