#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

#include "../control/config.hpp"
#include "string_utils.hpp"

namespace conduit::logging {

static thread_local quill::Logger* g_current_logger = nullptr;

void init_logging_system() {
  quill::Backend::start();
}

static quill::LogLevel parse_level(std::string_view level) {
  std::string level_lower = core::to_lower(level);

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  }
  if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  }
  if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

quill::Logger* init_logger(std::string_view name, const control::LogConfig& log_config) {
  std::string logger_name{name};
  quill::Logger* logger = nullptr;

  if (log_config.output == "console") {
    auto console_sink =
        quill::Frontend::create_or_get_sink<quill::ConsoleSink>(logger_name + "_console");
    logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/{}.log", log_config.output, logger_name);

    if (log_config.format == "json") {
      auto json_sink =
          quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger(logger_name, std::move(json_sink));
    } else {
      auto file_sink =
          quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
      logger = quill::Frontend::create_or_get_logger(logger_name, std::move(file_sink));
    }
  }

  logger->set_log_level(parse_level(log_config.level));

  g_current_logger = logger;
  return logger;
}

void shutdown_logging() {
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger;
}

// Random v4 UUID, generated once per thread
static std::string generate_base_uuid() {
  std::mt19937 rng(std::random_device{}() ^
                   std::chrono::steady_clock::now().time_since_epoch().count());
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 4) {
    uint32_t random_val = dist(rng);
    uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
    uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
    uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
    uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
  }

  // Version 4, RFC 4122 variant
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');

  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
  }

  return oss.str();
}

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view uuid) {
  // Example: 550e8400-e29b-41d4-a716-446655440000#42
  size_t hash_pos = uuid.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;
  }

  std::string_view uuid_part = uuid.substr(0, hash_pos);
  std::string_view counter_part = uuid.substr(hash_pos + 1);

  if (uuid_part.length() != 36) {
    return false;
  }

  if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
      uuid_part[23] != '-') {
    return false;
  }

  if (uuid_part[14] != '4') {
    return false;
  }

  char variant = uuid_part[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
      variant != 'A' && variant != 'B') {
    return false;
  }

  auto is_hex = [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  };

  for (size_t i = 0; i < 36; ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23)
      continue;
    if (!is_hex(uuid_part[i])) return false;
  }

  if (counter_part.empty()) {
    return false;
  }

  return std::all_of(counter_part.begin(), counter_part.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace conduit::logging
