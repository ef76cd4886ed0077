#include "infra/config.h"

#include "core/compression_level.h"
#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace freya::infra {

namespace {

void warn_invalid(const std::shared_ptr<core::ILogger> &logger,
                  const char *name, const char *raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

const char *env_value(const char *name) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return nullptr;
  }
  return raw;
}

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = env_value(name);
  if (!raw) {
    return fallback;
  }

  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && value <= 24L * 3600 * 1000 &&
                     (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }

  return static_cast<int>(value);
}

bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = env_value(name);
  if (!raw) {
    return fallback;
  }
  const std::string value(raw);
  if (value == "1" || value == "true") {
    return true;
  }
  if (value == "0" || value == "false") {
    return false;
  }
  warn_invalid(logger, name, raw, fallback ? "1" : "0");
  return fallback;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

} // namespace

AppConfig
AppConfig::from_environment(const std::shared_ptr<core::ILogger> &logger) {
  AppConfig cfg;
  auto &ctl = cfg.controller;

  ctl.poll_interval = std::chrono::milliseconds(parse_env_int(
      "FREYA_POLL_INTERVAL_MS", static_cast<int>(ctl.poll_interval.count()),
      false, logger));
  ctl.result_dismiss_after = std::chrono::milliseconds(parse_env_int(
      "FREYA_RESULT_DISMISS_MS",
      static_cast<int>(ctl.result_dismiss_after.count()), true, logger));

  if (const char *raw = env_value("FREYA_LEVEL")) {
    if (auto level = core::parse_compression_level(raw)) {
      ctl.initial_level = *level;
    } else {
      warn_invalid(logger, "FREYA_LEVEL", raw, to_string(ctl.initial_level));
    }
  }

  if (const char *raw = env_value("FREYA_START_POLICY")) {
    const std::string policy = lowercase(raw);
    if (policy == "reject") {
      ctl.start_policy = core::StartPolicy::Reject;
    } else if (policy == "detach") {
      ctl.start_policy = core::StartPolicy::Detach;
    } else {
      warn_invalid(logger, "FREYA_START_POLICY", raw,
                   to_string(ctl.start_policy));
    }
  }

  ctl.exit_after_result =
      parse_env_bool("FREYA_EXIT_AFTER_RESULT", ctl.exit_after_result, logger);
  ctl.ask_output_path =
      parse_env_bool("FREYA_ASK_OUTPUT_PATH", ctl.ask_output_path, logger);

  cfg.log_level = log_level_from_environment();
  return cfg;
}

std::string AppConfig::log_level_from_environment() {
  const char *raw = env_value("FREYA_LOG_LEVEL");
  return raw ? lowercase(raw) : std::string("info");
}

} // namespace freya::infra
