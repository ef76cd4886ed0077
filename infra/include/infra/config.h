#pragma once

#include "core/controller.h"

#include <memory>
#include <string>

namespace freya::core {
class ILogger;
} // namespace freya::core

namespace freya::infra {

/// Runtime tunables, read once at start-up from FREYA_* environment
/// variables. Nothing is persisted.
struct AppConfig {
  core::ControllerConfig controller;
  std::string log_level = "info";

  /// Invalid values log `config_invalid` and keep the default.
  static AppConfig from_environment(const std::shared_ptr<core::ILogger> &logger);

  /// FREYA_LOG_LEVEL alone; needed before a logger exists.
  static std::string log_level_from_environment();
};

} // namespace freya::infra
