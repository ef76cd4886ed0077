#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace freya::infra {

namespace {

class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(spdlog::level::level_enum level) {
    logger_ = spdlog::get("freya");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("freya");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(level);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

spdlog::level::level_enum parse_level(const std::string &name) {
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str maps unknown names to off; treat those as info instead.
  const auto level = spdlog::level::from_str(name);
  return level == spdlog::level::off ? spdlog::level::info : level;
}

} // namespace

std::unique_ptr<core::ILogger> create_console_logger(const std::string &level) {
  return std::make_unique<ConsoleLogger>(parse_level(level));
}

} // namespace freya::infra
