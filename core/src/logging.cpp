#include "logging.hpp"

#include <algorithm>
#include <memory>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ember {

namespace {

spdlog::level::level_enum to_spdlog(log_level_t level) {
  switch (level) {
  case log_level_t::debug:
    return spdlog::level::debug;
  case log_level_t::info:
    return spdlog::level::info;
  case log_level_t::warn:
    return spdlog::level::warn;
  case log_level_t::error:
    return spdlog::level::err;
  case log_level_t::critical:
    return spdlog::level::critical;
  }
  return spdlog::level::info;
}

std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> get_logger() {
  static std::shared_ptr<spdlog::logger> logger = nullptr;

  std::lock_guard<std::mutex> lk(logger_mutex);
  if (!logger) {
    logger = spdlog::stdout_color_mt("EMBER");

    // Not through set_log_level, which would re-enter get_logger()
    const char *env = std::getenv("EMBER_LOG_LEVEL");
    if (env) {
      auto lvl = parse_log_level(env);
      if (lvl.has_value())
        logger->set_level(to_spdlog(lvl.value()));
      else
        logger->warn("Unknown log level: {}", env);
    }
  }

  return logger;
}

} // namespace

std::optional<log_level_t> parse_log_level(const std::string &name) {
  std::string lvl = name;
  std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::tolower);
  if (lvl == "debug")
    return log_level_t::debug;
  else if (lvl == "info")
    return log_level_t::info;
  else if (lvl == "warn" || lvl == "warning")
    return log_level_t::warn;
  else if (lvl == "error")
    return log_level_t::error;
  else if (lvl == "critical")
    return log_level_t::critical;
  return std::nullopt;
}

bool set_log_level(const std::string &level) {
  auto lvl = parse_log_level(level);
  if (!lvl.has_value()) {
    get_logger()->warn("Unknown log level: {}", level);
    return false;
  }
  get_logger()->set_level(to_spdlog(lvl.value()));
  return true;
}

void log(log_level_t level, const std::string &msg) {
  get_logger()->log(to_spdlog(level), msg);
}

} // namespace ember
