#pragma once

#include <format>
#include <optional>
#include <string>

namespace ember {

enum class log_level_t { debug, info, warn, error, critical };

/**
 * @brief Parse a level name (debug, info, warn(ing), error, critical),
 * ignoring case.
 */
std::optional<log_level_t> parse_log_level(const std::string &name);

/**
 * @brief Set the level of the shared "EMBER" logger.
 * @return false if the level name is unknown (the level is left unchanged)
 * @details The initial level comes from `EMBER_LOG_LEVEL`.
 */
bool set_log_level(const std::string &level);

void log(log_level_t level, const std::string &msg);

template <log_level_t level, typename... args_t>
inline void log(const std::format_string<std::type_identity_t<args_t>...> fmt,
                args_t &&...args) {
  log(level, std::format(fmt, std::forward<args_t>(args)...));
}

inline void debug(const std::string &msg) { log(log_level_t::debug, msg); }

template <typename... args_t>
inline void debug(const std::format_string<std::type_identity_t<args_t>...> fmt,
                  args_t &&...args) {
  log<log_level_t::debug, args_t...>(fmt, std::forward<args_t>(args)...);
}

inline void info(const std::string &msg) { log(log_level_t::info, msg); }

template <typename... args_t>
inline void info(const std::format_string<std::type_identity_t<args_t>...> fmt,
                 args_t &&...args) {
  log<log_level_t::info, args_t...>(fmt, std::forward<args_t>(args)...);
}

inline void warn(const std::string &msg) { log(log_level_t::warn, msg); }

template <typename... args_t>
inline void warn(const std::format_string<std::type_identity_t<args_t>...> fmt,
                 args_t &&...args) {
  log<log_level_t::warn, args_t...>(fmt, std::forward<args_t>(args)...);
}

inline void error(const std::string &msg) { log(log_level_t::error, msg); }

template <typename... args_t>
inline void error(const std::format_string<std::type_identity_t<args_t>...> fmt,
                  args_t &&...args) {
  log<log_level_t::error, args_t...>(fmt, std::forward<args_t>(args)...);
}

inline void critical(const std::string &msg) {
  log(log_level_t::critical, msg);
}

template <typename... args_t>
inline void
critical(const std::format_string<std::type_identity_t<args_t>...> fmt,
         args_t &&...args) {
  log<log_level_t::critical, args_t...>(fmt, std::forward<args_t>(args)...);
}

} // namespace ember
