#pragma once

#include <concepts>
#include <exception>
#include <format>
#include <string>

namespace ember {

/**
 * @brief Closed set of failure categories
 * @details
 * `not_found` and `conflict` describe expected "nothing to do" outcomes.
 * Every other kind is an unexpected failure.
 */
enum class error_kind_t {
  not_found,
  conflict,
  validation,
  configuration,
  process,
  api,
  network,
  registry,
  vmm,
};

/**
 * @brief Capture the current stack trace, without the frames of this file.
 */
std::string build_trace();

template <typename T>
concept is_exception_reason = requires(T t) {
  requires noexcept(t.what());
  { t.what() } -> std::same_as<const char *>;
  { T::kind } -> std::convertible_to<error_kind_t>;
};

struct value_error {
  static constexpr error_kind_t kind = error_kind_t::validation;

  value_error() : value_error("Value error") {}

  value_error(const std::string &what) : errstr_(what) {}

  value_error(const std::string &context, const std::string &name,
              const std::string &expected, const std::string &actual)
      : errstr_(std::format(
            "[{}] Invalid {}: expected {}, got {}", context, name, expected,
            actual)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<value_error>);

struct not_found_error {
  static constexpr error_kind_t kind = error_kind_t::not_found;

  not_found_error() : errstr_("Not found") {}

  not_found_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<not_found_error>);

struct conflict_error {
  static constexpr error_kind_t kind = error_kind_t::conflict;

  conflict_error() : errstr_("Conflict") {}

  conflict_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<conflict_error>);

/**
 * @brief Invalid or missing input, or a failed control API configuration step
 */
struct configuration_error {
  static constexpr error_kind_t kind = error_kind_t::configuration;

  configuration_error() : errstr_("Configuration error") {}

  configuration_error(const std::string &what) : errstr_(what) {}

  configuration_error(const std::string &step, const std::string &cause)
      : errstr_(std::format("Failed to configure {}: {}", step, cause)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<configuration_error>);

/**
 * @brief The hypervisor process is unexpectedly absent
 */
struct process_error {
  static constexpr error_kind_t kind = error_kind_t::process;

  process_error() : errstr_("Process error") {}

  process_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<process_error>);

/**
 * @brief The control API is unreachable or answered with a failure
 */
struct api_error {
  static constexpr error_kind_t kind = error_kind_t::api;

  api_error() : errstr_("API error") {}

  api_error(const std::string &what) : errstr_(what) {}

  api_error(const std::string &method, const std::string &cause)
      : errstr_(std::format("{} failed: {}", method, cause)) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<api_error>);

struct network_error {
  static constexpr error_kind_t kind = error_kind_t::network;

  network_error() : errstr_("Network error") {}

  network_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<network_error>);

struct registry_error {
  static constexpr error_kind_t kind = error_kind_t::registry;

  registry_error() : errstr_("Registry error") {}

  registry_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<registry_error>);

/**
 * @brief Lifecycle-level failure (rollback, remote shell, batch operations)
 */
struct vmm_error {
  static constexpr error_kind_t kind = error_kind_t::vmm;

  vmm_error() : errstr_("VMM error") {}

  vmm_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<vmm_error>);

/**
 * @brief Common base of every exception thrown by ember components
 */
class exception_base_t : public std::exception {
public:
  exception_base_t(error_kind_t kind, const std::string &what)
      : std::exception(), kind_(kind), errstr_(what), trace_(build_trace()) {}

  const char *what() const noexcept override { return errstr_.c_str(); }

  error_kind_t kind() const noexcept { return kind_; }

  /**
   * @brief Stack trace captured at the throw site, for debug logs
   */
  const std::string &trace() const noexcept { return trace_; }

private:
  error_kind_t kind_;
  std::string errstr_;
  std::string trace_;
};

template <typename T = vmm_error>
  requires is_exception_reason<T>
class exception_t : public exception_base_t {
public:
  template <typename... TArgs>
  exception_t(TArgs... args) : exception_base_t(T::kind, T(args...).what()) {}
};

template <typename T = vmm_error, typename... TArgs>
exception_t<T> exception(TArgs... args) {
  return exception_t<T>{args...};
}

} // namespace ember
