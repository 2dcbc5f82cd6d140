#pragma once

#include <string>
#include <variant>

#include "exception.hpp"

namespace ember {

struct ok_output_t {
  ok_output_t(const std::string &message) : message(message) {}

  std::string message;
};

struct error_output_t {
  error_output_t(error_kind_t kind, const std::string &reason)
      : kind(kind), reason(reason) {}

  error_output_t(const exception_base_t &e)
      : kind(e.kind()), reason(e.what()) {}

  /**
   * @brief not_found and conflict are "nothing to do" rather than failures
   */
  bool expected() const {
    return kind == error_kind_t::not_found || kind == error_kind_t::conflict;
  }

  error_kind_t kind;
  std::string reason;
};

/**
 * @brief Result of every mutating lifecycle operation
 */
using outcome_t = std::variant<ok_output_t, error_output_t>;

inline bool succeeded(const outcome_t &outcome) {
  return std::holds_alternative<ok_output_t>(outcome);
}

inline const std::string &message_of(const outcome_t &outcome) {
  if (auto ok = std::get_if<ok_output_t>(&outcome))
    return ok->message;
  return std::get<error_output_t>(outcome).reason;
}

} // namespace ember
