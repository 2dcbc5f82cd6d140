#pragma once

#include <chrono>

#include <termios.h>
#include <unistd.h>

#include "remote_shell.hpp"

namespace ember {

/**
 * @brief Puts a terminal in raw mode for its lifetime
 * @details Does nothing when `fd` is not a terminal.
 */
class raw_terminal_t {
public:
  explicit raw_terminal_t(int fd);

  raw_terminal_t(const raw_terminal_t &) = delete;

  raw_terminal_t &operator=(const raw_terminal_t &) = delete;

  ~raw_terminal_t();

  bool active() const { return active_; }

private:
  int fd_;
  bool active_ = false;
  termios saved_{};
};

struct relay_options_t {
  int in_fd = STDIN_FILENO;
  int out_fd = STDOUT_FILENO;
  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100);
};

enum class relay_end_t {
  remote_finished,
  local_eof,
};

/**
 * @brief Copy bytes both ways between a local terminal and `channel`
 * @details Returns when the remote side finishes or local input reaches EOF.
 */
relay_end_t relay(shell_channel_t &channel, const relay_options_t &options);

} // namespace ember
