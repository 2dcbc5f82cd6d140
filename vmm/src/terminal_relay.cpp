#include "terminal_relay.hpp"

#include <cerrno>

#include <poll.h>

#include "logging.hpp"

namespace ember {

namespace {

bool write_all(int fd, const char *buf, size_t len) {
  while (len > 0) {
    auto n = ::write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    buf += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

} // namespace

raw_terminal_t::raw_terminal_t(int fd) : fd_(fd) {
  if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0)
    return;
  termios raw = saved_;
  ::cfmakeraw(&raw);
  if (::tcsetattr(fd_, TCSANOW, &raw) == 0)
    active_ = true;
}

raw_terminal_t::~raw_terminal_t() {
  if (active_)
    ::tcsetattr(fd_, TCSANOW, &saved_);
}

relay_end_t relay(shell_channel_t &channel, const relay_options_t &options) {
  char buf[4096];
  while (true) {
    auto n = channel.read_nonblocking(buf, sizeof(buf));
    if (n > 0) {
      if (!write_all(options.out_fd, buf, static_cast<size_t>(n)))
        warn("[Relay] failed to write to local output");
    } else if (n < 0 || channel.finished()) {
      return relay_end_t::remote_finished;
    }

    pollfd pfd{.fd = options.in_fd, .events = POLLIN, .revents = 0};
    // Keep draining without delay while the remote side is producing
    int timeout = n > 0 ? 0 : static_cast<int>(options.poll_interval.count());
    int rc = ::poll(&pfd, 1, timeout);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      warn("[Relay] poll() failed, closing the session");
      return relay_end_t::local_eof;
    }
    if (rc == 0)
      continue;

    if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
      auto r = ::read(options.in_fd, buf, sizeof(buf));
      if (r < 0 && errno == EINTR)
        continue;
      if (r <= 0)
        return relay_end_t::local_eof;
      if (!channel.write(buf, static_cast<size_t>(r)))
        return relay_end_t::remote_finished;
    }
  }
}

} // namespace ember
