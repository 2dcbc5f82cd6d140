#include "remote_shell.hpp"

#include <cstdlib>
#include <format>

#include <libssh/libssh.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "logging.hpp"

namespace ember {

namespace {

class libssh_channel_t : public shell_channel_t {
public:
  explicit libssh_channel_t(ssh_channel channel) : channel_(channel) {}

  ~libssh_channel_t() { close(); }

  ssize_t read_nonblocking(char *buf, size_t len) override {
    if (!channel_)
      return -1;
    int n = ssh_channel_read_nonblocking(channel_, buf,
                                         static_cast<uint32_t>(len), 0);
    if (n == 0 && ssh_channel_is_eof(channel_))
      return -1;
    return n;
  }

  bool write(const char *buf, size_t len) override {
    if (!channel_)
      return false;
    return ssh_channel_write(channel_, buf, static_cast<uint32_t>(len)) ==
           static_cast<int>(len);
  }

  bool finished() override {
    return !channel_ || ssh_channel_is_eof(channel_) ||
           ssh_channel_is_closed(channel_);
  }

  void close() override {
    if (!channel_)
      return;
    if (!ssh_channel_is_closed(channel_)) {
      ssh_channel_send_eof(channel_);
      ssh_channel_close(channel_);
    }
    ssh_channel_free(channel_);
    channel_ = nullptr;
  }

private:
  ssh_channel channel_;
};

ssh_session as_session(void *p) { return static_cast<ssh_session>(p); }

} // namespace

bool is_unreachable_message(const std::string &message) {
  for (const char *needle : {"Connection refused", "No route to host",
                             "Network is unreachable", "Host is unreachable"})
    if (message.find(needle) != std::string::npos)
      return true;
  return false;
}

libssh_remote_shell_t::~libssh_remote_shell_t() { disconnect(); }

void libssh_remote_shell_t::connect(const std::string &host,
                                    const std::string &user,
                                    const std::filesystem::path &key_path) {
  disconnect();

  ssh_session session = ssh_new();
  if (!session)
    throw exception<vmm_error>("ssh_new() failed");
  session_ = session;

  long timeout_sec = 10;
  ssh_options_set(session, SSH_OPTIONS_HOST, host.c_str());
  ssh_options_set(session, SSH_OPTIONS_USER, user.c_str());
  ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &timeout_sec);
  // Guest host keys change on every recreate; they are not verified
  int strict = 0;
  ssh_options_set(session, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);

  if (ssh_connect(session) != SSH_OK) {
    std::string cause = ssh_get_error(session);
    disconnect();
    if (is_unreachable_message(cause))
      throw exception<unreachable_error>(
          std::format("Cannot reach {}: {}", host, cause));
    throw exception<vmm_error>(
        std::format("SSH connection to {} failed: {}", host, cause));
  }

  ssh_key key = nullptr;
  if (ssh_pki_import_privkey_file(key_path.c_str(), nullptr, nullptr, nullptr,
                                  &key) != SSH_OK) {
    disconnect();
    throw exception<vmm_error>(
        std::format("Cannot load SSH key {}", key_path.string()));
  }
  int rc = ssh_userauth_publickey(session, nullptr, key);
  ssh_key_free(key);
  if (rc != SSH_AUTH_SUCCESS) {
    std::string cause = ssh_get_error(session);
    disconnect();
    throw exception<vmm_error>(std::format(
        "SSH authentication as {}@{} failed: {}", user, host, cause));
  }
  debug("[SSH] connected to {}@{}", user, host);
}

std::shared_ptr<shell_channel_t> libssh_remote_shell_t::open_shell() {
  if (!session_)
    throw exception<vmm_error>("SSH session is not connected");
  auto session = as_session(session_);

  ssh_channel channel = ssh_channel_new(session);
  if (!channel)
    throw exception<vmm_error>(std::format("ssh_channel_new() failed: {}",
                                           ssh_get_error(session)));
  auto rv = create<libssh_channel_t>(channel);

  if (ssh_channel_open_session(channel) != SSH_OK)
    throw exception<vmm_error>(std::format("Cannot open SSH channel: {}",
                                           ssh_get_error(session)));

  winsize ws{};
  int cols = 80, rows = 24;
  if (::isatty(STDIN_FILENO) && ::ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0 &&
      ws.ws_col > 0) {
    cols = ws.ws_col;
    rows = ws.ws_row;
  }
  const char *term = std::getenv("TERM");
  if (ssh_channel_request_pty_size(channel, term ? term : "xterm", cols,
                                   rows) != SSH_OK ||
      ssh_channel_request_shell(channel) != SSH_OK)
    throw exception<vmm_error>(std::format("Cannot start remote shell: {}",
                                           ssh_get_error(session)));
  return rv;
}

void libssh_remote_shell_t::disconnect() {
  if (!session_)
    return;
  auto session = as_session(session_);
  if (ssh_is_connected(session))
    ssh_disconnect(session);
  ssh_free(session);
  session_ = nullptr;
}

} // namespace ember
