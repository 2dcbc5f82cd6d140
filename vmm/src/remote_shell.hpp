#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <sys/types.h>

#include "exception.hpp"
#include "object.hpp"

namespace ember {

/**
 * @brief The remote host refused the connection or could not be routed to
 * @details Thrown by `remote_shell_t::connect`; the only failure worth
 * retrying while a guest is still booting.
 */
struct unreachable_error {
  static constexpr error_kind_t kind = error_kind_t::network;

  unreachable_error() : errstr_("Host unreachable") {}

  unreachable_error(const std::string &what) : errstr_(what) {}

  const char *what() const noexcept { return errstr_.c_str(); }

  std::string errstr_;
};

static_assert(is_exception_reason<unreachable_error>);

/**
 * @brief Bidirectional byte stream of an interactive remote shell
 */
class shell_channel_t : public object_t {
public:
  /**
   * @return bytes read, 0 if nothing is pending, negative once the channel
   * is unusable
   */
  virtual ssize_t read_nonblocking(char *buf, size_t len) = 0;

  virtual bool write(const char *buf, size_t len) = 0;

  /**
   * @brief The remote side has closed or sent EOF
   */
  virtual bool finished() = 0;

  virtual void close() = 0;
};

class remote_shell_t : public object_t {
public:
  /**
   * @throws ember::exception_t<unreachable_error> when the host refuses or
   * cannot be routed to
   * @throws ember::exception_t<vmm_error> for every other failure
   * (handshake, authentication, unreadable key)
   */
  virtual void connect(const std::string &host, const std::string &user,
                       const std::filesystem::path &key_path) = 0;

  /**
   * @brief Open a PTY backed login shell on the connected session
   */
  virtual std::shared_ptr<shell_channel_t> open_shell() = 0;

  virtual void disconnect() = 0;
};

/**
 * @brief libssh public key sessions
 */
class libssh_remote_shell_t : public remote_shell_t {
public:
  libssh_remote_shell_t() = default;

  ~libssh_remote_shell_t();

  void connect(const std::string &host, const std::string &user,
               const std::filesystem::path &key_path) override;

  std::shared_ptr<shell_channel_t> open_shell() override;

  void disconnect() override;

private:
  /**
   * ssh_session, kept opaque so that libssh stays out of this header
   */
  void *session_ = nullptr;
};

/**
 * @brief true for transport errors that mean "nobody is listening yet"
 */
bool is_unreachable_message(const std::string &message);

} // namespace ember
