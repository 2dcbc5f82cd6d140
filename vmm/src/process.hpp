#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "object.hpp"

namespace ember {

struct session_spec_t {
  std::string session_name;
  std::filesystem::path binary;
  std::vector<std::string> args;
  std::filesystem::path log_path;
};

struct process_info_t {
  pid_t pid;

  /**
   * ISO-8601 UTC
   */
  std::string started_at;
};

/**
 * @brief Hosts hypervisor processes inside detachable terminal sessions
 */
class process_manager_t : public object_t {
public:
  /**
   * @return pid of the session process
   */
  virtual pid_t start_detached_session(const session_spec_t &spec) = 0;

  virtual bool process_alive(pid_t pid) = 0;

  /**
   * @brief Locate the hypervisor started with `--id <instance_id>`
   */
  virtual std::optional<process_info_t>
  get_pid_and_start_time(const std::string &instance_id) = 0;

  /**
   * @brief Type the contents of `path` into the session as literal
   * keystrokes
   * @return true if the injection commands succeeded
   */
  virtual bool paste_file(const std::string &session_name,
                          const std::filesystem::path &path) = 0;

  /**
   * @brief Quit the session and make sure `pid` (if not 0) is gone
   * @return true if nothing is left running
   */
  virtual bool stop_session(const std::string &session_name, pid_t pid) = 0;
};

/**
 * @brief GNU screen backed sessions
 */
class screen_process_manager_t : public process_manager_t {
public:
  explicit screen_process_manager_t(const std::filesystem::path &binary_path);

  pid_t start_detached_session(const session_spec_t &spec) override;

  bool process_alive(pid_t pid) override;

  std::optional<process_info_t>
  get_pid_and_start_time(const std::string &instance_id) override;

  bool paste_file(const std::string &session_name,
                  const std::filesystem::path &path) override;

  bool stop_session(const std::string &session_name, pid_t pid) override;

private:
  std::string binary_name_;
};

/**
 * @brief Command line of `pid` split on NUL, empty if unreadable
 */
std::vector<std::string> read_cmdline(pid_t pid);

/**
 * @brief Start time of `pid` as ISO-8601 UTC, from /proc
 */
std::optional<std::string> process_start_time(pid_t pid);

} // namespace ember
