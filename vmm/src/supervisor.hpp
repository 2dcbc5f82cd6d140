#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "api_client.hpp"
#include "process.hpp"
#include "retry.hpp"

namespace ember {

/**
 * @brief Everything an instance owns on disk, derived from its id
 */
struct instance_paths_t {
  std::filesystem::path root;
  std::filesystem::path rootfs_dir;
  std::filesystem::path log_dir;
  std::filesystem::path rootfs_file;
  std::filesystem::path socket_path;
  std::filesystem::path hypervisor_log;
  std::filesystem::path session_log;
  std::string session_name;

  static instance_paths_t make(const std::filesystem::path &data_path,
                               const std::string &id,
                               const std::filesystem::path &base_rootfs);
};

struct spawn_result_t {
  std::shared_ptr<api_client_t> api;
  pid_t session_pid;
};

/**
 * @brief Starts a hypervisor in its own session and waits for its socket
 */
class supervisor_t {
public:
  supervisor_t(const std::filesystem::path &binary_path,
               std::shared_ptr<process_manager_t> process,
               api_factory_t api_factory, retry_t socket_wait = retry_t{});

  /**
   * @brief Lay out the instance tree, copy the rootfs and start the session
   * @details On failure everything created here is removed again before the
   * exception propagates.
   * @throws ember::exception_t<process_error> if the session dies
   * @throws ember::exception_t<api_error> if the socket never appears
   */
  spawn_result_t spawn(const std::string &id, const instance_paths_t &paths,
                       const std::filesystem::path &base_rootfs);

  /**
   * @brief Stop the session and remove the instance tree
   * @return false if something could not be released; the failures are logged
   */
  bool cleanup(const instance_paths_t &paths, pid_t pid) noexcept;

private:
  void _prepare(const instance_paths_t &paths,
                const std::filesystem::path &base_rootfs);

  std::filesystem::path binary_path_;
  std::shared_ptr<process_manager_t> process_;
  api_factory_t api_factory_;
  retry_t socket_wait_;
};

} // namespace ember
