/**
 * @file microvm.hpp
 * @brief Lifecycle of Firecracker microVMs on one host
 * @details
 * `microvm_manager_t` composes the registry, the process supervisor, the
 * control API configurator and the host network into the lifecycle
 * operations.
 *
 * Result conventions:
 * - Mutating operations return `outcome_t`. `ok_output_t` carries the
 *   message shown to the user. `error_output_t::expected()` distinguishes
 *   "nothing to do" (unknown id, duplicate name) from failures.
 * - Queries return `std::optional` (or an empty container) when the
 *   instance does not exist.
 *
 * ```cpp
 * auto config = ember::config_t::load();
 * ember::microvm_manager_t manager(config);
 * auto outcome = manager.create(ember::create_request_t{.name = "web"});
 * std::cout << ember::message_of(outcome) << std::endl;
 * ```
 */
#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "instance.hpp"
#include "outcome.hpp"
#include "request.hpp"
#include "retry.hpp"

namespace ember {

class api_client_t;
class host_network_t;
class process_manager_t;
class registry_t;
class remote_shell_t;

/**
 * @brief Replaceable collaborators; unset members get the host defaults
 */
struct collaborators_t {
  std::shared_ptr<process_manager_t> process = nullptr;
  std::shared_ptr<host_network_t> network = nullptr;
  std::shared_ptr<remote_shell_t> shell = nullptr;
  std::function<std::shared_ptr<api_client_t>(const std::filesystem::path &)>
      api_factory = nullptr;
  std::function<std::filesystem::path(const std::string &,
                                      const std::filesystem::path &)>
      rootfs_fetcher = nullptr;
};

struct timings_t {
  retry_t socket_wait{.attempts = 3,
                      .interval = std::chrono::milliseconds(500)};
  retry_t ssh_connect{.attempts = 3,
                      .interval = std::chrono::milliseconds(2000)};
};

struct connect_options_t {
  std::optional<std::string> username = std::nullopt;
  std::optional<std::filesystem::path> key_path = std::nullopt;
  int in_fd = 0;
  int out_fd = 1;
};

class microvm_manager_t {
public:
  explicit microvm_manager_t(const config_t &config,
                             collaborators_t collaborators = {},
                             timings_t timings = {});

  ~microvm_manager_t();

  outcome_t create(const create_request_t &request);

  outcome_t pause(const std::string &id);

  outcome_t resume(const std::string &id);

  outcome_t remove(const std::string &id);

  /**
   * @brief Delete every instance, continuing past individual failures
   */
  outcome_t remove_all();

  outcome_t port_forward(const std::string &id, const port_spec_t &host_ports,
                         const port_spec_t &dest_ports, bool remove = false);

  /**
   * @brief Interactive shell on the guest, relayed to the local terminal
   * @details Blocks until the remote shell exits or local input closes.
   */
  outcome_t connect(const std::string &id, const connect_options_t &options);

  /**
   * @brief Type `commands` into the guest console, one per line
   * @return true if the keystrokes were delivered
   */
  bool execute_in_vm(const std::string &id,
                     const std::vector<std::string> &commands);

  std::vector<instance_record_t> list() const;

  /**
   * @brief "VMM <id> is running" or "VMM <id> is paused"
   */
  std::optional<std::string> status(const std::string &id) const;

  std::optional<instance_record_t> inspect(const std::string &id) const;

  /**
   * @brief Live machine configuration reported by the hypervisor
   * @throws ember::exception_t<api_error> if the hypervisor cannot be asked
   */
  std::optional<nlohmann::json> config(const std::string &id);

  /**
   * @return ids of the instances in `state` carrying every label in `labels`
   */
  std::vector<std::string> find(instance_state_t state,
                                const labels_t &labels = {}) const;

private:
  /**
   * @brief Release everything `record` holds, continuing past failures
   * @param keep_if_running Keep the files when the process could not be
   * stopped
   * @return one message per failed step
   */
  std::vector<std::string> _teardown(const instance_record_t &record,
                                     bool keep_if_running);

  void _forward(const std::string &id, const std::string &dest_ip,
                const std::vector<int64_t> &host_ports,
                const std::vector<int64_t> &dest_ports, bool remove,
                port_map_t &ports);

  outcome_t _set_state(const std::string &id, instance_state_t target);

  std::string _unique_name();

  void _note(bool verbose, const std::string &msg);

  const config_t &config_;
  collaborators_t collaborators_;
  timings_t timings_;
  std::unique_ptr<registry_t> registry_;
};

} // namespace ember
