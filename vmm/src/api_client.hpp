#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "object.hpp"

namespace ember {

/**
 * @brief Hypervisor control API of one instance
 * @details Every method throws `ember::exception_t<api_error>` naming the
 * method and the cause when the request fails or the answer is not 2xx.
 */
class api_client_t : public object_t {
public:
  virtual void put_boot_source(const std::string &kernel_image_path,
                               const std::string &boot_args) = 0;

  virtual void put_drive(const std::string &drive_id,
                         const std::string &path_on_host, bool is_root_device,
                         bool is_read_only) = 0;

  virtual void put_machine_config(uint32_t vcpu_count,
                                  uint32_t mem_size_mib) = 0;

  virtual void put_network_interface(const std::string &iface_id,
                                     const std::string &host_dev_name) = 0;

  virtual void
  put_mmds_config(const std::string &version, const std::string &ipv4_address,
                  const std::vector<std::string> &network_interfaces) = 0;

  virtual void put_mmds(const nlohmann::json &payload) = 0;

  virtual void put_action(const std::string &action_type) = 0;

  /**
   * @param state "Paused" or "Resumed"
   */
  virtual void patch_vm_state(const std::string &state) = 0;

  virtual nlohmann::json get_vm_config() = 0;

  virtual void close() = 0;
};

using api_factory_t = std::function<std::shared_ptr<api_client_t>(
    const std::filesystem::path &socket_path)>;

/**
 * @brief Firecracker's HTTP API over its UNIX socket
 */
class firecracker_api_t : public api_client_t {
public:
  explicit firecracker_api_t(const std::filesystem::path &socket_path);

  ~firecracker_api_t();

  void put_boot_source(const std::string &kernel_image_path,
                       const std::string &boot_args) override;

  void put_drive(const std::string &drive_id, const std::string &path_on_host,
                 bool is_root_device, bool is_read_only) override;

  void put_machine_config(uint32_t vcpu_count, uint32_t mem_size_mib) override;

  void put_network_interface(const std::string &iface_id,
                             const std::string &host_dev_name) override;

  void
  put_mmds_config(const std::string &version, const std::string &ipv4_address,
                  const std::vector<std::string> &network_interfaces) override;

  void put_mmds(const nlohmann::json &payload) override;

  void put_action(const std::string &action_type) override;

  void patch_vm_state(const std::string &state) override;

  nlohmann::json get_vm_config() override;

  void close() override;

private:
  void _send(const std::string &method_name, const std::string &verb,
             const std::string &path, const nlohmann::json &body);

  std::filesystem::path socket_path_;
  std::shared_ptr<httplib::Client> cli_;
};

} // namespace ember
