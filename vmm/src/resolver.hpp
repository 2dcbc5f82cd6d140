#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "request.hpp"
#include "rootfs_fetch.hpp"
#include "supervisor.hpp"

namespace ember {

/**
 * @brief A create request with every default applied and validated
 */
struct resolved_config_t {
  std::string id;
  std::string name;
  std::filesystem::path kernel_file;
  std::filesystem::path base_rootfs;
  uint32_t vcpu_count;
  uint32_t mem_size_mib;
  std::string ip_addr;
  std::string gateway_ip;
  std::string guest_iface;
  std::string tap_name;
  bool bridge;
  std::string bridge_name;
  bool nat_enabled;
  bool mmds_enabled;
  std::string mmds_ip;
  std::optional<std::string> user_data;

  /**
   * Host-wide user data, served when the request carries none
   */
  std::optional<std::string> default_user_data;

  labels_t labels;
  std::string working_dir;
  bool expose_ports;
  std::vector<int64_t> host_ports;
  std::vector<int64_t> dest_ports;
  bool verbose;
  instance_paths_t paths;
};

constexpr uint32_t min_mem_size_mib = 128;
constexpr uint32_t max_vcpu_count = 32;

/**
 * @brief Apply `config` defaults to `request` and validate the result
 * @param id Instance id, already reserved
 * @param name Instance name, already checked for uniqueness
 * @throws ember::exception_t<configuration_error> naming the invalid field
 */
resolved_config_t resolve_config(const create_request_t &request,
                                 const config_t &config, const std::string &id,
                                 const std::string &name,
                                 const rootfs_fetcher_t &fetch);

} // namespace ember
