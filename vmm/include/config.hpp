/**
 * @file config.hpp
 * @brief Host-wide defaults for every microVM managed by ember
 * @details
 * A `config_t` is built once per process and handed by reference to the
 * components that need it. Sources, later ones overriding earlier ones:
 *
 * 1. built-in defaults (the member initializers below)
 * 2. a JSON document named by `EMBER_CONFIG`, keys equal to member names
 * 3. `EMBER_<MEMBER_NAME>` environment variables, e.g. `EMBER_DATA_PATH`
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ember {

struct config_t {
  std::filesystem::path data_path = "/var/lib/ember";

  std::filesystem::path binary_path = "/usr/local/bin/firecracker";

  /**
   * Defaults to `<data_path>/vmlinux` when left empty
   */
  std::filesystem::path kernel_file;

  /**
   * Defaults to `<data_path>/rootfs.img` when left empty
   */
  std::filesystem::path base_rootfs;

  std::string ip_addr = "172.16.0.2";

  uint32_t vcpu_count = 1;

  uint32_t mem_size_mib = 512;

  bool bridge = false;

  std::string bridge_name = "docker0";

  bool mmds_enabled = false;

  std::string mmds_ip = "169.254.169.254";

  std::string guest_iface = "eth0";

  bool nat_enabled = true;

  bool expose_ports = false;

  std::string ssh_user = "root";

  std::optional<std::string> user_data = std::nullopt;

  bool verbose = false;

  /**
   * @brief Defaults, then `EMBER_CONFIG`, then `EMBER_*` variables
   * @throws ember::exception_t<configuration_error> on malformed input
   */
  static config_t load();

  /**
   * @brief Override members with the keys present in `j`
   */
  void merge(const nlohmann::json &j);

  /**
   * @brief Override members with `EMBER_*` environment variables
   */
  void merge_env();

  /**
   * @brief Fill the paths derived from `data_path`
   */
  void finalize();
};

} // namespace ember

namespace nlohmann {

void to_json(json &j, const ember::config_t &obj);

} // namespace nlohmann
