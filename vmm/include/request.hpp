#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "instance.hpp"

namespace ember {

/**
 * @brief A loosely typed port specification, as accepted from callers
 * @details
 * One of: nothing, a single integer, a comma separated string ("80, 443"),
 * or a list mixing integers and strings.
 */
using port_item_t = std::variant<int64_t, std::string>;

using port_spec_t = std::variant<std::monostate, int64_t, std::string,
                                 std::vector<port_item_t>>;

/**
 * @brief Normalize a port specification to an ordered list of integers
 * @details
 * Order is preserved and whitespace around items is ignored. Items that are
 * not numeric are dropped. An absent specification yields an empty list.
 */
std::vector<int64_t> parse_ports(const port_spec_t &spec);

/**
 * @brief Per-call overrides for `microvm_manager_t::create`
 * @details Every unset field falls back to the host-wide `config_t`.
 */
struct create_request_t {
  std::optional<std::string> name = std::nullopt;
  std::optional<std::filesystem::path> kernel_file = std::nullopt;
  std::optional<std::filesystem::path> base_rootfs = std::nullopt;

  /**
   * Downloaded into the data path when set; takes precedence over
   * `base_rootfs`
   */
  std::optional<std::string> rootfs_url = std::nullopt;

  std::optional<int64_t> vcpu_count = std::nullopt;
  std::optional<int64_t> mem_size_mib = std::nullopt;
  std::optional<std::string> ip_addr = std::nullopt;
  std::optional<bool> bridge = std::nullopt;
  std::optional<std::string> bridge_name = std::nullopt;
  std::optional<bool> mmds_enabled = std::nullopt;
  std::optional<std::string> mmds_ip = std::nullopt;
  labels_t labels = {};
  std::string working_dir = "/root";
  std::optional<bool> expose_ports = std::nullopt;
  port_spec_t host_port = std::monostate{};
  port_spec_t dest_port = std::monostate{};

  /**
   * Inline user data; ignored when `user_data_file` is set
   */
  std::optional<std::string> user_data = std::nullopt;
  std::optional<std::filesystem::path> user_data_file = std::nullopt;

  bool verbose = false;
};

} // namespace ember
