#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <nlohmann/json.hpp>

namespace ember {

enum class instance_state_t { created, running, paused, deleted };

using labels_t = std::map<std::string, std::string>;

/* Structs stored in the per-instance record document */

struct port_rule_t {
  uint16_t host_port;
  uint16_t dest_port;

  bool operator==(const port_rule_t &) const = default;
};

/**
 * Keyed by "<dest_port>/tcp"
 */
using port_map_t = std::map<std::string, std::vector<port_rule_t>>;

struct network_entry_t {
  std::string ip_address;
  std::string gateway;
};

struct instance_record_t {
  std::string id;
  std::string name;
  std::string created_at;
  instance_state_t state = instance_state_t::created;

  /**
   * Hypervisor pid, or the pid of its terminal session before the hypervisor
   * has been found
   */
  pid_t pid = 0;

  std::filesystem::path rootfs_path;
  std::filesystem::path kernel_path;

  /**
   * Keyed by tap device name
   */
  std::map<std::string, network_entry_t> network;

  port_map_t ports;
  labels_t labels;
  std::string working_dir = "/root";
  uint32_t vcpu_count = 1;
  uint32_t mem_size_mib = 512;
  std::filesystem::path socket_path;
  std::string session_name;

  std::string tap_name() const;

  /**
   * @brief Guest address of the first network entry, if any
   */
  std::optional<std::string> ip_address() const;

  std::optional<std::string> gateway() const;

  bool matches_labels(const labels_t &selector) const;
};

/**
 * @brief "<dest_port>/tcp"
 */
std::string port_key(uint16_t dest_port);

/**
 * @brief "tap_<id>"
 */
std::string tap_name_for(const std::string &id);

/**
 * @brief "fc_<id>"
 */
std::string session_name_for(const std::string &id);

std::string to_string(instance_state_t state);

std::optional<instance_state_t> parse_instance_state(const std::string &s);

} // namespace ember

namespace nlohmann {

void to_json(json &j, const ember::port_rule_t &obj);

void from_json(const json &j, ember::port_rule_t &obj);

void to_json(json &j, const ember::network_entry_t &obj);

void from_json(const json &j, ember::network_entry_t &obj);

void to_json(json &j, const ember::instance_record_t &obj);

void from_json(const json &j, ember::instance_record_t &obj);

} // namespace nlohmann
