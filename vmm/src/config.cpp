#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "exception.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace ember {

namespace {

std::optional<std::string> getenv_opt(const std::string &name) {
  const char *v = std::getenv(name.c_str());
  if (!v)
    return std::nullopt;
  return std::string(v);
}

bool parse_bool(const std::string &name, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  if (value == "1" || value == "true" || value == "yes" || value == "on")
    return true;
  if (value == "0" || value == "false" || value == "no" || value == "off")
    return false;
  throw exception<configuration_error>(
      std::format("{} must be a boolean, got \"{}\"", name, value));
}

uint32_t parse_uint(const std::string &name, const std::string &value) {
  if (!utils::is_digits(value))
    throw exception<configuration_error>(
        std::format("{} must be a non-negative integer, got \"{}\"", name,
                    value));
  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::out_of_range &) {
    throw exception<configuration_error>(
        std::format("{} is out of range: {}", name, value));
  }
}

template <typename T>
void merge_key(const nlohmann::json &j, const std::string &key, T &out) {
  if (!j.contains(key) || j[key].is_null())
    return;
  try {
    out = j[key].get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw exception<configuration_error>(
        std::format("Invalid value for \"{}\": {}", key, e.what()));
  }
}

} // namespace

config_t config_t::load() {
  config_t config;

  if (auto path = getenv_opt("EMBER_CONFIG")) {
    std::ifstream ifs(*path);
    if (!ifs)
      throw exception<configuration_error>(
          std::format("Cannot open config file {}", *path));
    nlohmann::json j;
    try {
      ifs >> j;
    } catch (const nlohmann::json::parse_error &e) {
      throw exception<configuration_error>(
          std::format("Failed to parse config file {}: {}", *path, e.what()));
    }
    config.merge(j);
    debug("[Config] loaded {}", *path);
  }

  config.merge_env();
  config.finalize();
  return config;
}

void config_t::merge(const nlohmann::json &j) {
  if (!j.is_object())
    throw exception<configuration_error>("Config document must be an object");

  std::string path;
  if (j.contains("data_path")) {
    merge_key(j, "data_path", path);
    data_path = path;
  }
  if (j.contains("binary_path")) {
    merge_key(j, "binary_path", path);
    binary_path = path;
  }
  if (j.contains("kernel_file")) {
    merge_key(j, "kernel_file", path);
    kernel_file = path;
  }
  if (j.contains("base_rootfs")) {
    merge_key(j, "base_rootfs", path);
    base_rootfs = path;
  }
  merge_key(j, "ip_addr", ip_addr);
  merge_key(j, "vcpu_count", vcpu_count);
  merge_key(j, "mem_size_mib", mem_size_mib);
  merge_key(j, "bridge", bridge);
  merge_key(j, "bridge_name", bridge_name);
  merge_key(j, "mmds_enabled", mmds_enabled);
  merge_key(j, "mmds_ip", mmds_ip);
  merge_key(j, "guest_iface", guest_iface);
  merge_key(j, "nat_enabled", nat_enabled);
  merge_key(j, "expose_ports", expose_ports);
  merge_key(j, "ssh_user", ssh_user);
  if (j.contains("user_data") && j["user_data"].is_string())
    user_data = j["user_data"].get<std::string>();
  merge_key(j, "verbose", verbose);
}

void config_t::merge_env() {
  if (auto v = getenv_opt("EMBER_DATA_PATH"))
    data_path = *v;
  if (auto v = getenv_opt("EMBER_BINARY_PATH"))
    binary_path = *v;
  if (auto v = getenv_opt("EMBER_KERNEL_FILE"))
    kernel_file = *v;
  if (auto v = getenv_opt("EMBER_BASE_ROOTFS"))
    base_rootfs = *v;
  if (auto v = getenv_opt("EMBER_IP_ADDR"))
    ip_addr = *v;
  if (auto v = getenv_opt("EMBER_VCPU_COUNT"))
    vcpu_count = parse_uint("EMBER_VCPU_COUNT", *v);
  if (auto v = getenv_opt("EMBER_MEM_SIZE_MIB"))
    mem_size_mib = parse_uint("EMBER_MEM_SIZE_MIB", *v);
  if (auto v = getenv_opt("EMBER_BRIDGE"))
    bridge = parse_bool("EMBER_BRIDGE", *v);
  if (auto v = getenv_opt("EMBER_BRIDGE_NAME"))
    bridge_name = *v;
  if (auto v = getenv_opt("EMBER_MMDS_ENABLED"))
    mmds_enabled = parse_bool("EMBER_MMDS_ENABLED", *v);
  if (auto v = getenv_opt("EMBER_MMDS_IP"))
    mmds_ip = *v;
  if (auto v = getenv_opt("EMBER_GUEST_IFACE"))
    guest_iface = *v;
  if (auto v = getenv_opt("EMBER_NAT_ENABLED"))
    nat_enabled = parse_bool("EMBER_NAT_ENABLED", *v);
  if (auto v = getenv_opt("EMBER_EXPOSE_PORTS"))
    expose_ports = parse_bool("EMBER_EXPOSE_PORTS", *v);
  if (auto v = getenv_opt("EMBER_SSH_USER"))
    ssh_user = *v;
  if (auto v = getenv_opt("EMBER_USER_DATA"))
    user_data = *v;
  if (auto v = getenv_opt("EMBER_VERBOSE"))
    verbose = parse_bool("EMBER_VERBOSE", *v);
}

void config_t::finalize() {
  if (data_path.empty())
    throw exception<configuration_error>("data_path must not be empty");
  if (kernel_file.empty())
    kernel_file = data_path / "vmlinux";
  if (base_rootfs.empty())
    base_rootfs = data_path / "rootfs.img";
}

} // namespace ember

namespace nlohmann {

void to_json(json &j, const ember::config_t &obj) {
  j = json{
      {"data_path", obj.data_path.string()},
      {"binary_path", obj.binary_path.string()},
      {"kernel_file", obj.kernel_file.string()},
      {"base_rootfs", obj.base_rootfs.string()},
      {"ip_addr", obj.ip_addr},
      {"vcpu_count", obj.vcpu_count},
      {"mem_size_mib", obj.mem_size_mib},
      {"bridge", obj.bridge},
      {"bridge_name", obj.bridge_name},
      {"mmds_enabled", obj.mmds_enabled},
      {"mmds_ip", obj.mmds_ip},
      {"guest_iface", obj.guest_iface},
      {"nat_enabled", obj.nat_enabled},
      {"expose_ports", obj.expose_ports},
      {"ssh_user", obj.ssh_user},
      {"verbose", obj.verbose},
  };
  j["user_data"] = obj.user_data.has_value() ? json(*obj.user_data) : json();
}

} // namespace nlohmann
