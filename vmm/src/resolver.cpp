#include "resolver.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include "exception.hpp"
#include "instance.hpp"
#include "ip_allocator.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace ember {

namespace {

std::string read_user_data_file(const fs::path &path) {
  if (!fs::is_regular_file(path))
    throw exception<configuration_error>(
        "user_data_file", std::format("{} does not exist", path.string()));
  std::ifstream ifs(path);
  if (!ifs)
    throw exception<configuration_error>(
        "user_data_file", std::format("{} is not readable", path.string()));
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

} // namespace

resolved_config_t resolve_config(const create_request_t &request,
                                 const config_t &config, const std::string &id,
                                 const std::string &name,
                                 const rootfs_fetcher_t &fetch) {
  resolved_config_t rv;
  rv.id = id;
  rv.name = name;

  int64_t vcpu = request.vcpu_count.value_or(config.vcpu_count);
  if (vcpu <= 0)
    throw exception<configuration_error>(
        "vcpu_count", std::format("must be a positive integer, got {}", vcpu));
  if (vcpu > max_vcpu_count)
    throw exception<configuration_error>(
        "vcpu_count",
        std::format("must be at most {}, got {}", max_vcpu_count, vcpu));
  rv.vcpu_count = static_cast<uint32_t>(vcpu);

  int64_t mem = request.mem_size_mib.value_or(config.mem_size_mib);
  if (mem < min_mem_size_mib)
    throw exception<configuration_error>(
        "mem_size_mib",
        std::format("must be at least {} MiB, got {}", min_mem_size_mib, mem));
  if (mem > std::numeric_limits<uint32_t>::max())
    throw exception<configuration_error>(
        "mem_size_mib",
        std::format("must be at most {} MiB, got {}",
                    std::numeric_limits<uint32_t>::max(), mem));
  rv.mem_size_mib = static_cast<uint32_t>(mem);

  rv.ip_addr = request.ip_addr.value_or(config.ip_addr);
  if (!is_valid_ipv4(rv.ip_addr))
    throw exception<configuration_error>(
        "ip_addr", std::format("\"{}\" is not a valid IPv4 address",
                               rv.ip_addr));
  rv.gateway_ip = gateway_for(rv.ip_addr);

  rv.kernel_file = request.kernel_file.value_or(config.kernel_file);

  if (request.rootfs_url.has_value())
    rv.base_rootfs = fetch(request.rootfs_url.value(), config.data_path);
  else
    rv.base_rootfs = request.base_rootfs.value_or(config.base_rootfs);
  if (rv.base_rootfs.filename().empty())
    throw exception<configuration_error>(
        "base_rootfs",
        std::format("\"{}\" does not name a file", rv.base_rootfs.string()));

  rv.bridge = request.bridge.value_or(config.bridge);
  rv.bridge_name = request.bridge_name.value_or(config.bridge_name);
  rv.nat_enabled = config.nat_enabled;
  rv.guest_iface = config.guest_iface;
  rv.tap_name = tap_name_for(id);

  if (request.user_data_file.has_value())
    rv.user_data = read_user_data_file(request.user_data_file.value());
  else
    rv.user_data = request.user_data;
  rv.default_user_data = config.user_data;

  rv.mmds_enabled = request.mmds_enabled.value_or(config.mmds_enabled);
  std::optional<std::string> mmds_ip = request.mmds_ip;
  if (rv.user_data.has_value()) {
    rv.mmds_enabled = true;
    if (!mmds_ip.has_value())
      debug("[Resolver] user data given, enabling MMDS at {}", config.mmds_ip);
  }
  rv.mmds_ip = mmds_ip.value_or(config.mmds_ip);
  if (rv.mmds_enabled && !is_valid_ipv4(rv.mmds_ip))
    throw exception<configuration_error>(
        "mmds_ip",
        std::format("\"{}\" is not a valid IPv4 address", rv.mmds_ip));

  rv.labels = request.labels;
  rv.working_dir = request.working_dir;
  rv.expose_ports = request.expose_ports.value_or(config.expose_ports);
  rv.host_ports = parse_ports(request.host_port);
  rv.dest_ports = parse_ports(request.dest_port);
  rv.verbose = request.verbose || config.verbose;

  rv.paths = instance_paths_t::make(config.data_path, id, rv.base_rootfs);
  return rv;
}

} // namespace ember
