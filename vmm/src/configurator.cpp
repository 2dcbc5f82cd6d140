#include "configurator.hpp"

#include <format>

#include "exception.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace ember {

namespace {

template <typename fn_t> void run_step(const std::string &step, fn_t &&fn) {
  try {
    fn();
    debug("[Configurator] {} done", step);
  } catch (const exception_t<configuration_error> &) {
    throw;
  } catch (const exception_base_t &e) {
    throw exception<configuration_error>(step, e.what());
  } catch (const std::exception &e) {
    throw exception<configuration_error>(step, e.what());
  }
}

} // namespace

std::string render_boot_args(const resolved_config_t &config) {
  std::string rv = "console=ttyS0 reboot=k panic=1 ";
  if (config.mmds_enabled)
    rv += std::format("ds=nocloud-net;s=http://{}/latest/ ", config.mmds_ip);
  rv += std::format("ip={}::{}:255.255.255.0:{}:{}:off", config.ip_addr,
                    config.gateway_ip, config.name, config.guest_iface);
  return rv;
}

nlohmann::json render_mmds_payload(const resolved_config_t &config) {
  nlohmann::json latest;
  latest["meta-data"] = {{"instance-id", config.id},
                         {"local-hostname", config.name}};
  auto user_data = config.user_data.has_value() ? config.user_data
                                                : config.default_user_data;
  if (user_data.has_value())
    latest["user-data"] = user_data.value();
  return {{"latest", latest}};
}

configurator_t::configurator_t(std::shared_ptr<api_client_t> api,
                               std::shared_ptr<host_network_t> network)
    : api_(std::move(api)), network_(std::move(network)) {}

void configurator_t::apply(const resolved_config_t &config) {
  configure_boot_source(config);
  configure_root_drive(config);
  configure_machine(config);
  configure_network(config);
  if (config.mmds_enabled)
    configure_mmds(config);
}

void configurator_t::configure_boot_source(const resolved_config_t &config) {
  std::error_code ec;
  if (!fs::is_regular_file(config.kernel_file, ec))
    throw exception<configuration_error>(
        "boot source",
        std::format("kernel file {} not found", config.kernel_file.string()));
  run_step("boot source", [&] {
    api_->put_boot_source(config.kernel_file.string(),
                          render_boot_args(config));
  });
}

void configurator_t::configure_root_drive(const resolved_config_t &config) {
  run_step("root drive", [&] {
    api_->put_drive("rootfs", config.paths.rootfs_file.string(), true, false);
  });
}

void configurator_t::configure_machine(const resolved_config_t &config) {
  run_step("machine config", [&] {
    api_->put_machine_config(config.vcpu_count, config.mem_size_mib);
  });
}

void configurator_t::configure_network(const resolved_config_t &config) {
  run_step("network", [&] {
    // A bridged tap is routed by the bridge, not NATed through the host
    bool nat = config.nat_enabled && !config.bridge;
    std::string parent_iface;
    if (nat)
      parent_iface = network_->get_default_interface_name();
    network_->create_tap(config.tap_name, parent_iface, config.gateway_ip,
                         config.bridge, config.bridge_name);
    if (nat)
      network_->enable_nat(config.tap_name, parent_iface, config.ip_addr);
    api_->put_network_interface(config.guest_iface, config.tap_name);
  });
}

void configurator_t::configure_mmds(const resolved_config_t &config) {
  run_step("mmds", [&] {
    api_->put_mmds_config("V2", config.mmds_ip, {config.guest_iface});
    api_->put_mmds(render_mmds_payload(config));
  });
}

} // namespace ember
