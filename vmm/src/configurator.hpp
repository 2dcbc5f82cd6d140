#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "api_client.hpp"
#include "host_network.hpp"
#include "resolver.hpp"

namespace ember {

/**
 * @brief Kernel command line with static guest networking
 * @details
 * `console=ttyS0 reboot=k panic=1 [ds=nocloud-net;s=http://<mmds_ip>/latest/ ]
 * ip=<ip>::<gateway>:255.255.255.0:<hostname>:<iface>:off`
 */
std::string render_boot_args(const resolved_config_t &config);

/**
 * @brief MMDS document served to the guest under /latest
 */
nlohmann::json render_mmds_payload(const resolved_config_t &config);

/**
 * @brief Applies a resolved configuration to a freshly spawned hypervisor
 * @details Steps run in a fixed order; the first failing one aborts the
 * sequence with a `configuration_error` naming it.
 */
class configurator_t {
public:
  configurator_t(std::shared_ptr<api_client_t> api,
                 std::shared_ptr<host_network_t> network);

  void apply(const resolved_config_t &config);

  void configure_boot_source(const resolved_config_t &config);

  void configure_root_drive(const resolved_config_t &config);

  void configure_machine(const resolved_config_t &config);

  void configure_network(const resolved_config_t &config);

  void configure_mmds(const resolved_config_t &config);

private:
  std::shared_ptr<api_client_t> api_;
  std::shared_ptr<host_network_t> network_;
};

} // namespace ember
