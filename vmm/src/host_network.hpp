#pragma once

#include <optional>
#include <string>
#include <vector>

#include "object.hpp"

namespace ember {

/**
 * @brief Host-side networking for guests: tap devices, NAT and DNAT rules
 * @details Failures throw `ember::exception_t<network_error>`.
 */
class host_network_t : public object_t {
public:
  /**
   * @param bridge When true, attach the tap to `bridge_name` instead of
   * giving it `gateway_ip`
   */
  virtual void create_tap(const std::string &name,
                          const std::string &parent_iface,
                          const std::string &gateway_ip, bool bridge,
                          const std::string &bridge_name) = 0;

  virtual void delete_tap(const std::string &name) = 0;

  virtual void enable_nat(const std::string &tap_name,
                          const std::string &parent_iface,
                          const std::string &vm_ip) = 0;

  virtual void disable_nat(const std::string &tap_name,
                           const std::string &parent_iface,
                           const std::string &vm_ip) = 0;

  virtual void add_port_forward(const std::string &host_ip, int host_port,
                                const std::string &dest_ip, int dest_port) = 0;

  virtual void delete_port_forward(const std::string &host_ip, int host_port,
                                   const std::string &dest_ip,
                                   int dest_port) = 0;

  virtual std::string get_host_ip() = 0;

  virtual std::string get_gateway_ip(const std::string &ip) = 0;

  virtual std::string get_default_interface_name() = 0;
};

/**
 * @brief Drives `ip` and `iptables`; needs CAP_NET_ADMIN
 */
class iptables_host_network_t : public host_network_t {
public:
  void create_tap(const std::string &name, const std::string &parent_iface,
                  const std::string &gateway_ip, bool bridge,
                  const std::string &bridge_name) override;

  void delete_tap(const std::string &name) override;

  void enable_nat(const std::string &tap_name, const std::string &parent_iface,
                  const std::string &vm_ip) override;

  void disable_nat(const std::string &tap_name,
                   const std::string &parent_iface,
                   const std::string &vm_ip) override;

  void add_port_forward(const std::string &host_ip, int host_port,
                        const std::string &dest_ip, int dest_port) override;

  void delete_port_forward(const std::string &host_ip, int host_port,
                           const std::string &dest_ip, int dest_port) override;

  std::string get_host_ip() override;

  std::string get_gateway_ip(const std::string &ip) override;

  std::string get_default_interface_name() override;
};

/**
 * @brief Name of the interface carrying the default route in a
 * /proc/net/route formatted table
 */
std::optional<std::string> parse_default_route(const std::string &table);

using rule_t = std::vector<std::string>;

/**
 * @brief iptables rules publishing `host_ip:host_port` on
 * `dest_ip:dest_port`
 *
 * Every rule matches on the host port, so two mappings onto the same guest
 * port never share a rule.
 */
std::vector<rule_t> forward_rules(const std::string &host_ip, int host_port,
                                  const std::string &dest_ip, int dest_port);

} // namespace ember
