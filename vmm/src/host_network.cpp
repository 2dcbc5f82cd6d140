#include "host_network.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>

#include "command.hpp"
#include "exception.hpp"
#include "ip_allocator.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace ember {

namespace {

void run_or_throw(const std::vector<std::string> &argv) {
  auto result = run_command(argv);
  if (!result.ok()) {
    auto output = result.output;
    throw exception<network_error>(std::format(
        "`{}` failed: {}", utils::join(" ", argv), utils::trim(output)));
  }
}

bool link_exists(const std::string &name) {
  return run_command({"ip", "link", "show", name}).ok();
}

/**
 * iptables invocation for `rule` with `action` (-A, -D or -C) spliced in
 * after the optional table selector
 */
std::vector<std::string> iptables(const std::string &action,
                                  const rule_t &rule) {
  std::vector<std::string> argv = {"iptables"};
  auto it = rule.begin();
  if (it != rule.end() && *it == "-t") {
    argv.push_back(*it++);
    argv.push_back(*it++);
  }
  argv.push_back(action);
  argv.insert(argv.end(), it, rule.end());
  return argv;
}

void append_rule(const rule_t &rule) {
  if (run_command(iptables("-C", rule)).ok())
    return;
  run_or_throw(iptables("-A", rule));
}

void delete_rule(const rule_t &rule) {
  if (!run_command(iptables("-C", rule)).ok())
    return;
  run_or_throw(iptables("-D", rule));
}

std::vector<rule_t> nat_rules(const std::string &tap_name,
                              const std::string &parent_iface,
                              const std::string &vm_ip) {
  return {
      {"-t", "nat", "POSTROUTING", "-s", vm_ip, "-o", parent_iface, "-j",
       "MASQUERADE"},
      {"FORWARD", "-i", tap_name, "-o", parent_iface, "-j", "ACCEPT"},
      {"FORWARD", "-i", parent_iface, "-o", tap_name, "-m", "conntrack",
       "--ctstate", "RELATED,ESTABLISHED", "-j", "ACCEPT"},
  };
}

} // namespace

std::vector<rule_t> forward_rules(const std::string &host_ip, int host_port,
                                  const std::string &dest_ip, int dest_port) {
  return {
      {"-t", "nat", "PREROUTING", "-p", "tcp", "-d", host_ip, "--dport",
       std::to_string(host_port), "-j", "DNAT", "--to-destination",
       std::format("{}:{}", dest_ip, dest_port)},
      {"-t", "nat", "OUTPUT", "-p", "tcp", "-d", host_ip, "--dport",
       std::to_string(host_port), "-j", "DNAT", "--to-destination",
       std::format("{}:{}", dest_ip, dest_port)},
      {"FORWARD", "-p", "tcp", "-d", dest_ip, "--dport",
       std::to_string(dest_port), "-m", "conntrack", "--ctstate", "DNAT",
       "--ctorigdstport", std::to_string(host_port), "-j", "ACCEPT"},
  };
}

std::optional<std::string> parse_default_route(const std::string &table) {
  std::istringstream iss(table);
  std::string line;
  // Header: Iface Destination Gateway Flags ...
  std::getline(iss, line);
  while (std::getline(iss, line)) {
    std::istringstream fields(line);
    std::string iface, destination;
    if (!(fields >> iface >> destination))
      continue;
    if (destination == "00000000")
      return iface;
  }
  return std::nullopt;
}

void iptables_host_network_t::create_tap(const std::string &name,
                                         const std::string &parent_iface,
                                         const std::string &gateway_ip,
                                         bool bridge,
                                         const std::string &bridge_name) {
  if (link_exists(name)) {
    debug("[Network] tap {} already exists", name);
  } else {
    run_or_throw({"ip", "tuntap", "add", "dev", name, "mode", "tap"});
  }

  if (bridge) {
    if (!link_exists(bridge_name))
      throw exception<network_error>(
          std::format("Bridge {} does not exist", bridge_name));
    run_or_throw({"ip", "link", "set", name, "master", bridge_name});
  } else {
    auto result =
        run_command({"ip", "addr", "add", gateway_ip + "/24", "dev", name});
    if (!result.ok() && result.output.find("File exists") == std::string::npos)
      throw exception<network_error>(std::format(
          "Failed to assign {} to {}: {}", gateway_ip, name, result.output));
  }
  run_or_throw({"ip", "link", "set", name, "up"});
  debug("[Network] tap {} is up (parent {})", name, parent_iface);
}

void iptables_host_network_t::delete_tap(const std::string &name) {
  if (!link_exists(name))
    return;
  run_or_throw({"ip", "link", "del", name});
  debug("[Network] tap {} removed", name);
}

void iptables_host_network_t::enable_nat(const std::string &tap_name,
                                         const std::string &parent_iface,
                                         const std::string &vm_ip) {
  std::ofstream ofs("/proc/sys/net/ipv4/ip_forward");
  if (!(ofs << "1"))
    throw exception<network_error>("Failed to enable IPv4 forwarding");
  ofs.close();

  for (const auto &rule : nat_rules(tap_name, parent_iface, vm_ip))
    append_rule(rule);
}

void iptables_host_network_t::disable_nat(const std::string &tap_name,
                                          const std::string &parent_iface,
                                          const std::string &vm_ip) {
  for (const auto &rule : nat_rules(tap_name, parent_iface, vm_ip))
    delete_rule(rule);
}

void iptables_host_network_t::add_port_forward(const std::string &host_ip,
                                               int host_port,
                                               const std::string &dest_ip,
                                               int dest_port) {
  for (const auto &rule : forward_rules(host_ip, host_port, dest_ip, dest_port))
    append_rule(rule);
  debug("[Network] forwarding {}:{} -> {}:{}", host_ip, host_port, dest_ip,
        dest_port);
}

void iptables_host_network_t::delete_port_forward(const std::string &host_ip,
                                                  int host_port,
                                                  const std::string &dest_ip,
                                                  int dest_port) {
  for (const auto &rule : forward_rules(host_ip, host_port, dest_ip, dest_port))
    delete_rule(rule);
}

std::string iptables_host_network_t::get_host_ip() {
  auto iface = get_default_interface_name();

  ifaddrs *addrs = nullptr;
  if (::getifaddrs(&addrs) != 0)
    throw exception<network_error>("getifaddrs() failed");

  std::optional<std::string> found;
  for (auto *it = addrs; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET)
      continue;
    if (iface != it->ifa_name)
      continue;
    char buf[INET_ADDRSTRLEN];
    auto *sin = reinterpret_cast<sockaddr_in *>(it->ifa_addr);
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
      found = buf;
      break;
    }
  }
  ::freeifaddrs(addrs);

  if (!found.has_value())
    throw exception<network_error>(
        std::format("No IPv4 address on interface {}", iface));
  return found.value();
}

std::string iptables_host_network_t::get_gateway_ip(const std::string &ip) {
  return gateway_for(ip);
}

std::string iptables_host_network_t::get_default_interface_name() {
  std::ifstream ifs("/proc/net/route");
  if (!ifs)
    throw exception<network_error>("Cannot read /proc/net/route");
  std::string table((std::istreambuf_iterator<char>(ifs)),
                    std::istreambuf_iterator<char>());
  auto iface = parse_default_route(table);
  if (!iface.has_value())
    throw exception<network_error>("No default route found");
  return iface.value();
}

} // namespace ember
