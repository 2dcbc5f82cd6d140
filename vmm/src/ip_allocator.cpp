#include "ip_allocator.hpp"

#include <arpa/inet.h>

#include "exception.hpp"
#include "logging.hpp"

namespace ember {

std::optional<ipv4_t> ipv4_t::parse(const std::string &s) {
  in_addr addr;
  if (inet_pton(AF_INET, s.c_str(), &addr) != 1)
    return std::nullopt;
  return ipv4_t{ntohl(addr.s_addr)};
}

std::string ipv4_t::to_string() const {
  in_addr addr;
  addr.s_addr = htonl(value);
  char buf[INET_ADDRSTRLEN];
  if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf)))
    throw exception<value_error>("Cannot format IPv4 address");
  return buf;
}

bool is_valid_ipv4(const std::string &s) {
  return ipv4_t::parse(s).has_value();
}

std::string gateway_for(const std::string &ip) {
  auto addr = ipv4_t::parse(ip);
  if (!addr.has_value())
    throw exception<value_error>("IP allocation", "address", "IPv4", ip);
  return addr->with_last_octet(1).to_string();
}

ip_allocation_t allocate_ip(const std::string &requested,
                            const std::set<std::string> &in_use) {
  auto addr = ipv4_t::parse(requested);
  if (!addr.has_value())
    throw exception<value_error>("IP allocation", "address", "IPv4",
                                 requested);
  auto gateway = addr->with_last_octet(1);

  auto usable = [&](const ipv4_t &candidate) {
    uint8_t octet = candidate.last_octet();
    return octet != 0 && octet != 255 && !(candidate == gateway) &&
           !in_use.contains(candidate.to_string());
  };

  if (usable(addr.value()))
    return ip_allocation_t{requested, gateway.to_string(), false};

  for (int octet = 1; octet <= 254; octet++) {
    auto candidate = addr->with_last_octet(static_cast<uint8_t>(octet));
    if (usable(candidate)) {
      debug("[IP] {} is unavailable, using {}", requested,
            candidate.to_string());
      return ip_allocation_t{candidate.to_string(), gateway.to_string(), true};
    }
  }
  throw exception<network_error>(
      "Could not find an available IP address in the subnet");
}

} // namespace ember
