#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace ember {

/**
 * @brief Dotted-quad IPv4 address
 */
struct ipv4_t {
  uint32_t value = 0;

  static std::optional<ipv4_t> parse(const std::string &s);

  std::string to_string() const;

  uint8_t last_octet() const { return value & 0xff; }

  ipv4_t with_last_octet(uint8_t octet) const {
    return ipv4_t{(value & 0xffffff00u) | octet};
  }

  bool operator==(const ipv4_t &) const = default;
};

bool is_valid_ipv4(const std::string &s);

/**
 * @brief The ".1" address of the /24 containing `ip`
 * @throws ember::exception_t<value_error> if `ip` is not IPv4
 */
std::string gateway_for(const std::string &ip);

struct ip_allocation_t {
  std::string ip;
  std::string gateway;

  /**
   * true when `ip` differs from the requested address
   */
  bool remapped = false;
};

/**
 * @brief Choose a free guest address in the /24 of `requested`
 * @details
 * The requested address is kept when it is free and usable. Otherwise the
 * first free host address in .1 - .254 is taken, skipping the gateway.
 * @throws ember::exception_t<value_error> if `requested` is not IPv4
 * @throws ember::exception_t<network_error> if the subnet is exhausted
 */
ip_allocation_t allocate_ip(const std::string &requested,
                            const std::set<std::string> &in_use);

} // namespace ember
