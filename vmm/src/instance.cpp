#include "instance.hpp"

#include <algorithm>
#include <format>

#include <magic_enum/magic_enum.hpp>

namespace ember {

std::string instance_record_t::tap_name() const { return tap_name_for(id); }

std::optional<std::string> instance_record_t::ip_address() const {
  if (network.empty())
    return std::nullopt;
  return network.begin()->second.ip_address;
}

std::optional<std::string> instance_record_t::gateway() const {
  if (network.empty())
    return std::nullopt;
  return network.begin()->second.gateway;
}

bool instance_record_t::matches_labels(const labels_t &selector) const {
  return std::all_of(selector.begin(), selector.end(), [&](const auto &kv) {
    auto it = labels.find(kv.first);
    return it != labels.end() && it->second == kv.second;
  });
}

std::string port_key(uint16_t dest_port) {
  return std::format("{}/tcp", dest_port);
}

std::string tap_name_for(const std::string &id) { return "tap_" + id; }

std::string session_name_for(const std::string &id) { return "fc_" + id; }

std::string to_string(instance_state_t state) {
  return std::string(magic_enum::enum_name(state));
}

std::optional<instance_state_t> parse_instance_state(const std::string &s) {
  std::string lowered = s;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
  auto v = magic_enum::enum_cast<instance_state_t>(lowered);
  if (!v.has_value())
    return std::nullopt;
  return v.value();
}

} // namespace ember

namespace nlohmann {

void to_json(json &j, const ember::port_rule_t &obj) {
  j = json{{"HostPort", obj.host_port}, {"DestPort", obj.dest_port}};
}

void from_json(const json &j, ember::port_rule_t &obj) {
  j.at("HostPort").get_to(obj.host_port);
  j.at("DestPort").get_to(obj.dest_port);
}

void to_json(json &j, const ember::network_entry_t &obj) {
  j = json{{"IPAddress", obj.ip_address}, {"Gateway", obj.gateway}};
}

void from_json(const json &j, ember::network_entry_t &obj) {
  j.at("IPAddress").get_to(obj.ip_address);
  if (j.contains("Gateway"))
    j.at("Gateway").get_to(obj.gateway);
}

void to_json(json &j, const ember::instance_record_t &obj) {
  j = json{
      {"ID", obj.id},
      {"Name", obj.name},
      {"CreatedAt", obj.created_at},
      {"Rootfs", obj.rootfs_path.string()},
      {"Kernel", obj.kernel_path.string()},
      {"State",
       {
           {"Status", ember::to_string(obj.state)},
           {"Running", obj.state == ember::instance_state_t::running},
           {"Paused", obj.state == ember::instance_state_t::paused},
           {"Pid", obj.pid},
       }},
      {"Network", obj.network},
      {"Ports", obj.ports},
      {"Labels", obj.labels},
      {"WorkingDir", obj.working_dir},
      {"VcpuCount", obj.vcpu_count},
      {"MemSizeMib", obj.mem_size_mib},
      {"SocketPath", obj.socket_path.string()},
      {"SessionName", obj.session_name},
  };
}

void from_json(const json &j, ember::instance_record_t &obj) {
  j.at("ID").get_to(obj.id);
  j.at("Name").get_to(obj.name);
  obj.created_at = j.value("CreatedAt", "");
  obj.rootfs_path = j.value("Rootfs", "");
  obj.kernel_path = j.value("Kernel", "");

  if (j.contains("State")) {
    const auto &state = j.at("State");
    auto status = ember::parse_instance_state(state.value("Status", ""));
    if (status.has_value())
      obj.state = status.value();
    else if (state.value("Paused", false))
      obj.state = ember::instance_state_t::paused;
    else if (state.value("Running", false))
      obj.state = ember::instance_state_t::running;
    obj.pid = state.value("Pid", 0);
  }

  if (j.contains("Network"))
    j.at("Network").get_to(obj.network);
  if (j.contains("Ports"))
    j.at("Ports").get_to(obj.ports);
  if (j.contains("Labels"))
    j.at("Labels").get_to(obj.labels);
  obj.working_dir = j.value("WorkingDir", "/root");
  obj.vcpu_count = j.value("VcpuCount", 1u);
  obj.mem_size_mib = j.value("MemSizeMib", 512u);
  obj.socket_path = j.value("SocketPath", "");
  obj.session_name =
      j.value("SessionName", ember::session_name_for(obj.id));
}

} // namespace nlohmann
