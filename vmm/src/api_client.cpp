#include "api_client.hpp"

#include <format>

#include "exception.hpp"
#include "logging.hpp"

namespace ember {

namespace {

/**
 * Firecracker answers failures with {"fault_message": "..."}
 */
std::string describe_failure(const httplib::Response &res) {
  std::string detail = res.body;
  auto j = nlohmann::json::parse(res.body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("fault_message"))
    detail = j["fault_message"].get<std::string>();
  return std::format("{} {}: {}", res.status,
                     httplib::status_message(res.status), detail);
}

} // namespace

firecracker_api_t::firecracker_api_t(const std::filesystem::path &socket_path)
    : socket_path_(socket_path),
      cli_(std::make_shared<httplib::Client>(socket_path.string())) {
  cli_->set_address_family(AF_UNIX);
  cli_->set_connection_timeout(5, 0);
  cli_->set_read_timeout(10, 0);
}

firecracker_api_t::~firecracker_api_t() { close(); }

void firecracker_api_t::_send(const std::string &method_name,
                              const std::string &verb, const std::string &path,
                              const nlohmann::json &body) {
  if (!cli_)
    throw exception<api_error>(method_name, "client is closed");

  std::string payload = body.dump();
  httplib::Result result = verb == "PATCH"
                               ? cli_->Patch(path, payload, "application/json")
                               : cli_->Put(path, payload, "application/json");
  if (!result)
    throw exception<api_error>(
        method_name,
        std::format("request to {} failed: {}", socket_path_.string(),
                    httplib::to_string(result.error())));
  if (result->status < 200 || result->status >= 300)
    throw exception<api_error>(method_name, describe_failure(*result));
  debug("[API] {} {} -> {}", verb, path, result->status);
}

void firecracker_api_t::put_boot_source(const std::string &kernel_image_path,
                                        const std::string &boot_args) {
  _send("put_boot_source", "PUT", "/boot-source",
        {{"kernel_image_path", kernel_image_path}, {"boot_args", boot_args}});
}

void firecracker_api_t::put_drive(const std::string &drive_id,
                                  const std::string &path_on_host,
                                  bool is_root_device, bool is_read_only) {
  _send("put_drive", "PUT", "/drives/" + drive_id,
        {{"drive_id", drive_id},
         {"path_on_host", path_on_host},
         {"is_root_device", is_root_device},
         {"is_read_only", is_read_only}});
}

void firecracker_api_t::put_machine_config(uint32_t vcpu_count,
                                           uint32_t mem_size_mib) {
  _send("put_machine_config", "PUT", "/machine-config",
        {{"vcpu_count", vcpu_count}, {"mem_size_mib", mem_size_mib}});
}

void firecracker_api_t::put_network_interface(
    const std::string &iface_id, const std::string &host_dev_name) {
  _send("put_network_interface", "PUT", "/network-interfaces/" + iface_id,
        {{"iface_id", iface_id}, {"host_dev_name", host_dev_name}});
}

void firecracker_api_t::put_mmds_config(
    const std::string &version, const std::string &ipv4_address,
    const std::vector<std::string> &network_interfaces) {
  _send("put_mmds_config", "PUT", "/mmds/config",
        {{"version", version},
         {"ipv4_address", ipv4_address},
         {"network_interfaces", network_interfaces}});
}

void firecracker_api_t::put_mmds(const nlohmann::json &payload) {
  _send("put_mmds", "PUT", "/mmds", payload);
}

void firecracker_api_t::put_action(const std::string &action_type) {
  _send("put_action", "PUT", "/actions", {{"action_type", action_type}});
}

void firecracker_api_t::patch_vm_state(const std::string &state) {
  _send("patch_vm_state", "PATCH", "/vm", {{"state", state}});
}

nlohmann::json firecracker_api_t::get_vm_config() {
  if (!cli_)
    throw exception<api_error>("get_vm_config", "client is closed");
  auto result = cli_->Get("/vm/config");
  if (!result)
    throw exception<api_error>("get_vm_config",
                               httplib::to_string(result.error()));
  if (result->status != httplib::OK_200)
    throw exception<api_error>("get_vm_config", describe_failure(*result));
  try {
    return nlohmann::json::parse(result->body);
  } catch (const nlohmann::json::parse_error &e) {
    throw exception<api_error>("get_vm_config", e.what());
  }
}

void firecracker_api_t::close() {
  if (!cli_)
    return;
  cli_->stop();
  cli_.reset();
}

} // namespace ember
