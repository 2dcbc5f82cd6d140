#include "microvm.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>

#include "api_client.hpp"
#include "configurator.hpp"
#include "exception.hpp"
#include "host_network.hpp"
#include "id.hpp"
#include "ip_allocator.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "registry.hpp"
#include "remote_shell.hpp"
#include "resolver.hpp"
#include "rootfs_fetch.hpp"
#include "string_util.hpp"
#include "supervisor.hpp"
#include "terminal_relay.hpp"

namespace fs = std::filesystem;

namespace ember {

namespace {

std::string utc_now() {
  auto now = std::chrono::floor<std::chrono::seconds>(
      std::chrono::system_clock::now());
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

} // namespace

microvm_manager_t::microvm_manager_t(const config_t &config,
                                     collaborators_t collaborators,
                                     timings_t timings)
    : config_(config), collaborators_(std::move(collaborators)),
      timings_(timings),
      registry_(std::make_unique<registry_t>(config.data_path)) {
  if (!collaborators_.process)
    collaborators_.process =
        ember::create<screen_process_manager_t>(config_.binary_path);
  if (!collaborators_.network)
    collaborators_.network = ember::create<iptables_host_network_t>();
  if (!collaborators_.shell)
    collaborators_.shell = ember::create<libssh_remote_shell_t>();
  if (!collaborators_.api_factory)
    collaborators_.api_factory = [](const fs::path &socket_path) {
      return std::static_pointer_cast<api_client_t>(
          ember::create<firecracker_api_t>(socket_path));
    };
  if (!collaborators_.rootfs_fetcher)
    collaborators_.rootfs_fetcher = [](const std::string &url,
                                       const fs::path &dest_dir) {
      return fetch_rootfs(url, dest_dir);
    };
}

microvm_manager_t::~microvm_manager_t() = default;

void microvm_manager_t::_note(bool verbose, const std::string &msg) {
  if (verbose)
    info(msg);
  else
    debug(msg);
}

std::string microvm_manager_t::_unique_name() {
  for (size_t i = 0; i < 32; i++) {
    auto name = generate_name();
    if (!registry_->find_by_name(name).has_value())
      return name;
  }
  return std::format("{}-{}", generate_name(), generate_id(2));
}

outcome_t microvm_manager_t::create(const create_request_t &request) {
  std::string id;
  try {
    // Held until the record is persisted, so that concurrent creates
    // cannot pick the same name or address
    auto guard = registry_->lock();

    std::string name;
    if (request.name.has_value()) {
      name = request.name.value();
      if (name.empty())
        return error_output_t(error_kind_t::validation,
                              "VMM name must not be empty");
      if (registry_->find_by_name(name).has_value())
        return error_output_t(error_kind_t::conflict,
                              std::format("VMM with name {} already exists",
                                          name));
    } else {
      name = _unique_name();
    }

    id = registry_->reserve_id();
    auto cfg = resolve_config(request, config_, id, name,
                              collaborators_.rootfs_fetcher);
    _note(cfg.verbose, std::format("Creating VMM {} ({})", id, name));

    supervisor_t supervisor(config_.binary_path, collaborators_.process,
                            collaborators_.api_factory, timings_.socket_wait);
    auto spawned = supervisor.spawn(id, cfg.paths, cfg.base_rootfs);
    _note(cfg.verbose, std::format("Firecracker for VMM {} is listening", id));

    instance_record_t record;
    record.id = id;
    record.name = name;
    record.pid = spawned.session_pid;
    record.labels = cfg.labels;
    record.working_dir = cfg.working_dir;
    record.vcpu_count = cfg.vcpu_count;
    record.mem_size_mib = cfg.mem_size_mib;
    record.socket_path = cfg.paths.socket_path;
    record.session_name = cfg.paths.session_name;

    try {
      record.rootfs_path = fs::absolute(cfg.paths.rootfs_file);
      record.kernel_path = fs::absolute(cfg.kernel_file);

      auto allocation = allocate_ip(cfg.ip_addr, registry_->ips_in_use());
      if (allocation.remapped)
        info("IP {} is not available, VMM {} uses {} instead", cfg.ip_addr,
             id, allocation.ip);
      cfg.ip_addr = allocation.ip;
      cfg.gateway_ip = allocation.gateway;
      record.network[cfg.tap_name] =
          network_entry_t{cfg.ip_addr, cfg.gateway_ip};

      configurator_t(spawned.api, collaborators_.network).apply(cfg);
      spawned.api->put_action("InstanceStart");
      _note(cfg.verbose, std::format("VMM {} started", id));

      if (cfg.expose_ports) {
        try {
          _forward(id, cfg.ip_addr, cfg.host_ports, cfg.dest_ports, false,
                   record.ports);
        } catch (const exception_base_t &e) {
          warn("Port forwarding for VMM {} was not set up: {}", id, e.what());
        }
      }

      auto proc = collaborators_.process->get_pid_and_start_time(id);
      if (!proc.has_value() ||
          !collaborators_.process->process_alive(proc->pid)) {
        error("Firecracker process for VMM {} is not running, rolling back",
              id);
        spawned.api->close();
        _teardown(record, false);
        return error_output_t(
            error_kind_t::process,
            std::format("VMM {} failed to create: Firecracker process is not "
                        "running",
                        id));
      }

      record.pid = proc->pid;
      record.created_at =
          proc->started_at.empty() ? utc_now() : proc->started_at;
      record.state = instance_state_t::running;
      registry_->create(record);
      spawned.api->close();
    } catch (const exception_base_t &e) {
      error("Failed to create VMM {}: {}", id, e.what());
      debug("{}", e.trace());
      spawned.api->close();
      _teardown(record, false);
      return error_output_t(e.kind(), std::format("Failed to create VMM {}: {}",
                                                  id, e.what()));
    } catch (const std::exception &e) {
      error("Failed to create VMM {}: {}", id, e.what());
      spawned.api->close();
      _teardown(record, false);
      return error_output_t(error_kind_t::vmm,
                            std::format("Failed to create VMM {}: {}", id,
                                        e.what()));
    }

    return ok_output_t(std::format("VMM {} is created successfully", id));
  } catch (const exception_base_t &e) {
    error("Failed to create VMM {}: {}", id, e.what());
    debug("{}", e.trace());
    return error_output_t(e.kind(),
                          std::format("Failed to create VMM: {}", e.what()));
  } catch (const std::exception &e) {
    error("Failed to create VMM {}: {}", id, e.what());
    return error_output_t(error_kind_t::vmm,
                          std::format("Failed to create VMM: {}", e.what()));
  }
}

std::vector<std::string>
microvm_manager_t::_teardown(const instance_record_t &record,
                             bool keep_if_running) {
  std::vector<std::string> failures;
  auto attempt = [&](const std::string &what, auto &&fn) {
    try {
      fn();
    } catch (const exception_base_t &e) {
      warn("[Teardown] {} of VMM {}: {}", what, record.id, e.what());
      failures.push_back(std::format("{}: {}", what, e.what()));
    }
  };

  auto &network = collaborators_.network;
  auto ip = record.ip_address();
  if (ip.has_value() && !record.ports.empty()) {
    attempt("port forwarding", [&] {
      auto host_ip = network->get_host_ip();
      for (const auto &[key, rules] : record.ports)
        for (const auto &rule : rules)
          network->delete_port_forward(host_ip, rule.host_port, ip.value(),
                                       rule.dest_port);
    });
  }
  if (ip.has_value() && config_.nat_enabled) {
    attempt("NAT", [&] {
      network->disable_nat(record.tap_name(),
                           network->get_default_interface_name(), ip.value());
    });
  }
  if (!record.network.empty())
    attempt("tap device", [&] { network->delete_tap(record.tap_name()); });

  bool stopped = false;
  attempt("process", [&] {
    stopped = collaborators_.process->stop_session(record.session_name,
                                                   record.pid);
    if (!stopped)
      throw exception<process_error>(
          std::format("pid {} is still running", record.pid));
  });

  if (stopped || !keep_if_running)
    attempt("files", [&] { registry_->remove(record.id); });
  else
    failures.push_back("files: kept so that the deletion can be retried");
  return failures;
}

outcome_t microvm_manager_t::remove(const std::string &id) {
  try {
    auto guard = registry_->lock();
    auto record = registry_->get(id);
    if (!record.has_value())
      return error_output_t(error_kind_t::not_found,
                            std::format("VMM with ID {} not found", id));

    auto failures = _teardown(record.value(), true);
    if (!failures.empty())
      return error_output_t(error_kind_t::vmm,
                            std::format("Failed to delete VMM {}: {}", id,
                                        utils::join("; ", failures)));
    info("VMM {} deleted", id);
    return ok_output_t(std::format("VMM {} deleted successfully", id));
  } catch (const exception_base_t &e) {
    return error_output_t(e.kind(), std::format("Failed to delete VMM {}: {}",
                                                id, e.what()));
  }
}

outcome_t microvm_manager_t::remove_all() {
  auto records = registry_->list();
  if (records.empty())
    return error_output_t(error_kind_t::not_found,
                          "No VMMs available to delete");

  std::vector<std::string> failures;
  for (const auto &record : records) {
    auto outcome = remove(record.id);
    if (!succeeded(outcome))
      failures.push_back(message_of(outcome));
  }
  if (!failures.empty())
    return error_output_t(
        error_kind_t::vmm,
        std::format("Failed to delete {} of {} VMMs: {}", failures.size(),
                    records.size(), utils::join("; ", failures)));
  return ok_output_t("All VMMs deleted successfully");
}

outcome_t microvm_manager_t::_set_state(const std::string &id,
                                        instance_state_t target) {
  bool pausing = target == instance_state_t::paused;
  try {
    auto guard = registry_->lock();
    auto record = registry_->get(id);
    if (!record.has_value())
      return error_output_t(error_kind_t::not_found,
                            std::format("VMM with ID {} not found", id));

    if (record->state != target) {
      auto api = collaborators_.api_factory(record->socket_path);
      api->patch_vm_state(pausing ? "Paused" : "Resumed");
      api->close();
      registry_->update_state(id, target);
    } else {
      debug("VMM {} is already {}", id, to_string(target));
    }
    return ok_output_t(std::format("VMM {} {} successfully", id,
                                   pausing ? "paused" : "resumed"));
  } catch (const exception_base_t &e) {
    return error_output_t(e.kind(),
                          std::format("Failed to {} VMM {}: {}",
                                      pausing ? "pause" : "resume", id,
                                      e.what()));
  }
}

outcome_t microvm_manager_t::pause(const std::string &id) {
  return _set_state(id, instance_state_t::paused);
}

outcome_t microvm_manager_t::resume(const std::string &id) {
  return _set_state(id, instance_state_t::running);
}

void microvm_manager_t::_forward(const std::string &id,
                                 const std::string &dest_ip,
                                 const std::vector<int64_t> &host_ports,
                                 const std::vector<int64_t> &dest_ports,
                                 bool remove, port_map_t &ports) {
  if (host_ports.empty() || dest_ports.empty())
    throw exception<value_error>(
        "Both host_port and dest_port must be provided");
  if (host_ports.size() != dest_ports.size())
    throw exception<value_error>(
        std::format("Number of host ports ({}) must match number of "
                    "destination ports ({})",
                    host_ports.size(), dest_ports.size()));
  for (auto port : host_ports)
    if (port < 1 || port > 65535)
      throw exception<value_error>("port_forward", "host port", "1-65535",
                                   std::to_string(port));
  for (auto port : dest_ports)
    if (port < 1 || port > 65535)
      throw exception<value_error>("port_forward", "destination port",
                                   "1-65535", std::to_string(port));

  auto &network = collaborators_.network;
  auto host_ip = network->get_host_ip();

  size_t applied = 0;
  try {
    for (; applied < host_ports.size(); applied++) {
      int hp = static_cast<int>(host_ports[applied]);
      int dp = static_cast<int>(dest_ports[applied]);
      if (remove)
        network->delete_port_forward(host_ip, hp, dest_ip, dp);
      else
        network->add_port_forward(host_ip, hp, dest_ip, dp);
    }
  } catch (const exception_base_t &) {
    if (!remove) {
      for (size_t i = 0; i < applied; i++) {
        try {
          network->delete_port_forward(
              host_ip, static_cast<int>(host_ports[i]), dest_ip,
              static_cast<int>(dest_ports[i]));
        } catch (const exception_base_t &e) {
          warn("Failed to roll back forwarding of port {} for VMM {}: {}",
               host_ports[i], id, e.what());
        }
      }
    }
    throw;
  }

  for (size_t i = 0; i < host_ports.size(); i++) {
    port_rule_t rule{static_cast<uint16_t>(host_ports[i]),
                     static_cast<uint16_t>(dest_ports[i])};
    auto key = port_key(rule.dest_port);
    if (remove) {
      auto it = ports.find(key);
      if (it == ports.end())
        continue;
      std::erase(it->second, rule);
      if (it->second.empty())
        ports.erase(it);
    } else {
      auto &rules = ports[key];
      if (std::find(rules.begin(), rules.end(), rule) == rules.end())
        rules.push_back(rule);
    }
  }
}

outcome_t microvm_manager_t::port_forward(const std::string &id,
                                          const port_spec_t &host_ports,
                                          const port_spec_t &dest_ports,
                                          bool remove) {
  try {
    auto guard = registry_->lock();
    auto record = registry_->get(id);
    if (!record.has_value())
      return error_output_t(error_kind_t::not_found,
                            std::format("VMM with ID {} not found", id));

    auto ip = record->ip_address();
    if (!ip.has_value())
      return error_output_t(
          error_kind_t::vmm,
          std::format("Network configuration not found for VMM {}", id));

    auto ports = record->ports;
    _forward(id, ip.value(), parse_ports(host_ports), parse_ports(dest_ports),
             remove, ports);
    registry_->update_ports(id, ports);
    return ok_output_t(remove ? "Port forwarding removed successfully"
                              : "Port forwarding added successfully");
  } catch (const exception_base_t &e) {
    return error_output_t(e.kind(),
                          std::format("Failed to {} port forwarding for VMM "
                                      "{}: {}",
                                      remove ? "remove" : "add", id,
                                      e.what()));
  }
}

outcome_t microvm_manager_t::connect(const std::string &id,
                                     const connect_options_t &options) {
  if (!options.key_path.has_value())
    return error_output_t(error_kind_t::validation, "SSH key path is required");
  std::error_code ec;
  if (!fs::is_regular_file(options.key_path.value(), ec))
    return error_output_t(error_kind_t::validation,
                          std::format("SSH key file not found: {}",
                                      options.key_path->string()));

  auto record = registry_->get(id);
  if (!record.has_value())
    return error_output_t(error_kind_t::not_found,
                          std::format("VMM with ID {} not found", id));
  auto ip = record->ip_address();
  if (!ip.has_value())
    return error_output_t(
        error_kind_t::vmm,
        std::format("Network configuration not found for VMM {}", id));

  auto &shell = collaborators_.shell;
  auto user = options.username.value_or(config_.ssh_user);
  try {
    std::string last_error;
    bool connected =
        retry_until(timings_.ssh_connect, [&](size_t attempt) {
          try {
            shell->connect(ip.value(), user, options.key_path.value());
            return true;
          } catch (const exception_t<unreachable_error> &e) {
            last_error = e.what();
            warn("SSH attempt {}/{} to VMM {} failed: {}", attempt + 1,
                 timings_.ssh_connect.attempts, id, e.what());
            return false;
          }
        });
    if (!connected)
      return error_output_t(
          error_kind_t::network,
          std::format("Unable to connect to VMM {} via SSH after {} attempts: "
                      "{}",
                      id, timings_.ssh_connect.attempts, last_error));

    auto channel = shell->open_shell();
    try {
      raw_terminal_t raw(options.in_fd);
      auto end = relay(*channel, relay_options_t{.in_fd = options.in_fd,
                                                 .out_fd = options.out_fd});
      debug("SSH relay for VMM {} ended ({})", id,
            end == relay_end_t::local_eof ? "local EOF" : "remote closed");
    } catch (...) {
      channel->close();
      throw;
    }
    channel->close();
    shell->disconnect();
    return ok_output_t(std::format("SSH session to VMM {} closed", id));
  } catch (const exception_base_t &e) {
    shell->disconnect();
    return error_output_t(
        e.kind(), std::format("Failed to connect to VMM {}: {}", id, e.what()));
  }
}

bool microvm_manager_t::execute_in_vm(
    const std::string &id, const std::vector<std::string> &commands) {
  if (commands.empty()) {
    warn("No commands to run in VMM {}", id);
    return false;
  }
  auto record = registry_->get(id);
  if (!record.has_value()) {
    warn("VMM with ID {} not found", id);
    return false;
  }

  auto text = utils::join("\n", commands) + "\n";
  auto staged = registry_->instance_dir(id) / "logs" / "commands.txt";
  {
    std::ofstream ofs(staged, std::ios::trunc);
    if (!(ofs << text)) {
      error("Cannot stage commands for VMM {} in {}", id, staged.string());
      return false;
    }
  }

  try {
    bool ok =
        collaborators_.process->paste_file(record->session_name, staged);
    if (ok)
      debug("Sent {} command(s) to VMM {}", commands.size(), id);
    else
      error("Failed to send commands to VMM {}", id);
    return ok;
  } catch (const exception_base_t &e) {
    error("Failed to send commands to VMM {}: {}", id, e.what());
    return false;
  }
}

std::vector<instance_record_t> microvm_manager_t::list() const {
  return registry_->list();
}

std::optional<std::string>
microvm_manager_t::status(const std::string &id) const {
  auto record = registry_->get(id);
  if (!record.has_value())
    return std::nullopt;
  return std::format("VMM {} is {}", id, to_string(record->state));
}

std::optional<instance_record_t>
microvm_manager_t::inspect(const std::string &id) const {
  return registry_->get(id);
}

std::optional<nlohmann::json>
microvm_manager_t::config(const std::string &id) {
  auto record = registry_->get(id);
  if (!record.has_value())
    return std::nullopt;
  auto api = collaborators_.api_factory(record->socket_path);
  auto rv = api->get_vm_config();
  api->close();
  return rv;
}

std::vector<std::string>
microvm_manager_t::find(instance_state_t state, const labels_t &labels) const {
  std::vector<std::string> rv;
  for (const auto &record : registry_->find_by_state_and_labels(state, labels))
    rv.push_back(record.id);
  return rv;
}

} // namespace ember
