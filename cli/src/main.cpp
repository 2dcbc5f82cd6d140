#include <format>
#include <iostream>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <magic_enum/magic_enum.hpp>

#include "config.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "microvm.hpp"

namespace {

ember::labels_t parse_labels(const std::vector<std::string> &items) {
  ember::labels_t labels;
  for (const auto &item : items) {
    auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0)
      throw std::invalid_argument("Label must look like key=value: " + item);
    labels[item.substr(0, eq)] = item.substr(eq + 1);
  }
  return labels;
}

int report(const ember::outcome_t &outcome) {
  if (ember::succeeded(outcome)) {
    std::cout << ember::message_of(outcome) << std::endl;
    return 0;
  }
  const auto &err = std::get<ember::error_output_t>(outcome);
  ember::debug("[CLI] {} failure ({})", magic_enum::enum_name(err.kind),
               err.expected() ? "expected" : "unexpected");
  std::cerr << err.reason << std::endl;
  return 1;
}

void print_table(const std::vector<ember::instance_record_t> &records) {
  std::cout << std::format("{:<10} {:<20} {:<9} {:<16} {}", "ID", "NAME",
                           "STATE", "IP", "CREATED")
            << std::endl;
  for (const auto &r : records)
    std::cout << std::format("{:<10} {:<20} {:<9} {:<16} {}", r.id, r.name,
                             ember::to_string(r.state),
                             r.ip_address().value_or("-"), r.created_at)
              << std::endl;
}

int _main(int argc, char *argv[]) {
  argparse::ArgumentParser program("emberctl");
  program.add_description("Manage Firecracker microVMs on this host");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true);

  argparse::ArgumentParser create_command("create");
  create_command.add_description("Create and start a microVM");
  create_command.add_argument("-n", "--name");
  create_command.add_argument("--kernel").help("Kernel image");
  create_command.add_argument("--rootfs").help("Base rootfs image to copy");
  create_command.add_argument("--rootfs-url").help("Download the base rootfs");
  create_command.add_argument("-c", "--vcpu").scan<'i', int64_t>();
  create_command.add_argument("-m", "--memory")
      .scan<'i', int64_t>()
      .help("Memory in MiB");
  create_command.add_argument("--ip");
  create_command.add_argument("--bridge")
      .default_value(false)
      .implicit_value(true);
  create_command.add_argument("--bridge-name");
  create_command.add_argument("--mmds")
      .default_value(false)
      .implicit_value(true);
  create_command.add_argument("--mmds-ip");
  create_command.add_argument("-l", "--label").append().help("key=value");
  create_command.add_argument("--working-dir")
      .default_value(std::string("/root"));
  create_command.add_argument("--expose-ports")
      .default_value(false)
      .implicit_value(true);
  create_command.add_argument("--host-port").help("Comma separated host ports");
  create_command.add_argument("--dest-port")
      .help("Comma separated guest ports");
  create_command.add_argument("--user-data");
  create_command.add_argument("--user-data-file");
  program.add_subparser(create_command);

  argparse::ArgumentParser list_command("list");
  list_command.add_description("List microVMs");
  program.add_subparser(list_command);

  argparse::ArgumentParser status_command("status");
  status_command.add_argument("id");
  program.add_subparser(status_command);

  argparse::ArgumentParser inspect_command("inspect");
  inspect_command.add_description("Show the stored record of a microVM");
  inspect_command.add_argument("id");
  program.add_subparser(inspect_command);

  argparse::ArgumentParser config_command("config");
  config_command.add_description("Ask a running microVM for its configuration");
  config_command.add_argument("id");
  program.add_subparser(config_command);

  argparse::ArgumentParser find_command("find");
  find_command.add_argument("-s", "--state")
      .default_value(std::string("running"));
  find_command.add_argument("-l", "--label").append().help("key=value");
  program.add_subparser(find_command);

  argparse::ArgumentParser pause_command("pause");
  pause_command.add_argument("id");
  program.add_subparser(pause_command);

  argparse::ArgumentParser resume_command("resume");
  resume_command.add_argument("id");
  program.add_subparser(resume_command);

  argparse::ArgumentParser delete_command("delete");
  delete_command.add_argument("id").nargs(argparse::nargs_pattern::optional);
  delete_command.add_argument("--all")
      .default_value(false)
      .implicit_value(true);
  program.add_subparser(delete_command);

  argparse::ArgumentParser port_forward_command("port-forward");
  port_forward_command.add_argument("id");
  port_forward_command.add_argument("--host-port").required();
  port_forward_command.add_argument("--dest-port").required();
  port_forward_command.add_argument("--remove")
      .default_value(false)
      .implicit_value(true);
  program.add_subparser(port_forward_command);

  argparse::ArgumentParser connect_command("connect");
  connect_command.add_description("Open a shell on a microVM over SSH");
  connect_command.add_argument("id");
  connect_command.add_argument("-u", "--user");
  connect_command.add_argument("-k", "--key").required().help("Private key");
  program.add_subparser(connect_command);

  argparse::ArgumentParser exec_command("exec");
  exec_command.add_description("Type commands into the microVM console");
  exec_command.add_argument("id");
  exec_command.add_argument("commands").remaining();
  program.add_subparser(exec_command);

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error &err) {
    std::cerr << err.what() << std::endl;
    std::cerr << program;
    return 1;
  }

  auto config = ember::config_t::load();
  if (program.get<bool>("--verbose"))
    config.verbose = true;
  ember::set_log_level(config.verbose ? "debug" : "warn");

  ember::microvm_manager_t manager(config);

  if (program.is_subcommand_used("create")) {
    ember::create_request_t request;
    request.name = create_command.present("--name");
    request.kernel_file = create_command.present("--kernel");
    request.base_rootfs = create_command.present("--rootfs");
    request.rootfs_url = create_command.present("--rootfs-url");
    request.vcpu_count = create_command.present<int64_t>("--vcpu");
    request.mem_size_mib = create_command.present<int64_t>("--memory");
    request.ip_addr = create_command.present("--ip");
    if (create_command.get<bool>("--bridge"))
      request.bridge = true;
    request.bridge_name = create_command.present("--bridge-name");
    if (create_command.get<bool>("--mmds"))
      request.mmds_enabled = true;
    request.mmds_ip = create_command.present("--mmds-ip");
    if (auto labels =
            create_command.present<std::vector<std::string>>("--label"))
      request.labels = parse_labels(labels.value());
    request.working_dir = create_command.get("--working-dir");
    if (create_command.get<bool>("--expose-ports"))
      request.expose_ports = true;
    if (auto p = create_command.present("--host-port"))
      request.host_port = p.value();
    if (auto p = create_command.present("--dest-port"))
      request.dest_port = p.value();
    request.user_data = create_command.present("--user-data");
    request.user_data_file = create_command.present("--user-data-file");
    request.verbose = config.verbose;
    return report(manager.create(request));
  } else if (program.is_subcommand_used("list")) {
    print_table(manager.list());
    return 0;
  } else if (program.is_subcommand_used("status")) {
    auto id = status_command.get("id");
    auto status = manager.status(id);
    std::cout << status.value_or(std::format("VMM with ID {} not found", id))
              << std::endl;
    return status.has_value() ? 0 : 1;
  } else if (program.is_subcommand_used("inspect")) {
    auto id = inspect_command.get("id");
    auto record = manager.inspect(id);
    if (!record.has_value()) {
      std::cerr << std::format("VMM with ID {} not found", id) << std::endl;
      return 1;
    }
    std::cout << nlohmann::json(record.value()).dump(2) << std::endl;
    return 0;
  } else if (program.is_subcommand_used("config")) {
    auto id = config_command.get("id");
    auto live = manager.config(id);
    if (!live.has_value()) {
      std::cerr << std::format("VMM with ID {} not found", id) << std::endl;
      return 1;
    }
    std::cout << live->dump(2) << std::endl;
    return 0;
  } else if (program.is_subcommand_used("find")) {
    auto state_name = find_command.get("--state");
    auto state = ember::parse_instance_state(state_name);
    if (!state.has_value()) {
      std::cerr << "Unknown state: " << state_name << std::endl;
      return 1;
    }
    ember::labels_t labels;
    if (auto items = find_command.present<std::vector<std::string>>("--label"))
      labels = parse_labels(items.value());
    for (const auto &id : manager.find(state.value(), labels))
      std::cout << id << std::endl;
    return 0;
  } else if (program.is_subcommand_used("pause")) {
    return report(manager.pause(pause_command.get("id")));
  } else if (program.is_subcommand_used("resume")) {
    return report(manager.resume(resume_command.get("id")));
  } else if (program.is_subcommand_used("delete")) {
    if (delete_command.get<bool>("--all"))
      return report(manager.remove_all());
    auto id = delete_command.present("id");
    if (!id.has_value()) {
      std::cerr << "Either an id or --all is required" << std::endl;
      return 1;
    }
    return report(manager.remove(id.value()));
  } else if (program.is_subcommand_used("port-forward")) {
    return report(manager.port_forward(
        port_forward_command.get("id"),
        port_forward_command.get("--host-port"),
        port_forward_command.get("--dest-port"),
        port_forward_command.get<bool>("--remove")));
  } else if (program.is_subcommand_used("connect")) {
    ember::connect_options_t options;
    options.username = connect_command.present("--user");
    options.key_path = connect_command.get("--key");
    return report(manager.connect(connect_command.get("id"), options));
  } else if (program.is_subcommand_used("exec")) {
    auto commands = exec_command.present<std::vector<std::string>>("commands");
    bool ok = manager.execute_in_vm(
        exec_command.get("id"), commands.value_or(std::vector<std::string>{}));
    return ok ? 0 : 1;
  }

  std::cerr << program;
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    return _main(argc, argv);
  } catch (const ember::exception_base_t &e) {
    std::cerr << e.what() << std::endl;
    ember::debug("{}", e.trace());
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Unexpected error: " << e.what() << std::endl;
    return 1;
  }
}
