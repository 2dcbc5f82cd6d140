#include <gtest/gtest.h>

#include <fstream>
#include <set>

#include <unistd.h>

#include "fakes.hpp"
#include "ip_allocator.hpp"
#include "microvm.hpp"
#include "registry.hpp"

using namespace std::chrono_literals;
using namespace ember::testing;

namespace fs = std::filesystem;

namespace {

class EmberMicrovmTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.data_path = tmp.path / "data";
    config.binary_path = "/usr/local/bin/firecracker";
    config.base_rootfs = tmp.path / "images" / "rootfs.img";
    config.finalize();
    fs::create_directories(config.data_path);
    fs::create_directories(config.base_rootfs.parent_path());
    write_file(config.kernel_file, "kernel");
    write_file(config.base_rootfs, "ext4");
    write_file(tmp.path / "id_ed25519", "key");

    manager = std::make_unique<ember::microvm_manager_t>(
        config,
        ember::collaborators_t{
            .process = process,
            .network = network,
            .shell = shell,
            .api_factory =
                [this](const fs::path &) {
                  return std::static_pointer_cast<ember::api_client_t>(api);
                },
            .rootfs_fetcher =
                [](const std::string &url, const fs::path &) -> fs::path {
              throw ember::exception<ember::network_error>("no network");
            },
        },
        ember::timings_t{.socket_wait = {.attempts = 3, .interval = 1ms},
                         .ssh_connect = {.attempts = 3, .interval = 1ms}});
  }

  std::string create_one(ember::create_request_t request = {}) {
    std::set<std::string> before;
    for (const auto &record : manager->list())
      before.insert(record.id);
    auto outcome = manager->create(request);
    EXPECT_TRUE(ember::succeeded(outcome)) << ember::message_of(outcome);
    for (const auto &record : manager->list())
      if (!before.contains(record.id))
        return record.id;
    return "";
  }

  ember::connect_options_t connect_options() {
    return ember::connect_options_t{.key_path = tmp.path / "id_ed25519",
                                    .in_fd = in_fds[0],
                                    .out_fd = out_fds[1]};
  }

  temp_dir_t tmp;
  ember::config_t config;
  std::shared_ptr<fake_process_t> process = ember::create<fake_process_t>();
  std::shared_ptr<fake_network_t> network = ember::create<fake_network_t>();
  std::shared_ptr<fake_shell_t> shell = ember::create<fake_shell_t>();
  std::shared_ptr<fake_api_t> api = ember::create<fake_api_t>();
  std::unique_ptr<ember::microvm_manager_t> manager;
  int in_fds[2] = {-1, -1};
  int out_fds[2] = {-1, -1};
};

const ember::error_output_t &error_of(const ember::outcome_t &outcome) {
  return std::get<ember::error_output_t>(outcome);
}

} // namespace

TEST_F(EmberMicrovmTest, TestCreatePersistsRunningInstance) {
  auto outcome = manager->create({.vcpu_count = 2, .mem_size_mib = 256});
  ASSERT_TRUE(ember::succeeded(outcome)) << ember::message_of(outcome);

  auto records = manager->list();
  ASSERT_EQ(records.size(), 1);
  const auto &record = records.front();
  ASSERT_EQ(ember::message_of(outcome),
            std::format("VMM {} is created successfully", record.id));
  ASSERT_EQ(record.state, ember::instance_state_t::running);
  ASSERT_EQ(record.pid, 4242);
  ASSERT_EQ(record.created_at, "2026-10-19T10:00:00Z");
  ASSERT_EQ(record.vcpu_count, 2);
  ASSERT_EQ(record.mem_size_mib, 256);
  ASSERT_EQ(record.network.size(), 1);
  ASSERT_EQ(record.network.at("tap_" + record.id).ip_address, "172.16.0.2");
  ASSERT_EQ(record.network.at("tap_" + record.id).gateway, "172.16.0.1");
  ASSERT_TRUE(record.ports.empty());
  ASSERT_FALSE(record.name.empty());
  ASSERT_TRUE(fs::is_regular_file(config.data_path / record.id / "rootfs" /
                                  "rootfs.img"));

  ASSERT_EQ(api->calls.back(), "put_action:InstanceStart");
  ASSERT_EQ(api->count("put_boot_source"), 1);
  ASSERT_TRUE(network->taps.contains("tap_" + record.id));
  ASSERT_EQ(manager->status(record.id),
            std::format("VMM {} is running", record.id));
}

TEST_F(EmberMicrovmTest, TestCollidingAddressIsRemapped) {
  auto first = create_one();
  auto second = create_one();
  ASSERT_NE(first, second);
  ASSERT_EQ(manager->inspect(first)->ip_address(), "172.16.0.2");
  ASSERT_EQ(manager->inspect(second)->ip_address(), "172.16.0.3");
}

TEST_F(EmberMicrovmTest, TestDuplicateNameIsRejected) {
  create_one({.name = "web"});
  auto outcome = manager->create({.name = "web"});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::conflict);
  ASSERT_TRUE(error_of(outcome).expected());
  ASSERT_EQ(error_of(outcome).reason, "VMM with name web already exists");
  ASSERT_EQ(manager->list().size(), 1);
  ASSERT_EQ(process->sessions.size(), 1);
}

TEST_F(EmberMicrovmTest, TestInvalidRequestStartsNothing) {
  auto outcome = manager->create({.mem_size_mib = 64});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::configuration);
  ASSERT_TRUE(process->sessions.empty());
  ASSERT_TRUE(manager->list().empty());
}

TEST_F(EmberMicrovmTest, TestCreateRollsBackWhenProcessIsGone) {
  process->hypervisor_alive = false;
  auto outcome = manager->create({});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::process);
  ASSERT_NE(error_of(outcome).reason.find("Firecracker process is not running"),
            std::string::npos);

  ASSERT_TRUE(manager->list().empty());
  ASSERT_EQ(process->stopped.size(), 1);
  ASSERT_TRUE(network->taps.empty());
  ASSERT_EQ(network->deleted_taps.size(), 1);
  for (const auto &entry : fs::directory_iterator(config.data_path))
    ASSERT_TRUE(entry.path().filename().string().starts_with("."))
        << entry.path();
}

TEST_F(EmberMicrovmTest, TestCreateRollsBackOnConfigurationFailure) {
  api->fail_on = "put_network_interface";
  auto outcome = manager->create({});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::configuration);
  ASSERT_FALSE(error_of(outcome).expected());
  ASSERT_TRUE(manager->list().empty());
  ASSERT_EQ(process->stopped.size(), 1);
  ASSERT_TRUE(network->taps.empty());
  ASSERT_EQ(api->count("put_action:InstanceStart"), 0);
}

TEST_F(EmberMicrovmTest, TestCreateRollsBackWhenRecordCannotBeSaved) {
  auto outcome = manager->create({.labels = {{"k", "\xff"}}});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::registry);
  ASSERT_TRUE(manager->list().empty());
  ASSERT_EQ(process->stopped.size(), 1);
  ASSERT_TRUE(process->running.empty());
  ASSERT_TRUE(network->taps.empty());
  for (const auto &entry : fs::directory_iterator(config.data_path))
    ASSERT_TRUE(entry.path().filename().string().starts_with("."))
        << entry.path();
}

TEST_F(EmberMicrovmTest, TestCreateFailsWhenSubnetIsExhausted) {
  {
    ember::registry_t registry(config.data_path);
    for (int host = 2; host <= 254; ++host) {
      auto id = std::format("{:08x}", host);
      auto ip = std::format("172.16.0.{}", host);
      ember::instance_record_t record;
      record.id = id;
      record.name = std::format("vm-{}", host);
      record.created_at = "2026-10-19T10:00:00Z";
      record.state = ember::instance_state_t::running;
      record.pid = 4242;
      record.network[ember::tap_name_for(id)] = ember::network_entry_t{
          .ip_address = ip, .gateway = ember::gateway_for(ip)};
      record.session_name = ember::session_name_for(id);
      registry.create(record);
    }
  }

  auto outcome = manager->create({});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::network);
  ASSERT_EQ(process->stopped.size(), 1);
  ASSERT_TRUE(process->running.empty());
  ASSERT_EQ(api->count("put_boot_source"), 0);
  ASSERT_TRUE(network->taps.empty());

  size_t dirs = 0;
  for (const auto &entry : fs::directory_iterator(config.data_path))
    if (!entry.path().filename().string().starts_with("."))
      ++dirs;
  ASSERT_EQ(dirs, 253);
}

TEST_F(EmberMicrovmTest, TestExposedPortsAtCreate) {
  auto id = create_one({.expose_ports = true,
                        .host_port = std::string("8080"),
                        .dest_port = int64_t{80}});
  auto record = manager->inspect(id);
  ASSERT_EQ(record->ports.at("80/tcp"),
            (std::vector<ember::port_rule_t>{{8080, 80}}));
  ASSERT_TRUE(network->forwards.contains("8080->172.16.0.2:80"));
}

TEST_F(EmberMicrovmTest, TestExposedPortFailureDoesNotFailCreate) {
  network->fail_forward = true;
  auto id = create_one({.expose_ports = true,
                        .host_port = int64_t{8080},
                        .dest_port = int64_t{80}});
  ASSERT_TRUE(manager->inspect(id)->ports.empty());
}

TEST_F(EmberMicrovmTest, TestPortForwardAddAndRemove) {
  auto id = create_one();
  auto outcome =
      manager->port_forward(id, std::string("8080,8081"), std::string("80,81"));
  ASSERT_TRUE(ember::succeeded(outcome)) << ember::message_of(outcome);
  ASSERT_EQ(ember::message_of(outcome), "Port forwarding added successfully");

  auto record = manager->inspect(id);
  ASSERT_EQ(record->ports.size(), 2);
  ASSERT_EQ(record->ports.at("81/tcp").front().host_port, 8081);
  ASSERT_EQ(network->forwards.size(), 2);

  // Adding the same pair again does not duplicate the entry
  manager->port_forward(id, int64_t{8080}, int64_t{80});
  ASSERT_EQ(manager->inspect(id)->ports.at("80/tcp").size(), 1);

  outcome = manager->port_forward(id, std::string("8080,8081"),
                                  std::string("80,81"), true);
  ASSERT_TRUE(ember::succeeded(outcome)) << ember::message_of(outcome);
  ASSERT_TRUE(manager->inspect(id)->ports.empty());
  ASSERT_TRUE(network->forwards.empty());
}

TEST_F(EmberMicrovmTest, TestPortForwardRejectsMismatchedLists) {
  auto id = create_one();
  std::vector<ember::port_item_t> hosts{int64_t{8080}, int64_t{8081}};
  auto outcome = manager->port_forward(id, hosts, int64_t{80});
  ASSERT_FALSE(ember::succeeded(outcome));
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::validation);
  ASSERT_NE(error_of(outcome).reason.find(
                "Number of host ports (2) must match number of destination "
                "ports (1)"),
            std::string::npos);
  ASSERT_TRUE(network->forwards.empty());
  ASSERT_TRUE(manager->inspect(id)->ports.empty());

  outcome = manager->port_forward(id, std::monostate{}, int64_t{80});
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::validation);

  outcome = manager->port_forward(id, int64_t{70000}, int64_t{80});
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::validation);
}

TEST_F(EmberMicrovmTest, TestPortForwardUnknownInstance) {
  auto outcome = manager->port_forward("ffffffff", int64_t{8080}, int64_t{80});
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::not_found);
  ASSERT_EQ(error_of(outcome).reason, "VMM with ID ffffffff not found");
}

TEST_F(EmberMicrovmTest, TestPauseAndResumeAreIdempotent) {
  auto id = create_one();
  api->calls.clear();

  auto outcome = manager->pause(id);
  ASSERT_EQ(ember::message_of(outcome),
            std::format("VMM {} paused successfully", id));
  ASSERT_EQ(manager->inspect(id)->state, ember::instance_state_t::paused);
  ASSERT_TRUE(ember::succeeded(manager->pause(id)));
  ASSERT_EQ(api->count("patch_vm_state:Paused"), 1);
  ASSERT_EQ(manager->find(ember::instance_state_t::paused),
            std::vector<std::string>{id});

  ASSERT_TRUE(ember::succeeded(manager->resume(id)));
  ASSERT_TRUE(ember::succeeded(manager->resume(id)));
  ASSERT_EQ(api->count("patch_vm_state:Resumed"), 1);
  ASSERT_EQ(manager->inspect(id)->state, ember::instance_state_t::running);

  ASSERT_EQ(error_of(manager->pause("ffffffff")).kind,
            ember::error_kind_t::not_found);
}

TEST_F(EmberMicrovmTest, TestPauseFailureKeepsState) {
  auto id = create_one();
  api->fail_on = "patch_vm_state";
  auto outcome = manager->pause(id);
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::api);
  ASSERT_EQ(manager->inspect(id)->state, ember::instance_state_t::running);
}

TEST_F(EmberMicrovmTest, TestDeleteIsIdempotent) {
  auto id = create_one();
  manager->port_forward(id, int64_t{2222}, int64_t{22});

  auto outcome = manager->remove(id);
  ASSERT_EQ(ember::message_of(outcome),
            std::format("VMM {} deleted successfully", id));
  ASSERT_FALSE(fs::exists(config.data_path / id));
  ASSERT_TRUE(network->forwards.empty());
  ASSERT_TRUE(network->taps.empty());
  ASSERT_TRUE(network->nat.empty());

  outcome = manager->remove(id);
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::not_found);
  ASSERT_TRUE(error_of(outcome).expected());
}

TEST_F(EmberMicrovmTest, TestDeleteKeepsRecordWhenProcessSurvives) {
  auto id = create_one();
  process->stop_result = false;
  auto outcome = manager->remove(id);
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::vmm);
  ASSERT_TRUE(manager->inspect(id).has_value());

  process->stop_result = true;
  ASSERT_TRUE(ember::succeeded(manager->remove(id)));
  ASSERT_FALSE(manager->inspect(id).has_value());
}

TEST_F(EmberMicrovmTest, TestDeleteAll) {
  auto outcome = manager->remove_all();
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::not_found);
  ASSERT_EQ(error_of(outcome).reason, "No VMMs available to delete");

  create_one();
  create_one();
  outcome = manager->remove_all();
  ASSERT_EQ(ember::message_of(outcome), "All VMMs deleted successfully");
  ASSERT_TRUE(manager->list().empty());
}

TEST_F(EmberMicrovmTest, TestFindByLabels) {
  auto dev = create_one({.labels = {{"env", "dev"}}});
  create_one({.labels = {{"env", "prod"}}});
  ASSERT_EQ(manager->find(ember::instance_state_t::running, {{"env", "dev"}}),
            std::vector<std::string>{dev});
  ASSERT_EQ(manager->find(ember::instance_state_t::running).size(), 2);
  ASSERT_TRUE(manager->find(ember::instance_state_t::paused).empty());
}

TEST_F(EmberMicrovmTest, TestQueriesOnUnknownInstance) {
  ASSERT_FALSE(manager->status("ffffffff").has_value());
  ASSERT_FALSE(manager->inspect("ffffffff").has_value());
  ASSERT_FALSE(manager->config("ffffffff").has_value());
}

TEST_F(EmberMicrovmTest, TestLiveConfig) {
  auto id = create_one({.vcpu_count = 2});
  auto rv = manager->config(id);
  ASSERT_TRUE(rv.has_value());
  ASSERT_EQ((*rv)["machine-config"]["vcpu_count"], 2);
}

TEST_F(EmberMicrovmTest, TestExecuteInVm) {
  auto id = create_one();
  ASSERT_TRUE(manager->execute_in_vm(id, {"ls", "pwd"}));
  ASSERT_EQ(process->sent, (std::vector<std::string>{"ls\npwd\n"}));

  std::ifstream ifs(config.data_path / id / "logs" / "commands.txt");
  std::string staged((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
  ASSERT_EQ(staged, "ls\npwd\n");

  ASSERT_FALSE(manager->execute_in_vm(id, {}));
  ASSERT_FALSE(manager->execute_in_vm("ffffffff", {"ls"}));
  process->paste_result = false;
  ASSERT_FALSE(manager->execute_in_vm(id, {"ls"}));
}

TEST_F(EmberMicrovmTest, TestConnectRetriesUnreachableHost) {
  auto id = create_one();
  ASSERT_EQ(::pipe(in_fds), 0);
  ASSERT_EQ(::pipe(out_fds), 0);
  shell->unreachable_failures = 2;
  shell->channel->pending = {"Welcome\r\n"};

  auto outcome = manager->connect(id, connect_options());
  ::close(in_fds[0]);
  ::close(in_fds[1]);
  ::close(out_fds[0]);
  ::close(out_fds[1]);

  ASSERT_TRUE(ember::succeeded(outcome)) << ember::message_of(outcome);
  ASSERT_EQ(ember::message_of(outcome),
            std::format("SSH session to VMM {} closed", id));
  ASSERT_EQ(shell->attempts, 3);
  ASSERT_EQ(shell->host, "172.16.0.2");
  ASSERT_EQ(shell->user, "root");
  ASSERT_TRUE(shell->channel->closed);
  ASSERT_EQ(shell->disconnects, 1);
}

TEST_F(EmberMicrovmTest, TestConnectGivesUp) {
  auto id = create_one();
  shell->unreachable_failures = 10;
  auto outcome = manager->connect(id, connect_options());
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::network);
  ASSERT_NE(error_of(outcome).reason.find("after 3 attempts"),
            std::string::npos);
  ASSERT_EQ(shell->attempts, 3);
}

TEST_F(EmberMicrovmTest, TestConnectDoesNotRetryOtherFailures) {
  auto id = create_one();
  shell->fatal = true;
  auto outcome = manager->connect(id, connect_options());
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::vmm);
  ASSERT_EQ(shell->attempts, 1);
}

TEST_F(EmberMicrovmTest, TestConnectValidatesKey) {
  auto id = create_one();
  auto outcome = manager->connect(id, {});
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::validation);
  ASSERT_EQ(error_of(outcome).reason, "SSH key path is required");

  outcome = manager->connect(id, {.key_path = tmp.path / "missing"});
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::validation);

  outcome = manager->connect("ffffffff", connect_options());
  ASSERT_EQ(error_of(outcome).kind, ember::error_kind_t::not_found);
  ASSERT_EQ(shell->attempts, 0);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
