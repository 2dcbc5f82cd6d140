#include <gtest/gtest.h>

#include <fstream>
#include <thread>

#include "fakes.hpp"
#include "ip_allocator.hpp"
#include "registry.hpp"

namespace fs = std::filesystem;
using ember::testing::temp_dir_t;

namespace {

ember::instance_record_t make_record(const std::string &id,
                                     const std::string &name,
                                     const std::string &ip) {
  ember::instance_record_t record;
  record.id = id;
  record.name = name;
  record.created_at = "2026-10-19T10:00:00Z";
  record.state = ember::instance_state_t::running;
  record.pid = 4242;
  record.network[ember::tap_name_for(id)] = ember::network_entry_t{
      .ip_address = ip, .gateway = ember::gateway_for(ip)};
  record.session_name = ember::session_name_for(id);
  return record;
}

} // namespace

TEST(EmberRegistryTest, TestCreateAndGet) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);

  auto record = make_record("0a1b2c3d", "web", "172.16.0.2");
  record.labels = {{"env", "dev"}};
  record.ports["80/tcp"] = {ember::port_rule_t{8080, 80}};
  registry.create(record);

  ASSERT_TRUE(fs::exists(tmp.path / "0a1b2c3d" / "config.json"));
  auto loaded = registry.get("0a1b2c3d");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->name, "web");
  ASSERT_EQ(loaded->state, ember::instance_state_t::running);
  ASSERT_EQ(loaded->ip_address(), "172.16.0.2");
  ASSERT_EQ(loaded->gateway(), "172.16.0.1");
  ASSERT_EQ(loaded->labels.at("env"), "dev");
  ASSERT_EQ(loaded->ports.at("80/tcp").front().host_port, 8080);
}

TEST(EmberRegistryTest, TestUnencodableRecordIsRejected) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);

  auto record = make_record("0a1b2c3d", "web", "172.16.0.2");
  record.labels = {{"k", "\xff"}};
  try {
    registry.create(record);
    FAIL() << "expected a registry error";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::registry);
  }
  ASSERT_FALSE(registry.get("0a1b2c3d").has_value());
}

TEST(EmberRegistryTest, TestDocumentLayout) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  registry.create(make_record("0a1b2c3d", "web", "172.16.0.2"));

  std::ifstream ifs(registry.document_path("0a1b2c3d"));
  auto j = nlohmann::json::parse(ifs);
  ASSERT_EQ(j["ID"], "0a1b2c3d");
  ASSERT_EQ(j["State"]["Status"], "running");
  ASSERT_EQ(j["State"]["Running"], true);
  ASSERT_EQ(j["State"]["Paused"], false);
  ASSERT_EQ(j["Network"]["tap_0a1b2c3d"]["IPAddress"], "172.16.0.2");
  ASSERT_TRUE(j["Ports"].empty());
}

TEST(EmberRegistryTest, TestDuplicateNameIsRejected) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  registry.create(make_record("00000001", "web", "172.16.0.2"));
  try {
    registry.create(make_record("00000002", "web", "172.16.0.3"));
    FAIL() << "duplicate name accepted";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::conflict);
    ASSERT_STREQ(e.what(), "VMM with name web already exists");
  }
  ASSERT_EQ(registry.list().size(), 1);
}

TEST(EmberRegistryTest, TestListIsOrderedAndSkipsGarbage) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  auto late = make_record("000000bb", "late", "172.16.0.3");
  late.created_at = "2026-10-19T11:00:00Z";
  registry.create(late);
  registry.create(make_record("000000aa", "early", "172.16.0.2"));

  fs::create_directories(tmp.path / "broken");
  ember::testing::write_file(tmp.path / "broken" / "config.json", "{not json");
  fs::create_directories(tmp.path / "empty");

  auto records = registry.list();
  ASSERT_EQ(records.size(), 2);
  ASSERT_EQ(records[0].id, "000000aa");
  ASSERT_EQ(records[1].id, "000000bb");
}

TEST(EmberRegistryTest, TestUpdates) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  registry.create(make_record("0a1b2c3d", "web", "172.16.0.2"));

  registry.update_state("0a1b2c3d", ember::instance_state_t::paused);
  ASSERT_EQ(registry.get("0a1b2c3d")->state, ember::instance_state_t::paused);

  ember::port_map_t ports;
  ports["22/tcp"] = {ember::port_rule_t{2222, 22}};
  registry.update_ports("0a1b2c3d", ports);
  ASSERT_EQ(registry.get("0a1b2c3d")->ports, ports);

  try {
    registry.update_state("ffffffff", ember::instance_state_t::running);
    FAIL() << "missing record updated";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::not_found);
    ASSERT_STREQ(e.what(), "VMM with ID ffffffff not found");
  }
}

TEST(EmberRegistryTest, TestQueries) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  auto a = make_record("000000aa", "a", "172.16.0.2");
  a.labels = {{"env", "dev"}, {"team", "core"}};
  auto b = make_record("000000bb", "b", "172.16.0.3");
  b.state = ember::instance_state_t::paused;
  b.labels = {{"env", "dev"}};
  registry.create(a);
  registry.create(b);

  ASSERT_EQ(registry.find_by_name("b")->id, "000000bb");
  ASSERT_FALSE(registry.find_by_name("c").has_value());

  auto dev = registry.find_by_state_and_labels(ember::instance_state_t::running,
                                               {{"env", "dev"}});
  ASSERT_EQ(dev.size(), 1);
  ASSERT_EQ(dev[0].id, "000000aa");
  ASSERT_TRUE(registry
                  .find_by_state_and_labels(ember::instance_state_t::running,
                                            {{"env", "prod"}})
                  .empty());

  ASSERT_TRUE(registry.check_ip_in_use("172.16.0.3"));
  ASSERT_FALSE(registry.check_ip_in_use("172.16.0.4"));
  ASSERT_EQ(registry.ips_in_use(),
            (std::set<std::string>{"172.16.0.2", "172.16.0.3"}));
}

TEST(EmberRegistryTest, TestRemoveIsIdempotent) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  registry.create(make_record("0a1b2c3d", "web", "172.16.0.2"));
  fs::create_directories(tmp.path / "0a1b2c3d" / "rootfs");

  ASSERT_TRUE(registry.remove("0a1b2c3d"));
  ASSERT_FALSE(fs::exists(tmp.path / "0a1b2c3d"));
  ASSERT_FALSE(registry.remove("0a1b2c3d"));
  ASSERT_FALSE(registry.remove("../etc"));
  ASSERT_FALSE(registry.get("../etc").has_value());
}

TEST(EmberRegistryTest, TestReserveIdIsUnique) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  std::set<std::string> ids;
  for (int i = 0; i < 32; i++)
    ids.insert(registry.reserve_id());
  ASSERT_EQ(ids.size(), 32);

  std::ifstream ifs(tmp.path / ".ids");
  std::string line;
  size_t lines = 0;
  while (std::getline(ifs, line))
    lines++;
  ASSERT_EQ(lines, 32);
}

TEST(EmberRegistryTest, TestLockSerializesWriters) {
  temp_dir_t tmp;
  ember::registry_t registry(tmp.path);
  std::vector<std::thread> workers;
  for (int i = 0; i < 8; i++) {
    workers.emplace_back([&registry, i] {
      auto guard = registry.lock();
      auto name = "vm" + std::to_string(i % 2);
      if (registry.find_by_name(name).has_value())
        return;
      auto id = registry.reserve_id();
      registry.create(
          make_record(id, name, "172.16.0." + std::to_string(i + 2)));
    });
  }
  for (auto &worker : workers)
    worker.join();
  ASSERT_EQ(registry.list().size(), 2);
}

TEST(EmberRegistryTest, TestWriteFileAtomic) {
  temp_dir_t tmp;
  auto path = tmp.path / "doc.json";
  ember::write_file_atomic(path, "first");
  ember::write_file_atomic(path, "second");

  std::ifstream ifs(path);
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  ASSERT_EQ(content, "second");
  ASSERT_FALSE(fs::exists(tmp.path / "doc.json.tmp"));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
