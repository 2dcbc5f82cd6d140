#include <gtest/gtest.h>

#include "configurator.hpp"
#include "fakes.hpp"

using ember::testing::fake_api_t;
using ember::testing::fake_network_t;
using ember::testing::temp_dir_t;

namespace {

ember::resolved_config_t make_resolved(const std::filesystem::path &root) {
  ember::config_t config;
  config.data_path = root;
  config.finalize();
  ember::testing::write_file(config.kernel_file, "kernel");
  return ember::resolve_config(
      {}, config, "0a1b2c3d", "web",
      [](const std::string &, const std::filesystem::path &dest) {
        return dest / "unused.img";
      });
}

} // namespace

TEST(EmberConfiguratorTest, TestBootArgs) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  ASSERT_EQ(ember::render_boot_args(cfg),
            "console=ttyS0 reboot=k panic=1 "
            "ip=172.16.0.2::172.16.0.1:255.255.255.0:web:eth0:off");

  cfg.mmds_enabled = true;
  ASSERT_EQ(ember::render_boot_args(cfg),
            "console=ttyS0 reboot=k panic=1 "
            "ds=nocloud-net;s=http://169.254.169.254/latest/ "
            "ip=172.16.0.2::172.16.0.1:255.255.255.0:web:eth0:off");
}

TEST(EmberConfiguratorTest, TestMetadataPayload) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  auto payload = ember::render_mmds_payload(cfg);
  ASSERT_EQ(payload["latest"]["meta-data"]["instance-id"], "0a1b2c3d");
  ASSERT_EQ(payload["latest"]["meta-data"]["local-hostname"], "web");
  ASSERT_FALSE(payload["latest"].contains("user-data"));

  cfg.default_user_data = "#cloud-config\n";
  ASSERT_EQ(ember::render_mmds_payload(cfg)["latest"]["user-data"],
            "#cloud-config\n");

  cfg.user_data = "#!/bin/sh\n";
  ASSERT_EQ(ember::render_mmds_payload(cfg)["latest"]["user-data"],
            "#!/bin/sh\n");
}

TEST(EmberConfiguratorTest, TestApplyOrder) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  cfg.vcpu_count = 2;
  cfg.mem_size_mib = 256;
  auto api = ember::create<fake_api_t>();
  auto network = ember::create<fake_network_t>();

  ember::configurator_t(api, network).apply(cfg);
  ASSERT_EQ(api->calls,
            (std::vector<std::string>{"put_boot_source", "put_drive",
                                      "put_machine_config",
                                      "put_network_interface"}));
  ASSERT_EQ(api->vcpus, 2);
  ASSERT_EQ(api->mem, 256);
  ASSERT_EQ(api->tap, "tap_0a1b2c3d");
  ASSERT_EQ(api->drive_path, cfg.paths.rootfs_file.string());
  ASSERT_TRUE(network->taps.contains("tap_0a1b2c3d"));
  ASSERT_TRUE(network->nat.contains("172.16.0.2"));
}

TEST(EmberConfiguratorTest, TestMetadataStepsWhenEnabled) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  cfg.mmds_enabled = true;
  cfg.user_data = "#cloud-config\n";
  auto api = ember::create<fake_api_t>();

  ember::configurator_t(api, ember::create<fake_network_t>()).apply(cfg);
  ASSERT_EQ(api->calls.size(), 6);
  ASSERT_EQ(api->calls[4], "put_mmds_config");
  ASSERT_EQ(api->calls[5], "put_mmds");
  ASSERT_EQ(api->mmds_version, "V2");
  ASSERT_EQ(api->mmds_payload["latest"]["user-data"], "#cloud-config\n");
}

TEST(EmberConfiguratorTest, TestBridgedTapSkipsNat) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  cfg.bridge = true;
  auto network = ember::create<fake_network_t>();

  ember::configurator_t(ember::create<fake_api_t>(), network).apply(cfg);
  ASSERT_TRUE(network->taps.contains("tap_0a1b2c3d"));
  ASSERT_TRUE(network->nat.empty());
}

TEST(EmberConfiguratorTest, TestMissingKernel) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  std::filesystem::remove(cfg.kernel_file);
  auto api = ember::create<fake_api_t>();
  try {
    ember::configurator_t(api, ember::create<fake_network_t>()).apply(cfg);
    FAIL() << "missing kernel accepted";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::configuration);
  }
  ASSERT_TRUE(api->calls.empty());
}

TEST(EmberConfiguratorTest, TestFailedStepIsNamed) {
  temp_dir_t tmp;
  auto cfg = make_resolved(tmp.path);
  auto api = ember::create<fake_api_t>();
  api->fail_on = "put_machine_config";
  try {
    ember::configurator_t(api, ember::create<fake_network_t>()).apply(cfg);
    FAIL() << "failed step ignored";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::configuration);
    ASSERT_EQ(std::string(e.what()),
              "Failed to configure machine config: put_machine_config "
              "failed: injected failure");
  }
  ASSERT_EQ(api->calls.back(), "put_machine_config");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
