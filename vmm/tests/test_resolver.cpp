#include <gtest/gtest.h>

#include "fakes.hpp"
#include "resolver.hpp"
#include "rootfs_fetch.hpp"

using ember::testing::temp_dir_t;

namespace {

ember::config_t make_config(const std::filesystem::path &data_path) {
  ember::config_t config;
  config.data_path = data_path;
  config.finalize();
  return config;
}

ember::rootfs_fetcher_t no_fetch = [](const std::string &url,
                                      const std::filesystem::path &) {
  throw ember::exception<ember::network_error>("unexpected download of " +
                                               url);
  return std::filesystem::path();
};

void expect_configuration_error(const ember::create_request_t &request,
                                const ember::config_t &config) {
  try {
    ember::resolve_config(request, config, "0a1b2c3d", "web", no_fetch);
    FAIL() << "request accepted";
  } catch (const ember::exception_base_t &e) {
    ASSERT_EQ(e.kind(), ember::error_kind_t::configuration);
  }
}

} // namespace

TEST(EmberResolverTest, TestDefaultsFromConfig) {
  temp_dir_t tmp;
  auto config = make_config(tmp.path);
  auto rv = ember::resolve_config({}, config, "0a1b2c3d", "web", no_fetch);

  ASSERT_EQ(rv.vcpu_count, 1);
  ASSERT_EQ(rv.mem_size_mib, 512);
  ASSERT_EQ(rv.ip_addr, "172.16.0.2");
  ASSERT_EQ(rv.gateway_ip, "172.16.0.1");
  ASSERT_EQ(rv.tap_name, "tap_0a1b2c3d");
  ASSERT_EQ(rv.kernel_file, tmp.path / "vmlinux");
  ASSERT_EQ(rv.base_rootfs, tmp.path / "rootfs.img");
  ASSERT_FALSE(rv.mmds_enabled);
  ASSERT_EQ(rv.working_dir, "/root");

  ASSERT_EQ(rv.paths.root, tmp.path / "0a1b2c3d");
  ASSERT_EQ(rv.paths.rootfs_file, tmp.path / "0a1b2c3d/rootfs/rootfs.img");
  ASSERT_EQ(rv.paths.socket_path, tmp.path / "0a1b2c3d/firecracker.socket");
  ASSERT_EQ(rv.paths.hypervisor_log, tmp.path / "0a1b2c3d/logs/0a1b2c3d.log");
  ASSERT_EQ(rv.paths.session_name, "fc_0a1b2c3d");
}

TEST(EmberResolverTest, TestRequestOverrides) {
  temp_dir_t tmp;
  auto config = make_config(tmp.path);
  ember::create_request_t request{
      .vcpu_count = 2,
      .mem_size_mib = 256,
      .ip_addr = "10.0.0.7",
      .labels = {{"env", "dev"}},
      .host_port = std::string("8080,8081"),
      .dest_port = std::string("80,81"),
  };
  auto rv = ember::resolve_config(request, config, "0a1b2c3d", "web", no_fetch);
  ASSERT_EQ(rv.vcpu_count, 2);
  ASSERT_EQ(rv.mem_size_mib, 256);
  ASSERT_EQ(rv.ip_addr, "10.0.0.7");
  ASSERT_EQ(rv.gateway_ip, "10.0.0.1");
  ASSERT_EQ(rv.labels.at("env"), "dev");
  ASSERT_EQ(rv.host_ports, (std::vector<int64_t>{8080, 8081}));
  ASSERT_EQ(rv.dest_ports, (std::vector<int64_t>{80, 81}));
}

TEST(EmberResolverTest, TestInvalidRequests) {
  temp_dir_t tmp;
  auto config = make_config(tmp.path);
  expect_configuration_error({.vcpu_count = 0}, config);
  expect_configuration_error({.vcpu_count = 33}, config);
  expect_configuration_error({.vcpu_count = 4294967297}, config);
  expect_configuration_error({.mem_size_mib = 64}, config);
  expect_configuration_error({.mem_size_mib = 4294967424}, config);
  expect_configuration_error({.ip_addr = "172.16.0"}, config);
  expect_configuration_error(
      {.mmds_enabled = true, .mmds_ip = "not-an-ip"}, config);
  expect_configuration_error({.user_data_file = tmp.path / "missing.yaml"},
                             config);
}

TEST(EmberResolverTest, TestUserDataEnablesMetadata) {
  temp_dir_t tmp;
  auto config = make_config(tmp.path);
  ember::testing::write_file(tmp.path / "user-data.yaml", "#cloud-config\n");

  auto rv = ember::resolve_config(
      {.user_data_file = tmp.path / "user-data.yaml"}, config, "0a1b2c3d",
      "web", no_fetch);
  ASSERT_TRUE(rv.mmds_enabled);
  ASSERT_EQ(rv.mmds_ip, "169.254.169.254");
  ASSERT_EQ(rv.user_data, "#cloud-config\n");

  rv = ember::resolve_config({.user_data = "#!/bin/sh\n"}, config, "0a1b2c3d",
                             "web", no_fetch);
  ASSERT_TRUE(rv.mmds_enabled);
}

TEST(EmberResolverTest, TestRootfsUrlIsFetched) {
  temp_dir_t tmp;
  auto config = make_config(tmp.path);
  std::string fetched_url;
  ember::rootfs_fetcher_t fetch = [&](const std::string &url,
                                      const std::filesystem::path &dest) {
    fetched_url = url;
    return dest / "ubuntu.ext4";
  };
  auto rv = ember::resolve_config(
      {.rootfs_url = "https://images.example.com/ubuntu.ext4"}, config,
      "0a1b2c3d", "web", fetch);
  ASSERT_EQ(fetched_url, "https://images.example.com/ubuntu.ext4");
  ASSERT_EQ(rv.base_rootfs, tmp.path / "ubuntu.ext4");
  ASSERT_EQ(rv.paths.rootfs_file, tmp.path / "0a1b2c3d/rootfs/ubuntu.ext4");
}

TEST(EmberRootfsFetchTest, TestParseUrl) {
  auto url = ember::parse_rootfs_url(
      "https://images.example.com:8443/releases/ubuntu-22.04.ext4");
  ASSERT_EQ(url.scheme_host_port, "https://images.example.com:8443");
  ASSERT_EQ(url.path, "/releases/ubuntu-22.04.ext4");
  ASSERT_EQ(url.filename, "ubuntu-22.04.ext4");

  ASSERT_THROW(ember::parse_rootfs_url("ftp://example.com/rootfs.img"),
               ember::exception_base_t);
  ASSERT_THROW(ember::parse_rootfs_url("https:///rootfs.img"),
               ember::exception_base_t);
  ASSERT_THROW(ember::parse_rootfs_url("https://example.com/images/"),
               ember::exception_base_t);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
