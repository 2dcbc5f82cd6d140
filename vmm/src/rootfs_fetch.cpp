#include "rootfs_fetch.hpp"

#include <fstream>

#include <httplib.h>
#include <indicators/block_progress_bar.hpp>

#include "exception.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace ember {

parsed_url_t parse_rootfs_url(const std::string &url) {
  if (!url.starts_with("http://") && !url.starts_with("https://"))
    throw exception<configuration_error>(
        "rootfs_url", std::format("unsupported URL scheme in {}", url));

  parsed_url_t rv;
  size_t host_begin = url.find("://") + 3;
  size_t slash_pos = url.find('/', host_begin);
  if (slash_pos == std::string::npos) {
    rv.scheme_host_port = url;
    rv.path = "/";
  } else {
    rv.scheme_host_port = url.substr(0, slash_pos);
    rv.path = url.substr(slash_pos);
  }
  if (rv.scheme_host_port.size() == host_begin)
    throw exception<configuration_error>(
        "rootfs_url", std::format("missing host in {}", url));

  auto name = rv.path.substr(0, rv.path.find_first_of("?#"));
  rv.filename = name.substr(name.rfind('/') + 1);
  if (rv.filename.empty() || rv.filename == "." || rv.filename == "..")
    throw exception<configuration_error>(
        "rootfs_url", std::format("no file name in {}", url));
  return rv;
}

fs::path fetch_rootfs(const std::string &url, const fs::path &dest_dir,
                      bool show_progress) {
  auto parsed = parse_rootfs_url(url);

  std::error_code ec;
  fs::create_directories(dest_dir, ec);
  if (ec)
    throw exception<configuration_error>(
        "rootfs_url", std::format("cannot create {}: {}", dest_dir.string(),
                                  ec.message()));

  fs::path local_path = dest_dir / parsed.filename;
  fs::path partial_path = local_path;
  partial_path += ".part";

  httplib::Client client(parsed.scheme_host_port);
  client.set_follow_location(true);
  client.set_connection_timeout(10, 0);
  client.set_read_timeout(60, 0);

  indicators::BlockProgressBar bar{
      indicators::option::BarWidth{50},
      indicators::option::PrefixText{"Downloading " + parsed.filename + " "},
      indicators::option::ShowPercentage{true},
      indicators::option::ShowElapsedTime{true}};

  std::ofstream ofs(partial_path, std::ios::binary | std::ios::trunc);
  if (!ofs)
    throw exception<configuration_error>(
        "rootfs_url",
        std::format("cannot write {}", partial_path.string()));

  info("Downloading rootfs from {}", url);
  int status = 0;
  httplib::Result res = client.Get(
      parsed.path,
      [&](const httplib::Response &response) {
        status = response.status;
        return status >= 200 && status < 300;
      },
      [&](const char *data, size_t data_length) {
        ofs.write(data, static_cast<std::streamsize>(data_length));
        return ofs.good();
      },
      [&](uint64_t current, uint64_t total) {
        if (show_progress && total > 0)
          bar.set_progress(static_cast<float>(current) / total * 100);
        return true;
      });
  ofs.close();

  if (!res || status < 200 || status >= 300 || !ofs) {
    fs::remove(partial_path, ec);
    std::string cause =
        status != 0 ? std::format("HTTP {}", status)
                    : std::string(httplib::to_string(res.error()));
    throw exception<configuration_error>(
        "rootfs_url", std::format("failed to download {}: {}", url, cause));
  }
  if (show_progress)
    bar.mark_as_completed();

  fs::rename(partial_path, local_path, ec);
  if (ec)
    throw exception<configuration_error>(
        "rootfs_url", std::format("cannot move {} into place: {}",
                                  partial_path.string(), ec.message()));
  info("Rootfs saved to {}", local_path.string());
  return local_path;
}

} // namespace ember
