#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace ember {

using rootfs_fetcher_t = std::function<std::filesystem::path(
    const std::string &url, const std::filesystem::path &dest_dir)>;

struct parsed_url_t {
  /**
   * "http://host[:port]" or "https://host[:port]"
   */
  std::string scheme_host_port;
  std::string path;

  /**
   * Last path segment, without query or fragment
   */
  std::string filename;
};

/**
 * @throws ember::exception_t<configuration_error> for anything but an
 * http(s) URL naming a file
 */
parsed_url_t parse_rootfs_url(const std::string &url);

/**
 * @brief Stream `url` into `<dest_dir>/<filename>`
 * @return the downloaded file
 * @throws ember::exception_t<configuration_error> on a bad URL, a transport
 * error or a non-2xx status; no partial file is left behind
 */
std::filesystem::path fetch_rootfs(const std::string &url,
                                   const std::filesystem::path &dest_dir,
                                   bool show_progress = true);

} // namespace ember
