#include "supervisor.hpp"

#include <fstream>

#include "exception.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace ember {

instance_paths_t instance_paths_t::make(const fs::path &data_path,
                                        const std::string &id,
                                        const fs::path &base_rootfs) {
  instance_paths_t p;
  p.root = data_path / id;
  p.rootfs_dir = p.root / "rootfs";
  p.log_dir = p.root / "logs";
  p.rootfs_file = p.rootfs_dir / base_rootfs.filename();
  p.socket_path = p.root / "firecracker.socket";
  p.hypervisor_log = p.log_dir / (id + ".log");
  p.session_log = p.log_dir / (id + ".screen.log");
  p.session_name = "fc_" + id;
  return p;
}

supervisor_t::supervisor_t(const fs::path &binary_path,
                           std::shared_ptr<process_manager_t> process,
                           api_factory_t api_factory, retry_t socket_wait)
    : binary_path_(binary_path), process_(std::move(process)),
      api_factory_(std::move(api_factory)), socket_wait_(socket_wait) {}

void supervisor_t::_prepare(const instance_paths_t &paths,
                            const fs::path &base_rootfs) {
  std::error_code ec;
  for (const auto &dir : {paths.root, paths.rootfs_dir, paths.log_dir}) {
    fs::create_directories(dir, ec);
    if (ec)
      throw exception<vmm_error>(std::format("Failed to create {}: {}",
                                             dir.string(), ec.message()));
  }

  for (const auto &log : {paths.hypervisor_log, paths.session_log}) {
    std::ofstream touch(log, std::ios::app);
    if (!touch)
      throw exception<vmm_error>(
          std::format("Failed to create {}", log.string()));
  }

  if (!fs::is_regular_file(base_rootfs))
    throw exception<configuration_error>(
        std::format("Rootfs file not found: {}", base_rootfs.string()));
  fs::copy_file(base_rootfs, paths.rootfs_file,
                fs::copy_options::overwrite_existing, ec);
  if (ec)
    throw exception<vmm_error>(std::format("Failed to copy {} to {}: {}",
                                           base_rootfs.string(),
                                           paths.rootfs_file.string(),
                                           ec.message()));

  fs::remove(paths.socket_path, ec);
}

spawn_result_t supervisor_t::spawn(const std::string &id,
                                   const instance_paths_t &paths,
                                   const fs::path &base_rootfs) {
  pid_t pid = 0;
  try {
    _prepare(paths, base_rootfs);
    debug("[Supervisor] {} prepared under {}", id, paths.root.string());

    pid = process_->start_detached_session(session_spec_t{
        .session_name = paths.session_name,
        .binary = binary_path_,
        .args = {"--api-sock", paths.socket_path.string(), "--id", id,
                 "--log-path", paths.hypervisor_log.string()},
        .log_path = paths.session_log,
    });

    bool ready = retry_until(socket_wait_, [&](size_t attempt) {
      if (!process_->process_alive(pid))
        throw exception<process_error>(
            std::format("Firecracker process for VMM {} exited", id));
      if (fs::exists(paths.socket_path))
        return true;
      debug("[Supervisor] waiting for {} (attempt {})",
            paths.socket_path.string(), attempt + 1);
      return false;
    });
    if (!ready)
      throw exception<api_error>(std::format(
          "API socket {} not available after {} attempts",
          paths.socket_path.string(), socket_wait_.attempts));

    return spawn_result_t{api_factory_(paths.socket_path), pid};
  } catch (const exception_base_t &e) {
    error("[Supervisor] failed to start VMM {}: {}", id, e.what());
    cleanup(paths, pid);
    throw;
  } catch (const std::filesystem::filesystem_error &e) {
    error("[Supervisor] failed to start VMM {}: {}", id, e.what());
    cleanup(paths, pid);
    throw exception<vmm_error>(e.what());
  }
}

bool supervisor_t::cleanup(const instance_paths_t &paths, pid_t pid) noexcept {
  bool ok = true;
  try {
    if (!process_->stop_session(paths.session_name, pid)) {
      warn("[Supervisor] session {} is still running", paths.session_name);
      ok = false;
    }
  } catch (const std::exception &e) {
    warn("[Supervisor] failed to stop {}: {}", paths.session_name, e.what());
    ok = false;
  }

  std::error_code ec;
  fs::remove_all(paths.root, ec);
  if (ec) {
    warn("[Supervisor] failed to remove {}: {}", paths.root.string(),
         ec.message());
    ok = false;
  }
  return ok;
}

} // namespace ember
