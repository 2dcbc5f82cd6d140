#include "registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unordered_set>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "exception.hpp"
#include "id.hpp"
#include "logging.hpp"

namespace fs = std::filesystem;

namespace ember {

namespace {

const std::string document_name = "config.json";

std::string errno_string() { return std::strerror(errno); }

void write_all(int fd, const std::string &content, const fs::path &path) {
  size_t written = 0;
  while (written < content.size()) {
    ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw exception<registry_error>(
          std::format("Failed to write {}: {}", path.string(), errno_string()));
    }
    written += static_cast<size_t>(n);
  }
}

bool is_active(const instance_record_t &record) {
  return record.state != instance_state_t::deleted;
}

} // namespace

void write_file_atomic(const fs::path &path, const std::string &content) {
  fs::path tmp = path;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0)
    throw exception<registry_error>(
        std::format("Failed to open {}: {}", tmp.string(), errno_string()));
  try {
    write_all(fd, content, tmp);
  } catch (const exception_base_t &) {
    ::close(fd);
    ::unlink(tmp.c_str());
    throw;
  }
  if (::fsync(fd) != 0) {
    auto cause = errno_string();
    ::close(fd);
    ::unlink(tmp.c_str());
    throw exception<registry_error>(
        std::format("Failed to flush {}: {}", tmp.string(), cause));
  }
  ::close(fd);

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    auto cause = errno_string();
    ::unlink(tmp.c_str());
    throw exception<registry_error>(
        std::format("Failed to replace {}: {}", path.string(), cause));
  }

  // Persist the rename itself
  int dirfd = ::open(path.parent_path().c_str(), O_RDONLY | O_DIRECTORY);
  if (dirfd >= 0) {
    ::fsync(dirfd);
    ::close(dirfd);
  }
}

registry_lock_t::registry_lock_t(registry_t &registry) : registry_(registry) {
  registry_.acquire();
}

registry_lock_t::~registry_lock_t() { registry_.release(); }

registry_t::registry_t(const fs::path &data_path) : data_path_(data_path) {
  std::error_code ec;
  fs::create_directories(data_path_, ec);
  if (ec)
    throw exception<registry_error>(
        std::format("Failed to create data path {}: {}", data_path_.string(),
                    ec.message()));
}

registry_t::~registry_t() {
  if (lock_fd_ >= 0)
    ::close(lock_fd_);
}

fs::path registry_t::instance_dir(const std::string &id) const {
  return data_path_ / id;
}

fs::path registry_t::document_path(const std::string &id) const {
  return instance_dir(id) / document_name;
}

void registry_t::acquire() {
  mutex_.lock();
  if (lock_depth_++ > 0)
    return;

  auto path = data_path_ / ".lock";
  lock_fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lock_fd_ < 0) {
    auto cause = errno_string();
    lock_depth_--;
    mutex_.unlock();
    throw exception<registry_error>(
        std::format("Failed to open {}: {}", path.string(), cause));
  }
  int rc;
  do {
    rc = ::flock(lock_fd_, LOCK_EX);
  } while (rc != 0 && errno == EINTR);
  if (rc != 0) {
    auto cause = errno_string();
    ::close(lock_fd_);
    lock_fd_ = -1;
    lock_depth_--;
    mutex_.unlock();
    throw exception<registry_error>(
        std::format("Failed to lock {}: {}", path.string(), cause));
  }
}

void registry_t::release() {
  if (--lock_depth_ == 0 && lock_fd_ >= 0) {
    ::flock(lock_fd_, LOCK_UN);
    ::close(lock_fd_);
    lock_fd_ = -1;
  }
  mutex_.unlock();
}

std::string registry_t::reserve_id() {
  auto guard = lock();
  auto ledger_path = data_path_ / ".ids";

  std::unordered_set<std::string> used;
  {
    std::ifstream ifs(ledger_path);
    std::string line;
    while (std::getline(ifs, line))
      if (!line.empty())
        used.insert(line);
  }

  for (size_t i = 0; i < 16; i++) {
    auto id = generate_id();
    if (used.contains(id) || fs::exists(instance_dir(id)))
      continue;

    int fd = ::open(ledger_path.c_str(),
                    O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0)
      throw exception<registry_error>(std::format(
          "Failed to open {}: {}", ledger_path.string(), errno_string()));
    try {
      write_all(fd, id + "\n", ledger_path);
    } catch (const exception_base_t &) {
      ::close(fd);
      throw;
    }
    ::fsync(fd);
    ::close(fd);
    debug("[Registry] reserved id {}", id);
    return id;
  }
  throw exception<registry_error>("Failed to generate an unused instance id");
}

void registry_t::create(const instance_record_t &record) {
  auto guard = lock();
  auto existing = find_by_name(record.name);
  if (existing.has_value() && existing->id != record.id)
    throw exception<conflict_error>(
        std::format("VMM with name {} already exists", record.name));
  write_record(record);
  debug("[Registry] created record {} ({})", record.id, record.name);
}

std::optional<instance_record_t> registry_t::get(const std::string &id) const {
  if (id.empty() || id.find('/') != std::string::npos || id.starts_with("."))
    return std::nullopt;
  return read_record(document_path(id));
}

std::vector<instance_record_t> registry_t::list() const {
  std::vector<instance_record_t> rv;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(data_path_, ec)) {
    if (!entry.is_directory())
      continue;
    auto name = entry.path().filename().string();
    if (name.starts_with("."))
      continue;
    auto doc = entry.path() / document_name;
    if (!fs::exists(doc))
      continue;
    if (auto record = read_record(doc))
      rv.push_back(std::move(record.value()));
  }
  if (ec)
    warn("[Registry] cannot list {}: {}", data_path_.string(), ec.message());

  std::sort(rv.begin(), rv.end(), [](const auto &a, const auto &b) {
    if (a.created_at != b.created_at)
      return a.created_at < b.created_at;
    return a.id < b.id;
  });
  return rv;
}

std::optional<instance_record_t>
registry_t::find_by_name(const std::string &name) const {
  for (auto &record : list())
    if (is_active(record) && record.name == name)
      return record;
  return std::nullopt;
}

std::vector<instance_record_t>
registry_t::find_by_state_and_labels(instance_state_t state,
                                     const labels_t &labels) const {
  std::vector<instance_record_t> rv;
  for (auto &record : list())
    if (record.state == state && record.matches_labels(labels))
      rv.push_back(std::move(record));
  return rv;
}

void registry_t::update_state(const std::string &id, instance_state_t state) {
  auto guard = lock();
  auto record = get(id);
  if (!record.has_value())
    throw exception<not_found_error>(
        std::format("VMM with ID {} not found", id));
  record->state = state;
  write_record(record.value());
  debug("[Registry] {} is now {}", id, to_string(state));
}

void registry_t::update_ports(const std::string &id, const port_map_t &ports) {
  auto guard = lock();
  auto record = get(id);
  if (!record.has_value())
    throw exception<not_found_error>(
        std::format("VMM with ID {} not found", id));
  record->ports = ports;
  write_record(record.value());
}

bool registry_t::remove(const std::string &id) {
  auto guard = lock();
  if (id.empty() || id.find('/') != std::string::npos || id.starts_with("."))
    return false;
  auto dir = instance_dir(id);
  std::error_code ec;
  if (!fs::exists(dir, ec))
    return false;

  fs::remove(document_path(id), ec);
  fs::remove_all(dir, ec);
  if (ec)
    throw exception<registry_error>(std::format(
        "Failed to remove {}: {}", dir.string(), ec.message()));
  debug("[Registry] removed {}", id);
  return true;
}

bool registry_t::check_ip_in_use(const std::string &ip) const {
  return ips_in_use().contains(ip);
}

std::set<std::string> registry_t::ips_in_use() const {
  std::set<std::string> rv;
  for (const auto &record : list()) {
    if (!is_active(record))
      continue;
    for (const auto &[tap, entry] : record.network)
      rv.insert(entry.ip_address);
  }
  return rv;
}

void registry_t::write_record(const instance_record_t &record) {
  auto dir = instance_dir(record.id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw exception<registry_error>(std::format(
        "Failed to create {}: {}", dir.string(), ec.message()));
  std::string text;
  try {
    nlohmann::json j = record;
    text = j.dump(2);
  } catch (const nlohmann::json::exception &e) {
    throw exception<registry_error>(
        std::format("Failed to serialize VMM {}: {}", record.id, e.what()));
  }
  write_file_atomic(document_path(record.id), text);
}

std::optional<instance_record_t>
registry_t::read_record(const fs::path &path) const {
  std::ifstream ifs(path);
  if (!ifs)
    return std::nullopt;
  try {
    auto j = nlohmann::json::parse(ifs);
    return j.get<instance_record_t>();
  } catch (const nlohmann::json::exception &e) {
    warn("[Registry] skipping unreadable record {}: {}", path.string(),
         e.what());
    return std::nullopt;
  }
}

} // namespace ember
