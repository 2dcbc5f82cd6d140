#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "instance.hpp"

namespace ember {

class registry_t;

/**
 * @brief Scoped hold on the registry's advisory lock
 */
class registry_lock_t {
public:
  explicit registry_lock_t(registry_t &registry);

  registry_lock_t(const registry_lock_t &) = delete;

  registry_lock_t &operator=(const registry_lock_t &) = delete;

  ~registry_lock_t();

private:
  registry_t &registry_;
};

/**
 * @brief File-backed store of instance records
 * @details
 * Layout under the data path:
 *
 * ```
 * <data_path>/.lock              advisory flock serializing mutations
 * <data_path>/.ids               append-only ledger of every id handed out
 * <data_path>/<id>/config.json   the record of instance <id>
 * ```
 *
 * Documents are replaced by writing a sibling temporary file, flushing it,
 * and renaming it over the original, so readers observe either the old or
 * the new document. Mutating methods take the lock themselves; callers that
 * need a larger critical section (check-then-act across calls) hold a
 * `registry_lock_t` around it. The lock is reentrant within one registry.
 */
class registry_t {
public:
  explicit registry_t(const std::filesystem::path &data_path);

  registry_t(const registry_t &) = delete;

  registry_t &operator=(const registry_t &) = delete;

  ~registry_t();

  const std::filesystem::path &data_path() const { return data_path_; }

  std::filesystem::path instance_dir(const std::string &id) const;

  std::filesystem::path document_path(const std::string &id) const;

  /**
   * @brief Hand out an id that was never handed out before
   */
  std::string reserve_id();

  /**
   * @throws ember::exception_t<conflict_error> if an active instance already
   * uses the record's name
   */
  void create(const instance_record_t &record);

  std::optional<instance_record_t> get(const std::string &id) const;

  /**
   * @brief Every readable record, oldest first
   */
  std::vector<instance_record_t> list() const;

  std::optional<instance_record_t> find_by_name(const std::string &name) const;

  std::vector<instance_record_t>
  find_by_state_and_labels(instance_state_t state,
                           const labels_t &labels) const;

  /**
   * @throws ember::exception_t<not_found_error> if the record is absent
   */
  void update_state(const std::string &id, instance_state_t state);

  /**
   * @throws ember::exception_t<not_found_error> if the record is absent
   */
  void update_ports(const std::string &id, const port_map_t &ports);

  /**
   * @brief Remove the record and the whole instance directory
   * @return false if nothing existed for `id`
   */
  bool remove(const std::string &id);

  bool check_ip_in_use(const std::string &ip) const;

  std::set<std::string> ips_in_use() const;

  registry_lock_t lock() { return registry_lock_t(*this); }

private:
  friend class registry_lock_t;

  void acquire();

  void release();

  void write_record(const instance_record_t &record);

  std::optional<instance_record_t>
  read_record(const std::filesystem::path &path) const;

  std::filesystem::path data_path_;

  std::recursive_mutex mutex_;

  int lock_fd_ = -1;

  size_t lock_depth_ = 0;
};

/**
 * @brief Replace `path` with `content` atomically
 * @throws ember::exception_t<registry_error> on I/O failure
 */
void write_file_atomic(const std::filesystem::path &path,
                       const std::string &content);

} // namespace ember
