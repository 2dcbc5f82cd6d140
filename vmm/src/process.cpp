#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

#include "command.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "retry.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

namespace ember {

namespace {

/**
 * Fields of /proc/<pid>/stat following the parenthesized command name,
 * so that index 0 is the process state (field 3)
 */
std::vector<std::string> read_stat_fields(pid_t pid) {
  std::ifstream ifs(fs::path("/proc") / std::to_string(pid) / "stat");
  if (!ifs)
    return {};
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  auto close = content.rfind(')');
  if (close == std::string::npos)
    return {};
  std::istringstream iss(content.substr(close + 1));
  std::vector<std::string> fields;
  std::string field;
  while (iss >> field)
    fields.push_back(field);
  return fields;
}

std::optional<long long> boot_time() {
  std::ifstream ifs("/proc/stat");
  std::string key;
  while (ifs >> key) {
    if (key == "btime") {
      long long btime;
      if (ifs >> btime)
        return btime;
      return std::nullopt;
    }
    ifs.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
  }
  return std::nullopt;
}

} // namespace

std::vector<std::string> read_cmdline(pid_t pid) {
  std::ifstream ifs(fs::path("/proc") / std::to_string(pid) / "cmdline");
  std::vector<std::string> rv;
  std::string arg;
  while (std::getline(ifs, arg, '\0'))
    rv.push_back(arg);
  return rv;
}

std::optional<std::string> process_start_time(pid_t pid) {
  auto fields = read_stat_fields(pid);
  // starttime is field 22
  if (fields.size() < 20 || !utils::is_digits(fields[19]))
    return std::nullopt;
  auto btime = boot_time();
  if (!btime.has_value())
    return std::nullopt;

  long ticks = ::sysconf(_SC_CLK_TCK);
  auto start_ticks = std::stoll(fields[19]);
  std::chrono::sys_seconds start{
      std::chrono::seconds(btime.value() + start_ticks / ticks)};
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", start);
}

screen_process_manager_t::screen_process_manager_t(
    const fs::path &binary_path)
    : binary_name_(binary_path.filename().string()) {}

pid_t screen_process_manager_t::start_detached_session(
    const session_spec_t &spec) {
  std::vector<std::string> args = {"screen",
                                   "-D",
                                   "-m",
                                   "-L",
                                   "-Logfile",
                                   spec.log_path.string(),
                                   "-S",
                                   spec.session_name,
                                   spec.binary.string()};
  args.insert(args.end(), spec.args.begin(), spec.args.end());
  std::vector<char *> c_args;
  for (auto &arg : args)
    c_args.push_back(&arg[0]);
  c_args.push_back(nullptr);

  auto pid = ::fork();
  if (pid < 0)
    throw exception<process_error>(
        std::format("fork() failed: {}", std::strerror(errno)));
  if (pid == 0) {
    // Detach from the caller's terminal and process group
    ::setsid();
    ::execvp(c_args[0], c_args.data());
    _exit(127);
  }

  debug("[Process] started session {} (pid {})", spec.session_name, pid);
  return pid;
}

bool screen_process_manager_t::process_alive(pid_t pid) {
  if (pid <= 0)
    return false;

  // Reap our own children so that they do not linger as zombies
  int wstatus;
  auto rc = ::waitpid(pid, &wstatus, WNOHANG);
  if (rc == pid)
    return false;

  if (::kill(pid, 0) != 0 && errno == ESRCH)
    return false;

  auto fields = read_stat_fields(pid);
  if (!fields.empty() && (fields[0] == "Z" || fields[0] == "X"))
    return false;
  return true;
}

std::optional<process_info_t>
screen_process_manager_t::get_pid_and_start_time(
    const std::string &instance_id) {
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator("/proc", ec)) {
    auto name = entry.path().filename().string();
    if (!utils::is_digits(name))
      continue;
    pid_t pid = std::stoi(name);
    auto cmdline = read_cmdline(pid);
    if (cmdline.empty() ||
        fs::path(cmdline[0]).filename().string() != binary_name_)
      continue;

    auto it = std::find(cmdline.begin(), cmdline.end(), "--id");
    if (it == cmdline.end() || std::next(it) == cmdline.end() ||
        *std::next(it) != instance_id)
      continue;

    auto started = process_start_time(pid);
    return process_info_t{pid, started.value_or("")};
  }
  if (ec)
    warn("[Process] cannot scan /proc: {}", ec.message());
  return std::nullopt;
}

bool screen_process_manager_t::paste_file(const std::string &session_name,
                                          const fs::path &path) {
  // Load the file into the paste buffer of the session, then type it out
  auto result = run_command(
      {"screen", "-S", session_name, "-X", "readbuf", path.string()});
  if (!result.ok()) {
    warn("[Process] screen -X readbuf failed for {}: {}", session_name,
         result.output);
    return false;
  }
  result = run_command({"screen", "-S", session_name, "-X", "paste", "."});
  if (!result.ok())
    warn("[Process] screen -X paste failed for {}: {}", session_name,
         result.output);
  return result.ok();
}

bool screen_process_manager_t::stop_session(const std::string &session_name,
                                            pid_t pid) {
  auto result = run_command({"screen", "-S", session_name, "-X", "quit"});
  if (!result.ok())
    debug("[Process] no session {} to quit", session_name);

  if (pid <= 0 || !process_alive(pid))
    return true;

  ::kill(pid, SIGTERM);
  retry_t policy{.attempts = 20, .interval = std::chrono::milliseconds(100)};
  if (retry_until(policy, [&](size_t) { return !process_alive(pid); }))
    return true;

  warn("[Process] pid {} ignored SIGTERM, killing", pid);
  ::kill(pid, SIGKILL);
  policy.attempts = 10;
  return retry_until(policy, [&](size_t) { return !process_alive(pid); });
}

} // namespace ember
