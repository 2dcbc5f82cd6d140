#include "command.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "exception.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace ember {

command_result_t run_command(const std::vector<std::string> &argv) {
  if (argv.empty())
    throw exception<vmm_error>("Empty command line");

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw exception<vmm_error>(
        std::format("pipe() failed: {}", std::strerror(errno)));

  // The child may only make async-signal-safe calls
  std::vector<char *> c_args;
  for (const auto &arg : argv)
    c_args.push_back(const_cast<char *>(arg.c_str()));
  c_args.push_back(nullptr);

  auto pid = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw exception<vmm_error>(
        std::format("fork() failed: {}", std::strerror(errno)));
  }
  if (pid == 0) {
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::execvp(c_args[0], c_args.data());
    _exit(127);
  }
  ::close(fds[1]);

  command_result_t rv{-1, ""};
  char buf[4096];
  while (true) {
    auto n = ::read(fds[0], buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    rv.output.append(buf, static_cast<size_t>(n));
  }
  ::close(fds[0]);

  int wstatus = 0;
  while (::waitpid(pid, &wstatus, 0) < 0) {
    if (errno != EINTR)
      throw exception<vmm_error>(
          std::format("waitpid() failed: {}", std::strerror(errno)));
  }
  if (WIFEXITED(wstatus))
    rv.status = WEXITSTATUS(wstatus);

  debug("[Command] `{}` exited with {}", utils::join(" ", argv), rv.status);
  return rv;
}

} // namespace ember
