#pragma once

#include <string>
#include <vector>

namespace ember {

struct command_result_t {
  /**
   * Exit status, or -1 if the command was killed by a signal
   */
  int status;

  /**
   * stdout and stderr, interleaved
   */
  std::string output;

  bool ok() const { return status == 0; }
};

/**
 * @brief Run `argv` to completion, searching PATH for `argv[0]`
 * @throws ember::exception_t<vmm_error> if the child cannot be started
 */
command_result_t run_command(const std::vector<std::string> &argv);

} // namespace ember
