#ifndef PILLBOX_EXECUTE_HPP__
#define PILLBOX_EXECUTE_HPP__

#include <string>

#include <pillbox/spawn_options.hpp>

namespace pillbox {

struct ExecutionResult {
  ExecutionResult() : exit_code(0) {}

  std::string stdout_data;
  std::string stderr_data;
  int exit_code;
};

/**
 * Runs |command| to completion and returns what it wrote and how it exited.
 *
 * The command runs in a grandchild with privileges dropped per
 * options.privileges, the configured working directory and environment, and
 * stdin bound to /dev/null.  A child of ours collects the grandchild's output
 * and exit status and sends them back to us over a pipe, so nothing the
 * command does can disturb the calling process.
 *
 * If the command can't be started, the reason is reported in stderr_data and
 * exit_code is 127.  A command killed by a signal reports 128 + the signal
 * number.  If no result comes back at all, an empty result with exit_code 0
 * is returned.
 *
 * Throws std::system_error if the pipe or the first fork could not be created
 * or the result could not be read.
 */
ExecutionResult ExecuteBlocking(const std::string& command,
    const SpawnOptions& options);

// Encodes |result| for transfer between processes.
std::string SerializeExecutionResult(const ExecutionResult& result);

/**
 * Decodes the output of SerializeExecutionResult().
 *
 * An empty |data| decodes to an empty result with exit_code 0.
 */
ExecutionResult DeserializeExecutionResult(const std::string& data);

}  // namespace pillbox

#endif  // PILLBOX_EXECUTE_HPP__
