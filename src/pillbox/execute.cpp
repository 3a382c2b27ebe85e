#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <stdexcept>
#include <system_error>

#include <glib.h>

#include "exec_string_utils.hpp"
#include "execute.hpp"
#include "fd_util.hpp"
#include "io_redirect.hpp"

namespace pillbox {

// GVariant type of a serialized ExecutionResult: stdout, stderr, exit code.
static const char kResultType[] = "(ayayi)";

static GVariant* NewByteArray(const std::string& data) {
  return g_variant_new_fixed_array(G_VARIANT_TYPE_BYTE, data.data(),
      data.size(), sizeof(guchar));
}

static std::string GetByteArray(GVariant* record, int index) {
  GVariant* child = g_variant_get_child_value(record, index);
  gsize len = 0;
  const gconstpointer data = g_variant_get_fixed_array(child, &len,
      sizeof(guchar));
  std::string result;
  if (data && len) {
    result.assign(static_cast<const char*>(data), len);
  }
  g_variant_unref(child);
  return result;
}

std::string SerializeExecutionResult(const ExecutionResult& result) {
  GVariant* record = g_variant_ref_sink(g_variant_new("(@ay@ayi)",
        NewByteArray(result.stdout_data),
        NewByteArray(result.stderr_data),
        static_cast<gint32>(result.exit_code)));
  const std::string data(static_cast<const char*>(g_variant_get_data(record)),
      g_variant_get_size(record));
  g_variant_unref(record);
  return data;
}

ExecutionResult DeserializeExecutionResult(const std::string& data) {
  ExecutionResult result;
  if (data.empty()) {
    return result;
  }

  GBytes* bytes = g_bytes_new(data.data(), data.size());
  GVariant* record = g_variant_ref_sink(g_variant_new_from_bytes(
        G_VARIANT_TYPE(kResultType), bytes, FALSE));
  g_bytes_unref(bytes);

  result.stdout_data = GetByteArray(record, 0);
  result.stderr_data = GetByteArray(record, 1);
  GVariant* exit_code = g_variant_get_child_value(record, 2);
  result.exit_code = g_variant_get_int32(exit_code);
  g_variant_unref(exit_code);

  g_variant_unref(record);
  return result;
}

// The grandchild.  Becomes |command| with its output going to the pipes.
static void RunCommand(const std::string& command, const SpawnOptions& options,
    int result_fd, const int out_fds[2], const int err_fds[2]) {
  // where to complain if we can't exec
  int diagnostic_fd = err_fds[1];
  try {
    // close unused fds so ancestors wont hang waiting for end-of-stream
    close(result_fd);
    close(out_fds[0]);
    close(err_fds[0]);

    DropPrivileges(options.privileges);
    ApplyWorkingDirAndEnvironment(options);

    // we do not care about stdin of cmd
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0) {
      throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }
    MoveFd(null_fd, STDIN_FILENO);
    MoveFd(out_fds[1], STDOUT_FILENO);
    diagnostic_fd = STDERR_FILENO;
    MoveFd(err_fds[1], STDERR_FILENO);

    std::string error;
    ExecCommand(command, &error);
    throw std::runtime_error(error);
  } catch (const std::exception& e) {
    dprintf(diagnostic_fd, "Exception in grandchild: %s.\n", e.what());
  }
  _exit(kExecFailureStatus);
}

// The child.  Runs the command in a grandchild, collects its output and exit
// status, and sends them back through |result_fd|.
static void RunCollector(const std::string& command,
    const SpawnOptions& options, int result_fd) {
  try {
    // create a child in which we can override the stdin, stdout and stderr
    int out_fds[2];
    int err_fds[2];
    CreatePipe(out_fds);
    CreatePipe(err_fds);

    const pid_t pid = fork();
    if (pid < 0) {
      throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (0 == pid) {
      RunCommand(command, options, result_fd, out_fds, err_fds);
    }

    // we do not use these ends of the pipes in the child
    close(out_fds[1]);
    close(err_fds[1]);

    ExecutionResult result;
    DrainPipes(out_fds[0], err_fds[0], &result.stdout_data,
        &result.stderr_data);
    close(out_fds[0]);
    close(err_fds[0]);

    // acknowledge the command's death
    int status = 0;
    if (!WaitForPid(pid, &status)) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    result.exit_code = ExitCodeFromStatus(status);

    // Time to tell the parent about what went down
    if (!WriteAll(result_fd, SerializeExecutionResult(result))) {
      throw std::system_error(errno, std::generic_category(), "write");
    }
    close(result_fd);
    _exit(0);
  } catch (const std::exception& e) {
    dbgt("unable to execute [%s]: %s\n", command.c_str(), e.what());
  }
  _exit(1);
}

ExecutionResult ExecuteBlocking(const std::string& command,
    const SpawnOptions& options) {
  int fds[2];
  CreatePipe(fds);

  const pid_t child = fork();
  if (child < 0) {
    const int fork_errno = errno;
    close(fds[0]);
    close(fds[1]);
    throw std::system_error(fork_errno, std::generic_category(), "fork");
  }
  if (0 == child) {
    close(fds[0]);
    RunCollector(command, options, fds[1]);
  }

  close(fds[1]);

  std::string payload;
  const bool read_ok = ReadAll(fds[0], &payload);
  const int read_errno = errno;
  close(fds[0]);

  int status = 0;
  if (!WaitForPid(child, &status) && errno != ECHILD) {
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (!read_ok) {
    throw std::system_error(read_errno, std::generic_category(), "read");
  }
  return DeserializeExecutionResult(payload);
}

}  // namespace pillbox
