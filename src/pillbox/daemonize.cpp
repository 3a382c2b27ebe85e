#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <stdexcept>
#include <system_error>

#include "daemonize.hpp"
#include "exec_string_utils.hpp"
#include "fd_util.hpp"
#include "io_redirect.hpp"
#include "pid_file.hpp"

namespace pillbox {

#if 1
#define dbg(...)
#else
#define dbg(...) do { dbgt(__VA_ARGS__); } while(0)
#endif

// Resolves |path| against the current directory, so that it still names the
// same file after the daemon changes directory.
static std::string AbsolutePath(const std::string& path) {
  if (path.empty() || path[0] == '/') {
    return path;
  }
  char* cwd = getcwd(NULL, 0);
  if (!cwd) {
    throw std::system_error(errno, std::generic_category(), "getcwd");
  }
  const std::string result = std::string(cwd) + "/" + path;
  free(cwd);
  return result;
}

static bool ParsePid(const std::string& payload, pid_t* pid) {
  if (payload.empty()) {
    return false;
  }
  char* end = NULL;
  const long value = strtol(payload.c_str(), &end, 10);
  if (*end != '\0' || value <= 0) {
    return false;
  }
  *pid = static_cast<pid_t>(value);
  return true;
}

// The daemon itself.  Publishes its pid, then becomes |command|.
static void RunDaemon(const std::string& command, const std::string& pid_file,
    int handoff_fd) {
  const pid_t pid = getpid();
  if (!pid_file.empty() && !WritePidFile(pid_file, pid)) {
    dbgt("unable to write pid file %s: %s\n", pid_file.c_str(),
        strerror(errno));
    _exit(1);
  }

  if (!WriteAll(handoff_fd, std::to_string(pid))) {
    dbgt("unable to report daemon pid: %s\n", strerror(errno));
    _exit(1);
  }
  close(handoff_fd);

  std::string error;
  ExecCommand(command, &error);

  // if execvp returns, the command did not execute successfully
  // (e.g. permission denied or bad path or something)
  dbgt("ERROR executing [%s]: %s\n", command.c_str(), error.c_str());
  _exit(kExecFailureStatus);
}

// The intermediate child.  Prepares the daemon's environment and detaches it
// from our session.  Exits without writing to |handoff_fd| on any failure.
static void RunIntermediate(const std::string& command,
    const SpawnOptions& options, int handoff_fd) {
  Logger* logger = options.logger ? options.logger : DefaultLogger();
  try {
    DropPrivileges(options.privileges);

    // if we cannot write the pid file as the target user, err out
    const std::string pid_file = AbsolutePath(options.pid_file);
    if (!pid_file.empty() && !CanWritePidFile(pid_file, logger)) {
      _exit(1);
    }

    ApplyWorkingDirAndEnvironment(options);
    RedirectIo(options.stdin_path, options.stdout_path, options.stderr_path);

    // the daemon keeps nothing of ours but its standard streams
    SetCloseOnExecFrom(STDERR_FILENO + 1);

    if (setsid() < 0) {
      throw std::system_error(errno, std::generic_category(), "setsid");
    }

    const pid_t pid = fork();
    if (pid < 0) {
      throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (0 == pid) {
      RunDaemon(command, pid_file, handoff_fd);
    }
    _exit(0);
  } catch (const std::exception& e) {
    logger->Warn("unable to daemonize [" + command + "]: " + e.what());
  }
  _exit(1);
}

pid_t Daemonize(const std::string& command, const SpawnOptions& options) {
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
    RunIntermediate(command, options, fds[1]);
  }

  close(fds[1]);

  std::string payload;
  const bool read_ok = ReadAll(fds[0], &payload);
  close(fds[0]);

  // The intermediate child has already closed its end of the pipe, so it has
  // exited or is about to.  Reap it so it never lingers as a zombie.  ECHILD
  // means the caller ignores SIGCHLD and the kernel reaped it for us.
  int status = 0;
  if (!WaitForPid(child, &status) && errno != ECHILD) {
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }

  pid_t daemon_pid = 0;
  if (!read_ok || !ParsePid(payload, &daemon_pid)) {
    throw std::runtime_error("daemonization failed");
  }
  dbg("daemonized [%s] as %d\n", command.c_str(), (int) daemon_pid);
  return daemon_pid;
}

}  // namespace pillbox
