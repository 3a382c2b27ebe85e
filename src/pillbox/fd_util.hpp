#ifndef PILLBOX_FD_UTIL_HPP__
#define PILLBOX_FD_UTIL_HPP__

// Pipe and descriptor helpers shared by Daemonize() and ExecuteBlocking().

#include <sys/types.h>

#include <string>

namespace pillbox {

// pipe2() with O_CLOEXEC on both ends.  Throws std::system_error.
void CreatePipe(int fds[2]);

// Reads from |fd| until end-of-stream, appending to |data|.  Returns false
// with errno set on a read error.
bool ReadAll(int fd, std::string* data);

// Writes all of |data| to |fd|.  Returns false with errno set on error.
bool WriteAll(int fd, const std::string& data);

/**
 * Reads |out_fd| and |err_fd| concurrently until both reach end-of-stream.
 *
 * Reading both at once keeps a child that fills one pipe from blocking
 * while we wait on the other.  Throws std::system_error.
 */
void DrainPipes(int out_fd, int err_fd, std::string* out, std::string* err);

/**
 * Marks every open descriptor numbered |lowest_fd| or higher close-on-exec,
 * so a command exec'd afterwards starts with only the descriptors below it.
 *
 * Throws std::system_error.
 */
void SetCloseOnExecFrom(int lowest_fd);

// waitpid() retried on EINTR.  Returns false with errno set on error.
bool WaitForPid(pid_t pid, int* status);

// Exit code for a wait status: the exit status, or 128 + signal number for a
// command killed by a signal.
int ExitCodeFromStatus(int status);

}  // namespace pillbox

#endif  // PILLBOX_FD_UTIL_HPP__
