#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

#include "io_redirect.hpp"

namespace pillbox {

static int OpenOrThrow(const std::string& path, int flags) {
  const int fd = open(path.c_str(), flags, 0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + path);
  }
  return fd;
}

static int OpenForAppend(const std::string& path) {
  return OpenOrThrow(path, O_WRONLY | O_APPEND | O_CREAT);
}

void MoveFd(int fd, int target_fd) {
  if (fd == target_fd) {
    // already in place, but it has to survive exec
    const int flags = fcntl(fd, F_GETFD);
    if (flags < 0 || fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) < 0) {
      throw std::system_error(errno, std::generic_category(), "fcntl");
    }
    return;
  }
  if (dup2(fd, target_fd) < 0) {
    const int dup_errno = errno;
    close(fd);
    throw std::system_error(dup_errno, std::generic_category(), "dup2");
  }
  close(fd);
}

void RedirectIo(const std::string& stdin_path, const std::string& stdout_path,
    const std::string& stderr_path) {
  if (!stdin_path.empty()) {
    MoveFd(OpenOrThrow(stdin_path, O_RDONLY), STDIN_FILENO);
  }

  if (!stdout_path.empty() && stdout_path == stderr_path) {
    MoveFd(OpenForAppend(stdout_path), STDOUT_FILENO);
    if (dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
      throw std::system_error(errno, std::generic_category(), "dup2");
    }
    return;
  }

  if (!stdout_path.empty()) {
    MoveFd(OpenForAppend(stdout_path), STDOUT_FILENO);
  }
  if (!stderr_path.empty()) {
    MoveFd(OpenForAppend(stderr_path), STDERR_FILENO);
  }
}

}  // namespace pillbox
