#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "pid_file.hpp"

namespace pillbox {

// Attempts made to unlink a pid file we lack permission to remove.
static const int kMaxDeleteAttempts = 3;

bool WritePidFile(const std::string& path, pid_t pid) {
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
      0644);
  if (fd < 0) {
    return false;
  }
  // not subject to the umask
  if (0 != fchmod(fd, 0644)) {
    const int chmod_errno = errno;
    close(fd);
    errno = chmod_errno;
    return false;
  }

  char buf[32];
  const int len = snprintf(buf, sizeof(buf), "%d", (int) pid);
  int written = 0;
  while (written < len) {
    const ssize_t status = write(fd, buf + written, len - written);
    if (status < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int write_errno = errno;
      close(fd);
      errno = write_errno;
      return false;
    }
    written += status;
  }
  return 0 == close(fd);
}

bool CanWritePidFile(const std::string& path, Logger* logger) {
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    logger->Warn("cannot create pid file " + path + ": " + strerror(errno));
    return false;
  }
  close(fd);
  if (0 != unlink(path.c_str())) {
    logger->Warn("cannot remove pid file " + path + ": " + strerror(errno));
    return false;
  }
  return true;
}

void DeleteIfExists(const std::string& path, Logger* logger) {
  if (path.empty()) {
    return;
  }
  for (int attempt = 1; attempt <= kMaxDeleteAttempts; ++attempt) {
    if (0 == unlink(path.c_str()) || errno == ENOENT) {
      return;
    }
    if (errno != EACCES && errno != EPERM) {
      logger->Warn("unable to delete " + path + ": " + strerror(errno));
      return;
    }
  }
  logger->Warn("permission denied trying to delete " + path);
}

}  // namespace pillbox
