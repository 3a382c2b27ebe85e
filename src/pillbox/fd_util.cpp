#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

#include <system_error>
#include <vector>

#include "fd_util.hpp"

namespace pillbox {

void CreatePipe(int fds[2]) {
  if (0 != pipe2(fds, O_CLOEXEC)) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
}

bool ReadAll(int fd, std::string* data) {
  char buf[4096];
  while (true) {
    const ssize_t status = read(fd, buf, sizeof(buf));
    if (status > 0) {
      data->append(buf, status);
    } else if (status == 0) {
      return true;
    } else if (errno != EINTR) {
      return false;
    }
  }
}

bool WriteAll(int fd, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t status = write(fd, data.data() + written,
        data.size() - written);
    if (status < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += status;
  }
  return true;
}

void DrainPipes(int out_fd, int err_fd, std::string* out, std::string* err) {
  struct pollfd pfds[2];
  pfds[0].fd = out_fd;
  pfds[0].events = POLLIN;
  pfds[1].fd = err_fd;
  pfds[1].events = POLLIN;
  std::string* sinks[2] = { out, err };

  int num_open = 2;
  while (num_open > 0) {
    if (poll(pfds, 2, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (int i = 0; i < 2; ++i) {
      if (pfds[i].fd < 0 ||
          !(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      char buf[4096];
      const ssize_t status = read(pfds[i].fd, buf, sizeof(buf));
      if (status > 0) {
        sinks[i]->append(buf, status);
      } else if (status == 0) {
        // poll() ignores negative descriptors
        pfds[i].fd = -1;
        --num_open;
      } else if (errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "read");
      }
    }
  }
}

static void SetCloseOnExec(int fd) {
  const int flags = fcntl(fd, F_GETFD);
  if (flags < 0) {
    // closed while we were looking
    if (errno == EBADF) {
      return;
    }
    throw std::system_error(errno, std::generic_category(), "fcntl");
  }
  if (!(flags & FD_CLOEXEC) && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
    throw std::system_error(errno, std::generic_category(), "fcntl");
  }
}

void SetCloseOnExecFrom(int lowest_fd) {
  DIR* dir = opendir("/proc/self/fd");
  if (!dir) {
    // no /proc, so try every descriptor we could possibly have
    const long max_fd = sysconf(_SC_OPEN_MAX);
    for (long fd = lowest_fd; fd < max_fd; ++fd) {
      SetCloseOnExec(static_cast<int>(fd));
    }
    return;
  }

  std::vector<int> fds;
  const int dir_fd = dirfd(dir);
  struct dirent* entry;
  while ((entry = readdir(dir)) != NULL) {
    char* end = NULL;
    const long fd = strtol(entry->d_name, &end, 10);
    if (*end != '\0' || end == entry->d_name) {
      // "." and ".."
      continue;
    }
    if (fd >= lowest_fd && fd != dir_fd) {
      fds.push_back(static_cast<int>(fd));
    }
  }
  closedir(dir);

  for (int fd : fds) {
    SetCloseOnExec(fd);
  }
}

bool WaitForPid(pid_t pid, int* status) {
  while (waitpid(pid, status, 0) < 0) {
    if (errno != EINTR) {
      return false;
    }
  }
  return true;
}

int ExitCodeFromStatus(int status) {
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return WEXITSTATUS(status);
}

}  // namespace pillbox
