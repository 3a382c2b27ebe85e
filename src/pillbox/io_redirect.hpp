#ifndef PILLBOX_IO_REDIRECT_HPP__
#define PILLBOX_IO_REDIRECT_HPP__

#include <string>

namespace pillbox {

/**
 * Rebinds the standard streams of the calling process.
 *
 * stdin is read from |stdin_path|.  stdout and stderr are opened in append
 * mode, created with mode 0644 if needed.  When both name the same file,
 * stderr shares stdout's open file so their output interleaves correctly.
 * An empty path leaves that stream as inherited.
 *
 * Throws std::system_error if a file can't be opened or dup2 fails.
 */
void RedirectIo(const std::string& stdin_path, const std::string& stdout_path,
    const std::string& stderr_path);

// dup2(fd, target_fd) then closes |fd|.  |target_fd| is left open across
// exec.  Throws std::system_error.
void MoveFd(int fd, int target_fd);

}  // namespace pillbox

#endif  // PILLBOX_IO_REDIRECT_HPP__
