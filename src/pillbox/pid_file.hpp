#ifndef PILLBOX_PID_FILE_HPP__
#define PILLBOX_PID_FILE_HPP__

// A pid file holds a single decimal pid and is created with mode 0644.

#include <sys/types.h>

#include <string>

#include <pillbox/logger.hpp>

namespace pillbox {

// Truncates |path| and writes |pid| to it.  Returns false and sets errno on
// failure.
bool WritePidFile(const std::string& path, pid_t pid);

/**
 * Checks that the current identity may create |path| by creating and removing
 * it.  On failure the reason is passed to |logger| and false is returned.
 */
bool CanWritePidFile(const std::string& path, Logger* logger);

/**
 * Removes |path| if it exists.
 *
 * A missing file is not an error.  A permission error is retried a few times
 * and then reported to |logger| as a warning.  Never throws.
 */
void DeleteIfExists(const std::string& path, Logger* logger);

}  // namespace pillbox

#endif  // PILLBOX_PID_FILE_HPP__
