#ifndef PILLBOX_SPAWN_OPTIONS_HPP__
#define PILLBOX_SPAWN_OPTIONS_HPP__

#include <map>
#include <string>
#include <vector>

#include <pillbox/logger.hpp>
#include <pillbox/privileges.hpp>

namespace pillbox {

typedef std::map<std::string, std::string> StringStringMap;

// How a command is started by Daemonize() and ExecuteBlocking().
// Empty strings mean "not configured".
struct SpawnOptions {
  static SpawnOptions Defaults();

  // identity assumed by the command, when started as root
  PrivilegeSpec privileges;

  std::string working_dir;

  // merged into the inherited environment
  StringStringMap environment;

  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;

  // Daemonize() only
  std::string pid_file;

  // not owned.  NULL means DefaultLogger()
  Logger* logger;
};

/**
 * Changes to options.working_dir (also setting PWD, as a shell would) and
 * merges options.environment into the environment of the calling process.
 *
 * Only call this in a forked child.  Throws std::system_error.
 */
void ApplyWorkingDirAndEnvironment(const SpawnOptions& options);

}  // namespace pillbox

#endif  // PILLBOX_SPAWN_OPTIONS_HPP__
