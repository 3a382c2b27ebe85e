#ifndef PILLBOX_DAEMONIZE_HPP__
#define PILLBOX_DAEMONIZE_HPP__

#include <sys/types.h>

#include <string>

#include <pillbox/spawn_options.hpp>

namespace pillbox {

/**
 * Starts |command| as a daemon and returns the daemon's pid.
 *
 * The calling process forks an intermediate child that drops privileges,
 * checks that options.pid_file is writable, applies the working directory,
 * environment and stream redirections, and then starts a new session and
 * forks the daemon.  The daemon writes its pid to the pid file and back to
 * the caller through a pipe before exec'ing |command|.  The intermediate
 * child exits right away and is reaped here.
 *
 * |command| is split into words with shell quoting rules and run directly,
 * never through a shell.
 *
 * Throws std::runtime_error("daemonization failed") if no pid came back, and
 * std::system_error if the pipe or the first fork could not be created.
 */
pid_t Daemonize(const std::string& command, const SpawnOptions& options);

}  // namespace pillbox

#endif  // PILLBOX_DAEMONIZE_HPP__
