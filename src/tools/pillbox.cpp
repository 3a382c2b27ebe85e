#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <exception>
#include <string>
#include <vector>

#include "pillbox/daemonize.hpp"
#include "pillbox/exec_string_utils.hpp"
#include "pillbox/execute.hpp"
#include "pillbox/procinfo.hpp"
#include "pillbox/process_table.hpp"

namespace pillbox {

static void usage() {
    fprintf (stderr, "usage: pillbox [options] run COMMAND\n"
            "       pillbox [options] daemonize COMMAND\n"
            "       pillbox [-c] usage PID\n"
            "       pillbox alive PID\n"
            "\n"
            "  -h, --help            shows this help text and exits\n"
            "  -u, --user NAME       run COMMAND as user NAME (root only)\n"
            "  -g, --group NAME      run COMMAND with primary group NAME\n"
            "  -G, --groups A,B,...  supplementary groups for COMMAND\n"
            "  -d, --chdir DIR       run COMMAND in DIR\n"
            "  -e, --env NAME=VALUE  add NAME=VALUE to the environment of COMMAND\n"
            "  -i, --stdin PATH      daemonize: read stdin from PATH\n"
            "  -o, --stdout PATH     daemonize: append stdout to PATH\n"
            "  -E, --stderr PATH     daemonize: append stderr to PATH\n"
            "  -p, --pid-file PATH   daemonize: write the daemon pid to PATH\n"
            "  -c, --children        usage: include all descendants of PID\n"
            "\n"
            "COMMAND is split into words like a shell would, but is never\n"
            "run by a shell.\n"
            "\n"
            "EXIT STATUS\n"
            "  run        exit status of COMMAND\n"
            "  daemonize  0 once the daemon is running, 1 otherwise\n"
            "  usage      0 if PID was found, 1 otherwise\n"
            "  alive      0 if PID exists, 1 otherwise\n"
          );
}

static bool ParsePidArg(const char* arg, int* pid) {
  char* end = NULL;
  const long value = strtol(arg, &end, 10);
  if (*arg == '\0' || *end != '\0' || value <= 0) {
    fprintf(stderr, "invalid pid [%s]\n", arg);
    return false;
  }
  *pid = static_cast<int>(value);
  return true;
}

static int RunCommand(const std::string& command,
    const SpawnOptions& options) {
  const ExecutionResult result = ExecuteBlocking(command, options);
  fwrite(result.stdout_data.data(), 1, result.stdout_data.size(), stdout);
  fwrite(result.stderr_data.data(), 1, result.stderr_data.size(), stderr);
  return result.exit_code;
}

static int DaemonizeCommand(const std::string& command,
    const SpawnOptions& options) {
  const pid_t pid = Daemonize(command, options);
  printf("%d\n", (int) pid);
  return 0;
}

static int PrintUsage(int pid, bool include_children) {
  ProcessTableCache cache;
  const ProcessTablePtr snapshot = cache.Snapshot();
  const ProcessTable& table = *snapshot;

  double cpu = 0;
  double rss = 0;
  int seconds = 0;
  std::string command;
  if (!CpuUsage(table, pid, include_children, &cpu) ||
      !MemoryUsage(table, pid, include_children, &rss) ||
      !RunningTime(table, pid, &seconds) ||
      !Command(table, pid, &command)) {
    fprintf(stderr, "no process %d\n", pid);
    return 1;
  }
  printf("pid:     %d\n", pid);
  printf("cpu:     %.1f%%\n", cpu);
  printf("rss:     %.0f KB\n", rss);
  printf("elapsed: %d s\n", seconds);
  printf("command: %s\n", command.c_str());
  if (include_children) {
    printf("descendants:");
    for (int child_pid : GetDescendants(table, pid)) {
      printf(" %d", child_pid);
    }
    printf("\n");
  }
  return 0;
}

}  // namespace pillbox

using namespace pillbox;

int main (int argc, char **argv) {
  const char *optstring = "hu:g:G:d:e:i:o:E:p:c";
  int c;
  struct option long_opts[] = {
    { "help", no_argument, 0, 'h' },
    { "user", required_argument, 0, 'u' },
    { "group", required_argument, 0, 'g' },
    { "groups", required_argument, 0, 'G' },
    { "chdir", required_argument, 0, 'd' },
    { "env", required_argument, 0, 'e' },
    { "stdin", required_argument, 0, 'i' },
    { "stdout", required_argument, 0, 'o' },
    { "stderr", required_argument, 0, 'E' },
    { "pid-file", required_argument, 0, 'p' },
    { "children", no_argument, 0, 'c' },
    { 0, 0, 0, 0 }
  };

  SpawnOptions options = SpawnOptions::Defaults();
  bool include_children = false;

  while ((c = getopt_long (argc, argv, optstring, long_opts, 0)) >= 0) {
    switch (c) {
      case 'u':
        options.privileges.user = optarg;
        break;
      case 'g':
        options.privileges.group = optarg;
        break;
      case 'G':
        for (const std::string& group : Split(optarg, ",", 0)) {
          if (!group.empty()) {
            options.privileges.supplementary_groups.push_back(group);
          }
        }
        break;
      case 'd':
        options.working_dir = optarg;
        break;
      case 'e':
        {
          const std::vector<std::string> parts = Split(optarg, "=", 2);
          if (parts.size() != 2 || parts[0].empty()) {
            fprintf(stderr, "expected NAME=VALUE, got [%s]\n", optarg);
            return 1;
          }
          options.environment[parts[0]] = parts[1];
        }
        break;
      case 'i':
        options.stdin_path = optarg;
        break;
      case 'o':
        options.stdout_path = optarg;
        break;
      case 'E':
        options.stderr_path = optarg;
        break;
      case 'p':
        options.pid_file = optarg;
        break;
      case 'c':
        include_children = true;
        break;
      case 'h':
      default:
        usage();
        return 1;
    }
  }

  if (argc - optind != 2) {
    usage();
    return 1;
  }
  const std::string action = argv[optind];
  const char* arg = argv[optind + 1];

  try {
    if (action == "run") {
      return RunCommand(arg, options);
    } else if (action == "daemonize") {
      return DaemonizeCommand(arg, options);
    } else if (action == "usage") {
      int pid;
      return ParsePidArg(arg, &pid) ? PrintUsage(pid, include_children) : 1;
    } else if (action == "alive") {
      int pid;
      if (!ParsePidArg(arg, &pid)) {
        return 1;
      }
      const bool alive = IsAlive(pid);
      printf("%d %s\n", pid, alive ? "alive" : "dead");
      return alive ? 0 : 1;
    }
  } catch (const std::exception& e) {
    fprintf(stderr, "pillbox: %s\n", e.what());
    return 1;
  }

  usage();
  return 1;
}
