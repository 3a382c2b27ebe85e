#include <errno.h>
#include <signal.h>
#include <sys/types.h>

#include <map>
#include <system_error>
#include <utility>
#include <vector>

#include "procinfo.hpp"

namespace pillbox {

typedef std::multimap<int, int> ChildMap;

static void GetDescendantsRecursive(const ChildMap& children, int pid,
    std::set<int>* result) {
  auto range = children.equal_range(pid);
  for (auto iter = range.first; iter != range.second; ++iter) {
    const int child_pid = iter->second;
    // guard against a corrupt table feeding us a ppid cycle
    if (!result->insert(child_pid).second) {
      continue;
    }
    GetDescendantsRecursive(children, child_pid, result);
  }
}

std::set<int> GetDescendants(const ProcessTable& table, int pid) {
  std::set<int> result;
  if (table.find(pid) == table.end()) {
    return result;
  }

  // a ppid that is not in the table means no parent
  ChildMap children;
  for (const auto& item : table) {
    const ProcessRecord& record = item.second;
    if (record.pid != record.ppid && table.count(record.ppid)) {
      children.insert(std::make_pair(record.ppid, record.pid));
    }
  }

  GetDescendantsRecursive(children, pid, &result);
  result.erase(pid);
  return result;
}

static bool SumUsage(const ProcessTable& table, int pid, bool include_children,
    double ProcessRecord::* field, double* result) {
  auto iter = table.find(pid);
  if (iter == table.end()) {
    return false;
  }

  double used = iter->second.*field;
  if (include_children) {
    for (int child_pid : GetDescendants(table, pid)) {
      auto child = table.find(child_pid);
      if (child != table.end()) {
        used += child->second.*field;
      }
    }
  }
  *result = used;
  return true;
}

bool CpuUsage(const ProcessTable& table, int pid, bool include_children,
    double* cpu_percent) {
  return SumUsage(table, pid, include_children, &ProcessRecord::cpu_percent,
      cpu_percent);
}

bool MemoryUsage(const ProcessTable& table, int pid, bool include_children,
    double* rss_kb) {
  return SumUsage(table, pid, include_children, &ProcessRecord::rss_kb,
      rss_kb);
}

bool RunningTime(const ProcessTable& table, int pid, int* seconds) {
  auto iter = table.find(pid);
  if (iter == table.end()) {
    return false;
  }
  *seconds = iter->second.elapsed_seconds;
  return true;
}

bool Command(const ProcessTable& table, int pid, std::string* command) {
  auto iter = table.find(pid);
  if (iter == table.end()) {
    return false;
  }
  *command = iter->second.command;
  return true;
}

bool IsAlive(int pid) {
  // kill() treats 0 and negative pids as process groups
  if (pid <= 0) {
    return false;
  }
  if (0 == kill(pid, 0)) {
    return true;
  }
  switch (errno) {
    case EPERM:
      // no permission, but it is definitely alive
      return true;
    case ESRCH:
      return false;
    default:
      throw std::system_error(errno, std::generic_category(), "kill");
  }
}

}  // namespace pillbox
