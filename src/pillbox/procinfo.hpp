#ifndef PILLBOX_PROCINFO_HPP__
#define PILLBOX_PROCINFO_HPP__

// functions for reading how much CPU and memory are being used by individual
// processes and their descendants.
//
// All of the queries work on a ProcessTable snapshot, normally the one held
// by a ProcessTableCache for the current tick.  A query for a pid that is not
// in the snapshot returns false; callers decide what a missing process means.

#include <set>
#include <string>

#include <pillbox/process_table.hpp>

namespace pillbox {

/**
 * Returns the children of |pid|, their children, and so on.
 *
 * Empty if |pid| has no children or is not in |table|.
 */
std::set<int> GetDescendants(const ProcessTable& table, int pid);

/**
 * Reports the CPU percentage of |pid|.  With |include_children|, the usage of
 * every descendant still in |table| is added in.
 */
bool CpuUsage(const ProcessTable& table, int pid, bool include_children,
    double* cpu_percent);

// Resident memory in KB, aggregated like CpuUsage().
bool MemoryUsage(const ProcessTable& table, int pid, bool include_children,
    double* rss_kb);

bool RunningTime(const ProcessTable& table, int pid, int* seconds);

bool Command(const ProcessTable& table, int pid, std::string* command);

/**
 * Checks whether a process with the given pid exists, using signal 0.
 *
 * A process we are not allowed to signal still exists, so EPERM counts as
 * alive.  A |pid| of zero or less names no single process and is never
 * alive.  Errors other than ESRCH are thrown as std::system_error.
 */
bool IsAlive(int pid);

}  // namespace pillbox

#endif   // PILLBOX_PROCINFO_HPP__
