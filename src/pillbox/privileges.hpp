#ifndef PILLBOX_PRIVILEGES_HPP__
#define PILLBOX_PRIVILEGES_HPP__

#include <sys/types.h>

#include <string>
#include <vector>

namespace pillbox {

// Names of the identity a command should run as.  Empty means "keep".
struct PrivilegeSpec {
  std::string user;
  std::string group;
  std::vector<std::string> supplementary_groups;
};

struct ResolvedIdentity {
  bool has_uid;
  uid_t uid;

  bool has_gid;
  gid_t gid;

  std::vector<gid_t> supplementary_gids;
};

/**
 * Looks up the numeric ids for the names in |spec|.
 *
 * Groups are resolved before the user.  Throws std::runtime_error naming the
 * first user or group that does not exist.
 */
ResolvedIdentity ResolveIdentity(const PrivilegeSpec& spec);

/**
 * Switches the calling process to the identity described by |spec|.
 *
 * Does nothing unless the effective uid is 0.  All names are resolved before
 * the first identity change, so an unknown name leaves the process untouched.
 * The group list is set first, then the gid, and the uid last, since dropping
 * the uid removes the right to change groups.  After a uid change HOME is set
 * to the user's home directory, when there is one.
 *
 * Only call this in a forked child.  Throws std::runtime_error for unknown
 * names and std::system_error if the kernel refuses a change.
 */
void DropPrivileges(const PrivilegeSpec& spec);

}  // namespace pillbox

#endif  // PILLBOX_PRIVILEGES_HPP__
