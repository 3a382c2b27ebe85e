#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "privileges.hpp"

namespace pillbox {

static gid_t LookupGroup(const std::string& name) {
  struct group* entry = getgrnam(name.c_str());
  if (!entry) {
    throw std::runtime_error("unknown group: " + name);
  }
  return entry->gr_gid;
}

static void ThrowErrno(const char* what) {
  throw std::system_error(errno, std::generic_category(), what);
}

ResolvedIdentity ResolveIdentity(const PrivilegeSpec& spec) {
  ResolvedIdentity result;
  result.has_uid = false;
  result.uid = 0;
  result.has_gid = false;
  result.gid = 0;

  if (!spec.group.empty()) {
    result.gid = LookupGroup(spec.group);
    result.has_gid = true;
  }
  for (const std::string& name : spec.supplementary_groups) {
    result.supplementary_gids.push_back(LookupGroup(name));
  }

  if (!spec.user.empty()) {
    struct passwd* entry = getpwnam(spec.user.c_str());
    if (!entry) {
      throw std::runtime_error("unknown user: " + spec.user);
    }
    result.uid = entry->pw_uid;
    result.has_uid = true;
  }
  return result;
}

void DropPrivileges(const PrivilegeSpec& spec) {
  if (geteuid() != 0) {
    return;
  }

  const ResolvedIdentity identity = ResolveIdentity(spec);

  if (identity.has_gid) {
    if (0 != setgroups(1, &identity.gid)) {
      ThrowErrno("setgroups");
    }
  }

  if (!identity.supplementary_gids.empty()) {
    const int count = getgroups(0, NULL);
    if (count < 0) {
      ThrowErrno("getgroups");
    }
    std::vector<gid_t> groups(count);
    if (count > 0 && getgroups(count, groups.data()) < 0) {
      ThrowErrno("getgroups");
    }
    for (gid_t gid : identity.supplementary_gids) {
      if (std::find(groups.begin(), groups.end(), gid) == groups.end()) {
        groups.push_back(gid);
      }
    }
    if (0 != setgroups(groups.size(), groups.data())) {
      ThrowErrno("setgroups");
    }
  }

  if (identity.has_gid) {
    if (0 != setregid(identity.gid, identity.gid)) {
      ThrowErrno("setregid");
    }
  }

  if (identity.has_uid) {
    if (0 != setreuid(identity.uid, identity.uid)) {
      ThrowErrno("setreuid");
    }

    struct passwd* entry = getpwuid(identity.uid);
    if (entry && entry->pw_dir) {
      setenv("HOME", entry->pw_dir, 1);
    }
  }
}

}  // namespace pillbox
