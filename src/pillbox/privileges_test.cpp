#include <assert.h>
#include <pwd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "privileges.hpp"

using pillbox::DropPrivileges;
using pillbox::PrivilegeSpec;
using pillbox::ResolveIdentity;
using pillbox::ResolvedIdentity;

static const char kMissingName[] = "pillbox-no-such-name";

static std::vector<gid_t> CurrentGroups() {
  std::vector<gid_t> groups(getgroups(0, NULL));
  const int count = getgroups(groups.size(), groups.data());
  assert(count >= 0);
  groups.resize(count);
  return groups;
}

void TestResolveNothing() {
  const ResolvedIdentity identity = ResolveIdentity(PrivilegeSpec());
  assert(!identity.has_uid);
  assert(!identity.has_gid);
  assert(identity.supplementary_gids.empty());
}

void TestResolveRoot() {
  PrivilegeSpec spec;
  spec.user = "root";
  spec.group = "root";
  spec.supplementary_groups.push_back("root");
  const ResolvedIdentity identity = ResolveIdentity(spec);
  assert(identity.has_uid);
  assert(identity.uid == 0);
  assert(identity.has_gid);
  assert(identity.gid == 0);
  assert(identity.supplementary_gids.size() == 1);
  assert(identity.supplementary_gids[0] == 0);
}

void TestResolveUnknownNames() {
  PrivilegeSpec spec;
  spec.user = "root";
  spec.supplementary_groups.push_back(kMissingName);
  bool threw = false;
  try {
    ResolveIdentity(spec);
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(strstr(e.what(), kMissingName));
  }
  assert(threw);

  spec = PrivilegeSpec();
  spec.user = kMissingName;
  threw = false;
  try {
    ResolveIdentity(spec);
  } catch (const std::runtime_error& e) {
    threw = true;
    assert(strstr(e.what(), "unknown user"));
  }
  assert(threw);
}

void TestUnknownGroupLeavesIdentityAlone() {
  const uid_t uid = getuid();
  const uid_t euid = geteuid();
  const gid_t gid = getgid();
  const gid_t egid = getegid();
  const std::vector<gid_t> groups = CurrentGroups();

  PrivilegeSpec spec;
  spec.user = "nobody";
  spec.group = "root";
  spec.supplementary_groups.push_back(kMissingName);

  bool threw = false;
  try {
    DropPrivileges(spec);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  // only root ever attempts a drop
  assert(threw == (euid == 0));

  assert(getuid() == uid);
  assert(geteuid() == euid);
  assert(getgid() == gid);
  assert(getegid() == egid);
  assert(CurrentGroups() == groups);
}

void TestNotRootIsNoop() {
  if (geteuid() == 0) {
    printf("  running as root, skipping\n");
    return;
  }
  PrivilegeSpec spec;
  spec.user = "root";
  spec.group = "root";
  const uid_t uid = getuid();
  DropPrivileges(spec);
  assert(getuid() == uid);
}

void TestDropToNobody() {
  if (geteuid() != 0) {
    printf("  not running as root, skipping\n");
    return;
  }
  struct passwd* nobody = getpwnam("nobody");
  if (!nobody) {
    printf("  no user nobody, skipping\n");
    return;
  }
  const uid_t nobody_uid = nobody->pw_uid;
  const std::string nobody_home = nobody->pw_dir ? nobody->pw_dir : "";

  const pid_t child = fork();
  assert(child >= 0);
  if (0 == child) {
    PrivilegeSpec spec;
    spec.user = "nobody";
    try {
      DropPrivileges(spec);
    } catch (const std::exception& e) {
      fprintf(stderr, "%s\n", e.what());
      _exit(2);
    }
    const char* home = getenv("HOME");
    const bool ok = getuid() == nobody_uid && geteuid() == nobody_uid &&
      home && nobody_home == home;
    _exit(ok ? 0 : 1);
  }
  int status;
  assert(waitpid(child, &status, 0) == child);
  assert(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

int main(int argc, char** argv) {
  printf("TestResolveNothing\n");
  TestResolveNothing();
  printf("TestResolveRoot\n");
  TestResolveRoot();
  printf("TestResolveUnknownNames\n");
  TestResolveUnknownNames();
  printf("TestUnknownGroupLeavesIdentityAlone\n");
  TestUnknownGroupLeavesIdentityAlone();
  printf("TestNotRootIsNoop\n");
  TestNotRootIsNoop();
  printf("TestDropToNobody\n");
  TestDropToNobody();

  printf("All tests passed\n");
}
