#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <system_error>

#include "spawn_options.hpp"

namespace pillbox {

SpawnOptions SpawnOptions::Defaults() {
  SpawnOptions result;
  result.logger = nullptr;
  return result;
}

void ApplyWorkingDirAndEnvironment(const SpawnOptions& options) {
  if (!options.working_dir.empty()) {
    if (0 != chdir(options.working_dir.c_str())) {
      throw std::system_error(errno, std::generic_category(),
          "chdir " + options.working_dir);
    }
    if (0 != setenv("PWD", options.working_dir.c_str(), 1)) {
      throw std::system_error(errno, std::generic_category(), "setenv PWD");
    }
  }

  for (auto& item : options.environment) {
    if (0 != setenv(item.first.c_str(), item.second.c_str(), 1)) {
      throw std::system_error(errno, std::generic_category(),
          "setenv " + item.first);
    }
  }
}

}  // namespace pillbox
