#ifndef PILLBOX_TEST_UTIL_HPP__
#define PILLBOX_TEST_UTIL_HPP__

// Helpers shared by the *_test.cpp programs.

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "logger.hpp"

namespace pillbox {

class RecordingLogger : public Logger {
  public:
    void Warn(const std::string& message) override {
      warnings.push_back(message);
    }

    std::vector<std::string> warnings;
};

// Creates a fresh directory under /tmp.
inline std::string MakeTempDir() {
  char path[] = "/tmp/pillbox_test.XXXXXX";
  if (!mkdtemp(path)) {
    perror("mkdtemp");
    abort();
  }
  return path;
}

// Returns the contents of |path|, or an empty string if it can't be read.
inline std::string ReadFile(const std::string& path) {
  std::string result;
  FILE* fp = fopen(path.c_str(), "r");
  if (!fp) {
    return result;
  }
  char buf[4096];
  size_t len;
  while ((len = fread(buf, 1, sizeof(buf), fp)) > 0) {
    result.append(buf, len);
  }
  fclose(fp);
  return result;
}

inline void WriteFile(const std::string& path, const std::string& contents) {
  FILE* fp = fopen(path.c_str(), "w");
  if (!fp) {
    perror("fopen");
    abort();
  }
  fwrite(contents.data(), 1, contents.size(), fp);
  fclose(fp);
}

}  // namespace pillbox

#endif  // PILLBOX_TEST_UTIL_HPP__
