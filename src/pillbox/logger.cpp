#include <stdarg.h>
#include <stdio.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include "logger.hpp"

namespace pillbox {

Logger::~Logger() {
}

void StderrLogger::Warn(const std::string& message) {
  dbgt("WARNING: %s\n", message.c_str());
}

Logger* DefaultLogger() {
  static StderrLogger logger;
  return &logger;
}

void dbgt(const char *fmt, ...) {
  va_list ap;
  va_start (ap, fmt);

  char timebuf[80];
  struct timeval now_tv;
  gettimeofday(&now_tv, NULL);
  struct tm now_tm;
  localtime_r(&now_tv.tv_sec, &now_tm);
  int pos = strftime(timebuf, sizeof(timebuf), "%FT%T", &now_tm);
  pos += snprintf(timebuf + pos, sizeof(timebuf)-pos, ".%03d", (int)(now_tv.tv_usec / 1000));
  strftime(timebuf + pos, sizeof(timebuf)-pos, "%z", &now_tm);

  char buf[4096];
  vsnprintf (buf, sizeof(buf), fmt, ap);

  va_end (ap);

  fprintf (stderr, "%s [%d] %s", timebuf, (int) getpid(), buf);
}

}  // namespace pillbox
