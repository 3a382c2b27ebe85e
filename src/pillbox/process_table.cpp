#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/wait.h>

#include <sstream>
#include <utility>

#include <glib.h>

#include "process_table.hpp"

namespace pillbox {

#if 1
#define dbg(...)
#else
#define dbg(...) do { dbgt(__VA_ARGS__); } while(0)
#endif

// Number of whitespace separated columns preceding the command.
static const int kNumLeadingColumns = 5;

static size_t SkipSpace(const std::string& str, size_t pos) {
  while (pos < str.size() && isspace(static_cast<unsigned char>(str[pos]))) {
    ++pos;
  }
  return pos;
}

static size_t SkipWord(const std::string& str, size_t pos) {
  while (pos < str.size() && !isspace(static_cast<unsigned char>(str[pos]))) {
    ++pos;
  }
  return pos;
}

static bool ParseInt(const std::string& word, int* result) {
  if (word.empty()) {
    return false;
  }
  char* end = NULL;
  errno = 0;
  const long value = strtol(word.c_str(), &end, 10);
  if (*end != '\0' || errno == ERANGE || value > INT_MAX || value < INT_MIN) {
    return false;
  }
  *result = static_cast<int>(value);
  return true;
}

static bool ParseDouble(const std::string& word, double* result) {
  if (word.empty()) {
    return false;
  }
  char* end = NULL;
  const double value = strtod(word.c_str(), &end);
  if (*end != '\0') {
    return false;
  }
  *result = value;
  return true;
}

bool ParseProcessLine(const std::string& line, ProcessRecord* record) {
  std::string words[kNumLeadingColumns];
  size_t pos = 0;
  for (int i = 0; i < kNumLeadingColumns; ++i) {
    pos = SkipSpace(line, pos);
    const size_t word_end = SkipWord(line, pos);
    words[i] = line.substr(pos, word_end - pos);
    pos = word_end;
  }

  if (!ParseInt(words[0], &record->pid)) {
    return false;
  }
  if (!ParseInt(words[1], &record->ppid) ||
      !ParseDouble(words[2], &record->cpu_percent) ||
      !ParseDouble(words[3], &record->rss_kb) ||
      words[4].empty()) {
    dbg("discarding malformed process line [%s]\n", line.c_str());
    return false;
  }
  record->elapsed_seconds = ParseElapsedTime(words[4]);

  // the command runs to the end of the line, spaces and all.
  pos = SkipSpace(line, pos);
  size_t command_end = line.size();
  while (command_end > pos &&
      isspace(static_cast<unsigned char>(line[command_end - 1]))) {
    --command_end;
  }
  record->command = line.substr(pos, command_end - pos);
  return true;
}

ProcessTable ParseProcessListing(const std::string& listing) {
  ProcessTable result;
  std::istringstream input(listing);
  std::string line;
  while (std::getline(input, line)) {
    ProcessRecord record;
    if (ParseProcessLine(line, &record)) {
      result[record.pid] = record;
    }
  }
  return result;
}

static bool ParseDigits(const std::string& str, size_t begin, size_t end,
    int* result) {
  if (begin >= end) {
    return false;
  }
  int value = 0;
  for (size_t i = begin; i < end; ++i) {
    if (!isdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
    const int digit = str[i] - '0';
    if (value > (INT_MAX - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  *result = value;
  return true;
}

int ParseElapsedTime(const std::string& etime) {
  // [[dd-]hh:]mm:ss
  int days = 0;
  int hours = 0;
  int mins = 0;
  int secs = 0;

  size_t begin = 0;
  const size_t dash = etime.find('-');
  const bool has_days = dash != std::string::npos;
  if (has_days) {
    if (!ParseDigits(etime, 0, dash, &days)) {
      return 0;
    }
    begin = dash + 1;
  }

  int fields[3];
  int num_fields = 0;
  while (num_fields < 3) {
    size_t colon = etime.find(':', begin);
    const size_t end = colon == std::string::npos ? etime.size() : colon;
    if (!ParseDigits(etime, begin, end, &fields[num_fields])) {
      return 0;
    }
    ++num_fields;
    if (colon == std::string::npos) {
      break;
    }
    begin = colon + 1;
    if (num_fields == 3) {
      // more than three colon separated fields
      return 0;
    }
  }

  if (num_fields == 3) {
    hours = fields[0];
    mins = fields[1];
    secs = fields[2];
  } else if (num_fields == 2 && !has_days) {
    mins = fields[0];
    secs = fields[1];
  } else {
    return 0;
  }
  const long long total =
    ((days * 24LL + hours) * 60 + mins) * 60 + secs;
  if (total > INT_MAX) {
    return 0;
  }
  return static_cast<int>(total);
}

ProcessLister::~ProcessLister() {
}

bool PsProcessLister::List(std::string* output, std::string* error) {
  // BSD style ps invocation
  const char* argv[] = {
    "ps", "axo", "pid,ppid,pcpu,rss,etime,command", NULL
  };
  gchar* standard_output = NULL;
  gint wait_status = 0;
  GError* err = NULL;
  gboolean spawned = g_spawn_sync(NULL, const_cast<gchar**>(argv), NULL,
      static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH |
        G_SPAWN_STDERR_TO_DEV_NULL),
      NULL, NULL, &standard_output, NULL, &wait_status, &err);
  if (!spawned) {
    *error = err ? err->message : "unable to run ps";
    if (err) {
      g_error_free(err);
    }
    return false;
  }

  output->assign(standard_output ? standard_output : "");
  g_free(standard_output);

  if (!WIFEXITED(wait_status) || WEXITSTATUS(wait_status) != 0) {
    *error = "ps exited abnormally";
    return false;
  }
  return true;
}

ProcessTableCache::ProcessTableCache(std::unique_ptr<ProcessLister> lister,
    Logger* logger) :
  lister_(std::move(lister)),
  logger_(logger ? logger : DefaultLogger()),
  mutex_(),
  table_() {
  if (!lister_) {
    lister_.reset(new PsProcessLister());
  }
}

ProcessTablePtr ProcessTableCache::Snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (table_) {
    return table_;
  }

  std::string listing;
  std::string error;
  std::shared_ptr<ProcessTable> table = std::make_shared<ProcessTable>();
  if (lister_->List(&listing, &error)) {
    *table = ParseProcessListing(listing);
  } else {
    logger_->Warn("unable to read process table: " + error);
  }
  table_ = table;
  dbg("process table snapshot: %d processes\n", (int) table_->size());
  return table_;
}

void ProcessTableCache::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  table_.reset();
}

}  // namespace pillbox
