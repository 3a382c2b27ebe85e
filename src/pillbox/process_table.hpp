#ifndef PILLBOX_PROCESS_TABLE_HPP__
#define PILLBOX_PROCESS_TABLE_HPP__

// A memoized view of the system process table, as reported by
//   ps axo pid,ppid,pcpu,rss,etime,command

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <pillbox/logger.hpp>

namespace pillbox {

struct ProcessRecord {
  int pid;

  // Only a lookup key.  The parent may no longer be in the table.
  int ppid;

  double cpu_percent;

  // resident set size, KB
  double rss_kb;

  int elapsed_seconds;

  // full command line, including any whitespace
  std::string command;
};

typedef std::map<int, ProcessRecord> ProcessTable;

// A snapshot shared between the cache and its readers.  It stays valid for
// as long as a reader holds it, even across ProcessTableCache::Reset().
typedef std::shared_ptr<const ProcessTable> ProcessTablePtr;

/**
 * Parses one line of the process listing.
 *
 * The first five columns are separated by arbitrary whitespace.  Everything
 * from the start of the sixth column to the end of the line is the command,
 * kept verbatim.  Returns false for lines that do not start with a pid (the
 * header, blank lines) or are missing a column.
 */
bool ParseProcessLine(const std::string& line, ProcessRecord* record);

// Parses a complete listing, silently skipping lines ParseProcessLine rejects.
ProcessTable ParseProcessListing(const std::string& listing);

/**
 * Converts a ps elapsed-time field, [[days-]hours:]minutes:seconds, to
 * seconds.
 *
 * Text that does not match the format yields 0.  ps never emits such text
 * for a live process, so 0 is used rather than an error.
 */
int ParseElapsedTime(const std::string& etime);

// Source of the raw process listing.
class ProcessLister {
  public:
    virtual ~ProcessLister();

    // Fills |output| with the listing.  Returns false and sets |error| if the
    // listing could not be produced.
    virtual bool List(std::string* output, std::string* error) = 0;
};

// Runs ps(1).
class PsProcessLister : public ProcessLister {
  public:
    bool List(std::string* output, std::string* error) override;
};

/**
 * Holds one snapshot of the process table per supervision tick.
 *
 * The first call to Snapshot() after construction or Reset() runs the
 * listing.  Every later call returns the same table until Reset() is called,
 * so any number of usage queries within a tick cost a single fork.
 *
 * Safe to share between threads.  A snapshot is never modified once
 * published; Reset() only drops the cache's reference to it.
 */
class ProcessTableCache {
  public:
    /**
     * |lister| defaults to a PsProcessLister.  |logger| is not owned and
     * defaults to DefaultLogger().
     */
    explicit ProcessTableCache(std::unique_ptr<ProcessLister> lister =
        std::unique_ptr<ProcessLister>(),
        Logger* logger = nullptr);

    // Never NULL.
    ProcessTablePtr Snapshot();

    // Discards the current snapshot.  Call once per tick.
    void Reset();

  private:
    std::unique_ptr<ProcessLister> lister_;
    Logger* logger_;

    std::mutex mutex_;

    // NULL until the first Snapshot() of a tick
    ProcessTablePtr table_;
};

}  // namespace pillbox

#endif  // PILLBOX_PROCESS_TABLE_HPP__
