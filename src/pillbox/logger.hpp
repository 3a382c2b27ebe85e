#ifndef PILLBOX_LOGGER_HPP__
#define PILLBOX_LOGGER_HPP__

#include <string>

namespace pillbox {

/**
 * Sink for the warnings pillbox reports while supervising processes.
 *
 * The supervisor that owns pillbox usually provides its own implementation.
 * StderrLogger is used whenever none is supplied.
 */
class Logger {
  public:
    virtual ~Logger();

    virtual void Warn(const std::string& message) = 0;
};

class StderrLogger : public Logger {
  public:
    void Warn(const std::string& message) override;
};

// Returns a process-wide StderrLogger.
Logger* DefaultLogger();

// printf-style debug output to stderr, prefixed with a local timestamp.
void dbgt(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace pillbox

#endif  // PILLBOX_LOGGER_HPP__
