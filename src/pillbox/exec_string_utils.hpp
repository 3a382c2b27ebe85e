#ifndef PILLBOX_EXEC_STRING_UTILS_HPP__
#define PILLBOX_EXEC_STRING_UTILS_HPP__

#include <string>
#include <vector>

namespace pillbox {

// Exit status of a forked child that could not exec its command.
const int kExecFailureStatus = 127;

/**
 * Splits a command string into an argument vector the way a Bourne shell
 * would: quotes and backslash escapes are honored, but nothing is expanded
 * and no shell is ever run.
 *
 * Returns false and fills in |error| if the string can't be parsed (e.g.,
 * unbalanced quotes) or contains no words at all.
 */
bool SeparateArgs(const std::string& input, std::vector<std::string>* args,
    std::string* error);

/**
 * Splits |input| at any of the characters in |delimiters|.
 *
 * If |max_items| is positive, at most that many items are returned and the
 * last one holds the unsplit remainder of the input.
 */
std::vector<std::string> Split(const std::string& input,
    const std::string& delimiters,
    int max_items);

/**
 * Replaces the calling process image with |command|, searching PATH.
 *
 * Only returns on failure, with errno set by execvp, or with EINVAL if the
 * command could not be split into words; |error| describes what went wrong.
 */
void ExecCommand(const std::string& command, std::string* error);

}  // namespace pillbox

#endif  // PILLBOX_EXEC_STRING_UTILS_HPP__
