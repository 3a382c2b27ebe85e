#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <glib.h>

#include "exec_string_utils.hpp"

namespace pillbox {

std::vector<std::string> Split(const std::string& input,
    const std::string& delimiters,
    int max_items) {
  std::vector<std::string> result;

  size_t tok_begin = 0;
  while (tok_begin <= input.size()) {
    if (max_items > 0 && result.size() == static_cast<size_t>(max_items - 1)) {
      result.emplace_back(input, tok_begin);
      return result;
    }

    size_t tok_end = input.find_first_of(delimiters, tok_begin);
    if (tok_end == std::string::npos) {
      tok_end = input.size();
    }
    result.emplace_back(input, tok_begin, tok_end - tok_begin);

    tok_begin = tok_end + 1;
  }

  return result;
}

bool SeparateArgs(const std::string& input, std::vector<std::string>* args,
    std::string* error) {
  args->clear();

  char** argv = NULL;
  int argc = -1;
  GError *err = NULL;
  gboolean parsed = g_shell_parse_argv(input.c_str(), &argc, &argv, &err);

  if (!parsed || err) {
    // unable to parse the command string as a Bourne shell command.
    *error = err ? err->message : "unable to parse command";
    if (err) {
      g_error_free(err);
    }
    return false;
  }

  for (int i = 0; i < argc; ++i) {
    args->push_back(argv[i]);
  }
  g_strfreev(argv);

  if (args->empty()) {
    *error = "empty command";
    return false;
  }
  return true;
}

void ExecCommand(const std::string& command, std::string* error) {
  std::vector<std::string> args;
  if (!SeparateArgs(command, &args, error)) {
    errno = EINVAL;
    return;
  }

  std::vector<char*> argv;
  for (std::string& arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);

  // go!
  execvp(argv[0], argv.data());

  const int exec_errno = errno;
  *error = "execvp " + args[0] + ": " + strerror(exec_errno);
  errno = exec_errno;
}

}  // namespace pillbox
