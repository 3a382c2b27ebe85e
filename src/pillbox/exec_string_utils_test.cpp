#include <assert.h>
#include <stdio.h>

#include <string>
#include <vector>

#include "exec_string_utils.hpp"

using pillbox::SeparateArgs;
using pillbox::Split;

typedef std::vector<std::string> Strings;

void TestSeparateArgs() {
  Strings args;
  std::string error;

  assert(SeparateArgs("sleep 5", &args, &error));
  assert(args == Strings({ "sleep", "5" }));

  assert(SeparateArgs("  echo   'a  b' \"c d\" e\\ f  ", &args, &error));
  assert(args == Strings({ "echo", "a  b", "c d", "e f" }));

  // no shell is involved, so nothing gets expanded
  assert(SeparateArgs("echo '$HOME' ; rm -rf /", &args, &error));
  assert(args == Strings({ "echo", "$HOME", ";", "rm", "-rf", "/" }));
}

void TestSeparateArgsErrors() {
  Strings args;
  std::string error;

  assert(!SeparateArgs("echo 'unbalanced", &args, &error));
  assert(!error.empty());
  assert(args.empty());

  error.clear();
  assert(!SeparateArgs("", &args, &error));
  assert(!error.empty());

  error.clear();
  assert(!SeparateArgs("   ", &args, &error));
  assert(!error.empty());
}

void TestSplit() {
  assert(Split("a,b,c", ",", 0) == Strings({ "a", "b", "c" }));
  assert(Split("a,,b", ",", 0) == Strings({ "a", "", "b" }));
  assert(Split("NAME=a=b", "=", 2) == Strings({ "NAME", "a=b" }));
  assert(Split("NAME", "=", 2) == Strings({ "NAME" }));
  assert(Split("NAME=", "=", 2) == Strings({ "NAME", "" }));
  assert(Split("a b\tc", " \t", 0) == Strings({ "a", "b", "c" }));
}

int main(int argc, char** argv) {
  printf("TestSeparateArgs\n");
  TestSeparateArgs();
  printf("TestSeparateArgsErrors\n");
  TestSeparateArgsErrors();
  printf("TestSplit\n");
  TestSplit();

  printf("All tests passed\n");
}
