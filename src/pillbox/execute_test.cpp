#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <string>

#include "execute.hpp"

using pillbox::DeserializeExecutionResult;
using pillbox::ExecuteBlocking;
using pillbox::ExecutionResult;
using pillbox::SerializeExecutionResult;
using pillbox::SpawnOptions;

void TestSerialization() {
  ExecutionResult result;
  result.stdout_data = "out\n";
  result.exit_code = 0;
  ExecutionResult decoded =
    DeserializeExecutionResult(SerializeExecutionResult(result));
  assert(decoded.stdout_data == "out\n");
  assert(decoded.stderr_data.empty());
  assert(decoded.exit_code == 0);

  // binary output survives too
  result.stdout_data = std::string("a\0b\xff", 4);
  result.stderr_data = "err";
  result.exit_code = 42;
  decoded = DeserializeExecutionResult(SerializeExecutionResult(result));
  assert(decoded.stdout_data == result.stdout_data);
  assert(decoded.stderr_data == "err");
  assert(decoded.exit_code == 42);

  decoded = DeserializeExecutionResult("");
  assert(decoded.stdout_data.empty());
  assert(decoded.stderr_data.empty());
  assert(decoded.exit_code == 0);
}

void TestEcho() {
  const ExecutionResult result =
    ExecuteBlocking("echo hello", SpawnOptions::Defaults());
  assert(result.stdout_data == "hello\n");
  assert(result.stderr_data.empty());
  assert(result.exit_code == 0);
}

void TestStderrAndExitCode() {
  const ExecutionResult result = ExecuteBlocking(
      "sh -c 'echo out; echo oops >&2; exit 3'", SpawnOptions::Defaults());
  assert(result.stdout_data == "out\n");
  assert(result.stderr_data == "oops\n");
  assert(result.exit_code == 3);
}

void TestQuoting() {
  const ExecutionResult result = ExecuteBlocking("echo 'a  b' \"c;d\" '$HOME'",
      SpawnOptions::Defaults());
  assert(result.stdout_data == "a  b c;d $HOME\n");
}

void TestStdinIsNull() {
  const ExecutionResult result =
    ExecuteBlocking("cat", SpawnOptions::Defaults());
  assert(result.stdout_data.empty());
  assert(result.exit_code == 0);
}

void TestWorkingDirAndEnvironment() {
  SpawnOptions options = SpawnOptions::Defaults();
  options.working_dir = "/";
  options.environment["PILLBOX_TEST_VAR"] = "some value";
  const ExecutionResult result =
    ExecuteBlocking("sh -c 'pwd; echo \"$PILLBOX_TEST_VAR\"'", options);
  assert(result.stdout_data == "/\nsome value\n");
  assert(result.exit_code == 0);

  // the caller's own environment is left alone
  assert(getenv("PILLBOX_TEST_VAR") == NULL);
}

void TestLargeOutput() {
  const ExecutionResult result = ExecuteBlocking(
      "sh -c 'head -c 300000 /dev/zero; head -c 200000 /dev/zero >&2'",
      SpawnOptions::Defaults());
  assert(result.stdout_data.size() == 300000);
  assert(result.stderr_data.size() == 200000);
  assert(result.exit_code == 0);
}

void TestKilledBySignal() {
  const ExecutionResult result =
    ExecuteBlocking("sh -c 'kill -TERM $$'", SpawnOptions::Defaults());
  assert(result.exit_code == 128 + 15);
}

void TestCommandNotFound() {
  const ExecutionResult result = ExecuteBlocking(
      "/nonexistent/pillbox-command --flag", SpawnOptions::Defaults());
  assert(result.exit_code == 127);
  assert(result.stdout_data.empty());
  assert(result.stderr_data.find("Exception in grandchild") !=
      std::string::npos);
}

void TestUnparseableCommand() {
  const ExecutionResult result =
    ExecuteBlocking("echo 'unbalanced", SpawnOptions::Defaults());
  assert(result.exit_code == 127);
  assert(result.stdout_data.empty());
  assert(!result.stderr_data.empty());
}

void TestBadWorkingDir() {
  SpawnOptions options = SpawnOptions::Defaults();
  options.working_dir = "/nonexistent/pillbox-dir";
  const ExecutionResult result = ExecuteBlocking("echo hello", options);
  assert(result.exit_code == 127);
  assert(result.stdout_data.empty());
  assert(result.stderr_data.find("chdir") != std::string::npos);
}

int main(int argc, char** argv) {
  printf("TestSerialization\n");
  TestSerialization();
  printf("TestEcho\n");
  TestEcho();
  printf("TestStderrAndExitCode\n");
  TestStderrAndExitCode();
  printf("TestQuoting\n");
  TestQuoting();
  printf("TestStdinIsNull\n");
  TestStdinIsNull();
  printf("TestWorkingDirAndEnvironment\n");
  TestWorkingDirAndEnvironment();
  printf("TestLargeOutput\n");
  TestLargeOutput();
  printf("TestKilledBySignal\n");
  TestKilledBySignal();
  printf("TestCommandNotFound\n");
  TestCommandNotFound();
  printf("TestUnparseableCommand\n");
  TestUnparseableCommand();
  printf("TestBadWorkingDir\n");
  TestBadWorkingDir();

  printf("All tests passed\n");
}
