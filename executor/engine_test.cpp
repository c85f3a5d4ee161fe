#include "executor/engine.hpp"

#include <dirent.h>
#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>

#include <chrono>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

using executor::Engine;
using executor::ExecutionConfig;
using executor::ExecutionRequest;
using executor::ExecutionResult;
using executor::Status;

const std::string test_tmpdir = "/tmp/runbox_testdir";

std::string Interpreter() {
  if (util::File::IsExecutable("/usr/bin/python3")) return "/usr/bin/python3";
  return util::which("python3");
}

bool ProcessGone(pid_t pid) {
  for (int i = 0; i < 200; i++) {
    if (kill(pid, 0) == -1 && errno == ESRCH) return true;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string skip, state;
    if (stat >> skip >> skip >> state && state == "Z") return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> entries;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return entries;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries.push_back(name);
  }
  closedir(dir);
  return entries;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

ExecutionRequest Request(const std::string& code, double timeout = 5) {
  ExecutionRequest request;
  request.code = code;
  request.timeout_seconds = timeout;
  return request;
}

class EngineTest : public ::testing::Test {
 protected:
  EngineTest() : base_(test_tmpdir, "engine_") {
    config_.interpreter = Interpreter();
    config_.workspace_base = base_.Path();
    config_.max_concurrent_executions = 4;
  }

  Engine* engine() {
    if (!engine_) engine_.reset(new Engine(config_));
    return engine_.get();
  }

  util::TempDir base_;
  ExecutionConfig config_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(EngineTest, TestRoundTrip) {
  ExecutionResult result =
      engine()->Execute(Request("print(\"Result:\", 2+2)"));
  EXPECT_EQ(result.status, Status::SUCCESS);
  EXPECT_THAT(result.stdout_text, HasSubstr("Result: 4"));
  EXPECT_EQ(result.stderr_text, "");
  ASSERT_TRUE(result.return_code);
  EXPECT_EQ(*result.return_code, 0);
  EXPECT_GT(result.execution_time_seconds, 0);
  EXPECT_THAT(result.run_id, Not(IsEmpty()));
}

TEST_F(EngineTest, TestDefaultTimeout) {
  ExecutionRequest request;
  request.code = "print('ok')";
  ExecutionResult result = engine()->Execute(request);
  EXPECT_EQ(result.status, Status::SUCCESS);
  EXPECT_EQ(result.stdout_text, "ok\n");
}

TEST_F(EngineTest, TestUndefinedName) {
  ExecutionResult result = engine()->Execute(Request("print(undefined_name)"));
  EXPECT_EQ(result.status, Status::ERROR);
  ASSERT_TRUE(result.return_code);
  EXPECT_NE(*result.return_code, 0);
  EXPECT_THAT(result.stderr_text, HasSubstr("NameError"));
}

TEST_F(EngineTest, TestSyntaxError) {
  ExecutionResult result = engine()->Execute(Request("if True\n  pass"));
  EXPECT_EQ(result.status, Status::ERROR);
  EXPECT_THAT(result.stderr_text, HasSubstr("SyntaxError"));
}

TEST_F(EngineTest, TestExitCode) {
  ExecutionResult result =
      engine()->Execute(Request("import sys\nprint('bye')\nsys.exit(3)"));
  EXPECT_EQ(result.status, Status::ERROR);
  ASSERT_TRUE(result.return_code);
  EXPECT_EQ(*result.return_code, 3);
  EXPECT_EQ(result.stdout_text, "bye\n");
}

TEST_F(EngineTest, TestTimeout) {
  auto start = std::chrono::steady_clock::now();
  ExecutionResult result = engine()->Execute(
      Request("import time\nprint('before', flush=True)\ntime.sleep(10)", 2));
  double elapsed = SecondsSince(start);
  EXPECT_EQ(result.status, Status::TIMEOUT);
  EXPECT_FALSE(result.return_code);
  EXPECT_EQ(result.stdout_text, "before\n");
  EXPECT_THAT(result.stderr_text, HasSubstr("timed out after 2 seconds"));
  EXPECT_GE(result.execution_time_seconds, 2);
  EXPECT_LT(elapsed, 2 + config_.grace_period_millis / 1000.0 + 1);
}

TEST_F(EngineTest, TestTimeoutIgnoringTerm) {
  config_.grace_period_millis = 200;
  auto start = std::chrono::steady_clock::now();
  ExecutionResult result = engine()->Execute(
      Request("import signal, time\n"
              "signal.signal(signal.SIGTERM, signal.SIG_IGN)\n"
              "time.sleep(10)",
              1));
  EXPECT_EQ(result.status, Status::TIMEOUT);
  EXPECT_EQ(result.signal, SIGKILL);
  EXPECT_LT(SecondsSince(start), 3);
}

TEST_F(EngineTest, TestTimeoutKillsTree) {
  ExecutionResult result = engine()->Execute(
      Request("import subprocess, time\n"
              "child = subprocess.Popen(['sleep', '60'])\n"
              "print(child.pid, flush=True)\n"
              "time.sleep(60)",
              1));
  EXPECT_EQ(result.status, Status::TIMEOUT);
  ASSERT_THAT(result.stdout_text, Not(IsEmpty()));
  EXPECT_TRUE(ProcessGone(std::stoi(result.stdout_text)));
}

TEST_F(EngineTest, TestWorkspaceRemoved) {
  ExecutionResult result =
      engine()->Execute(Request("import os\nprint(os.getcwd())"));
  EXPECT_EQ(result.status, Status::SUCCESS);
  std::string cwd = result.stdout_text.substr(0, result.stdout_text.find('\n'));
  EXPECT_THAT(cwd, HasSubstr(base_.Path()));
  EXPECT_FALSE(util::File::Exists(cwd));
  EXPECT_THAT(ListDir(base_.Path()), IsEmpty());
}

TEST_F(EngineTest, TestWorkspaceRemovedAfterTimeout) {
  ExecutionResult result = engine()->Execute(
      Request("import os, time\nprint(os.getcwd(), flush=True)\n"
              "open('data', 'w').write('x')\ntime.sleep(10)",
              1));
  EXPECT_EQ(result.status, Status::TIMEOUT);
  EXPECT_THAT(ListDir(base_.Path()), IsEmpty());
}

TEST_F(EngineTest, TestWorkspaceIsPrivate) {
  ExecutionResult result = engine()->Execute(
      Request("import os, tempfile\n"
              "print(sorted(os.listdir('.')))\n"
              "print(tempfile.gettempdir() == os.getcwd())"));
  EXPECT_EQ(result.status, Status::SUCCESS);
  EXPECT_EQ(result.stdout_text, "[]\nTrue\n");
}

TEST_F(EngineTest, TestEnvironmentIsolation) {
  setenv("RUNBOX_SECRET", "1", 1);
  ExecutionResult result = engine()->Execute(
      Request("import os\n"
              "print(os.environ.get('RUNBOX_SECRET', 'missing'))\n"
              "print(os.environ['HOME'], os.environ['PYTHONUNBUFFERED'])"));
  unsetenv("RUNBOX_SECRET");
  EXPECT_EQ(result.status, Status::SUCCESS);
  EXPECT_EQ(result.stdout_text, "missing\n/tmp 1\n");
}

TEST_F(EngineTest, TestRejectsInvalidRequests) {
  EXPECT_THROW(engine()->Execute(Request("print(1)", 0)),  // NOLINT
               executor::invalid_request);
  EXPECT_THROW(engine()->Execute(Request("print(1)", 9999)),  // NOLINT
               executor::invalid_request);
  EXPECT_THROW(engine()->Execute(Request("", 5)),  // NOLINT
               executor::invalid_request);
  ExecutionRequest request = Request("print(1)");
  request.max_memory_bytes = -1;
  EXPECT_THROW(engine()->Execute(request),  // NOLINT
               executor::invalid_request);
  request.max_memory_bytes = config_.max_memory_bytes + 1;
  EXPECT_THROW(engine()->Execute(request),  // NOLINT
               executor::invalid_request);
  request = Request("print(1)");
  request.max_cpu_seconds = 0;
  EXPECT_THROW(engine()->ExecuteAsync(request),  // NOLINT
               executor::invalid_request);
  EXPECT_EQ(engine()->Gate().PeakInUse(), 0u);
  EXPECT_THAT(ListDir(base_.Path()), IsEmpty());
}

TEST_F(EngineTest, TestMissingInterpreter) {
  config_.interpreter = "/nonexistent/python3";
  ExecutionResult result = engine()->Execute(Request("print(1)"));
  EXPECT_EQ(result.status, Status::FAILED);
  EXPECT_FALSE(result.return_code);
  EXPECT_THAT(result.stderr_text, HasSubstr("exec"));
  EXPECT_THAT(ListDir(base_.Path()), IsEmpty());
  EXPECT_EQ(engine()->Gate().InUse(), 0u);
}

TEST_F(EngineTest, TestWorkspaceFailure) {
  std::string file = util::File::JoinPath(base_.Path(), "not_a_dir");
  util::File::Write(file, "");
  config_.workspace_base = file;
  ExecutionResult result = engine()->Execute(Request("print(1)"));
  EXPECT_EQ(result.status, Status::FAILED);
  EXPECT_FALSE(result.return_code);
  EXPECT_THAT(result.stderr_text, Not(IsEmpty()));
  EXPECT_EQ(engine()->Gate().InUse(), 0u);
}

TEST_F(EngineTest, TestOutputTruncated) {
  config_.max_output_bytes = 1000;
  ExecutionResult result =
      engine()->Execute(Request("print('x' * 5000)"));
  EXPECT_EQ(result.status, Status::SUCCESS);
  EXPECT_THAT(result.stdout_text, HasSubstr("[output truncated]"));
  EXPECT_LT(result.stdout_text.size(), 1100u);
}

TEST_F(EngineTest, TestOutputFloodBounded) {
  if (!engine()->LimitsEnforced()) GTEST_SKIP();
  config_.max_output_bytes = 1000;
  config_.max_file_size_kb = 64;
  config_.keep_workspaces = true;
  ExecutionResult result = engine()->Execute(
      Request("import sys\nchunk = 'x' * 65536\n"
              "for _ in range(3000):\n  sys.stdout.write(chunk)"));
  EXPECT_EQ(result.status, Status::ERROR);
  EXPECT_TRUE(result.signal == SIGXFSZ ||
              result.stderr_text.find("File too large") != std::string::npos)
      << result.stderr_text;
  EXPECT_THAT(result.stdout_text, HasSubstr("[output truncated]"));

  std::vector<std::string> workspaces = ListDir(base_.Path());
  ASSERT_EQ(workspaces.size(), 1u);
  std::string on_disk = util::File::Read(
      util::File::JoinPath(
          util::File::JoinPath(base_.Path(), workspaces[0]), "stdout"),
      1 << 24);
  EXPECT_LE(on_disk.size(), 64u * 1024);
}

TEST_F(EngineTest, TestMemoryLimit) {
  if (!engine()->LimitsEnforced()) GTEST_SKIP();
  ExecutionRequest request =
      Request("data = bytearray(512 * 1024 * 1024)\nprint(len(data))");
  request.max_memory_bytes = 96 * 1024 * 1024;
  ExecutionResult result = engine()->Execute(request);
  EXPECT_EQ(result.status, Status::ERROR);
  EXPECT_THAT(result.stderr_text, HasSubstr("MemoryError"));
}

TEST_F(EngineTest, TestCpuLimit) {
  if (!engine()->LimitsEnforced()) GTEST_SKIP();
  ExecutionRequest request = Request("while True:\n  pass", 10);
  request.max_cpu_seconds = 1;
  auto start = std::chrono::steady_clock::now();
  ExecutionResult result = engine()->Execute(request);
  EXPECT_LT(SecondsSince(start), 5);
  EXPECT_EQ(result.status, Status::ERROR);
  EXPECT_THAT(result.signal, AnyOf(Eq(SIGXCPU), Eq(SIGKILL)));
  ASSERT_TRUE(result.return_code);
  EXPECT_EQ(*result.return_code, -result.signal);
}

TEST_F(EngineTest, TestConcurrencyBound) {
  config_.max_concurrent_executions = 2;
  auto start = std::chrono::steady_clock::now();
  std::vector<std::future<ExecutionResult>> results;
  for (int i = 0; i < 6; i++) {
    results.push_back(
        engine()->ExecuteAsync(Request("import time\ntime.sleep(0.5)")));
  }
  for (auto& result : results) {
    EXPECT_EQ(result.get().status, Status::SUCCESS);
  }
  EXPECT_EQ(engine()->Gate().PeakInUse(), 2u);
  EXPECT_EQ(engine()->Gate().InUse(), 0u);
  EXPECT_GE(SecondsSince(start), 1.5);
}

TEST_F(EngineTest, TestCancellation) {
  sandbox::Cancellation cancellation;
  auto start = std::chrono::steady_clock::now();
  std::future<ExecutionResult> future = engine()->ExecuteAsync(
      Request("import time\ntime.sleep(10)", 10), &cancellation);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  cancellation.Cancel();
  ExecutionResult result = future.get();
  EXPECT_EQ(result.status, Status::TIMEOUT);
  EXPECT_FALSE(result.return_code);
  EXPECT_THAT(result.stderr_text, HasSubstr("cancelled"));
  EXPECT_LT(SecondsSince(start), 3);
}

TEST(StatusTest, Names) {
  EXPECT_STREQ(executor::StatusName(Status::SUCCESS), "success");
  EXPECT_STREQ(executor::StatusName(Status::ERROR), "error");
  EXPECT_STREQ(executor::StatusName(Status::TIMEOUT), "timeout");
  EXPECT_STREQ(executor::StatusName(Status::FAILED), "failed");
}

}  // namespace
