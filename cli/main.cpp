#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "executor/engine.hpp"
#include "executor/execution_config.hpp"
#include "executor/health.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "util/flags.hpp"

DEFINE_string(code, "", "Code to run");
DEFINE_string(file, "",
              "File containing the code to run, - for the standard input");
DEFINE_double(timeout, -1,
              "Timeout of the run in seconds, negative for the default");
DEFINE_int64(memory_limit_mb, 0,
             "Memory limit of the run, 0 for the configured one");
DEFINE_int64(cpu_limit_seconds, 0,
             "CPU time limit of the run, 0 for the configured one");
DEFINE_bool(health, false, "Print the health report and exit");

namespace {

enum ExitCode {
  kSuccess = 0,
  kError = 1,
  kTimeout = 2,
  kFailed = 3,
  kInvalidRequest = 4,
};

std::string ReadCode() {
  if (FLAGS_file.empty()) return FLAGS_code;
  if (FLAGS_file == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  std::ifstream fin(FLAGS_file);
  if (!fin) {
    LOG(ERROR) << "Cannot open " << FLAGS_file;
    return "";
  }
  std::stringstream buffer;
  buffer << fin.rdbuf();
  return buffer.str();
}

int PrintHealth(executor::Engine* engine) {
  executor::HealthReport report = executor::CheckHealth(engine);
  std::cout << "status: " << (report.healthy ? "healthy" : "unhealthy")
            << std::endl;
  for (const auto& check : report.checks) {
    std::cout << check.first << ": " << (check.second.ok ? "ok" : "error")
              << " (" << check.second.detail << ")" << std::endl;
  }
  return report.healthy ? kSuccess : kFailed;
}

int ExitCodeFor(executor::Status status) {
  switch (status) {
    case executor::Status::SUCCESS:
      return kSuccess;
    case executor::Status::ERROR:
      return kError;
    case executor::Status::TIMEOUT:
      return kTimeout;
    case executor::Status::FAILED:
      return kFailed;
  }
  return kFailed;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs Python code in an isolated subprocess");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  executor::ExecutionConfig config = executor::ExecutionConfig::FromFlags();
  try {
    config.Validate();
  } catch (const std::invalid_argument& exc) {
    LOG(ERROR) << "Invalid configuration: " << exc.what();
    return kFailed;
  }
  executor::Engine engine(config);
  if (FLAGS_health) return PrintHealth(&engine);

  executor::ExecutionRequest request;
  request.code = ReadCode();
  if (FLAGS_timeout >= 0) request.timeout_seconds = FLAGS_timeout;
  if (FLAGS_memory_limit_mb != 0) {
    request.max_memory_bytes = FLAGS_memory_limit_mb * 1024 * 1024;
  }
  if (FLAGS_cpu_limit_seconds != 0) {
    request.max_cpu_seconds = FLAGS_cpu_limit_seconds;
  }

  executor::ExecutionResult result;
  try {
    result = engine.Execute(request);
  } catch (const executor::invalid_request& exc) {
    std::cerr << "Invalid request: " << exc.what() << std::endl;
    return kInvalidRequest;
  }

  std::cout << "status: " << executor::StatusName(result.status) << std::endl;
  std::cout << "return_code: ";
  if (result.return_code) {
    std::cout << *result.return_code;
  } else {
    std::cout << "none";
  }
  std::cout << std::endl;
  std::cout << "execution_time: " << result.execution_time_seconds << "s"
            << std::endl;
  std::cout << "--- stdout ---" << std::endl << result.stdout_text;
  std::cout << "--- stderr ---" << std::endl << result.stderr_text;
  return ExitCodeFor(result.status);
}
