#include "executor/engine.hpp"

#include <cmath>
#include <cstdlib>
#include <memory>
#include <random>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace executor {

namespace {

static const constexpr char* kTruncatedMarker = "\n[output truncated]\n";

// Variables copied from the engine's environment when they are set.
static const constexpr char* kForwardedVars[] = {"PYTHONPATH", "PYTHONHOME"};

const ExecutionConfig& Validated(const ExecutionConfig& config) {
  config.Validate();
  return config;
}

void AppendLine(std::string* text, const std::string& line) {
  if (!text->empty() && text->back() != '\n') text->push_back('\n');
  *text += line;
}

}  // namespace

Engine::Engine(ExecutionConfig config)
    : config_(Validated(config)), gate_(config_.max_concurrent_executions) {
  interpreter_path_ = util::which(config_.interpreter);
  if (interpreter_path_.empty()) {
    LOG(WARNING) << "Interpreter " << config_.interpreter
                 << " not found, every run will fail";
  }
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  limits_enforced_ = sb && sb->LimitsEnforced();

  const char* path = std::getenv("PATH");
  host_env_.push_back(absl::StrCat("PATH=", path ? path : "/usr/bin:/bin"));
  for (const char* var : kForwardedVars) {
    const char* value = std::getenv(var);
    if (value) host_env_.push_back(absl::StrCat(var, "=", value));
  }

  std::random_device rd;
  run_id_salt_ = rd();

  LOG(INFO) << "Engine initialized: interpreter=" << interpreter_path_
            << " max_memory=" << config_.max_memory_bytes / (1024 * 1024)
            << "MB max_cpu_time=" << config_.max_cpu_seconds
            << "s max_concurrent=" << config_.max_concurrent_executions
            << " workspace_isolation=" << config_.workspace_isolation
            << " limits_enforced=" << limits_enforced_;
}

void Engine::Validate(const ExecutionRequest& request) const {
  if (request.code.empty()) {
    throw invalid_request("Empty code");
  }
  if (request.timeout_seconds) {
    double timeout = *request.timeout_seconds;
    if (!std::isfinite(timeout) || timeout < config_.min_timeout ||
        timeout > config_.max_timeout) {
      throw invalid_request(absl::StrCat("Timeout ", timeout,
                                         " must be between ",
                                         config_.min_timeout, " and ",
                                         config_.max_timeout, " seconds"));
    }
  }
  auto check_limit = [](const char* name, const absl::optional<int64_t>& value,
                        int64_t ceiling) {
    if (!value) return;
    if (*value <= 0) {
      throw invalid_request(absl::StrCat(name, " must be positive"));
    }
    if (ceiling && *value > ceiling) {
      throw invalid_request(
          absl::StrCat(name, " must not exceed ", ceiling));
    }
  };
  check_limit("Memory limit", request.max_memory_bytes,
              config_.max_memory_bytes);
  check_limit("CPU limit", request.max_cpu_seconds, config_.max_cpu_seconds);
}

double Engine::Timeout(const ExecutionRequest& request) const {
  return request.timeout_seconds ? *request.timeout_seconds
                                 : config_.default_timeout;
}

std::string Engine::NewRunId() {
  return absl::StrFormat("%08x%04x", run_id_salt_,
                         run_counter_.fetch_add(1) & 0xffff);
}

ExecutionResult Engine::Execute(const ExecutionRequest& request,
                                const sandbox::Cancellation* cancellation) {
  Validate(request);
  std::string run_id = NewRunId();
  LOG(INFO) << "[" << run_id << "] Executing code with timeout "
            << Timeout(request) << "s";
  try {
    ConcurrencyGate::Slot slot(&gate_);
    ExecutionResult result = Run(run_id, request, cancellation);
    switch (result.status) {
      case Status::FAILED:
        LOG(ERROR) << "[" << run_id << "] Execution failed: "
                   << result.stderr_text;
        break;
      case Status::TIMEOUT:
        LOG(WARNING) << "[" << run_id << "] Execution terminated after "
                     << result.execution_time_seconds << "s";
        break;
      default:
        LOG(INFO) << "[" << run_id << "] Execution completed: status="
                  << StatusName(result.status) << " time=" << result.execution_time_seconds << "s";
    }
    return result;
  } catch (const std::exception& exc) {
    LOG(ERROR) << "[" << run_id << "] Execution service error: " << exc.what();
    ExecutionResult result;
    result.run_id = run_id;
    result.status = Status::FAILED;
    result.stderr_text = absl::StrCat("Execution service error: ", exc.what());
    return result;
  }
}

std::future<ExecutionResult> Engine::ExecuteAsync(
    ExecutionRequest request, const sandbox::Cancellation* cancellation) {
  Validate(request);
  return std::async(std::launch::async,
                    [this, cancellation](const ExecutionRequest& request) {
                      return Execute(request, cancellation);
                    },
                    std::move(request));
}

ExecutionResult Engine::Run(const std::string& run_id,
                            const ExecutionRequest& request,
                            const sandbox::Cancellation* cancellation) {
  ExecutionResult result;
  result.run_id = run_id;

  util::TempDir workspace(config_.workspace_base, run_id + "_");
  if (config_.keep_workspaces) workspace.Keep();
  std::string box = util::File::JoinPath(workspace.Path(), kBoxDir);
  util::File::MakeDirs(box);
  VLOG(1) << "[" << run_id << "] Created workspace " << workspace.Path();

  sandbox::ExecutionOptions options(
      config_.workspace_isolation ? box : config_.workspace_base,
      interpreter_path_.empty() ? config_.interpreter : interpreter_path_);
  options.args = {"-c", request.code};
  options.env = Environment(box);
  options.stdout_file = util::File::JoinPath(workspace.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(workspace.Path(), "stderr");
  options.memory_limit_bytes =
      request.max_memory_bytes.value_or(config_.max_memory_bytes);
  options.cpu_limit_seconds =
      request.max_cpu_seconds.value_or(config_.max_cpu_seconds);
  options.max_files = config_.max_open_files;
  options.max_file_size_kb = config_.max_file_size_kb;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw std::runtime_error("No sandbox available");

  double timeout = Timeout(request);
  sandbox::Supervisor::Options supervisor_options;
  supervisor_options.wall_limit_millis =
      static_cast<int64_t>(std::ceil(timeout * 1000));
  supervisor_options.grace_period_millis = config_.grace_period_millis;
  supervisor_options.cancellation = cancellation;
  sandbox::Supervisor supervisor(sb.get(), supervisor_options);

  sandbox::ExecutionInfo info;
  std::string error_msg;
  sandbox::RunState state = supervisor.Run(options, &info, &error_msg);
  VLOG(1) << "[" << run_id << "] Child terminated: "
          << sandbox::RunStateName(state);

  result.stdout_text = ReadOutput(options.stdout_file);
  result.stderr_text = ReadOutput(options.stderr_file);

  switch (state) {
    case sandbox::RunState::COMPLETED:
      result.signal = info.signal;
      if (info.signal) {
        result.status = Status::ERROR;
        result.return_code = -info.signal;
      } else {
        result.status = info.status_code ? Status::ERROR : Status::SUCCESS;
        result.return_code = info.status_code;
      }
      break;
    case sandbox::RunState::TIMED_OUT:
      result.status = Status::TIMEOUT;
      result.signal = info.signal;
      AppendLine(&result.stderr_text,
                 absl::StrCat("Execution timed out after ", timeout,
                              " seconds\n"));
      break;
    case sandbox::RunState::CANCELLED:
      result.status = Status::TIMEOUT;
      result.signal = info.signal;
      AppendLine(&result.stderr_text, "Execution cancelled\n");
      break;
    case sandbox::RunState::RUNNING:
    case sandbox::RunState::CRASHED:
      result.status = Status::FAILED;
      AppendLine(&result.stderr_text,
                 absl::StrCat("Process execution failed: ", error_msg, "\n"));
      break;
  }
  result.execution_time_seconds = info.wall_time_millis / 1000.0;
  result.cpu_time_seconds =
      (info.cpu_time_millis + info.sys_time_millis) / 1000.0;
  result.memory_usage_kb = info.memory_usage_kb;
  return result;
}

std::vector<std::string> Engine::Environment(
    const std::string& temp_dir) const {
  std::vector<std::string> env = host_env_;
  env.push_back("HOME=/tmp");
  for (const char* var : {"TMPDIR", "TMP", "TEMP"}) {
    env.push_back(absl::StrCat(var, "=", temp_dir));
  }
  env.push_back("PYTHONUNBUFFERED=1");
  env.push_back("PYTHONDONTWRITEBYTECODE=1");
  return env;
}

std::string Engine::ReadOutput(const std::string& path) const {
  if (!util::File::Exists(path)) return "";
  bool truncated = false;
  std::string output =
      util::File::Read(path, config_.max_output_bytes, &truncated);
  if (truncated) output += kTruncatedMarker;
  return output;
}

}  // namespace executor
