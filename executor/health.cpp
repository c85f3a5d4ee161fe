#include "executor/health.hpp"

#include <errno.h>
#include <string.h>
#include <sys/statvfs.h>

#include <memory>
#include <system_error>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "sandbox/supervisor.hpp"
#include "util/file.hpp"

namespace executor {

namespace {

static const constexpr int64_t kProbeWallMillis = 2000;
static const constexpr int64_t kProbeGraceMillis = 100;
static const constexpr int64_t kMinFreeDiskBytes = 100LL * 1024 * 1024;

// Runs the interpreter with args, bypassing the concurrency gate. Returns
// false and sets error_msg unless it exits with code 0 within
// kProbeWallMillis.
bool RunInterpreter(Engine* engine, const std::vector<std::string>& args,
                    std::string* output, std::string* error_msg) {
  const ExecutionConfig& config = engine->Config();
  try {
    util::TempDir dir(config.workspace_base, "health_");
    sandbox::ExecutionOptions options(dir.Path(), engine->InterpreterPath());
    options.args = args;
    options.env = engine->Environment(dir.Path());
    options.stdout_file = util::File::JoinPath(dir.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(dir.Path(), "stderr");
    options.memory_limit_bytes = config.max_memory_bytes;
    options.cpu_limit_seconds = config.max_cpu_seconds;
    options.max_files = config.max_open_files;
    options.max_file_size_kb = config.max_file_size_kb;

    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    if (!sb) {
      *error_msg = "no sandbox available";
      return false;
    }
    sandbox::Supervisor::Options supervisor_options;
    supervisor_options.wall_limit_millis = kProbeWallMillis;
    supervisor_options.grace_period_millis = kProbeGraceMillis;
    sandbox::Supervisor supervisor(sb.get(), supervisor_options);
    sandbox::ExecutionInfo info;
    switch (supervisor.Run(options, &info, error_msg)) {
      case sandbox::RunState::COMPLETED:
        break;
      case sandbox::RunState::TIMED_OUT:
      case sandbox::RunState::CANCELLED:
        *error_msg = absl::StrCat("timed out after ", kProbeWallMillis, "ms");
        return false;
      case sandbox::RunState::RUNNING:
      case sandbox::RunState::CRASHED:
        return false;
    }
    if (info.signal) {
      *error_msg = absl::StrCat("killed by signal ", info.signal);
      return false;
    }
    if (info.status_code) {
      *error_msg = absl::StrCat("exited with code ", info.status_code);
      return false;
    }
    *output = util::File::Read(options.stdout_file, 4096);
    return true;
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
}

}  // namespace

HealthCheck CheckDiskSpace(const std::string& path, int64_t min_free_bytes) {
  HealthCheck check;
  struct statvfs stat {};
  if (statvfs(path.c_str(), &stat) == -1) {
    check.ok = true;
    check.detail = absl::StrCat("could not check ", path, ": ",
                                strerror(errno));
    return check;
  }
  int64_t free_bytes = static_cast<int64_t>(stat.f_bavail) * stat.f_frsize;
  check.ok = free_bytes >= min_free_bytes;
  check.detail = absl::StrFormat("%.2f GB free in %s",
                                 free_bytes / (1024.0 * 1024 * 1024), path);
  return check;
}

HealthReport CheckHealth(Engine* engine) {
  HealthReport report;
  const ExecutionConfig& config = engine->Config();

  HealthCheck& interpreter = report.checks["interpreter"];
  if (engine->InterpreterPath().empty()) {
    interpreter.detail = config.interpreter + " not found in PATH";
  } else {
    std::string version, error_msg;
    interpreter.ok = RunInterpreter(engine, {"--version"}, &version,
                                    &error_msg);
    interpreter.detail =
        interpreter.ok
            ? absl::StrCat(engine->InterpreterPath(), " (",
                           absl::StripAsciiWhitespace(version), ")")
            : absl::StrCat(engine->InterpreterPath(), ": ", error_msg);
  }

  HealthCheck& subprocess = report.checks["subprocess"];
  if (!engine->InterpreterPath().empty()) {
    std::string output, error_msg;
    subprocess.ok =
        RunInterpreter(engine, {"-c", "print('ok')"}, &output, &error_msg);
    if (subprocess.ok && output != "ok\n") {
      subprocess.ok = false;
      error_msg = absl::StrCat("unexpected output: ", output);
    }
    subprocess.detail = subprocess.ok ? "ok" : error_msg;
  } else {
    subprocess.detail = "skipped, no interpreter";
  }

  HealthCheck& workspace = report.checks["workspace"];
  try {
    util::TempDir dir(config.workspace_base, "health_");
    util::File::Write(util::File::JoinPath(dir.Path(), "test"), "test");
    workspace.ok = true;
    workspace.detail = config.workspace_base;
  } catch (const std::system_error& exc) {
    workspace.detail = exc.what();
  }

  HealthCheck& disk_space = report.checks["disk_space"] =
      CheckDiskSpace(config.workspace_base, kMinFreeDiskBytes);

  HealthCheck& limits = report.checks["resource_limits"];
  limits.ok = true;
  limits.detail = engine->LimitsEnforced() ? "enforced" : "not enforced";

  HealthCheck& concurrency = report.checks["concurrency"];
  concurrency.ok = true;
  concurrency.detail = absl::StrCat(engine->Gate().InUse(), "/",
                                    engine->Gate().Capacity(), " in use");

  report.healthy =
      interpreter.ok && subprocess.ok && workspace.ok && disk_space.ok;
  if (!report.healthy) LOG(WARNING) << "Health check failed";
  return report;
}

}  // namespace executor
