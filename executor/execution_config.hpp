#ifndef EXECUTOR_EXECUTION_CONFIG_HPP
#define EXECUTOR_EXECUTION_CONFIG_HPP

#include <cstdint>
#include <string>

namespace executor {

// Process-wide settings of the engine. Built once at start-up and read-only
// afterwards.
struct ExecutionConfig {
  std::string interpreter = "python3";

  // Seconds.
  double default_timeout = 5;
  double min_timeout = 1;
  double max_timeout = 30;
  int64_t grace_period_millis = 1000;

  int64_t max_memory_bytes = 128LL * 1024 * 1024;
  int64_t max_cpu_seconds = 10;
  int32_t max_open_files = 64;
  int64_t max_output_bytes = 1024 * 1024;
  // Largest file a run may write, its stdout and stderr included.
  int64_t max_file_size_kb = 2 * 1024;

  size_t max_concurrent_executions = 10;

  std::string workspace_base = "/tmp/runbox";
  bool workspace_isolation = true;
  bool keep_workspaces = false;

  // Snapshot of the command-line flags.
  static ExecutionConfig FromFlags();

  // Throws std::invalid_argument if the settings are inconsistent.
  void Validate() const;
};

}  // namespace executor

#endif
