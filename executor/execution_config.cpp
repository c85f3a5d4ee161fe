#include "executor/execution_config.hpp"

#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"

namespace executor {

ExecutionConfig ExecutionConfig::FromFlags() {
  ExecutionConfig config;
  config.interpreter = FLAGS_interpreter;
  config.default_timeout = FLAGS_default_timeout;
  config.min_timeout = FLAGS_min_timeout;
  config.max_timeout = FLAGS_max_timeout;
  config.grace_period_millis = FLAGS_grace_period_millis;
  config.max_memory_bytes = FLAGS_max_memory_mb * 1024 * 1024;
  config.max_cpu_seconds = FLAGS_max_cpu_seconds;
  config.max_open_files = FLAGS_max_open_files;
  config.max_output_bytes = FLAGS_max_output_kb * 1024;
  config.max_file_size_kb = FLAGS_max_file_size_kb;
  config.max_concurrent_executions =
      FLAGS_max_concurrent > 0 ? FLAGS_max_concurrent : 0;
  config.workspace_base = FLAGS_temp_directory;
  config.workspace_isolation = FLAGS_workspace_isolation;
  config.keep_workspaces = FLAGS_keep_workspaces;
  return config;
}

void ExecutionConfig::Validate() const {
  if (interpreter.empty()) {
    throw std::invalid_argument("No interpreter configured");
  }
  if (workspace_base.empty()) {
    throw std::invalid_argument("No workspace directory configured");
  }
  if (min_timeout <= 0 || min_timeout > max_timeout) {
    throw std::invalid_argument(absl::StrCat("Invalid timeout bounds [",
                                             min_timeout, ", ", max_timeout,
                                             "]"));
  }
  if (default_timeout < min_timeout || default_timeout > max_timeout) {
    throw std::invalid_argument(
        absl::StrCat("Default timeout ", default_timeout, " out of bounds"));
  }
  if (grace_period_millis < 0) {
    throw std::invalid_argument("Negative grace period");
  }
  if (max_memory_bytes < 0 || max_cpu_seconds < 0 || max_open_files < 0 ||
      max_file_size_kb < 0) {
    throw std::invalid_argument("Negative resource limit");
  }
  if (max_output_bytes <= 0) {
    throw std::invalid_argument("The output limit must be positive");
  }
  if (max_concurrent_executions == 0) {
    throw std::invalid_argument("At least one concurrent execution needed");
  }
}

}  // namespace executor
