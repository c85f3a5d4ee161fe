#ifndef EXECUTOR_EXECUTION_HPP
#define EXECUTOR_EXECUTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "absl/types/optional.h"

namespace executor {

// Thrown when a request is rejected before anything is spawned.
class invalid_request : public std::invalid_argument {
 public:
  explicit invalid_request(const std::string& msg)
      : std::invalid_argument(msg) {}
};

struct ExecutionRequest {
  std::string code;
  // Seconds. The configured default is used when unset.
  absl::optional<double> timeout_seconds;
  // Overrides of the configured ceilings. They can only make them tighter.
  absl::optional<int64_t> max_memory_bytes;
  absl::optional<int64_t> max_cpu_seconds;
};

enum class Status {
  SUCCESS,  // The program exited with return code 0.
  ERROR,    // The program exited with a nonzero code, or was killed by the OS.
  TIMEOUT,  // The program was terminated by the engine.
  FAILED,   // The engine could not run the program.
};

const char* StatusName(Status status);

struct ExecutionResult {
  Status status = Status::FAILED;
  std::string stdout_text;
  std::string stderr_text;
  double execution_time_seconds = 0;
  // Only present if the program terminated on its own. Negative values are
  // the number of the signal that killed the program.
  absl::optional<int> return_code;

  double cpu_time_seconds = 0;
  int64_t memory_usage_kb = 0;
  int32_t signal = 0;
  std::string run_id;
};

}  // namespace executor

#endif
