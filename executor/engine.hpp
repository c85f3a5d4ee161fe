#ifndef EXECUTOR_ENGINE_HPP
#define EXECUTOR_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

#include "executor/concurrency_gate.hpp"
#include "executor/execution.hpp"
#include "executor/execution_config.hpp"
#include "sandbox/supervisor.hpp"

namespace executor {

// Runs caller-supplied code with the configured interpreter, each run in its
// own process group and workspace, bounded in time, resources and number of
// concurrent runs. Thread-safe.
class Engine {
 public:
  // Throws std::invalid_argument if config is not valid.
  explicit Engine(ExecutionConfig config);

  // Throws invalid_request if the request cannot be run.
  void Validate(const ExecutionRequest& request) const;

  // Runs the request and blocks until the result is available. Waits for a
  // free slot if too many runs are in progress. Throws invalid_request if
  // the request does not pass Validate; every other failure is reported in
  // the result. The run is stopped as on a timeout if cancellation is
  // raised.
  ExecutionResult Execute(const ExecutionRequest& request,
                          const sandbox::Cancellation* cancellation = nullptr);

  // As Execute, on a thread dedicated to this run. The request is validated
  // before returning; cancellation must outlive the run.
  std::future<ExecutionResult> ExecuteAsync(
      ExecutionRequest request,
      const sandbox::Cancellation* cancellation = nullptr);

  // Whether memory and CPU limits are applied on this platform.
  bool LimitsEnforced() const { return limits_enforced_; }

  // Resolved path of the interpreter, empty if it could not be found.
  const std::string& InterpreterPath() const { return interpreter_path_; }

  // Environment of the child: only allow-listed variables, with temp_dir as
  // the temporary directory.
  std::vector<std::string> Environment(const std::string& temp_dir) const;

  const ExecutionConfig& Config() const { return config_; }
  const ConcurrencyGate& Gate() const { return gate_; }

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;

 private:
  static const constexpr char* kBoxDir = "box";

  // Everything that happens between acquiring and releasing the slot.
  ExecutionResult Run(const std::string& run_id,
                      const ExecutionRequest& request,
                      const sandbox::Cancellation* cancellation);

  // Reads at most max_output_bytes of the given output file.
  std::string ReadOutput(const std::string& path) const;

  double Timeout(const ExecutionRequest& request) const;

  std::string NewRunId();

  const ExecutionConfig config_;
  ConcurrencyGate gate_;
  std::string interpreter_path_;
  bool limits_enforced_ = false;
  // Allow-listed variables copied from the environment of the engine.
  std::vector<std::string> host_env_;
  uint32_t run_id_salt_ = 0;
  std::atomic<uint32_t> run_counter_{0};
};

}  // namespace executor

#endif
