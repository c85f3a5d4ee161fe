#ifndef SANDBOX_SUPERVISOR_HPP
#define SANDBOX_SUPERVISOR_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// A flag the caller of a run can raise to stop it. Thread-safe.
class Cancellation {
 public:
  void Cancel() { cancelled_ = true; }
  bool IsCancelled() const { return cancelled_; }

 private:
  std::atomic<bool> cancelled_{false};
};

enum class RunState { RUNNING, COMPLETED, TIMED_OUT, CANCELLED, CRASHED };

const char* RunStateName(RunState state);

// Runs one program in a sandbox, racing its completion against a deadline
// and an optional cancellation. When the deadline passes or the run is
// cancelled, the process group is sent a graceful termination request, and
// is killed if it is still alive after the grace period.
class Supervisor {
 public:
  struct Options {
    int64_t wall_limit_millis = 0;  // 0 means no deadline.
    int64_t grace_period_millis = 1000;
    const Cancellation* cancellation = nullptr;
  };

  Supervisor(Sandbox* sandbox, Options options)
      : sandbox_(sandbox), options_(options) {}

  // Spawns the program and waits for it to reach a terminal state, which is
  // returned. info is filled unless the state is CRASHED, in which case
  // error_msg describes the failure. wall_time_millis is measured from
  // spawn to the terminal state.
  RunState Run(const ExecutionOptions& exec_options, ExecutionInfo* info,
               std::string* error_msg);

  RunState State() const { return state_; }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

 private:
  // Sends SIGTERM, waits for the grace period and then sends SIGKILL.
  void Escalate();

  Sandbox* sandbox_;
  Options options_;
  RunState state_ = RunState::RUNNING;
};

}  // namespace sandbox

#endif
