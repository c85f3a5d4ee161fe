#include "sandbox/supervisor.hpp"

#include <chrono>
#include <thread>

#include "glog/logging.h"

namespace sandbox {

namespace {
static const constexpr auto kPollInterval = std::chrono::milliseconds(10);
}  // namespace

const char* RunStateName(RunState state) {
  switch (state) {
    case RunState::RUNNING:
      return "RUNNING";
    case RunState::COMPLETED:
      return "COMPLETED";
    case RunState::TIMED_OUT:
      return "TIMED_OUT";
    case RunState::CANCELLED:
      return "CANCELLED";
    case RunState::CRASHED:
      return "CRASHED";
  }
  return "UNKNOWN";
}

RunState Supervisor::Run(const ExecutionOptions& exec_options,
                         ExecutionInfo* info, std::string* error_msg) {
  CHECK(state_ == RunState::RUNNING) << "Supervisor reused";
  if (!sandbox_->Spawn(exec_options, error_msg)) {
    return state_ = RunState::CRASHED;
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  while (sandbox_->IsAlive()) {
    if (options_.wall_limit_millis &&
        elapsed_millis() >= options_.wall_limit_millis) {
      state_ = RunState::TIMED_OUT;
      break;
    }
    if (options_.cancellation && options_.cancellation->IsCancelled()) {
      state_ = RunState::CANCELLED;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (state_ != RunState::RUNNING) {
    VLOG(1) << "Terminating child: " << RunStateName(state_);
    Escalate();
  }

  if (!sandbox_->Reap(info, error_msg)) {
    return state_ = RunState::CRASHED;
  }
  info->wall_time_millis = elapsed_millis();
  if (state_ == RunState::RUNNING) {
    state_ = RunState::COMPLETED;
  } else {
    info->killed = true;
  }
  return state_;
}

void Supervisor::Escalate() {
  sandbox_->TerminateGracefully();
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(options_.grace_period_millis);
  while (sandbox_->IsAlive() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }
  if (sandbox_->IsAlive()) {
    VLOG(1) << "Child still alive after the grace period, killing it";
    sandbox_->TerminateForcefully();
  }
}

}  // namespace sandbox
