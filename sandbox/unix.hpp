#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Base class for sandboxes for UNIX-like systems. The child leads a new
// session, so that signals sent to its process group also reach every
// process it starts (unless they leave the group themselves).
class Unix : public Sandbox {
 public:
  bool Spawn(const ExecutionOptions& options, std::string* error_msg) override;
  bool IsAlive() override;
  void TerminateGracefully() override;
  void TerminateForcefully() override;
  bool Reap(ExecutionInfo* info, std::string* error_msg) override;
  bool LimitsEnforced() const override { return true; }
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

  // Kills and reaps the child if it is still around.
  ~Unix() override;

 protected:
  Unix() = default;

  // Creates the child process and saves its PID in child_pid_. argv_ and
  // envp_ are ready when this is called. Returns false and sets error_msg if
  // the program could not be started.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Must not allocate
  // memory, as other threads may hold the allocator's locks at fork time.
  [[noreturn]] void Child();

  // Sends signal to the child's process group, or to the child alone if the
  // group does not exist.
  void SignalGroup(int signal);

  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<char*> argv_;
  std::vector<char*> envp_;

 private:
  // Reads the errors reported by the child before exec.
  bool WaitForExec(std::string* error_msg);

  // Converts strings to the NULL-terminated arrays required by exec.
  void PrepareArgs();

  int pipe_fds_[2] = {-1, -1};
  bool exited_ = false;
  bool reaped_ = false;
  std::vector<std::vector<char>> storage_;
};

}  // namespace sandbox
#endif
