#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values. A limit of 0 means no limit.
  int64_t memory_limit_bytes = 0;
  int64_t cpu_limit_seconds = 0;
  int32_t max_files = 0;
  // Largest file the program may write, output files included.
  int64_t max_file_size_kb = 0;

  // The child reads from /dev/null; output files are created if needed and
  // truncated. An empty name leaves the stream unchanged.
  std::string stdout_file = "";
  std::string stderr_file = "";

  // Arguments after argv[0], which is always the executable.
  std::vector<std::string> args;
  // The whole environment of the child, as KEY=VALUE entries.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was terminated by the supervisor rather than
  // exiting on its own.
  bool killed = false;
};

// Sandbox interface: a handle to one child process and its process group.
// A Sandbox object can spawn a single program.
//
// Implementations need to register themselves by creating a global object of
// type Sandbox::Register<SandboxImpl> and should define the Create and Score
// static functions. Create should return a pointer to a newly allocated
// instance of the given implementation, while Score should return a value
// that defines how "good" that sandbox is: negative if the sandbox should
// not/cannot be used in the current configuration, positive otherwise (a
// bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Starts the specified command. Returns true if the program was started.
  // Otherwise, returns false and sets error_msg.
  virtual bool Spawn(const ExecutionOptions& options,
                     std::string* error_msg) = 0;

  // Returns true until the child terminates. Does not release the child's
  // process id, so its process group can still be signalled.
  virtual bool IsAlive() = 0;

  // Ask the child and every process in its group to exit.
  virtual void TerminateGracefully() = 0;

  // Kill the child and every process in its group.
  virtual void TerminateForcefully() = 0;

  // Waits for the child to terminate, kills whatever is left of its process
  // group and collects the termination status and resource usage into info.
  // Returns false and sets error_msg on failure.
  virtual bool Reap(ExecutionInfo* info, std::string* error_msg) = 0;

  // Whether memory and CPU limits in ExecutionOptions are applied.
  virtual bool LimitsEnforced() const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
