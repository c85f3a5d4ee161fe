#ifndef SANDBOX_POSIX_SPAWN_HPP
#define SANDBOX_POSIX_SPAWN_HPP
#include "sandbox/unix.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems where only posix_spawn can be used to start
// the child. Nothing runs between fork and exec, so memory and CPU limits
// are NOT applied: LimitsEnforced() is false. Process groups, redirections,
// working directory and environment are handled as in Unix.
class PosixSpawn : public Unix {
 public:
  bool LimitsEnforced() const override { return false; }
  static Sandbox* Create() { return new PosixSpawn(); }
  static int Score();

 protected:
  PosixSpawn() = default;
  bool DoFork(std::string* error_msg) override;
};

}  // namespace sandbox
#endif
