#ifndef EXECUTOR_HEALTH_HPP
#define EXECUTOR_HEALTH_HPP

#include <cstdint>
#include <map>
#include <string>

#include "executor/engine.hpp"

namespace executor {

struct HealthCheck {
  bool ok = false;
  std::string detail;
};

struct HealthReport {
  bool healthy = false;
  std::map<std::string, HealthCheck> checks;
};

// Verifies that the engine can run code: the interpreter exists and reports
// its version, a trivial program succeeds, workspaces can be created and
// written, and there is enough free space for them. Also reports whether
// resource limits are enforced and how many slots are in use, which never
// make the report unhealthy.
// The programs are run outside of the concurrency gate with a short time
// limit, so the report is available even when the engine is saturated.
HealthReport CheckHealth(Engine* engine);

// Fails if the file system holding path has less than min_free_bytes
// available. Not being able to query it is only reported.
HealthCheck CheckDiskSpace(const std::string& path, int64_t min_free_bytes);

}  // namespace executor

#endif
