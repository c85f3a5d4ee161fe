#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Interpreter
DECLARE_string(interpreter);

// Timeouts, in seconds.
DECLARE_double(default_timeout);
DECLARE_double(min_timeout);
DECLARE_double(max_timeout);
DECLARE_int32(grace_period_millis);

// Per-run resource ceilings.
DECLARE_int64(max_memory_mb);
DECLARE_int64(max_cpu_seconds);
DECLARE_int32(max_open_files);
DECLARE_int64(max_output_kb);
DECLARE_int64(max_file_size_kb);

// Admission control.
DECLARE_int32(max_concurrent);

// Workspaces.
DECLARE_string(temp_directory);
DECLARE_bool(workspace_isolation);
DECLARE_bool(keep_workspaces);

#endif
