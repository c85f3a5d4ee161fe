#include "util/flags.hpp"

DEFINE_string(interpreter, "python3",
              "Interpreter used to run the code. Names without a slash are "
              "looked up on PATH");

DEFINE_double(default_timeout, 5, "Timeout used when a request sets none");
DEFINE_double(min_timeout, 1, "Smallest timeout a request may ask for");
DEFINE_double(max_timeout, 30, "Largest timeout a request may ask for");
DEFINE_int32(grace_period_millis, 1000,
             "Time between SIGTERM and SIGKILL when a run is terminated");

DEFINE_int64(max_memory_mb, 128, "Address space limit of each run");
DEFINE_int64(max_cpu_seconds, 10, "CPU time limit of each run");
DEFINE_int32(max_open_files, 64, "File descriptor limit of each run");
DEFINE_int64(max_output_kb, 1024,
             "Maximum amount of stdout and of stderr returned for each run");
DEFINE_int64(max_file_size_kb, 2048,
             "Largest file each run may write, stdout and stderr included");

DEFINE_int32(max_concurrent, 10,
             "Maximum number of runs executing at the same time");

DEFINE_string(temp_directory, "/tmp/runbox",
              "Where the per-run workspaces should be created");
DEFINE_bool(workspace_isolation, true,
            "Run the code inside its own private working directory");
DEFINE_bool(keep_workspaces, false,
            "Do not remove workspaces after the run, for debugging");
