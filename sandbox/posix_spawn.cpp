#include "sandbox/posix_spawn.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#if defined(__GLIBC__) && \
    (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 29))
#define RUNBOX_HAVE_SPAWN_CHDIR 1
#endif

#if defined(__GLIBC__) && \
    (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 34))
#define RUNBOX_HAVE_SPAWN_CLOSEFROM 1
#endif

namespace sandbox {

int PosixSpawn::Score() {
#ifdef RUNBOX_HAVE_SPAWN_CHDIR
  return 1;
#else
  return -1;
#endif
}

bool PosixSpawn::DoFork(std::string* error_msg) {
#ifndef RUNBOX_HAVE_SPAWN_CHDIR
  *error_msg = "posix_spawn: changing directory is not supported";
  return false;
#else
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  auto fail = [error_msg](const char* prefix, int err) {
    *error_msg = prefix;
    *error_msg += ": ";
    *error_msg += strerror(err);
    return false;
  };
  int ret = posix_spawn_file_actions_init(&actions);
  if (ret != 0) return fail("posix_spawn_file_actions_init", ret);
  ret = posix_spawnattr_init(&attr);
  if (ret != 0) {
    posix_spawn_file_actions_destroy(&actions);
    return fail("posix_spawnattr_init", ret);
  }

  auto prepare = [this, &actions, &attr]() -> int {
    int ret = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO,
                                               "/dev/null", O_RDONLY, 0);
    if (ret != 0) return ret;
    if (!options_->stdout_file.empty()) {
      ret = posix_spawn_file_actions_addopen(
          &actions, STDOUT_FILENO, options_->stdout_file.c_str(),
          O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
      if (ret != 0) return ret;
    }
    if (!options_->stderr_file.empty()) {
      ret = posix_spawn_file_actions_addopen(
          &actions, STDERR_FILENO, options_->stderr_file.c_str(),
          O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
      if (ret != 0) return ret;
    }
#ifdef RUNBOX_HAVE_SPAWN_CLOSEFROM
    ret = posix_spawn_file_actions_addclosefrom_np(&actions,
                                                   STDERR_FILENO + 1);
    if (ret != 0) return ret;
#endif
    ret = posix_spawn_file_actions_addchdir_np(&actions,
                                               options_->root.c_str());
    if (ret != 0) return ret;
#ifdef POSIX_SPAWN_SETSID
    return posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);
#else
    ret = posix_spawnattr_setpgroup(&attr, 0);
    if (ret != 0) return ret;
    return posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
#endif
  };

  ret = prepare();
  pid_t pid = 0;
  if (ret == 0) {
    ret = posix_spawn(&pid, options_->executable.c_str(), &actions, &attr,
                      argv_.data(), envp_.data());
  }
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  if (ret != 0) return fail("posix_spawn", ret);
  child_pid_ = pid;
  return true;
#endif
}

namespace {
Sandbox::Register<PosixSpawn> r;
}  // namespace

}  // namespace sandbox
