#include "browser.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>

#include "internal/observability/logging.hpp"

extern char** environ;

namespace rdash::cli {

namespace obs = rdash::observability;

bool OpenInBrowser(const std::string& url) {
#if defined(__APPLE__)
  const char* launcher = "open";
#else
  const char* launcher = "xdg-open";
#endif

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  // keep the launcher's chatter off the terminal
  posix_spawn_file_actions_addopen(&actions, 1, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, 2, "/dev/null", O_WRONLY, 0);

  std::string arg0 = launcher;
  std::string arg1 = url;
  char*       argv[] = {arg0.data(), arg1.data(), nullptr};

  pid_t     pid = 0;
  const int rc  = posix_spawnp(&pid, launcher, &actions, nullptr, argv, environ);
  posix_spawn_file_actions_destroy(&actions);

  if (rc != 0) {
    obs::LogWarn("failed to launch browser", {obs::StringField("launcher", launcher), obs::IntField("errno", rc)});
    return false;
  }

  int status = 0;
  if (waitpid(pid, &status, 0) < 0) return true;
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace rdash::cli
