#pragma once

#include <string>

namespace launch {

class ISessionLauncher {
  public:
    virtual ~ISessionLauncher() = default;

    // Starts a headless assistant run titled `title` and returns the new
    // session id. Throws LaunchError.
    virtual std::string create_session(const std::string& title) = 0;

    // Runs `--resume id` in project_dir and waits; returns the exit status
    virtual int resume(const std::string& project_dir, const std::string& session_id) = 0;

    // Replaces this process with `--resume id`. Returns only by throwing.
    virtual void exec_resume(const std::string& project_dir, const std::string& session_id) = 0;
};

// Drives the real `claude` binary found on PATH
class AssistantLauncher : public ISessionLauncher {
  public:
    explicit AssistantLauncher(std::string command = "claude");

    std::string create_session(const std::string& title) override;
    int resume(const std::string& project_dir, const std::string& session_id) override;
    void exec_resume(const std::string& project_dir, const std::string& session_id) override;

  private:
    std::string command_;
};

// project_path itself when it is a directory, else its parent, else $HOME
std::string resolve_working_dir(const std::string& project_path);

// Pulls "session_id" out of `--output-format json` output. Control
// characters other than \n \r \t are dropped first. Throws LaunchError.
std::string parse_created_session_id(const std::string& output);

// SIGTERM / SIGHUP received while resume() waited, 0 if none. The caller
// re-raises it once temporary sessions are cleaned up.
int pending_termination_signal();

} // namespace launch
