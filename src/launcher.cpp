#include "launcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "util.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using std::string;

namespace launch {
namespace {

volatile std::sig_atomic_t g_pending_signal = 0;

void record_signal(int sig) { g_pending_signal = sig; }

std::vector<char*> make_argv(std::vector<string>& args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return argv;
}

string home_dir() {
    const char* home = std::getenv("HOME");
    return home ? string(home) : string("/");
}

// Restores the saved dispositions when the wait is over
class ScopedSignalGuard {
  public:
    ScopedSignalGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &old_int_);
        sigaction(SIGQUIT, &ignore, &old_quit_);

        struct sigaction record {};
        record.sa_handler = record_signal;
        sigemptyset(&record.sa_mask);
        sigaction(SIGTERM, &record, &old_term_);
        sigaction(SIGHUP, &record, &old_hup_);
    }
    ~ScopedSignalGuard() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGQUIT, &old_quit_, nullptr);
        sigaction(SIGTERM, &old_term_, nullptr);
        sigaction(SIGHUP, &old_hup_, nullptr);
    }
    ScopedSignalGuard(const ScopedSignalGuard&) = delete;
    ScopedSignalGuard& operator=(const ScopedSignalGuard&) = delete;

  private:
    struct sigaction old_int_ {}, old_quit_ {}, old_term_ {}, old_hup_ {};
};

} // namespace

AssistantLauncher::AssistantLauncher(string command) : command_(std::move(command)) {}

string AssistantLauncher::create_session(const string& title) {
    string cmd = util::shell_quote(command_) + " -p " + util::shell_quote(title) + " --output-format json";
    spdlog::debug("launch: {}", cmd);
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) throw LaunchError("cannot run " + command_ + ": " + std::strerror(errno));

    string output;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) output.append(buf, n);
    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw LaunchError("error creating session: " + command_ + " exited with status " +
                          std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : status));
    }
    return parse_created_session_id(output);
}

int AssistantLauncher::resume(const string& project_dir, const string& session_id) {
    std::vector<string> args = {command_, "--resume", session_id};
    spdlog::debug("launch: {} --resume {} in {}", command_, session_id, project_dir);

    ScopedSignalGuard guard;
    pid_t pid = fork();
    if (pid < 0) throw LaunchError(string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGHUP, SIG_DFL);
        if (chdir(project_dir.c_str()) != 0) _exit(127);
        setenv("CLAUDE_SESSION_ID", session_id.c_str(), 1);
        auto argv = make_argv(args);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw LaunchError(string("waitpid failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

void AssistantLauncher::exec_resume(const string& project_dir, const string& session_id) {
    if (chdir(project_dir.c_str()) != 0)
        throw LaunchError("cannot enter " + project_dir + ": " + std::strerror(errno));
    setenv("CLAUDE_SESSION_ID", session_id.c_str(), 1);
    std::vector<string> args = {command_, "--resume", session_id};
    auto argv = make_argv(args);
    execvp(argv[0], argv.data());
    throw LaunchError("cannot exec " + command_ + ": " + std::strerror(errno));
}

string resolve_working_dir(const string& project_path) {
    std::error_code ec;
    fs::path dir = project_path.empty() ? fs::path(home_dir()) : fs::path(project_path);
    if (fs::is_regular_file(dir, ec)) dir = dir.parent_path();
    if (fs::is_directory(dir, ec)) return dir.string();
    dir = dir.parent_path();
    if (!dir.empty() && fs::is_directory(dir, ec)) return dir.string();
    return home_dir();
}

string parse_created_session_id(const string& output) {
    string clean;
    clean.reserve(output.size());
    for (char c : output)
        if (static_cast<unsigned char>(c) >= 32 || c == '\n' || c == '\r' || c == '\t') clean.push_back(c);
    clean = util::trim(clean);

    json data = json::parse(clean, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        throw LaunchError("cannot parse assistant output: " + util::utf8_truncate(clean, 500));
    auto it = data.find("session_id");
    if (it == data.end() || !it->is_string() || it->get<string>().empty())
        throw LaunchError("no session_id in assistant output: " + util::utf8_truncate(clean, 500));
    return it->get<string>();
}

int pending_termination_signal() { return static_cast<int>(g_pending_signal); }

} // namespace launch
