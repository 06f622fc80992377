#include "config.hpp"

#include <cstdlib>
#include <filesystem>

#include "log.hpp"

namespace fs = std::filesystem;
using std::string;

namespace {

string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? string(v) : string();
}

} // namespace

void AppConfig::resolve_paths() {
    const fs::path root(claude_dir);
    projects_dir = (root / "projects").string();
    tags_file = (root / kTagFileName).string();
}

AppConfig config_from_env() {
    AppConfig cfg;
    string dir = env_or_empty("CLAUDE_CONFIG_DIR");
    if (dir.empty()) {
        string home = env_or_empty("HOME");
        dir = ((home.empty() ? fs::path("/") : fs::path(home)) / ".claude").string();
    }
    cfg.claude_dir = dir;
    cfg.debug = logging::env_flag(kDebugEnvVar);
    cfg.log_file = logging::default_log_path();

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    cfg.export_dir = ec ? string(".") : cwd.string();
    cfg.resolve_paths();
    return cfg;
}
