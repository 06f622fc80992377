#pragma once

#include <string>

// Effective settings: defaults, then environment, then command-line flags
struct AppConfig {
    std::string claude_dir;   // --claude-dir, $CLAUDE_CONFIG_DIR, ~/.claude
    std::string projects_dir; // <claude_dir>/projects
    std::string tags_file;    // <claude_dir>/claude-sessions-tags.json
    std::string export_dir;   // current directory
    std::string log_file;
    std::string assistant_command = "claude";
    bool debug = false;
    bool deep_search = false;
    bool temporary = false;

    // Fills every path from claude_dir
    void resolve_paths();
};

// Defaults and environment only; flags are layered on by main()
AppConfig config_from_env();

constexpr const char* kDebugEnvVar = "CLAUDE_SESSIONS_BROWSER_DEBUG";
constexpr const char* kTagFileName = "claude-sessions-tags.json";
