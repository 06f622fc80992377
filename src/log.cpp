#include "log.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "util.hpp"

namespace logging {

std::string default_log_path() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) dir = "/tmp";
    return (dir / "claude-sessions-browser-debug.log").string();
}

void init(bool debug, const std::string& path) {
    std::shared_ptr<spdlog::logger> logger;
    if (debug) {
        logger = std::make_shared<spdlog::logger>(
            "claude_sessions", std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true));
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::debug);
    } else {
        logger = std::make_shared<spdlog::logger>("claude_sessions", std::make_shared<spdlog::sinks::null_sink_mt>());
        logger->set_level(spdlog::level::off);
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::set_default_logger(logger);
    if (debug) spdlog::info("=== claude_sessions_browser started, log: {} ===", path);
}

bool env_flag(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw) return false;
    std::string v = util::tolower_copy(util::trim(raw));
    return v == "1" || v == "true" || v == "yes";
}

} // namespace logging
