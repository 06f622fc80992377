#include "clipboard.hpp"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

using std::string;

namespace clipboard {
namespace {

bool on_path(const string& tool) {
    const string detect = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(detect.c_str()) == 0;
}

bool exited_ok(int status) { return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0; }

} // namespace

bool SystemClipboard::copy(const string& text, string& error) {
    const std::vector<std::pair<string, string>> copy_commands = {
        {"pbcopy", "pbcopy"},
        {"wl-copy", "wl-copy"},
        {"xclip", "xclip -selection clipboard"},
        {"xsel", "xsel --clipboard --input"},
    };

    for (const auto& [tool, cmd] : copy_commands) {
        if (!on_path(tool)) continue;
        const string full = cmd + " >/dev/null 2>&1";
        FILE* pipe = popen(full.c_str(), "w");
        if (!pipe) continue;
        size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
        int status = pclose(pipe);
        if (written == text.size() && exited_ok(status)) {
            spdlog::debug("clipboard: copied {} bytes with {}", text.size(), tool);
            return true;
        }
        spdlog::debug("clipboard: {} failed", tool);
    }
    error = "no clipboard tool available (install wl-copy, xclip or xsel)";
    return false;
}

std::optional<string> SystemClipboard::primary_selection() {
    if (!on_path("xclip")) return std::nullopt;
    FILE* pipe = popen("xclip -selection primary -o 2>/dev/null", "r");
    if (!pipe) return std::nullopt;
    string out;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
    if (!exited_ok(pclose(pipe)) || out.empty()) return std::nullopt;
    return out;
}

} // namespace clipboard
