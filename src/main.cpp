// File: src/main.cpp
// Build: cmake -S . -B build && cmake --build build
// Runtime deps: ncursesw; `claude` on PATH; optional wl-copy / xclip / xsel for the clipboard
// Purpose: terminal browser for the assistant's conversation transcripts (browse, search, tag,
//          export, delete, resume) plus quick creation of tagged sessions from the command line.

#include <algorithm>
#include <cctype>
#include <csignal>
#include <curses.h>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "clipboard.hpp"
#include "config.hpp"
#include "controller.hpp"
#include "errors.hpp"
#include "launcher.hpp"
#include "log.hpp"
#include "session_index.hpp"
#include "tag_store.hpp"
#include "tui.hpp"
#include "util.hpp"

using std::string;

namespace {

// "+10" / "10" -> 10; anything else is a tag
std::optional<size_t> parse_session_number(const string& arg) {
    string digits = arg;
    if (!digits.empty() && digits[0] == '+') digits.erase(0, 1);
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) return std::nullopt;
    return static_cast<size_t>(std::stoul(digits));
}

// Working directory for a known session id, the current one if it is gone
string project_dir_for(SessionIndex& index, const string& id, const AppConfig& cfg) {
    index.refresh();
    if (SessionPtr session = index.find(id)) return launch::resolve_working_dir(session->project_path);
    return cfg.export_dir;
}

void reraise_pending_signal() {
    if (int sig = launch::pending_termination_signal()) {
        spdlog::info("re-raising signal {}", sig);
        std::signal(sig, SIG_DFL);
        std::raise(sig);
    }
}

// Creates (or reconnects to) the session tagged `tag` and hands the terminal to the assistant
int run_tagged_session(SessionIndex& index, launch::ISessionLauncher& launcher, const string& tag, bool temporary,
                       const AppConfig& cfg) {
    std::optional<string> replaces;
    if (auto existing = index.find_by_tag(tag)) {
        std::cout << "Tag '" << tag << "' already exists (session " << existing->substr(0, 8) << ")\n";
        std::cout << "[Y]connect / [n]abort / [o]verwrite: " << std::flush;
        string reply;
        std::getline(std::cin, reply);
        reply = util::tolower_copy(util::trim(reply));
        if (reply == "n") {
            std::cout << "Aborted.\n";
            return 0;
        }
        if (reply == "o") {
            std::cout << "Removing old session and creating new...\n";
            replaces = *existing;
        } else {
            std::cout << "Connecting to existing session...\n";
            launcher.exec_resume(project_dir_for(index, *existing, cfg), *existing);
            return 1; // exec_resume only returns by throwing
        }
    }

    string id;
    try {
        id = index.create(tag, temporary, launcher, replaces);
    } catch (const LaunchError& e) {
        std::cerr << "Error creating session: " << e.what() << "\n";
        return 1;
    } catch (const ValidationError& e) {
        std::cerr << "Error creating session: " << e.what() << "\n";
        return 1;
    } catch (const IoFailure& e) {
        // the session exists but is untagged; a temporary one must not outlive us
        std::cerr << "Error saving session tag: " << e.what() << "\n";
        if (temporary) index.cleanup_temporary();
        return 1;
    }
    if (replaces) std::cout << "Removed old session " << replaces->substr(0, 8) << "\n";

    if (!temporary) {
        std::cout << "Created session " << id.substr(0, 8) << " with tag: " << util::trim(tag) << "\n";
        launcher.exec_resume(cfg.export_dir, id);
        return 1;
    }

    std::cout << "Created TEMP session " << id.substr(0, 8) << " with tag: " << util::trim(tag) << "\n";
    int status = 0;
    {
        TemporarySessionGuard guard(index);
        status = launcher.resume(cfg.export_dir, id);
    }
    if (index.temporary_ids().empty()) std::cout << "Cleaned up temp session " << id.substr(0, 8) << "\n";
    reraise_pending_signal();
    return status;
}

int run_browser(SessionIndex& index, launch::ISessionLauncher& launcher, const AppConfig& cfg,
                std::optional<size_t> initial_number) {
    const DiscoveryReport& report = index.refresh();
    spdlog::info("loaded {} sessions ({} unreadable, {} malformed lines, {} dropped)", index.sessions().size(),
                 report.unreadable, report.skipped_lines, report.dropped.size());

    clipboard::SystemClipboard clip;
    modal::ModalController controller(index, clip, cfg.export_dir, cfg.deep_search);
    if (initial_number) controller.jump_to(*initial_number);

    SessionBrowser browser(controller);
    browser.run();

    const auto& exit = controller.exit_request();
    if (!exit) return 0;
    if (exit->kind == modal::ExitRequest::Kind::Create) return run_tagged_session(index, launcher, exit->tag, false, cfg);

    std::cout << "Resuming session " << exit->session_id.substr(0, 8) << " in " << exit->project_dir << "\n";
    launcher.exec_resume(exit->project_dir, exit->session_id);
    return 1;
}

} // namespace

// ---------------------------- CLI ----------------------------
static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--claude-dir DIR] [--debug] [--deep-search] [-t|--temp] [--help] [N | +N | TAG]\n"
              << "  N, +N        open the browser at session N\n"
              << "  TAG          create a session tagged TAG and resume it\n"
              << "  -t, --temp   with TAG: delete the session when the assistant exits\n"
              << "Examples: " << prog << ", " << prog << " +10, " << prog << " 'my-tag', " << prog << " -t 'temp-tag'\n";
}

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    AppConfig cfg = config_from_env();

    const option long_opts[] = {
        {"claude-dir", required_argument, nullptr, 'c'},
        {"debug", no_argument, nullptr, 'd'},
        {"deep-search", no_argument, nullptr, 's'},
        {"temp", no_argument, nullptr, 't'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt, idx;
    while ((opt = getopt_long(argc, argv, "th", long_opts, &idx)) != -1) {
        switch (opt) {
            case 'c': cfg.claude_dir = optarg; break;
            case 'd': cfg.debug = true; break;
            case 's': cfg.deep_search = true; break;
            case 't': cfg.temporary = true; break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 1;
        }
    }
    if (argc - optind > 1) {
        usage(argv[0]);
        return 1;
    }
    const string arg = optind < argc ? argv[optind] : "";
    cfg.resolve_paths();
    logging::init(cfg.debug, cfg.log_file);
    spdlog::debug("claude dir {}, tags {}", cfg.claude_dir, cfg.tags_file);

    const std::optional<size_t> number = arg.empty() ? std::nullopt : parse_session_number(arg);
    if (cfg.temporary && (arg.empty() || number)) {
        std::cerr << "Error: -t requires a tag name\n";
        return 1;
    }

    try {
        TagStore tags(cfg.tags_file);
        tags.load();
        SessionIndex index(cfg.projects_dir, std::move(tags));
        launch::AssistantLauncher launcher(cfg.assistant_command);

        if (!arg.empty() && !number) return run_tagged_session(index, launcher, arg, cfg.temporary, cfg);
        return run_browser(index, launcher, cfg, number);
    } catch (const std::exception& e) {
        endwin();
        spdlog::error("fatal: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
