#pragma once

#include <string>

namespace logging {

// Default location of the --debug log file
std::string default_log_path();

// Installs the process-wide spdlog logger. With debug off every record is
// dropped; curses owns the terminal, so nothing may go to stderr.
void init(bool debug, const std::string& path);

// "1", "true", "yes" (any case)
bool env_flag(const char* name);

} // namespace logging
