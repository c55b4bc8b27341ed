#pragma once
#include <string>

#include "events.hpp"

namespace mdv {

// Installs the default spdlog logger: colored stdout, plus `file` when non-empty.
// On a file sink failure the console logger is still installed and the error returned.
Status init_logging(const std::string& level, const std::string& file);

bool valid_log_level(const std::string& level);

} // namespace mdv
