#pragma once
#include "../controller/game_controller.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tttarm::cli {

// Parse "--machine-first <cell>" and "--quiet" (program name excluded).
// Nothing on an unknown flag, a missing value or a cell that is not a whole integer.
std::optional<controller::ControllerConfig> parse_args(const std::vector<std::string>& args);

} // namespace tttarm::cli
