#include "cli/options.hpp"
#include <stdexcept>

namespace tttarm::cli {

std::optional<controller::ControllerConfig> parse_args(const std::vector<std::string>& args) {
    controller::ControllerConfig config;

    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--machine-first" && i + 1 < args.size()) {
            const std::string& value = args[++i];
            try {
                size_t used = 0;
                config.machine_opening = std::stoi(value, &used);
                if (used != value.size()) {
                    return std::nullopt;
                }
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        } else if (args[i] == "--quiet") {
            config.log_moves = false;
        } else {
            return std::nullopt;
        }
    }
    return config;
}

} // namespace tttarm::cli
