#include "io/vision.hpp"
#include <utility>

namespace tttarm {

ScriptedVision::ScriptedVision(std::vector<std::optional<Observation>> script)
    : script_(script.begin(), script.end()) {}

std::optional<Observation> ScriptedVision::observe() {
    if (script_.empty()) {
        return std::nullopt;
    }
    std::optional<Observation> next = script_.front();
    script_.pop_front();
    return next;
}

void ScriptedVision::push(std::optional<Observation> observation) {
    script_.push_back(std::move(observation));
}

} // namespace tttarm
