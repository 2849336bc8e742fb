#pragma once
#include "../common.hpp"
#include <deque>
#include <optional>
#include <set>
#include <vector>

namespace tttarm {

// One report from the camera side
struct Observation {
    int position = -1;          // grid index 0-8
    Cell color = Cell::Human;
    // Every position where a human piece is seen in the same frame, if known
    std::optional<std::set<int>> visible;
};

// Interface for the vision collaborator
class VisionSource {
public:
    virtual ~VisionSource() = default;

    // Newest detected piece, nothing when no new piece is visible yet
    virtual std::optional<Observation> observe() = 0;
};

// Replays a fixed list of observations, then reports nothing
class ScriptedVision : public VisionSource {
public:
    ScriptedVision() = default;
    explicit ScriptedVision(std::vector<std::optional<Observation>> script);

    std::optional<Observation> observe() override;

    void push(std::optional<Observation> observation);
    size_t remaining() const { return script_.size(); }

private:
    std::deque<std::optional<Observation>> script_;
};

} // namespace tttarm
