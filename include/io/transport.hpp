#pragma once
#include "../common.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace tttarm {

// Raised by a transport when a frame could not be delivered
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Interface for the link to the arm
class Transport {
public:
    virtual ~Transport() = default;

    // Deliver one frame; throws TransportError on failure
    virtual void send(const Frame& frame) = 0;
};

// Keeps every frame in memory instead of writing to a device (tests, dry runs)
class RecordingTransport : public Transport {
public:
    void send(const Frame& frame) override;

    const std::vector<Frame>& frames() const { return frames_; }
    std::vector<std::string> payloads() const;
    void clear() { frames_.clear(); }

    // Make subsequent sends throw TransportError
    void set_failing(bool failing) { failing_ = failing; }

private:
    std::vector<Frame> frames_;
    bool failing_ = false;
};

} // namespace tttarm
