#include "io/transport.hpp"
#include "protocol/encoder.hpp"

namespace tttarm {

void RecordingTransport::send(const Frame& frame) {
    if (failing_) {
        throw TransportError("link down: " + protocol::to_hex(frame) + " not sent");
    }
    frames_.push_back(frame);
}

std::vector<std::string> RecordingTransport::payloads() const {
    std::vector<std::string> out;
    for (const Frame& frame : frames_) {
        auto payload = protocol::decode(frame);
        out.push_back(payload.value_or(""));
    }
    return out;
}

} // namespace tttarm
