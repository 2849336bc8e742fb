#include "cli/options.hpp"
#include "controller/game_controller.hpp"
#include "protocol/encoder.hpp"
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Prints frames in place of writing them to the serial link
class ConsoleTransport : public tttarm::Transport {
public:
    void send(const tttarm::Frame& frame) override {
        std::cout << "[Link] " << tttarm::protocol::to_hex(frame) << "\n";
    }
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--machine-first <0-8>] [--quiet]\n";
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = tttarm::cli::parse_args(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.has_value()) {
        usage(argv[0]);
        return 2;
    }
    const tttarm::controller::ControllerConfig& config = *parsed;

    auto transport = std::make_shared<ConsoleTransport>();
    std::unique_ptr<tttarm::controller::GameController> controller;
    try {
        controller = std::make_unique<tttarm::controller::GameController>(transport, config);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    using tttarm::controller::MatchState;
    using tttarm::controller::StepKind;

    if (controller->state() == MatchState::MachineTurn) {
        controller->start();
    }

    while (controller->state() != MatchState::GameOver) {
        std::cout << controller->render_board()
                  << "Cell where the human placed a piece (0-8): ";
        int position = 0;
        if (!(std::cin >> position)) {
            if (std::cin.eof()) {
                std::cout << "\nInput closed, match abandoned\n";
                return 1;
            }
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cout << "Invalid input, try again.\n";
            continue;
        }

        tttarm::Observation observation;
        observation.position = position;
        tttarm::controller::StepOutcome outcome = controller->submit(observation);

        switch (outcome.kind) {
            case StepKind::Rejected:
                std::cout << "Invalid move (" << tttarm::game::to_string(outcome.rule_error)
                          << "), try again.\n";
                break;
            case StepKind::Ignored:
                std::cout << "Piece already on the board, place a new one.\n";
                break;
            case StepKind::TransportFailed:
                std::cerr << "Link failure: " << outcome.transport_error << "\n";
                return 1;
            default:
                break;
        }
    }

    std::cout << controller->render_board() << "\n";
    switch (controller->result()) {
        case tttarm::GameResult::HumanWin:
            std::cout << "Human wins!\n";
            break;
        case tttarm::GameResult::MachineWin:
            std::cout << "Machine wins!\n";
            break;
        default:
            std::cout << "Draw!\n";
            break;
    }
    return 0;
}
