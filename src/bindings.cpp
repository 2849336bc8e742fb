#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../include/common.hpp"
#include "../include/game/rules.hpp"
#include "../include/search/minimax.hpp"
#include "../include/protocol/encoder.hpp"
#include "../include/protocol/calibration.hpp"
#include "../include/io/transport.hpp"
#include "../include/io/vision.hpp"
#include "../include/io/python_callback.hpp"
#include "../include/controller/game_controller.hpp"

namespace py = pybind11;

namespace {

py::bytes to_bytes(const tttarm::Frame& frame) {
    return py::bytes(reinterpret_cast<const char*>(frame.data()), frame.size());
}

tttarm::Frame from_bytes(const py::bytes& data) {
    std::string raw = data;
    return tttarm::Frame(raw.begin(), raw.end());
}

} // namespace

PYBIND11_MODULE(tttarm_cpp, m) {
    m.doc() = "Tic-tac-toe engine and arm command protocol for the robot player";

    using tttarm::Cell;
    using tttarm::GameResult;
    namespace game = tttarm::game;
    namespace protocol = tttarm::protocol;
    namespace controller = tttarm::controller;

    py::enum_<Cell>(m, "Cell")
        .value("Empty", Cell::Empty)
        .value("Human", Cell::Human)
        .value("Machine", Cell::Machine);

    py::enum_<GameResult>(m, "GameResult")
        .value("InProgress", GameResult::InProgress)
        .value("HumanWin", GameResult::HumanWin)
        .value("MachineWin", GameResult::MachineWin)
        .value("Draw", GameResult::Draw);

    py::enum_<game::RuleError>(m, "RuleError")
        .value("None_", game::RuleError::None)
        .value("OutOfRange", game::RuleError::OutOfRange)
        .value("CellOccupied", game::RuleError::CellOccupied);

    // Rules on a 9-element board
    m.def("empty_board", &tttarm::empty_board, "Board with every cell empty");
    m.def("detect_winner", &game::detect_winner, py::arg("board"), py::arg("player"),
          "True if player holds a full row, column or diagonal");
    m.def("is_full", &game::is_full, py::arg("board"), "True if no cell is empty");
    m.def("evaluate", &game::evaluate, py::arg("board"), "Game result for the board");
    m.def("get_valid_moves", &game::get_valid_moves, py::arg("board"), "Empty cells");
    m.def("render", &game::render, py::arg("board"), "Text rendering of the board");

    // CheatOutcome struct
    py::class_<game::CheatOutcome>(m, "CheatOutcome")
        .def(py::init<>())
        .def_readwrite("cheat", &game::CheatOutcome::cheat)
        .def_readwrite("from_", &game::CheatOutcome::from)
        .def_readwrite("to", &game::CheatOutcome::to)
        .def_readwrite("error", &game::CheatOutcome::error)
        .def("clean", &game::CheatOutcome::clean);

    // Move selection
    py::class_<tttarm::MoveStrategy, std::shared_ptr<tttarm::MoveStrategy>>(m, "MoveStrategy")
        .def("select", &tttarm::MoveStrategy::select, py::arg("board"));

    py::class_<tttarm::MinimaxSearch, tttarm::MoveStrategy,
               std::shared_ptr<tttarm::MinimaxSearch>>(m, "MinimaxSearch")
        .def(py::init<>(), "Create exhaustive minimax search")
        .def("best_machine_move", &tttarm::MinimaxSearch::best_machine_move,
             py::arg("board"),
             py::arg("fixed_first_move") = py::none(),
             "Best cell for the machine, None on a full board")
        .def("root_scores", &tttarm::MinimaxSearch::root_scores, "Scores of the last search")
        .def("nodes_visited", &tttarm::MinimaxSearch::nodes_visited)
        .def("set_log_usage", &tttarm::MinimaxSearch::set_log_usage, py::arg("enable"));

    // Protocol
    py::enum_<protocol::Opcode>(m, "Opcode")
        .value("HumanMove", protocol::Opcode::HumanMove)
        .value("MachineMove", protocol::Opcode::MachineMove)
        .value("CheatReport", protocol::Opcode::CheatReport)
        .value("CalibrationA", protocol::Opcode::CalibrationA)
        .value("CalibrationB", protocol::Opcode::CalibrationB);

    py::class_<protocol::Command>(m, "Command")
        .def(py::init<protocol::Opcode, int, int>(),
             py::arg("opcode"), py::arg("arg1"), py::arg("arg2"))
        .def_readwrite("opcode", &protocol::Command::opcode)
        .def_readwrite("arg1", &protocol::Command::arg1)
        .def_readwrite("arg2", &protocol::Command::arg2)
        .def("payload", &protocol::Command::payload, "Three-digit command string");

    m.def("encode", [](const std::string& payload) { return to_bytes(protocol::encode(payload)); },
          py::arg("payload"), "Wrap a command string into a frame");
    m.def("encode_command",
          [](const protocol::Command& command) { return to_bytes(protocol::encode(command)); },
          py::arg("command"), "Frame for a command");
    m.def("decode", [](const py::bytes& frame) { return protocol::decode(from_bytes(frame)); },
          py::arg("frame"), "Payload of a frame, None if malformed");
    m.def("to_hex", [](const py::bytes& frame) { return protocol::to_hex(from_bytes(frame)); },
          py::arg("frame"));
    m.def("rotated_position", &protocol::rotated_position, py::arg("position"),
          "Grid index on the rotated board layout");

    py::class_<protocol::CalibrationSequence>(m, "CalibrationSequence")
        .def(py::init<std::pair<int, int>, std::pair<int, int>, std::pair<int, int>,
                      std::pair<int, int>, bool>(),
             py::arg("human1"), py::arg("human2"), py::arg("machine1"), py::arg("machine2"),
             py::arg("rotated") = false,
             "Four-step calibration moves")
        .def_static("center", &protocol::CalibrationSequence::center, py::arg("position"))
        .def("next", &protocol::CalibrationSequence::next, "Next command, None when done")
        .def("done", &protocol::CalibrationSequence::done)
        .def("remaining", &protocol::CalibrationSequence::remaining);

    // Collaborators
    py::class_<tttarm::Observation>(m, "Observation")
        .def(py::init<>())
        .def(py::init([](int position, Cell color, std::optional<std::set<int>> visible) {
                 return tttarm::Observation{position, color, std::move(visible)};
             }),
             py::arg("position"), py::arg("color") = Cell::Human, py::arg("visible") = py::none())
        .def_readwrite("position", &tttarm::Observation::position)
        .def_readwrite("color", &tttarm::Observation::color)
        .def_readwrite("visible", &tttarm::Observation::visible);

    py::register_exception<tttarm::TransportError>(m, "TransportError", PyExc_RuntimeError);

    py::class_<tttarm::Transport, std::shared_ptr<tttarm::Transport>>(m, "Transport");

    py::class_<tttarm::RecordingTransport, tttarm::Transport,
               std::shared_ptr<tttarm::RecordingTransport>>(m, "RecordingTransport")
        .def(py::init<>(), "Transport that keeps frames in memory")
        .def("payloads", &tttarm::RecordingTransport::payloads)
        .def("clear", &tttarm::RecordingTransport::clear)
        .def("set_failing", &tttarm::RecordingTransport::set_failing, py::arg("failing"));

    // PythonCallbackTransport - frames go to a Python object (e.g. pyserial)
    py::class_<tttarm::PythonCallbackTransport, tttarm::Transport,
               std::shared_ptr<tttarm::PythonCallbackTransport>>(m, "PythonCallbackTransport")
        .def(py::init<py::object>(), py::arg("py_transport"),
             "Create transport that calls the object's send(frame) method");

    py::class_<tttarm::VisionSource>(m, "VisionSource");

    py::class_<tttarm::PythonCallbackVision, tttarm::VisionSource>(m, "PythonCallbackVision")
        .def(py::init<py::object>(), py::arg("py_vision"),
             "Create vision source that calls the object's observe() method");

    // Game controller
    py::enum_<controller::MatchState>(m, "MatchState")
        .value("AwaitingHumanMove", controller::MatchState::AwaitingHumanMove)
        .value("MachineTurn", controller::MatchState::MachineTurn)
        .value("GameOver", controller::MatchState::GameOver);

    py::enum_<controller::StepKind>(m, "StepKind")
        .value("Waiting", controller::StepKind::Waiting)
        .value("Ignored", controller::StepKind::Ignored)
        .value("Rejected", controller::StepKind::Rejected)
        .value("Cheat", controller::StepKind::Cheat)
        .value("Accepted", controller::StepKind::Accepted)
        .value("TransportFailed", controller::StepKind::TransportFailed)
        .value("Finished", controller::StepKind::Finished);

    py::class_<controller::ControllerConfig>(m, "ControllerConfig")
        .def(py::init<>())
        .def_readwrite("machine_opening", &controller::ControllerConfig::machine_opening)
        .def_readwrite("log_moves", &controller::ControllerConfig::log_moves);

    py::class_<controller::StepOutcome>(m, "StepOutcome")
        .def_readonly("kind", &controller::StepOutcome::kind)
        .def_property_readonly("frames", [](const controller::StepOutcome& o) {
            py::list frames;
            for (const auto& frame : o.frames) {
                frames.append(to_bytes(frame));
            }
            return frames;
        })
        .def_readonly("machine_move", &controller::StepOutcome::machine_move)
        .def_readonly("rule_error", &controller::StepOutcome::rule_error)
        .def_readonly("cheat", &controller::StepOutcome::cheat)
        .def_readonly("transport_error", &controller::StepOutcome::transport_error)
        .def_readonly("result", &controller::StepOutcome::result);

    py::class_<controller::GameController>(m, "GameController")
        .def(py::init([](std::shared_ptr<tttarm::Transport> transport,
                         std::optional<int> machine_opening, bool log_moves,
                         std::shared_ptr<tttarm::MoveStrategy> strategy) {
                 controller::ControllerConfig config;
                 config.machine_opening = machine_opening;
                 config.log_moves = log_moves;
                 return std::make_unique<controller::GameController>(
                     std::move(transport), config, std::move(strategy));
             }),
             py::arg("transport"),
             py::arg("machine_opening") = py::none(),
             py::arg("log_moves") = true,
             py::arg("strategy") = nullptr,
             "Create a match controller")
        .def("start", &controller::GameController::start, "Play the machine opening")
        .def("submit", &controller::GameController::submit, py::arg("observation"),
             "Process one observation (or None)")
        .def("play_match", &controller::GameController::play_match,
             py::arg("vision"),
             py::arg("max_observations") = 1000,
             "Poll vision until the match is over")
        .def("reset", &controller::GameController::reset, "Start a new match")
        .def("state", &controller::GameController::state)
        .def("result", &controller::GameController::result)
        .def("board", &controller::GameController::board)
        .def("confirmed_positions", &controller::GameController::confirmed_positions)
        .def("machine_move_count", &controller::GameController::machine_move_count)
        .def("render_board", &controller::GameController::render_board);

    m.attr("__version__") = "0.1.0";
}
