#include "controller/game_controller.hpp"
#include "io/python_callback.hpp"
#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

using namespace tttarm;
using namespace tttarm::controller;

namespace {

// Stand-ins for the camera and serial port scripts
const char* kCollaborators = R"(
class ClosedPort:
    def send(self, frame):
        raise IOError("port closed")

class RecordingPort:
    def __init__(self):
        self.frames = []
    def send(self, frame):
        self.frames.append(frame)

class Camera:
    def __init__(self, result):
        self.result = result
    def observe(self):
        return self.result
)";

py::object collaborator(const char* name) {
    return py::module_::import("__main__").attr(name);
}

PythonCallbackVision camera(py::object result) {
    return PythonCallbackVision(collaborator("Camera")(result));
}

ControllerConfig quiet() {
    ControllerConfig config;
    config.log_moves = false;
    return config;
}

Observation human_at(int position) {
    Observation obs;
    obs.position = position;
    obs.color = Cell::Human;
    return obs;
}

} // namespace

TEST(PythonCallbackTest, RaisingSendReportsTransportFailure) {
    auto link = std::make_shared<PythonCallbackTransport>(collaborator("ClosedPort")());
    GameController controller(link, quiet());

    StepOutcome outcome = controller.submit(human_at(0));

    EXPECT_EQ(outcome.kind, StepKind::TransportFailed);
    EXPECT_NE(outcome.transport_error.find("port closed"), std::string::npos);
    EXPECT_EQ(controller.machine_move_count(), 1);
}

TEST(PythonCallbackTest, SendPassesFrameBytes) {
    py::object port = collaborator("RecordingPort")();
    PythonCallbackTransport link(port);

    link.send(Frame{0xAA, 0x55, 0x32, 0x31, 0x34, 0x9A});

    py::list frames = port.attr("frames").cast<py::list>();
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].cast<std::string>(), std::string("\xAA\x55" "214" "\x9A"));
}

TEST(PythonCallbackTest, ObservationWithoutSnapshot) {
    auto obs = camera(py::make_tuple(4, "human")).observe();
    ASSERT_TRUE(obs.has_value());
    EXPECT_EQ(obs->position, 4);
    EXPECT_EQ(obs->color, Cell::Human);
    EXPECT_FALSE(obs->visible.has_value());

    EXPECT_EQ(camera(py::make_tuple(7, "machine")).observe()->color, Cell::Machine);
    EXPECT_FALSE(camera(py::none()).observe().has_value());
}

TEST(PythonCallbackTest, ObservationWithSnapshotFillsVisible) {
    auto obs = camera(py::make_tuple(2, 1, py::eval("{0, 2}"))).observe();
    ASSERT_TRUE(obs.has_value());
    EXPECT_EQ(obs->position, 2);
    EXPECT_EQ(obs->color, Cell::Human);
    ASSERT_TRUE(obs->visible.has_value());
    EXPECT_EQ(*obs->visible, (std::set<int>{0, 2}));

    auto machine = camera(py::make_tuple(5, 2, py::none())).observe();
    ASSERT_TRUE(machine.has_value());
    EXPECT_EQ(machine->color, Cell::Machine);
    EXPECT_FALSE(machine->visible.has_value());
}

TEST(PythonCallbackTest, MalformedObservationsThrow) {
    EXPECT_THROW(camera(py::make_tuple(1, "human", py::none(), 5)).observe(), std::runtime_error);
    EXPECT_THROW(camera(py::make_tuple(1)).observe(), std::runtime_error);
    EXPECT_THROW(camera(py::make_tuple(1, "blue")).observe(), std::runtime_error);
    EXPECT_THROW(camera(py::make_tuple(1, 3)).observe(), std::runtime_error);
}

TEST(PythonCallbackTest, ObjectsWithoutCallbacksAreRejected) {
    EXPECT_THROW(PythonCallbackVision{py::int_(3)}, std::runtime_error);
    EXPECT_THROW(PythonCallbackTransport{py::int_(3)}, std::runtime_error);
}

int main(int argc, char** argv) {
    py::scoped_interpreter interpreter;
    py::exec(kCollaborators);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
