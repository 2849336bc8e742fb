#include "io/python_callback.hpp"
#include <pybind11/stl.h>
#include <stdexcept>
#include <utility>
#include <string>

namespace tttarm {

namespace {

Cell parse_color(const py::handle& value) {
    if (py::isinstance<py::str>(value)) {
        std::string name = value.cast<std::string>();
        if (name == "human") {
            return Cell::Human;
        }
        if (name == "machine") {
            return Cell::Machine;
        }
        throw std::runtime_error("Unknown piece color from vision: " + name);
    }

    int mark = value.cast<int>();
    if (mark == static_cast<int>(Cell::Human)) {
        return Cell::Human;
    }
    if (mark == static_cast<int>(Cell::Machine)) {
        return Cell::Machine;
    }
    throw std::runtime_error("Unknown piece mark from vision: " + std::to_string(mark));
}

} // namespace

PythonCallbackVision::PythonCallbackVision(py::object py_vision)
    : py_vision_(std::move(py_vision)) {

    // Verify the Python object has an observe method
    if (!py::hasattr(py_vision_, "observe")) {
        throw std::runtime_error("Python vision must have an 'observe()' method");
    }
}

std::optional<Observation> PythonCallbackVision::observe() {
    py::object result = py_vision_.attr("observe")();
    if (result.is_none()) {
        return std::nullopt;
    }

    py::tuple py_result = result.cast<py::tuple>();
    if (py_result.size() != 2 && py_result.size() != 3) {
        throw std::runtime_error("Python observe() must return (position, color[, visible])");
    }

    Observation obs;
    obs.position = py_result[0].cast<int>();
    obs.color = parse_color(py_result[1]);
    if (py_result.size() == 3 && !py_result[2].is_none()) {
        obs.visible = py_result[2].cast<std::set<int>>();
    }
    return obs;
}

PythonCallbackTransport::PythonCallbackTransport(py::object py_transport)
    : py_transport_(std::move(py_transport)) {

    if (!py::hasattr(py_transport_, "send")) {
        throw std::runtime_error("Python transport must have a 'send(frame)' method");
    }
}

void PythonCallbackTransport::send(const Frame& frame) {
    py::bytes data(reinterpret_cast<const char*>(frame.data()), frame.size());
    try {
        py_transport_.attr("send")(data);
    } catch (const py::error_already_set& e) {
        throw TransportError(e.what());
    }
}

} // namespace tttarm
