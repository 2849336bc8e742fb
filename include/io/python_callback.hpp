#pragma once

#include "transport.hpp"
#include "vision.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

namespace tttarm {

/**
 * VisionSource that calls back into Python camera code.
 *
 * Frame grabbing and circle/color detection stay in Python (OpenCV);
 * only the resulting grid observation crosses into C++.
 */
class PythonCallbackVision : public VisionSource {
public:
    /**
     * @param py_vision Python object with observe() returning None,
     *                  (position, color) or (position, color, visible)
     *                  where color is "human"/"machine" or 1/2
     */
    explicit PythonCallbackVision(py::object py_vision);

    ~PythonCallbackVision() override = default;

    std::optional<Observation> observe() override;

private:
    py::object py_vision_;
};

/**
 * Transport that hands frames to a Python object (e.g. a pyserial port).
 */
class PythonCallbackTransport : public Transport {
public:
    /**
     * @param py_transport Python object with a send(bytes) method
     */
    explicit PythonCallbackTransport(py::object py_transport);

    ~PythonCallbackTransport() override = default;

    // Python exceptions are rethrown as TransportError
    void send(const Frame& frame) override;

private:
    py::object py_transport_;
};

} // namespace tttarm
