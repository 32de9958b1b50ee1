#include "util/embedded_python.hpp"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace py = pybind11;

namespace mathviz::util {

EmbeddedPython::EmbeddedPython() {
    if (Py_IsInitialized()) {
        spdlog::debug("Embedded Python: reusing host interpreter");
        return;
    }

    try {
        // No signal handlers: the host owns SIGINT; no program dir on sys.path
        py::initialize_interpreter(false, 0, nullptr, false);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("cannot start embedded Python: ") + e.what());
    }

    {
        py::module_ sys = py::module_::import("sys");
        std::string version = py::str(sys.attr("version"));
        spdlog::info("Embedded Python {} initialized", version.substr(0, version.find(' ')));
    }

    // Release the GIL; every run re-acquires it from its own thread
    PyEval_SaveThread();
}

EmbeddedPython& EmbeddedPython::instance() {
    // Never destroyed, so the interpreter is never finalized
    static EmbeddedPython* python = new EmbeddedPython();
    return *python;
}

bool EmbeddedPython::module_available(const std::string& name) {
    py::gil_scoped_acquire gil;
    try {
        py::module_::import(name.c_str());
        return true;
    } catch (const py::error_already_set& e) {
        spdlog::debug("Python module {} unavailable: {}", name, e.what());
        return false;
    }
}

} // namespace mathviz::util
