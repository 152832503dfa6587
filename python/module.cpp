#include <pybind11/pybind11.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "readeof/tail.hpp"

namespace py = pybind11;

// ---------- helpers ----------
static reof::ReadOptions make_read_options(const std::string& encoding, std::size_t buffer_size) {
    reof::ReadOptions opt;
    opt.encoding    = reof::parse_encoding(encoding);
    opt.buffer_size = buffer_size;
    return opt;
}

// Owns the stop source so Python can stop a follower blocked in __next__
// from another thread.
class PyFollower {
public:
    PyFollower(std::string path, long long max_lines, const std::string& encoding,
               std::size_t buffer_size, long long poll_ms, long long idle_ms)
    {
        reof::TailOptions opt;
        static_cast<reof::ReadOptions&>(opt) = make_read_options(encoding, buffer_size);
        opt.poll_interval      = std::chrono::milliseconds(poll_ms);
        opt.inactivity_timeout = std::chrono::milliseconds(idle_ms);
        follower_ = std::make_unique<reof::LineFollower>(std::move(path), max_lines, opt,
                                                         stop_.get_token());
    }

    std::string next() {
        std::optional<std::string> line;
        {
            py::gil_scoped_release nogil;
            line = follower_->next();
        }
        if (!line) throw py::stop_iteration();
        return std::move(*line);
    }

    void stop() { stop_.request_stop(); }

    [[nodiscard]] std::uint64_t position() const noexcept { return follower_->position(); }
    [[nodiscard]] bool stopped() const noexcept {
        const auto s = follower_->state();
        return s == reof::LineFollower::State::Stopped || s == reof::LineFollower::State::Failed;
    }

private:
    std::stop_source                    stop_;
    std::unique_ptr<reof::LineFollower> follower_;
};

// ---------- module ----------
PYBIND11_MODULE(pyreadeof, m) {
    m.doc() = "Read the last N lines of a file and follow appended lines";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const reof::TailError& e) {
            switch (e.kind) {
                case reof::ErrorKind::NotFound:
                    PyErr_SetString(PyExc_FileNotFoundError, e.what());     return;
                case reof::ErrorKind::PermissionDenied:
                    PyErr_SetString(PyExc_PermissionError, e.what());       return;
                case reof::ErrorKind::IsADirectory:
                    PyErr_SetString(PyExc_IsADirectoryError, e.what());     return;
                case reof::ErrorKind::InvalidArgument:
                    PyErr_SetString(PyExc_ValueError, e.what());            return;
                case reof::ErrorKind::IOError:
                    PyErr_SetString(PyExc_OSError, e.what());               return;
            }
            PyErr_SetString(PyExc_OSError, e.what());
        }
    });

    m.attr("DEFAULT_BUFFER_SIZE") = py::int_(reof::kDefaultBufferSize);

    // read_last(path, max_lines, encoding="utf8", buffer_size=16384) -> str
    m.def("read_last",
          [](const std::string& path, long long max_lines,
             const std::string& encoding, std::size_t buffer_size) {
              const auto opt = make_read_options(encoding, buffer_size);
              std::string text;
              {
                  py::gil_scoped_release nogil;
                  text = reof::read_last(path, max_lines, opt);
              }
              return text;
          },
          py::arg("path"), py::arg("max_lines"),
          py::arg("encoding") = "utf8",
          py::arg("buffer_size") = reof::kDefaultBufferSize);

    py::class_<PyFollower>(m, "Follower")
        .def(py::init<std::string, long long, const std::string&, std::size_t, long long, long long>(),
             py::arg("path"), py::arg("max_lines"),
             py::arg("encoding") = "utf8",
             py::arg("buffer_size") = reof::kDefaultBufferSize,
             py::arg("poll_ms") = 1000,
             py::arg("idle_ms") = 0)
        .def("__iter__", [](PyFollower& self) -> PyFollower& { return self; },
             py::return_value_policy::reference_internal)
        .def("__next__", &PyFollower::next)
        .def("stop", &PyFollower::stop)
        .def_property_readonly("position", &PyFollower::position)
        .def_property_readonly("stopped", &PyFollower::stopped);
}
