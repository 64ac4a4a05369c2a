#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "fand/inputs.hpp"
#include "fand/monitor.hpp"
#include "fand/pid.hpp"
#include "fand/pipeline.hpp"
#include "fand/scheduler.hpp"
#include "fand/stage_spec.hpp"

namespace py = pybind11;

namespace {

class PySampleSource : public fand::SampleSource {
public:
    using fand::SampleSource::SampleSource;

    std::optional<double> next_sample() override {
        PYBIND11_OVERRIDE_PURE(std::optional<double>, fand::SampleSource, next_sample);
    }
};

// Keeps the Python-side source alive for as long as the pipeline pulls it.
class SharedSource : public fand::SampleSource {
public:
    explicit SharedSource(std::shared_ptr<fand::SampleSource> inner) : inner_(std::move(inner)) {}

    std::optional<double> next_sample() override {
        return inner_->next_sample();
    }

private:
    std::shared_ptr<fand::SampleSource> inner_;
};

std::vector<double> drain(fand::Pipeline& pipeline, std::size_t limit) {
    std::vector<double> values;
    while (values.size() < limit) {
        auto value = pipeline.next_sample();
        if (!value.has_value()) {
            break;
        }
        values.push_back(*value);
    }
    return values;
}

}  // namespace

PYBIND11_MODULE(fand_python, m) {
    m.doc() = "Pybind11 bindings for the fand stream pipeline, for offline tuning of stage chains.";

    py::register_exception<fand::ConfigError>(m, "ConfigError");

    py::class_<fand::PidGains>(m, "PidGains")
        .def(py::init<>())
        .def_readwrite("kp", &fand::PidGains::kp)
        .def_readwrite("ki", &fand::PidGains::ki)
        .def_readwrite("kd", &fand::PidGains::kd)
        .def_readwrite("p_limit", &fand::PidGains::p_limit)
        .def_readwrite("i_limit", &fand::PidGains::i_limit)
        .def_readwrite("d_limit", &fand::PidGains::d_limit)
        .def_readwrite("setpoint", &fand::PidGains::setpoint);

    py::class_<fand::ControlOutput>(m, "ControlOutput")
        .def_readonly("p", &fand::ControlOutput::p)
        .def_readonly("i", &fand::ControlOutput::i)
        .def_readonly("d", &fand::ControlOutput::d)
        .def_readonly("output", &fand::ControlOutput::output);

    py::class_<fand::PidController>(m, "PidController")
        .def(py::init<fand::PidGains>())
        .def("next_control_output", &fand::PidController::next_control_output)
        .def("reset", &fand::PidController::reset)
        .def_property_readonly("integral_term", &fand::PidController::integral_term);

    py::class_<fand::IdentitySpec>(m, "IdentitySpec").def(py::init<>());
    py::class_<fand::AverageSpec>(m, "AverageSpec")
        .def(py::init<int>(), py::arg("n"))
        .def_readwrite("n", &fand::AverageSpec::n);
    py::class_<fand::PidSpec>(m, "PidSpec")
        .def(py::init([](fand::PidGains gains, int offset) { return fand::PidSpec{gains, offset}; }),
             py::arg("gains"), py::arg("offset") = 0)
        .def_readwrite("gains", &fand::PidSpec::gains)
        .def_readwrite("offset", &fand::PidSpec::offset);
    py::class_<fand::DampenedOscillatorSpec>(m, "DampenedOscillatorSpec")
        .def(py::init([](double m_, double k, double dt) { return fand::DampenedOscillatorSpec{m_, k, dt}; }),
             py::arg("m"), py::arg("k"), py::arg("dt"))
        .def_readwrite("m", &fand::DampenedOscillatorSpec::m)
        .def_readwrite("k", &fand::DampenedOscillatorSpec::k)
        .def_readwrite("dt", &fand::DampenedOscillatorSpec::dt);
    py::class_<fand::ClipSpec>(m, "ClipSpec")
        .def(py::init([](double min, double max) { return fand::ClipSpec{min, max}; }), py::arg("min"),
             py::arg("max"))
        .def_readwrite("min", &fand::ClipSpec::min)
        .def_readwrite("max", &fand::ClipSpec::max);
    py::class_<fand::AtLeastSpec>(m, "AtLeastSpec")
        .def(py::init([](double threshold) { return fand::AtLeastSpec{threshold}; }), py::arg("threshold"))
        .def_readwrite("threshold", &fand::AtLeastSpec::threshold);
    py::class_<fand::SupersampleSpec>(m, "SupersampleSpec")
        .def(py::init([](int n) { return fand::SupersampleSpec{n}; }), py::arg("n"))
        .def_readwrite("n", &fand::SupersampleSpec::n);
    py::class_<fand::SubsampleSpec>(m, "SubsampleSpec")
        .def(py::init([](int n) { return fand::SubsampleSpec{n}; }), py::arg("n"))
        .def_readwrite("n", &fand::SubsampleSpec::n);

    m.def("stage_kind", &fand::stage_kind);
    m.def("default_stage_specs", &fand::default_stage_specs);

    py::class_<fand::SampleSource, PySampleSource, std::shared_ptr<fand::SampleSource>>(m, "SampleSource")
        .def(py::init<>())
        .def("next_sample", &fand::SampleSource::next_sample);

    py::class_<fand::Pipeline>(m, "Pipeline")
        .def("next_sample", &fand::Pipeline::next_sample)
        .def("drain", &drain, py::arg("limit") = 1000000)
        .def("__len__", &fand::Pipeline::size)
        .def_property_readonly("exhausted", &fand::Pipeline::exhausted);

    py::class_<fand::OutputSuppressor>(m, "OutputSuppressor")
        .def(py::init<>())
        .def("should_forward", &fand::OutputSuppressor::should_forward)
        .def_property_readonly("last_forwarded", &fand::OutputSuppressor::last_forwarded);

    m.def("assemble_pipeline",
          [](const std::vector<fand::StageSpec>& specs, std::shared_ptr<fand::SampleSource> source) {
              return fand::assemble_pipeline(specs, std::make_unique<SharedSource>(std::move(source)));
          },
          py::arg("specs"), py::arg("source"), py::keep_alive<0, 2>());

    m.def("assemble_replay_pipeline",
          [](const std::vector<fand::StageSpec>& specs, std::vector<double> values) {
              return fand::assemble_pipeline(specs, std::make_unique<fand::ReplayInput>(std::move(values)));
          },
          py::arg("specs"), py::arg("values"));

    m.def("format_monitor_line", [](std::size_t stage_index, const std::string& tag, const std::string& payload) {
        return fand::MonitorMessage{stage_index, tag, payload}.line();
    });
}
