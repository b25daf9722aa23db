#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "qsoflux/awards.hpp"
#include "qsoflux/config.hpp"
#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/log_io.hpp"
#include "qsoflux/stream.hpp"

namespace py = pybind11;
using namespace qsoflux;

PYBIND11_MODULE(pyqsoflux, m) {
  py::class_<Qso>(m, "Qso")
      .def(py::init<>())
      .def_readwrite("call", &Qso::call)
      .def_readwrite("start_at", &Qso::start_at)
      .def_readwrite("band", &Qso::band)
      .def_readwrite("mode", &Qso::mode)
      .def_readwrite("freq_mhz", &Qso::freq_mhz)
      .def_readwrite("rst_sent", &Qso::rst_sent)
      .def_readwrite("rst_rcvd", &Qso::rst_rcvd)
      .def_readwrite("name", &Qso::name)
      .def_readwrite("qth", &Qso::qth)
      .def_readwrite("grid", &Qso::grid)
      .def_readwrite("country", &Qso::country)
      .def_readwrite("comment", &Qso::comment)
      .def("__eq__", [](const Qso& a, const Qso& b) { return a == b; });

  py::enum_<ImportBackendKind>(m, "ImportBackendKind")
      .value("async_", ImportBackendKind::async)
      .value("worker_pool", ImportBackendKind::worker_pool);

  py::class_<PipelineConfig>(m, "PipelineConfig")
      .def(py::init<>())
      .def_readwrite("backend", &PipelineConfig::backend)
      .def_readwrite("num_threads", &PipelineConfig::num_threads)
      .def_readwrite("serial_threshold", &PipelineConfig::serial_threshold)
      .def_readwrite("batch_records", &PipelineConfig::batch_records)
      .def_readwrite("queue_capacity", &PipelineConfig::queue_capacity);

  py::class_<ImportResult>(m, "ImportResult")
      .def_readonly("records", &ImportResult::records)
      .def_readonly("num_chunks", &ImportResult::num_chunks)
      .def_readonly("num_skipped", &ImportResult::num_skipped)
      .def_readonly("parallel", &ImportResult::parallel)
      .def_readonly("fell_back_serial", &ImportResult::fell_back_serial);

  py::class_<ImportPipeline>(m, "ImportPipeline")
      .def(py::init<PipelineConfig>(), py::arg("config") = PipelineConfig{})
      .def("run", [](const ImportPipeline& self, const std::string& text) { return self.Run(text); },
           py::call_guard<py::gil_scoped_release>());

  py::class_<AwardsSummary>(m, "AwardsSummary")
      .def_readonly("total_qsos", &AwardsSummary::total_qsos)
      .def_readonly("countries", &AwardsSummary::countries)
      .def_readonly("grids", &AwardsSummary::grids)
      .def_readonly("calls", &AwardsSummary::calls)
      .def_readonly("bands", &AwardsSummary::bands)
      .def_readonly("modes", &AwardsSummary::modes)
      .def("grids_per_band", &AwardsSummary::GridsPerBand);

  py::class_<SummaryOptions>(m, "SummaryOptions")
      .def(py::init<>())
      .def_readwrite("chunk_size", &SummaryOptions::chunk_size)
      .def_readwrite("num_threads", &SummaryOptions::num_threads);

  m.def("decode", [](const std::string& text) { return DecodeDocument(text).records; });
  m.def("encode", [](const QsoList& records, const std::string& program_id) {
        EncoderOptions opts;
        opts.program_id = program_id;
        return EncodeDocument(records, opts);
      },
      py::arg("records"), py::arg("program_id") = std::string(kDefaultProgramId));
  m.def("compute_summary", [](const QsoList& records) { return ComputeSummary(records); });
  m.def("compute_summary_parallel",
        [](const QsoList& records, SummaryOptions opts) { return ComputeSummaryParallel(records, opts); },
        py::arg("records"), py::arg("options") = SummaryOptions{});
  m.def("filtered_qsos",
        [](const QsoList& records, const std::string& band, const std::string& mode) {
          return FilterQsos(records, band, mode);
        },
        py::arg("records"), py::arg("band") = "", py::arg("mode") = "");
  m.def("suggest_awards", [](const AwardsSummary& summary, const std::string& thresholds_path) {
        return SuggestAwards(summary, LoadAwardThresholds(thresholds_path));
      },
      py::arg("summary"), py::arg("thresholds_path") = "");
  m.def("read_log_file", &ReadLogFile);
}
