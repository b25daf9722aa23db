#include <cassert>
#include <sstream>
#include <string>

#include "qsoflux/awards.hpp"
#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/record_store.hpp"
#include "qsoflux/stream.hpp"

int main() {
  using namespace qsoflux;

  std::ostringstream log;
  log << "Generated log <ADIF_VER:5>3.1.4 <EOH>\n";
  for (int i = 0; i < 400; ++i) {
    log << "<CALL:5>K1A" << (10 + i % 90) << "<QSO_DATE:8>20240101<TIME_ON:4>1200<BAND:3>" << (i % 2 ? "20m" : "40m")
        << "<GRIDSQUARE:4>FN" << (10 + i % 60) << "<COUNTRY:3>USA<EOR>\n";
  }

  PipelineConfig cfg;
  cfg.batch_records = 50;
  cfg.num_threads = 4;
  auto imported = ImportPipeline(cfg).Run(log.str());
  assert(imported.parallel);
  assert(imported.records.size() == 400);

  MemoryRecordStore store;
  store.InsertBatch(imported.records);

  auto summary = ComputeSummary(imported.records);
  assert(summary.UniqueCalls() == 90);
  assert(summary.UniqueCountries() == 1);
  assert(summary.UniqueGrids() == 60);
  assert(summary.GridsPerBand().at("20M") == 30);
  assert(summary.GridsPerBand().at("40M") == 30);

  auto cursor = store.Iterate();
  std::ostringstream out;
  assert(EncodeToStream(*cursor, out) == 400);
  auto again = DecodeDocument(out.str());
  assert(again.records == imported.records);
  return 0;
}
