#include <iostream>
#include <vector>

#include "qsoflux/awards.hpp"
#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/stream.hpp"

int main() {
  using namespace qsoflux;

  const std::string log =
      "<ADIF_VER:3>3.1 <PROGRAMID:7>Example <EOH>\n"
      "<CALL:5>K1ABC<QSO_DATE:8>20240101<TIME_ON:4>1200<BAND:3>20m<MODE:3>SSB<FREQ:9>14.250000"
      "<GRIDSQUARE:4>FN42<COUNTRY:3>USA<EOR>\n"
      "<CALL:5>G0XYZ<QSO_DATE:8>20240102<TIME_ON:6>083015<BAND:3>40m<MODE:2>CW"
      "<GRIDSQUARE:4>IO91<COUNTRY:7>England<COMMENT:12>qrs pse <73><EOR>\n"
      "<QSO_DATE:8>20240103<TIME_ON:4>0900<BAND:3>20m<EOR>\n";

  PipelineConfig cfg;
  cfg.num_threads = 4;
  ImportPipeline pipeline(cfg);
  auto result = pipeline.Run(log);
  std::cout << "accepted " << result.records.size() << ", skipped " << result.num_skipped << "\n";

  auto summary = ComputeSummary(result.records);
  std::cout << "countries " << summary.UniqueCountries() << ", grids " << summary.UniqueGrids() << "\n";
  for (const auto& [band, count] : summary.GridsPerBand()) {
    std::cout << "  " << band << ": " << count << " grid(s)\n";
  }

  VectorCursor cursor(result.records);
  StreamingEncoder encoder(cursor);
  while (auto fragment = encoder.Next()) {
    std::cout << *fragment;
  }
  return 0;
}
