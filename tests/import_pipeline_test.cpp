#include <algorithm>
#include <cassert>
#include <cstdio>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qsoflux/import_pipeline.hpp"
#include "qsoflux/progress.hpp"

using namespace qsoflux;

namespace {

std::string MakeLog(std::size_t n) {
  std::ostringstream oss;
  oss << "<ADIF_VER:3>3.1\n<EOH>\n";
  for (std::size_t i = 0; i < n; ++i) {
    const std::string call = "K" + std::to_string(i);
    const unsigned minute = static_cast<unsigned>(i % 60);
    char time_on[8];
    std::snprintf(time_on, sizeof(time_on), "12%02u", minute);
    if (i % 17 == 5) {
      // no CALL
      oss << "<QSO_DATE:8>20240101<TIME_ON:4>" << time_on << "<EOR>\n";
      continue;
    }
    oss << "<CALL:" << call.size() << ">" << call << "<QSO_DATE:8>20240101<TIME_ON:4>" << time_on
        << "<BAND:3>" << (i % 2 == 0 ? "20m" : "40m") << "<GRIDSQUARE:4>FN" << (10 + i % 80) << "<EOR>\n";
  }
  return oss.str();
}

// Completes batches on a fixed strategy but hands them back shuffled.
class ShufflingBackend final : public ImportBackend {
 public:
  std::vector<BatchResult> Run(const std::vector<ChunkBatch>& batches, std::size_t,
                               ProgressTracker*) const override {
    std::vector<BatchResult> out;
    for (const auto& b : batches) {
      out.push_back(DecodeBatch(b));
    }
    std::mt19937 rng(7);
    std::shuffle(out.begin(), out.end(), rng);
    return out;
  }
  std::string_view Name() const override { return "shuffle"; }
};

class FailingBackend final : public ImportBackend {
 public:
  std::vector<BatchResult> Run(const std::vector<ChunkBatch>&, std::size_t, ProgressTracker*) const override {
    throw std::runtime_error("dispatch refused");
  }
  std::string_view Name() const override { return "failing"; }
};

}  // namespace

int main() {
  const std::string log = MakeLog(1000);
  const ImportResult serial = DecodeDocument(log);
  assert(serial.num_chunks == 1000);
  assert(serial.num_skipped == 59);
  assert(serial.records.size() == 941);
  assert(serial.records.front().call == "K0");

  for (auto kind : {ImportBackendKind::async, ImportBackendKind::worker_pool}) {
    PipelineConfig cfg;
    cfg.backend = kind;
    cfg.batch_records = 32;
    ImportPipeline pipeline(cfg);
    for (std::size_t threads : {1u, 4u, 16u}) {
      auto result = pipeline.Run(log, threads);
      assert(result.parallel);
      assert(!result.fell_back_serial);
      assert(result.records == serial.records);
      assert(result.num_chunks == serial.num_chunks);
      assert(result.num_skipped == serial.num_skipped);
    }
  }

  // Tight queue: producers block on capacity without losing batches.
  {
    PipelineConfig cfg;
    cfg.backend = ImportBackendKind::worker_pool;
    cfg.batch_records = 1;
    cfg.queue_capacity = 1;
    auto result = ImportPipeline(cfg).Run(log, 3);
    assert(result.records == serial.records);
  }

  // Order is restored whatever order the backend returns.
  {
    PipelineConfig cfg;
    cfg.batch_records = 10;
    ImportPipeline pipeline(cfg, std::make_unique<ShufflingBackend>());
    auto result = pipeline.Run(log, 4);
    assert(result.parallel);
    assert(result.records == serial.records);
    assert(pipeline.GetBackend().Name() == "shuffle");
  }

  // Dispatch failure falls back to the serial decode.
  {
    ImportPipeline pipeline(PipelineConfig{}, std::make_unique<FailingBackend>());
    auto result = pipeline.Run(log, 4);
    assert(result.fell_back_serial);
    assert(!result.parallel);
    assert(result.records == serial.records);
  }

  // Below the threshold the serial path is taken.
  {
    const std::string small = MakeLog(50);
    auto result = ImportPipeline().Run(small, 8);
    assert(!result.parallel);
    assert(result.records == DecodeDocument(small).records);
  }

  // 200 records: parallel path.
  {
    const std::string mid = MakeLog(200);
    PipelineConfig cfg;
    cfg.batch_records = 16;
    auto result = ImportPipeline(cfg).Run(mid, 4);
    assert(result.parallel);
    assert(result.records == DecodeDocument(mid).records);
  }

  // Progress lines reach the sink.
  {
    std::ostringstream sink;
    ProgressTracker progress(4, "test", 1, sink);
    progress.Add(2, 20);
    progress.Add(2, 20);
    progress.Finish();
    assert(progress.DoneChunks() == 4);
    assert(progress.DoneRecords() == 40);
    assert(sink.str().find("[test] chunks 4/4") != std::string::npos);
  }

  {
    PipelineConfig cfg;
    cfg.batch_records = 0;
    bool threw = false;
    try {
      ImportPipeline pipeline(cfg);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      auto batches = MakeBatches({}, 0);
      (void)batches;
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  {
    std::vector<std::string_view> spans(10, "x");
    auto batches = MakeBatches(spans, 4);
    assert(batches.size() == 3);
    assert(batches[2].id == 2);
    assert(batches[2].spans.size() == 2);
  }

  assert(EffectiveThreads(3) == 3);
  assert(EffectiveThreads(0) >= 1);
  assert(DecodeDocument("").records.empty());
  return 0;
}
