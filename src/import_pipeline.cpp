#include "qsoflux/import_pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include "qsoflux/chunk_splitter.hpp"
#include "qsoflux/record_normalizer.hpp"

namespace qsoflux {

std::size_t EffectiveThreads(std::size_t configured) {
  if (configured > 0) {
    return configured;
  }
  const auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 4 : hw;
}

BatchResult DecodeBatch(const ChunkBatch& batch) {
  BatchResult out;
  out.id = batch.id;
  out.records.reserve(batch.spans.size());
  for (auto span : batch.spans) {
    if (auto qso = DecodeRecord(span)) {
      out.records.push_back(std::move(*qso));
    } else {
      ++out.num_skipped;
    }
  }
  return out;
}

std::vector<ChunkBatch> MakeBatches(const std::vector<std::string_view>& spans, std::size_t batch_records) {
  if (batch_records == 0) {
    throw std::invalid_argument("batch_records must be positive");
  }
  std::vector<ChunkBatch> batches;
  batches.reserve((spans.size() + batch_records - 1) / batch_records);
  for (std::size_t start = 0; start < spans.size(); start += batch_records) {
    const std::size_t end = std::min(start + batch_records, spans.size());
    ChunkBatch batch;
    batch.id = batches.size();
    batch.spans.assign(spans.begin() + static_cast<std::ptrdiff_t>(start),
                       spans.begin() + static_cast<std::ptrdiff_t>(end));
    batches.push_back(std::move(batch));
  }
  return batches;
}

std::vector<BatchResult> AsyncImportBackend::Run(const std::vector<ChunkBatch>& batches,
                                                 std::size_t num_threads,
                                                 ProgressTracker* progress) const {
  const std::size_t workers = std::max<std::size_t>(1, std::min(num_threads, batches.size()));

  std::vector<std::future<std::vector<BatchResult>>> futures;
  futures.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    futures.push_back(std::async(std::launch::async, [&batches, progress, w, workers] {
      std::vector<BatchResult> partial;
      for (std::size_t i = w; i < batches.size(); i += workers) {
        partial.push_back(DecodeBatch(batches[i]));
        if (progress != nullptr) {
          progress->Add(1, batches[i].spans.size());
        }
      }
      return partial;
    }));
  }

  std::vector<BatchResult> results;
  results.reserve(batches.size());
  for (auto& future : futures) {
    for (auto& result : future.get()) {
      results.push_back(std::move(result));
    }
  }
  return results;
}

std::vector<BatchResult> WorkerPoolImportBackend::Run(const std::vector<ChunkBatch>& batches,
                                                      std::size_t num_threads,
                                                      ProgressTracker* progress) const {
  const std::size_t workers = std::max<std::size_t>(1, std::min(num_threads, batches.size()));
  const std::size_t in_queue_cap =
      queue_capacity_ > 0 ? queue_capacity_ : std::max<std::size_t>(workers * 4, 8);

  std::atomic<bool> had_error{false};
  std::mutex err_mu;
  std::string shared_err;

  std::deque<const ChunkBatch*> in_queue;
  std::mutex in_mu;
  std::condition_variable in_cv;
  bool input_done = false;

  std::unordered_map<std::size_t, BatchResult> out_ready;
  std::mutex out_mu;
  std::condition_variable out_cv;
  std::size_t workers_done = 0;

  auto set_error = [&](const std::string& message) {
    had_error.store(true, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(err_mu);
      if (shared_err.empty()) {
        shared_err = message;
      }
    }
    {
      std::lock_guard<std::mutex> lock(in_mu);
      input_done = true;
    }
    in_cv.notify_all();
    out_cv.notify_all();
  };

  auto worker = [&]() {
    while (true) {
      const ChunkBatch* batch = nullptr;
      {
        std::unique_lock<std::mutex> lock(in_mu);
        in_cv.wait(lock, [&]() { return !in_queue.empty() || input_done; });
        if (in_queue.empty()) {
          break;
        }
        batch = in_queue.front();
        in_queue.pop_front();
      }
      in_cv.notify_all();

      if (had_error.load(std::memory_order_relaxed)) {
        continue;
      }
      try {
        BatchResult result = DecodeBatch(*batch);
        if (progress != nullptr) {
          progress->Add(1, batch->spans.size());
        }
        {
          std::lock_guard<std::mutex> lock(out_mu);
          out_ready.emplace(result.id, std::move(result));
        }
        out_cv.notify_all();
      } catch (const std::exception& e) {
        set_error(std::string("batch decode failed: ") + e.what());
      }
    }

    {
      std::lock_guard<std::mutex> lock(out_mu);
      ++workers_done;
    }
    out_cv.notify_all();
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  auto join_all = [&]() {
    for (auto& t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  };

  try {
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
  } catch (const std::system_error& e) {
    set_error(e.what());
    join_all();
    throw;
  }

  for (const auto& batch : batches) {
    std::unique_lock<std::mutex> lock(in_mu);
    in_cv.wait(lock, [&]() { return had_error.load(std::memory_order_relaxed) || in_queue.size() < in_queue_cap; });
    if (had_error.load(std::memory_order_relaxed)) {
      break;
    }
    in_queue.push_back(&batch);
    lock.unlock();
    in_cv.notify_all();
  }
  {
    std::lock_guard<std::mutex> lock(in_mu);
    input_done = true;
  }
  in_cv.notify_all();

  std::vector<BatchResult> results;
  results.reserve(batches.size());
  {
    std::unique_lock<std::mutex> lock(out_mu);
    out_cv.wait(lock, [&]() { return workers_done == threads.size(); });
    for (auto& kv : out_ready) {
      results.push_back(std::move(kv.second));
    }
  }
  join_all();

  if (had_error.load(std::memory_order_relaxed)) {
    std::lock_guard<std::mutex> lock(err_mu);
    throw std::runtime_error(shared_err.empty() ? "worker pool failed" : shared_err);
  }
  if (results.size() != batches.size()) {
    throw std::runtime_error("worker pool lost batches: expected " + std::to_string(batches.size()) + ", got " +
                             std::to_string(results.size()));
  }
  return results;
}

std::unique_ptr<ImportBackend> MakeImportBackend(ImportBackendKind kind, std::size_t queue_capacity) {
  switch (kind) {
    case ImportBackendKind::async:
      return std::make_unique<AsyncImportBackend>();
    case ImportBackendKind::worker_pool:
      return std::make_unique<WorkerPoolImportBackend>(queue_capacity);
  }
  throw std::invalid_argument("unknown import backend");
}

ImportResult DecodeDocument(std::string_view document) {
  ImportResult result;
  for (auto span : ChunkSplitter(document)) {
    ++result.num_chunks;
    if (auto qso = DecodeRecord(span)) {
      result.records.push_back(std::move(*qso));
    } else {
      ++result.num_skipped;
    }
  }
  return result;
}

ImportPipeline::ImportPipeline(PipelineConfig config)
    : ImportPipeline(config, MakeImportBackend(config.backend, config.queue_capacity)) {}

ImportPipeline::ImportPipeline(PipelineConfig config, std::unique_ptr<ImportBackend> backend)
    : config_(config), backend_(std::move(backend)) {
  if (config_.batch_records == 0) {
    throw std::invalid_argument("batch_records must be positive");
  }
  if (!backend_) {
    throw std::invalid_argument("import backend is null");
  }
}

ImportResult ImportPipeline::Run(std::string_view document) const {
  return Run(document, config_.num_threads);
}

ImportResult ImportPipeline::Run(std::string_view document, std::size_t num_threads) const {
  const auto spans = ChunkSplitter(document).Collect();
  if (spans.size() < config_.serial_threshold) {
    return DecodeDocument(document);
  }

  const std::size_t threads = EffectiveThreads(num_threads);
  const auto batches = MakeBatches(spans, config_.batch_records);

  std::unique_ptr<ProgressTracker> progress;
  if (config_.progress_interval_ms > 0) {
    progress = std::make_unique<ProgressTracker>(batches.size(), "import", config_.progress_interval_ms);
  }

  std::vector<BatchResult> partials;
  try {
    partials = backend_->Run(batches, threads, progress.get());
  } catch (const std::exception& e) {
    std::cerr << "parallel import (" << backend_->Name() << ") failed: " << e.what()
              << "; falling back to serial decode\n";
    auto serial = DecodeDocument(document);
    serial.fell_back_serial = true;
    return serial;
  }
  if (progress) {
    progress->Finish();
  }

  std::sort(partials.begin(), partials.end(),
            [](const BatchResult& l, const BatchResult& r) { return l.id < r.id; });

  ImportResult result;
  result.parallel = true;
  result.num_chunks = spans.size();
  std::size_t total = 0;
  for (const auto& p : partials) {
    total += p.records.size();
  }
  result.records.reserve(total);
  for (auto& p : partials) {
    result.num_skipped += p.num_skipped;
    std::move(p.records.begin(), p.records.end(), std::back_inserter(result.records));
  }
  return result;
}

}  // namespace qsoflux
