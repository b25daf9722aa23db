#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "qsoflux/progress.hpp"
#include "qsoflux/qso.hpp"

namespace qsoflux {

enum class ImportBackendKind {
  async = 0,
  worker_pool
};

struct PipelineConfig {
  ImportBackendKind backend = ImportBackendKind::worker_pool;
  std::size_t num_threads = 0;          // 0 -> hardware concurrency
  std::size_t serial_threshold = 100;   // fewer record spans than this run serially
  std::size_t batch_records = 256;      // record spans per task
  std::size_t queue_capacity = 0;       // worker_pool only; 0 -> derived from threads
  std::uint64_t progress_interval_ms = 0;  // 0 -> no progress lines
};

struct ImportResult {
  QsoList records;
  std::uint64_t num_chunks = 0;   // non-blank record spans offered
  std::uint64_t num_skipped = 0;  // spans rejected by the normalizer
  bool parallel = false;
  bool fell_back_serial = false;
};

// An immutable unit of work: consecutive record spans viewing the caller's
// document, identified by position so results can be re-assembled in order.
struct ChunkBatch {
  std::size_t id = 0;
  std::vector<std::string_view> spans;
};

struct BatchResult {
  std::size_t id = 0;
  QsoList records;
  std::uint64_t num_skipped = 0;
};

// Scanner + normalizer over every span of one batch. Pure; safe to call from
// any thread.
[[nodiscard]] BatchResult DecodeBatch(const ChunkBatch& batch);

// Groups the record spans of a document into batches of batch_records.
[[nodiscard]] std::vector<ChunkBatch> MakeBatches(const std::vector<std::string_view>& spans,
                                                  std::size_t batch_records);

// Fan-out/fan-in strategy. Implementations may complete batches in any order
// and return them in any order; they must return exactly one result per batch
// and throw when dispatch itself fails.
class ImportBackend {
 public:
  virtual ~ImportBackend() = default;

  [[nodiscard]] virtual std::vector<BatchResult> Run(const std::vector<ChunkBatch>& batches,
                                                     std::size_t num_threads,
                                                     ProgressTracker* progress) const = 0;
  [[nodiscard]] virtual std::string_view Name() const = 0;
};

// One std::async task per worker, each decoding a strided share of batches.
class AsyncImportBackend final : public ImportBackend {
 public:
  [[nodiscard]] std::vector<BatchResult> Run(const std::vector<ChunkBatch>& batches,
                                             std::size_t num_threads,
                                             ProgressTracker* progress) const override;
  [[nodiscard]] std::string_view Name() const override { return "async"; }
};

// Fixed worker threads pulling batches from a bounded queue and delivering
// results through an id-keyed output channel.
class WorkerPoolImportBackend final : public ImportBackend {
 public:
  explicit WorkerPoolImportBackend(std::size_t queue_capacity = 0) : queue_capacity_(queue_capacity) {}

  [[nodiscard]] std::vector<BatchResult> Run(const std::vector<ChunkBatch>& batches,
                                             std::size_t num_threads,
                                             ProgressTracker* progress) const override;
  [[nodiscard]] std::string_view Name() const override { return "worker_pool"; }

 private:
  std::size_t queue_capacity_;
};

[[nodiscard]] std::unique_ptr<ImportBackend> MakeImportBackend(ImportBackendKind kind,
                                                               std::size_t queue_capacity = 0);

[[nodiscard]] std::size_t EffectiveThreads(std::size_t configured);

// Serial reference decode of a whole document.
[[nodiscard]] ImportResult DecodeDocument(std::string_view document);

class ImportPipeline {
 public:
  explicit ImportPipeline(PipelineConfig config = {});
  ImportPipeline(PipelineConfig config, std::unique_ptr<ImportBackend> backend);

  // Decodes every valid record of document. The result is identical for any
  // worker count and backend; dispatch failures fall back to DecodeDocument.
  [[nodiscard]] ImportResult Run(std::string_view document) const;
  [[nodiscard]] ImportResult Run(std::string_view document, std::size_t num_threads) const;

  [[nodiscard]] const PipelineConfig& GetConfig() const { return config_; }
  [[nodiscard]] const ImportBackend& GetBackend() const { return *backend_; }

 private:
  PipelineConfig config_;
  std::unique_ptr<ImportBackend> backend_;
};

}  // namespace qsoflux
