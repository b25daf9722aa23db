#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include "qsoflux/cursor.hpp"
#include "qsoflux/qso.hpp"

namespace qsoflux {

struct QsoFilter {
  std::string band;            // normalized match; empty -> any
  std::string mode;            // normalized match; empty -> any
  std::string call_contains;   // case-insensitive substring; empty -> any
  std::size_t limit = 0;       // 0 -> unlimited
};

[[nodiscard]] bool MatchesFilter(const Qso& qso, const QsoFilter& filter);

// Persistence contract consumed by the import and export paths.
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  // Returns how many records were stored.
  virtual std::size_t InsertBatch(std::span<const Qso> records) = 0;

  [[nodiscard]] virtual std::unique_ptr<QsoCursor> Iterate(const QsoFilter& filter = {}) const = 0;
};

// Insertion-ordered store held in memory. Cursors iterate a snapshot taken
// when Iterate() is called.
class MemoryRecordStore final : public RecordStore {
 public:
  std::size_t InsertBatch(std::span<const Qso> records) override;
  [[nodiscard]] std::unique_ptr<QsoCursor> Iterate(const QsoFilter& filter = {}) const override;

  [[nodiscard]] std::size_t Size() const;

 private:
  mutable std::mutex mu_;
  QsoList records_;
};

}  // namespace qsoflux
