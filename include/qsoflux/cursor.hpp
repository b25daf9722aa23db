#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include "qsoflux/qso.hpp"

namespace qsoflux {

// Single-pass source of records. Restart by asking the producer for a new
// cursor.
class QsoCursor {
 public:
  virtual ~QsoCursor() = default;

  // Next record, or an empty optional once the sequence is exhausted.
  [[nodiscard]] virtual std::optional<Qso> Next() = 0;
};

// Cursor over an owned snapshot of records.
class VectorCursor final : public QsoCursor {
 public:
  explicit VectorCursor(QsoList records) : records_(std::move(records)) {}

  [[nodiscard]] std::optional<Qso> Next() override {
    if (pos_ >= records_.size()) {
      return std::nullopt;
    }
    return records_[pos_++];
  }

 private:
  QsoList records_;
  std::size_t pos_ = 0;
};

}  // namespace qsoflux
