#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "qsoflux/cursor.hpp"
#include "qsoflux/qso.hpp"

namespace qsoflux {

inline constexpr std::string_view kAdifVersion = "3.1";
inline constexpr std::string_view kDefaultProgramId = "QsoFlux";

struct EncoderOptions {
  std::string program_id = std::string(kDefaultProgramId);
};

// <TAG:byte-length>value
[[nodiscard]] std::string EncodeField(std::string_view tag, std::string_view value);

// Six decimals, then trailing zeros and a dangling '.' removed: 14.25, 14.
[[nodiscard]] std::string FormatFrequency(double mhz);

[[nodiscard]] std::string EncodeHeader(const EncoderOptions& options = {});

// One record in fixed field order, terminated by <EOR> and a newline. Absent
// and empty fields are omitted.
[[nodiscard]] std::string EncodeRecord(const Qso& qso);

// Lazy encoder: the first fragment is the header, then one fragment per
// record pulled from the cursor. Nothing beyond the current fragment is held.
class StreamingEncoder {
 public:
  explicit StreamingEncoder(QsoCursor& source, EncoderOptions options = {})
      : source_(source), options_(std::move(options)) {}

  [[nodiscard]] std::optional<std::string> Next();

  [[nodiscard]] std::uint64_t RecordsEmitted() const { return records_; }

 private:
  QsoCursor& source_;
  EncoderOptions options_;
  bool header_done_ = false;
  bool exhausted_ = false;
  std::uint64_t records_ = 0;
};

// Drains the cursor into out fragment by fragment; returns records written.
// Throws std::runtime_error when the stream goes bad.
std::uint64_t EncodeToStream(QsoCursor& source, std::ostream& out, const EncoderOptions& options = {});

// Whole-document convenience for small inputs.
[[nodiscard]] std::string EncodeDocument(const QsoList& records, const EncoderOptions& options = {});

}  // namespace qsoflux
