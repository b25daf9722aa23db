#pragma once

#include <optional>
#include <string_view>

#include "qsoflux/qso.hpp"
#include "qsoflux/tag_scanner.hpp"

namespace qsoflux {

// Strict YYYYMMDD + HHMM[SS] parse. Empty optional on any malformed or
// out-of-range component.
[[nodiscard]] std::optional<Timestamp> ParseQsoStart(std::string_view qso_date,
                                                     std::string_view time_on);

// Lenient FREQ parse; garbage yields an empty optional.
[[nodiscard]] std::optional<double> ParseFrequency(std::string_view text);

// Maps one record's fields to a Qso. Records without CALL, QSO_DATE or a
// valid TIME_ON are rejected by returning an empty optional; nothing throws.
[[nodiscard]] std::optional<Qso> NormalizeRecord(const RawFieldMap& fields);

// Scanner and normalizer composed over one record span.
[[nodiscard]] std::optional<Qso> DecodeRecord(std::string_view span);

}  // namespace qsoflux
