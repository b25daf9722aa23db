#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "qsoflux/qso.hpp"

namespace qsoflux {

using ValueSet = std::set<std::string>;

// Award statistics over a collection of records. Every set holds normalized
// values. grids_by_band keys are normalized bands; records without a band
// are grouped under "".
struct AwardsSummary {
  std::uint64_t total_qsos = 0;
  ValueSet countries;
  ValueSet grids;
  ValueSet calls;
  ValueSet bands;
  ValueSet modes;
  std::map<std::string, ValueSet> grids_by_band;

  [[nodiscard]] std::size_t UniqueCountries() const { return countries.size(); }
  [[nodiscard]] std::size_t UniqueGrids() const { return grids.size(); }
  [[nodiscard]] std::size_t UniqueCalls() const { return calls.size(); }
  [[nodiscard]] std::size_t UniqueBands() const { return bands.size(); }
  [[nodiscard]] std::size_t UniqueModes() const { return modes.size(); }

  // Distinct grids per band.
  [[nodiscard]] std::map<std::string, std::size_t> GridsPerBand() const;

  bool operator==(const AwardsSummary&) const = default;
};

// Trim + uppercase; an empty result means "no value".
[[nodiscard]] std::optional<std::string> Norm(std::string_view value);
[[nodiscard]] std::optional<std::string> NormField(const std::optional<std::string>& value);

[[nodiscard]] AwardsSummary ComputeSummary(std::span<const Qso> records);

// Union of every set; totals add. Associative and commutative.
void MergeInto(AwardsSummary& into, const AwardsSummary& from);
[[nodiscard]] AwardsSummary MergeSummaries(std::span<const AwardsSummary> parts);

struct SummaryOptions {
  std::size_t chunk_size = 5000;
  std::size_t num_threads = 0;  // 0 -> hardware concurrency
};

// Chunked-parallel ComputeSummary. Identical result to the serial form;
// collections smaller than one chunk are computed serially.
[[nodiscard]] AwardsSummary ComputeSummaryParallel(std::span<const Qso> records, SummaryOptions options = {});

// Keeps records whose normalized band/mode match; an empty filter matches all.
[[nodiscard]] QsoList FilterQsos(std::span<const Qso> records, std::string_view band = {},
                                 std::string_view mode = {});

// Award key (uppercase) -> required count.
using AwardThresholds = std::map<std::string, std::int64_t>;

inline constexpr std::int64_t kDefaultDxccThreshold = 100;
inline constexpr std::int64_t kDefaultVuccThreshold = 100;
inline constexpr std::size_t kStrongBandGridCount = 50;

[[nodiscard]] AwardThresholds DefaultAwardThresholds();

// Readable achievement and progress lines for DXCC (countries), VUCC
// (grids) and bands with a strong grid count.
[[nodiscard]] std::vector<std::string> SuggestAwards(const AwardsSummary& summary,
                                                     const AwardThresholds& thresholds);

}  // namespace qsoflux
