#include "qsoflux/awards.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "qsoflux/import_pipeline.hpp"

namespace qsoflux {

namespace {

void AddNormalized(ValueSet& set, const std::optional<std::string>& value) {
  if (auto v = NormField(value)) {
    set.insert(std::move(*v));
  }
}

std::int64_t ThresholdOr(const AwardThresholds& thresholds, const std::string& key, std::int64_t def_val) {
  auto it = thresholds.find(key);
  return it == thresholds.end() ? def_val : it->second;
}

void SuggestFor(std::vector<std::string>& out, const std::string& award, std::int64_t have, std::int64_t needed,
                const char* achieved_noun, const char* close_noun) {
  if (have >= needed) {
    out.push_back(award + " achieved: " + std::to_string(have) + " unique " + achieved_noun);
  } else if (have >= static_cast<std::int64_t>(0.9 * static_cast<double>(needed))) {
    out.push_back(award + " close: " + std::to_string(have) + " " + close_noun + " (need " +
                  std::to_string(needed - have) + " more)");
  }
}

}  // namespace

std::map<std::string, std::size_t> AwardsSummary::GridsPerBand() const {
  std::map<std::string, std::size_t> out;
  for (const auto& [band, grids_on_band] : grids_by_band) {
    out.emplace(band, grids_on_band.size());
  }
  return out;
}

std::optional<std::string> Norm(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  if (value.empty()) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

std::optional<std::string> NormField(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  return Norm(std::string_view(*value));
}

AwardsSummary ComputeSummary(std::span<const Qso> records) {
  AwardsSummary summary;
  summary.total_qsos = records.size();
  for (const auto& q : records) {
    AddNormalized(summary.countries, q.country);
    AddNormalized(summary.grids, q.grid);
    AddNormalized(summary.calls, q.call);
    AddNormalized(summary.bands, q.band);
    AddNormalized(summary.modes, q.mode);
    if (auto grid = NormField(q.grid)) {
      summary.grids_by_band[NormField(q.band).value_or("")].insert(std::move(*grid));
    }
  }
  return summary;
}

void MergeInto(AwardsSummary& into, const AwardsSummary& from) {
  into.total_qsos += from.total_qsos;
  into.countries.insert(from.countries.begin(), from.countries.end());
  into.grids.insert(from.grids.begin(), from.grids.end());
  into.calls.insert(from.calls.begin(), from.calls.end());
  into.bands.insert(from.bands.begin(), from.bands.end());
  into.modes.insert(from.modes.begin(), from.modes.end());
  for (const auto& [band, grids_on_band] : from.grids_by_band) {
    into.grids_by_band[band].insert(grids_on_band.begin(), grids_on_band.end());
  }
}

AwardsSummary MergeSummaries(std::span<const AwardsSummary> parts) {
  AwardsSummary merged;
  for (const auto& part : parts) {
    MergeInto(merged, part);
  }
  return merged;
}

AwardsSummary ComputeSummaryParallel(std::span<const Qso> records, SummaryOptions options) {
  if (options.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (records.size() < options.chunk_size) {
    return ComputeSummary(records);
  }

  const std::size_t num_chunks = (records.size() + options.chunk_size - 1) / options.chunk_size;
  const std::size_t workers = std::min(EffectiveThreads(options.num_threads), num_chunks);

  try {
    std::vector<std::future<AwardsSummary>> futures;
    futures.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      futures.push_back(std::async(std::launch::async, [records, &options, num_chunks, w, workers] {
        AwardsSummary local;
        for (std::size_t c = w; c < num_chunks; c += workers) {
          const std::size_t begin = c * options.chunk_size;
          const std::size_t count = std::min(options.chunk_size, records.size() - begin);
          MergeInto(local, ComputeSummary(records.subspan(begin, count)));
        }
        return local;
      }));
    }

    std::vector<AwardsSummary> partials;
    partials.reserve(workers);
    for (auto& future : futures) {
      partials.push_back(future.get());
    }
    return MergeSummaries(partials);
  } catch (const std::exception& e) {
    std::cerr << "parallel summary failed: " << e.what() << "; falling back to serial\n";
    return ComputeSummary(records);
  }
}

QsoList FilterQsos(std::span<const Qso> records, std::string_view band, std::string_view mode) {
  const auto want_band = Norm(band);
  const auto want_mode = Norm(mode);
  QsoList out;
  for (const auto& q : records) {
    if (want_band && NormField(q.band) != want_band) {
      continue;
    }
    if (want_mode && NormField(q.mode) != want_mode) {
      continue;
    }
    out.push_back(q);
  }
  return out;
}

AwardThresholds DefaultAwardThresholds() {
  return {{"DXCC", kDefaultDxccThreshold}, {"VUCC", kDefaultVuccThreshold}};
}

std::vector<std::string> SuggestAwards(const AwardsSummary& summary, const AwardThresholds& thresholds) {
  std::vector<std::string> suggestions;
  SuggestFor(suggestions, "DXCC", static_cast<std::int64_t>(summary.UniqueCountries()),
             ThresholdOr(thresholds, "DXCC", kDefaultDxccThreshold), "countries", "countries");
  SuggestFor(suggestions, "VUCC", static_cast<std::int64_t>(summary.UniqueGrids()),
             ThresholdOr(thresholds, "VUCC", kDefaultVuccThreshold), "grids", "grids");

  for (const auto& [band, count] : summary.GridsPerBand()) {
    if (count >= kStrongBandGridCount) {
      suggestions.push_back("Strong grid count on " + (band.empty() ? std::string("unknown") : band) + ": " +
                            std::to_string(count));
    }
  }
  return suggestions;
}

}  // namespace qsoflux
