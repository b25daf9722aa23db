#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qsoflux/awards.hpp"

using namespace qsoflux;

namespace {

Qso Make(const std::string& call, std::optional<std::string> band, std::optional<std::string> grid,
         std::optional<std::string> country = std::nullopt, std::optional<std::string> mode = std::nullopt) {
  Qso q;
  q.call = call;
  q.start_at = MakeTimestamp(2024, 1, 1);
  q.band = std::move(band);
  q.grid = std::move(grid);
  q.country = std::move(country);
  q.mode = std::move(mode);
  return q;
}

}  // namespace

int main() {
  assert(Norm("  fn42 ") == std::optional<std::string>("FN42"));
  assert(!Norm("   "));
  assert(!Norm(""));
  assert(Norm(*Norm("  ab c ")) == Norm("  ab c "));
  assert(!NormField(std::nullopt));

  {
    QsoList records = {
        Make("k1abc", "20m", "fn42", "usa", "ssb"),
        Make("K1ABC ", "20M", " FN43", "USA", "SSB"),
        Make("g0xyz", "40m", "io91", "England", "cw"),
        Make("w1aw", std::nullopt, "FN31", "  "),
        Make("n0call", "20m", std::nullopt),
    };
    auto s = ComputeSummary(records);
    assert(s.total_qsos == 5);
    assert(s.UniqueCalls() == 4);
    assert(s.UniqueCountries() == 2);
    assert(s.UniqueGrids() == 4);
    assert(s.UniqueBands() == 2);
    assert(s.UniqueModes() == 2);
    auto per_band = s.GridsPerBand();
    assert(per_band.at("20M") == 2);
    assert(per_band.at("40M") == 1);
    assert(per_band.at("") == 1);
  }

  // Overlapping grids across partitions are counted once.
  {
    QsoList left = {Make("A", "20m", "FN42"), Make("B", "20m", "FN43")};
    QsoList right = {Make("C", "20m", "FN42")};
    AwardsSummary merged = ComputeSummary(left);
    MergeInto(merged, ComputeSummary(right));
    assert(merged.GridsPerBand().at("20M") == 2);
    assert(merged.total_qsos == 3);

    QsoList all = left;
    all.insert(all.end(), right.begin(), right.end());
    assert(merged == ComputeSummary(all));
  }

  // Merge is associative and commutative.
  {
    auto a = ComputeSummary(QsoList{Make("A", "20m", "FN42", "USA")});
    auto b = ComputeSummary(QsoList{Make("B", "40m", "FN42", "Canada")});
    auto c = ComputeSummary(QsoList{Make("C", "20m", "EM10", "USA", "FT8")});

    auto ab = a;
    MergeInto(ab, b);
    auto ab_c = ab;
    MergeInto(ab_c, c);

    auto bc = b;
    MergeInto(bc, c);
    auto a_bc = a;
    MergeInto(a_bc, bc);
    assert(ab_c == a_bc);

    auto ba = b;
    MergeInto(ba, a);
    assert(ab == ba);

    std::vector<AwardsSummary> parts = {c, a, b};
    assert(MergeSummaries(parts) == ab_c);
    assert(MergeSummaries({}) == AwardsSummary{});
  }

  // Chunked parallel result matches the serial one.
  {
    QsoList records;
    const char* bands[] = {"160m", "80m", "40m", "20m", "15m", "10m", "6m"};
    for (int i = 0; i < 12000; ++i) {
      records.push_back(Make("C" + std::to_string(i % 3000), bands[i % 7],
                             "GR" + std::to_string(i % 211), "Country" + std::to_string(i % 150),
                             i % 2 ? "CW" : "SSB"));
    }
    const auto serial = ComputeSummary(records);
    for (std::size_t threads : {1u, 4u, 16u}) {
      SummaryOptions opts;
      opts.chunk_size = 1000;
      opts.num_threads = threads;
      assert(ComputeSummaryParallel(records, opts) == serial);
    }
    assert(ComputeSummaryParallel(records) == serial);

    bool threw = false;
    try {
      SummaryOptions opts;
      opts.chunk_size = 0;
      auto s = ComputeSummaryParallel(records, opts);
      (void)s;
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  {
    QsoList records = {Make("A", "20m", "FN42", std::nullopt, "SSB"), Make("B", "40m", "FN43", std::nullopt, "cw"),
                       Make("C", " 20M ", "FN44", std::nullopt, "CW")};
    assert(FilterQsos(records).size() == 3);
    assert(FilterQsos(records, "20m").size() == 2);
    assert(FilterQsos(records, "", "CW").size() == 2);
    auto both = FilterQsos(records, "20M", "cw");
    assert(both.size() == 1 && both[0].call == "C");
    assert(FilterQsos(records, "2m").empty());
  }

  {
    AwardsSummary s;
    for (int i = 0; i < 100; ++i) {
      s.countries.insert("C" + std::to_string(i));
    }
    for (int i = 0; i < 92; ++i) {
      s.grids.insert("G" + std::to_string(i));
      s.grids_by_band["6M"].insert("G" + std::to_string(i));
    }
    auto lines = SuggestAwards(s, DefaultAwardThresholds());
    assert(lines.size() == 3);
    assert(lines[0] == "DXCC achieved: 100 unique countries");
    assert(lines[1] == "VUCC close: 92 grids (need 8 more)");
    assert(lines[2] == "Strong grid count on 6M: 92");

    AwardThresholds strict = {{"DXCC", 200}, {"VUCC", 1000}};
    auto none = SuggestAwards(s, strict);
    assert(none.size() == 1);
    assert(SuggestAwards(AwardsSummary{}, DefaultAwardThresholds()).empty());
  }
  return 0;
}
