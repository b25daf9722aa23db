#include "qsoflux/record_store.hpp"

#include <cctype>
#include <string_view>
#include <utility>

#include "qsoflux/awards.hpp"

namespace qsoflux {

namespace {
std::string Upper(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}
}  // namespace

bool MatchesFilter(const Qso& qso, const QsoFilter& filter) {
  if (auto band = Norm(filter.band); band && NormField(qso.band) != band) {
    return false;
  }
  if (auto mode = Norm(filter.mode); mode && NormField(qso.mode) != mode) {
    return false;
  }
  if (!filter.call_contains.empty() && Upper(qso.call).find(Upper(filter.call_contains)) == std::string::npos) {
    return false;
  }
  return true;
}

std::size_t MemoryRecordStore::InsertBatch(std::span<const Qso> records) {
  std::lock_guard<std::mutex> lock(mu_);
  records_.insert(records_.end(), records.begin(), records.end());
  return records.size();
}

std::unique_ptr<QsoCursor> MemoryRecordStore::Iterate(const QsoFilter& filter) const {
  QsoList snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& q : records_) {
      if (filter.limit > 0 && snapshot.size() >= filter.limit) {
        break;
      }
      if (MatchesFilter(q, filter)) {
        snapshot.push_back(q);
      }
    }
  }
  return std::make_unique<VectorCursor>(std::move(snapshot));
}

std::size_t MemoryRecordStore::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.size();
}

}  // namespace qsoflux
