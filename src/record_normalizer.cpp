#include "qsoflux/record_normalizer.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <utility>

namespace qsoflux {

namespace {

bool AllDigits(std::string_view s) {
  for (unsigned char c : s) {
    if (!std::isdigit(c)) {
      return false;
    }
  }
  return true;
}

unsigned DigitsValue(std::string_view s) {
  unsigned v = 0;
  for (char c : s) {
    v = v * 10 + static_cast<unsigned>(c - '0');
  }
  return v;
}

std::optional<std::string> NonEmpty(const RawFieldMap& fields, const char* key) {
  auto it = fields.find(key);
  if (it == fields.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

std::optional<Timestamp> ParseQsoStart(std::string_view qso_date, std::string_view time_on) {
  if (qso_date.size() != 8 || !AllDigits(qso_date)) {
    return std::nullopt;
  }
  if ((time_on.size() != 4 && time_on.size() != 6) || !AllDigits(time_on)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{
      std::chrono::year{static_cast<int>(DigitsValue(qso_date.substr(0, 4)))},
      std::chrono::month{DigitsValue(qso_date.substr(4, 2))},
      std::chrono::day{DigitsValue(qso_date.substr(6, 2))}};
  if (!ymd.ok() || ymd.year() < std::chrono::year{1}) {
    return std::nullopt;
  }

  const unsigned hh = DigitsValue(time_on.substr(0, 2));
  const unsigned mm = DigitsValue(time_on.substr(2, 2));
  const unsigned ss = time_on.size() == 6 ? DigitsValue(time_on.substr(4, 2)) : 0;
  if (hh > 23 || mm > 59 || ss > 59) {
    return std::nullopt;
  }

  return std::chrono::sys_days{ymd} + std::chrono::hours{hh} + std::chrono::minutes{mm} +
         std::chrono::seconds{ss};
}

std::optional<double> ParseFrequency(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc() || ptr != last || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<Qso> NormalizeRecord(const RawFieldMap& fields) {
  auto call = NonEmpty(fields, "CALL");
  auto date = NonEmpty(fields, "QSO_DATE");
  auto time = NonEmpty(fields, "TIME_ON");
  if (!call || !date || !time) {
    return std::nullopt;
  }
  auto start = ParseQsoStart(*date, *time);
  if (!start) {
    return std::nullopt;
  }

  Qso qso;
  qso.call = std::move(*call);
  qso.start_at = *start;
  qso.band = NonEmpty(fields, "BAND");
  qso.mode = NonEmpty(fields, "MODE");
  if (auto freq = NonEmpty(fields, "FREQ")) {
    qso.freq_mhz = ParseFrequency(*freq);
  }
  qso.rst_sent = NonEmpty(fields, "RST_SENT");
  qso.rst_rcvd = NonEmpty(fields, "RST_RCVD");
  qso.name = NonEmpty(fields, "NAME");
  qso.qth = NonEmpty(fields, "QTH");
  qso.grid = NonEmpty(fields, "GRIDSQUARE");
  qso.country = NonEmpty(fields, "COUNTRY");
  qso.comment = NonEmpty(fields, "COMMENT");
  return qso;
}

std::optional<Qso> DecodeRecord(std::string_view span) {
  return NormalizeRecord(ScanRecord(span));
}

}  // namespace qsoflux
