#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace qsoflux {

using Timestamp = std::chrono::sys_seconds;

// One logged contact. call and start_at are always present; every other
// field is optional metadata.
struct Qso {
  std::string call;
  Timestamp start_at{};

  std::optional<std::string> band;
  std::optional<std::string> mode;
  std::optional<double> freq_mhz;

  std::optional<std::string> rst_sent;
  std::optional<std::string> rst_rcvd;

  std::optional<std::string> name;
  std::optional<std::string> qth;
  std::optional<std::string> grid;
  std::optional<std::string> country;

  std::optional<std::string> comment;

  bool operator==(const Qso&) const = default;
};

using QsoList = std::vector<Qso>;

// Builds a UTC timestamp; the caller is responsible for passing a valid date.
[[nodiscard]] Timestamp MakeTimestamp(int year, unsigned month, unsigned day,
                                      unsigned hour = 0, unsigned minute = 0,
                                      unsigned second = 0);

// "YYYYMMDD" / "HHMMSS" renderings used by the ADIF wire format.
[[nodiscard]] std::string FormatQsoDate(Timestamp t);
[[nodiscard]] std::string FormatTimeOn(Timestamp t);

}  // namespace qsoflux
