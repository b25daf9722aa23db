#include "qsoflux/qso.hpp"

#include <cstdio>

namespace qsoflux {

Timestamp MakeTimestamp(int year, unsigned month, unsigned day,
                        unsigned hour, unsigned minute, unsigned second) {
  using namespace std::chrono;
  const sys_days date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
  return date + hours{hour} + minutes{minute} + seconds{second};
}

std::string FormatQsoDate(Timestamp t) {
  using namespace std::chrono;
  const year_month_day ymd{floor<days>(t)};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%02u%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buf;
}

std::string FormatTimeOn(Timestamp t) {
  using namespace std::chrono;
  const auto day_start = floor<days>(t);
  const hh_mm_ss hms{t - day_start};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d%02d%02d", static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  return buf;
}

}  // namespace qsoflux
