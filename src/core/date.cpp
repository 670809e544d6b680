#include <sc/core/date.hpp>

#include <cstdio>     // std::snprintf
#include <ctime>      // std::time, localtime_r
#include <stdexcept>  // std::invalid_argument

namespace sc {
namespace core {

namespace {

constexpr int DAYS_IN_MONTH[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

// Jours depuis 1970-01-01 (algorithme "days from civil", ères de 400 ans).
long days_from_civil(int y, int m, int d) noexcept {
  y -= (m <= 2) ? 1 : 0;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = static_cast<long>(y) - era * 400;                     // [0, 399]
  const long mp  = (m > 2) ? m - 3 : m + 9;                              // mars = 0
  const long doy = (153 * mp + 2) / 5 + d - 1;                           // [0, 365]
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                // [0, 146096]
  return era * 146097 + doe - 719468;
}

void civil_from_days(long z, int& y, int& m, int& d) noexcept {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp  = (5 * doy + 2) / 153;
  d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

} // namespace

bool is_leap_year(int year) noexcept {
  if (year % 400 == 0) return true;
  if (year % 100 == 0) return false;
  return year % 4 == 0;
}

int days_in_month(int month, int year) noexcept {
  if (month == 2) return is_leap_year(year) ? 29 : 28;
  return DAYS_IN_MONTH[month - 1];
}

int days_in_year(int year) noexcept {
  return is_leap_year(year) ? 366 : 365;
}

Date::Date(int year, int month, int day) : year_(year), month_(month), day_(day) {
  if (month < 1 || month > 12) {
    throw std::invalid_argument("Date: month must be in [1, 12]");
  }
  if (day < 1 || day > days_in_month(month, year)) {
    throw std::invalid_argument("Date: day out of range for month");
  }
}

long Date::serial() const noexcept {
  return days_from_civil(year_, month_, day_);
}

Date Date::from_serial(long serial) noexcept {
  Date out;
  civil_from_days(serial, out.year_, out.month_, out.day_);
  return out;
}

Date Date::add_days(long n) const noexcept {
  return from_serial(serial() + n);
}

Date Date::add_months(int n) const noexcept {
  // mois "absolu" base 0 pour gérer les n négatifs
  long total = static_cast<long>(year_) * 12 + (month_ - 1) + n;
  long y = total >= 0 ? total / 12 : (total - 11) / 12;
  int  m = static_cast<int>(total - y * 12) + 1;

  Date out;
  out.year_  = static_cast<int>(y);
  out.month_ = m;
  const int dim = days_in_month(m, out.year_);
  out.day_   = day_ > dim ? dim : day_; // clamp fin de mois
  return out;
}

std::string Date::to_string() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year_, month_, day_);
  return std::string(buf);
}

Date Date::parse(const std::string& iso) {
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (std::sscanf(iso.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
    throw std::invalid_argument("Date: expected YYYY-MM-DD, got '" + iso + "'");
  }
  return Date(y, m, d);
}

Date Date::today() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return Date(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

} // namespace core
} // namespace sc
