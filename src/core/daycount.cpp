#include <sc/core/daycount.hpp>

#include <stdexcept>  // std::invalid_argument

namespace sc {
namespace core {

double year_fraction(const Date& start, const Date& end) noexcept {
  if (start >= end) return 0.0;

  double fraction = 0.0;
  Date current = start;

  // morceaux complets jusqu'au 1er janvier de l'année de end
  while (current.year() < end.year()) {
    const Date year_end(current.year() + 1, 1, 1);
    const long days = days_between(current, year_end);
    fraction += static_cast<double>(days) / days_in_year(current.year());
    current = year_end;
  }

  const long days = days_between(current, end);
  fraction += static_cast<double>(days) / days_in_year(end.year());
  return fraction;
}

double time_in_years(const Date& ref, const Date& target) noexcept {
  if (target >= ref) return year_fraction(ref, target);
  return -year_fraction(target, ref);
}

std::vector<Date> generate_payment_dates(const Date& start, const Date& end, int frequency_months) {
  if (frequency_months <= 0) {
    throw std::invalid_argument("generate_payment_dates: frequency_months must be > 0");
  }
  if (end <= start) {
    throw std::invalid_argument("generate_payment_dates: end must be after start");
  }

  std::vector<Date> dates;
  for (int k = 1;; ++k) {
    const Date d = start.add_months(k * frequency_months);
    if (d > end) break;
    dates.push_back(d);
  }

  // période courte finale
  if (dates.empty() || dates.back() != end) {
    dates.push_back(end);
  }
  return dates;
}

std::vector<Date> generate_schedule(const Date& start, const Date& end, int frequency_months) {
  std::vector<Date> schedule;
  schedule.push_back(start);
  const auto pay = generate_payment_dates(start, end, frequency_months);
  schedule.insert(schedule.end(), pay.begin(), pay.end());
  return schedule;
}

} // namespace core
} // namespace sc
