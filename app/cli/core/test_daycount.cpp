#include "sc/core/date.hpp"
#include "sc/core/daycount.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using sc::core::Date;

int main() {
  constexpr double EPS = 1e-14;

  // 1) Date : validation, mois en fin de mois, parse/format
  assert(sc::core::is_leap_year(2024) && !sc::core::is_leap_year(2023));
  assert(sc::core::is_leap_year(2000) && !sc::core::is_leap_year(1900));
  assert(Date(2024, 1, 31).add_months(1) == Date(2024, 2, 29));
  assert(Date(2023, 1, 31).add_months(1) == Date(2023, 2, 28));
  assert(Date(2024, 2, 29).add_years(1)  == Date(2025, 2, 28));
  assert(Date(2024, 3, 31).add_months(-1) == Date(2024, 2, 29));
  assert(Date::parse("2024-07-01") == Date(2024, 7, 1));
  assert(Date(2024, 7, 1).to_string() == "2024-07-01");
  assert(sc::core::days_between(Date(2024, 1, 1), Date(2025, 1, 1)) == 366);

  bool threw = false;
  try { (void)Date(2023, 2, 29); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)Date::parse("2024/07/01"); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 2) Act/Act ISDA : découpage par année civile
  const double yf = sc::core::year_fraction(Date(2023, 7, 1), Date(2024, 7, 1));
  assert(std::abs(yf - (184.0 / 365.0 + 182.0 / 366.0)) < EPS);
  assert(std::abs(sc::core::year_fraction(Date(2024, 1, 1), Date(2025, 1, 1)) - 1.0) < EPS);
  assert(std::abs(sc::core::year_fraction(Date(2023, 1, 1), Date(2024, 1, 1)) - 1.0) < EPS);
  assert(sc::core::year_fraction(Date(2024, 7, 1), Date(2023, 7, 1)) == 0.0);
  assert(sc::core::year_fraction(Date(2024, 7, 1), Date(2024, 7, 1)) == 0.0);

  // additivité (utilisée par les forwards de la jambe variable)
  const Date a(2023, 11, 15), b(2024, 5, 15), c(2025, 2, 3);
  assert(std::abs(sc::core::year_fraction(a, c)
                  - sc::core::year_fraction(a, b) - sc::core::year_fraction(b, c)) < 1e-13);

  // temps signé
  assert(std::abs(sc::core::time_in_years(Date(2024, 7, 1), Date(2023, 7, 1)) + yf) < EPS);

  // 3) Échéancier : chaque date calculée depuis start (pas de chaînage), stub final
  const auto q = sc::core::generate_payment_dates(Date(2024, 1, 31), Date(2025, 1, 31), 3);
  assert(q.size() == 4);
  assert(q[0] == Date(2024, 4, 30));
  assert(q[1] == Date(2024, 7, 31));
  assert(q[2] == Date(2024, 10, 31));
  assert(q[3] == Date(2025, 1, 31));

  const auto stub = sc::core::generate_payment_dates(Date(2024, 1, 15), Date(2025, 4, 15), 12);
  assert(stub.size() == 2);
  assert(stub[0] == Date(2025, 1, 15));
  assert(stub[1] == Date(2025, 4, 15));

  const auto sched = sc::core::generate_schedule(Date(2024, 1, 15), Date(2026, 1, 15), 6);
  assert(sched.size() == 5);
  assert(sched.front() == Date(2024, 1, 15) && sched.back() == Date(2026, 1, 15));

  threw = false;
  try { (void)sc::core::generate_payment_dates(Date(2024, 1, 1), Date(2025, 1, 1), 0); }
  catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)sc::core::generate_payment_dates(Date(2025, 1, 1), Date(2024, 1, 1), 6); }
  catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  std::cout << "OK: dates, Act/Act ISDA and schedules\n";
  return 0;
}
