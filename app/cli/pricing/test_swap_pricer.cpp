#include "sc/pricing/swap.hpp"
#include "sc/pricing/swap_pricer.hpp"
#include "sc/curves/bootstrap.hpp"
#include "sc/curves/curve_roll.hpp"
#include "sc/core/daycount.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using sc::core::Date;
using sc::curves::Curve;
using sc::pricing::Swap;

static Curve flat(const Date& ref, double r) {
  return Curve(ref, {0.5, 1.0, 5.0, 10.0}, {r, r, r, r});
}

int main() {
  const Date ref(2024, 1, 1);
  const double N = 1'000'000.0;

  // 1) Flux : jambe fixe annuelle, variable semestrielle, Act/Act
  Swap swap(ref, ref.add_years(5), N, 0.03);
  const auto fixed = swap.fixed_leg_cashflows();
  const auto flt   = swap.float_leg_periods();
  assert(fixed.size() == 5 && flt.size() == 10);
  assert(std::abs(swap.tenor_years() - 5.0) < 1e-12); // années civiles entières
  assert(fixed[0].payment_date == Date(2025, 1, 1));
  assert(std::abs(fixed[0].day_fraction - 1.0) < 1e-15);
  assert(std::abs(fixed[0].amount - N * 0.03) < 1e-9);
  assert(flt[0].accrual_start == ref && flt[0].accrual_end == Date(2024, 7, 1));
  assert(std::abs(flt[0].day_fraction - 182.0 / 366.0) < 1e-15);

  bool threw = false;
  try { (void)Swap(ref, ref, N); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)Swap(ref, ref.add_years(1), -1.0); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 2) Courbe plate, une seule courbe : PV variable = N (1 - DF(T))
  const Curve c = flat(ref, 0.03);
  const double T = c.time_of(swap.end_date());
  const double float_pv = sc::pricing::float_leg_pv(swap, c, c, ref);
  assert(std::abs(float_pv - N * (1.0 - c.discount_factor(T))) < 1e-6);

  // annuité et PV fixe
  const double ann = sc::pricing::fixed_annuity(swap, c, ref);
  assert(std::abs(sc::pricing::fixed_leg_pv(swap, c, ref) - N * 0.03 * ann) < 1e-6);

  // 3) Taux pair : revalorise à 0
  const double par = sc::pricing::par_rate(swap, c, c, ref);
  Swap at_par(ref, ref.add_years(5), N, par);
  assert(std::abs(sc::pricing::swap_pv(at_par, c, c, ref)) < 1e-6);

  const auto v = sc::pricing::price(at_par, c, c, ref);
  assert(std::abs(v.par_rate - par) < 1e-15);
  assert(std::abs(v.dirty_pv) < 1e-6);
  assert(v.fixed_accrual == 0.0 && v.float_accrual == 0.0); // rien de couru au départ
  assert(v.clean_pv == v.dirty_pv);

  // 4) Couru à +3M : 91 jours sur 366 (2024)
  const Date val = ref.add_months(3);
  assert(sc::core::days_between(ref, val) == 91);
  const double facc = sc::pricing::fixed_accrual(swap, val);
  assert(std::abs(facc - N * 0.03 * 91.0 / 366.0) < 1e-8);

  // couru variable : fraction écoulée du premier coupon variable
  const double first_rate = sc::pricing::float_period_rate(flt[0], c);
  const double vacc = sc::pricing::float_accrual(swap, c, val);
  assert(std::abs(vacc - N * first_rate * (91.0 / 366.0)) < 1e-8);

  // 5) Courbes bootstrapées, valorisation 3 mois plus tard sur courbes roulées
  const std::vector<sc::market::MarketQuote> quotes {
    {0.5, 0.0411, true}, {1.0, 0.0414}, {2.0, 0.0373}, {3.0, 0.0348},
    {5.0, 0.0321}, {7.0, 0.0311}, {10.0, 0.0308},
  };
  const auto cv = sc::curves::bootstrap_curves(ref, quotes, -38.0);

  Swap nine(ref, ref.add_years(9), N);
  nine.set_fixed_rate(sc::pricing::par_rate(nine, cv.projection, cv.discount, ref));
  assert(std::abs(sc::pricing::swap_pv(nine, cv.projection, cv.discount, ref)) < 1e-6);
  assert(nine.fixed_rate() > 0.025 && nine.fixed_rate() < 0.040);

  const auto pr = sc::curves::roll_curve(cv.projection, val);
  const auto dr = sc::curves::roll_curve(cv.discount, val);
  // la période variable en cours garde le taux fixé à l'origine
  const auto set = sc::pricing::current_float_fixing(nine, cv.projection, val);
  assert(set && *set == sc::pricing::float_period_rate(nine.float_leg_periods()[0], cv.projection));
  assert(!sc::pricing::current_float_fixing(nine, cv.projection, ref.add_years(10)));

  const auto lin = sc::pricing::price(nine, pr, dr, val, set);
  assert(lin.fixed_accrual > 0.0 && lin.float_accrual > 0.0);
  assert(std::abs(lin.float_accrual - N * *set * sc::core::year_fraction(ref, val)) < 1e-8);
  assert(std::abs(lin.float_leg_pv - sc::pricing::float_leg_pv(nine, pr, dr, val, set)) < 1e-9);
  assert(std::abs(lin.dirty_pv - (lin.clean_pv + lin.fixed_accrual - lin.float_accrual)) < 1e-9);
  assert(std::abs(lin.fixed_accrual - nine.fixed_rate() * N * 91.0 / 366.0) < 1e-8);

  const auto ps  = sc::curves::roll_curve_spline(cv.projection, val);
  const auto spl = sc::pricing::price(nine, ps, dr, val, set);
  assert(std::abs(spl.dirty_pv - (spl.clean_pv + spl.fixed_accrual - spl.float_accrual)) < 1e-9);
  assert(spl.fixed_accrual == lin.fixed_accrual);
  assert(spl.float_accrual == lin.float_accrual); // même fixing, quelle que soit l'interpolation

  // 6) Plus aucun paiement fixe : par_rate lève, price renvoie NaN
  const Date after = ref.add_years(6);
  threw = false;
  try { (void)sc::pricing::par_rate(swap, c, c, after); } catch (const std::runtime_error&) { threw = true; }
  assert(threw);
  assert(std::isnan(sc::pricing::price(swap, c, c, after).par_rate));

  std::cout << "OK: swap legs, par rate, accruals and clean/dirty split\n";
  return 0;
}
