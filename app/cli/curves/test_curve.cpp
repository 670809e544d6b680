#include "sc/curves/curve.hpp"
#include "sc/curves/curve_roll.hpp"
#include "sc/core/daycount.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using sc::core::Date;
using sc::curves::Curve;
using sc::curves::Interpolator;
using sc::curves::InterpolationKind;

int main() {
  const Date ref(2024, 1, 15);

  // 1) Courbe vide : erreur à la première requête
  Curve empty(ref);
  assert(empty.empty());
  bool threw = false;
  try { (void)empty.zero_rate(1.0); } catch (const std::logic_error&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)empty.discount_factor(1.0); } catch (const std::logic_error&) { threw = true; }
  assert(threw);

  // 2) Insertion triée, doublons refusés
  Curve c(ref);
  c.add_point(2.0, 0.035);
  c.add_point(0.5, 0.040);
  c.add_point(1.0, 0.038);
  assert(c.size() == 3);
  assert(c.times()[0] == 0.5 && c.times()[1] == 1.0 && c.times()[2] == 2.0);
  assert(c.zero_rates()[0] == 0.040);

  threw = false;
  try { c.add_point(1.0, 0.05); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw && c.size() == 3);
  threw = false;
  try { c.add_point(-0.1, 0.05); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 3) Requêtes
  assert(c.zero_rate(0.1) == 0.040);       // plat avant le premier noeud
  assert(c.zero_rate(5.0) == 0.035);       // plat après le dernier
  assert(std::abs(c.zero_rate(1.5) - 0.0365) < 1e-15);
  assert(c.discount_factor(0.0) == 1.0);
  assert(c.discount_factor(-1.0) == 1.0);
  assert(std::abs(c.discount_factor(2.0) - std::exp(-0.035 * 2.0)) < 1e-15);
  assert(std::abs(c.discount_factor_simple(2.0) - 1.0 / (1.0 + 0.035 * 2.0)) < 1e-15);

  const double fwd = c.forward_rate(1.0, 2.0);
  assert(std::abs(fwd - (c.discount_factor(1.0) / c.discount_factor(2.0) - 1.0)) < 1e-15);
  threw = false;
  try { (void)c.forward_rate(2.0, 2.0); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)c.forward_rate(2.0, 1.0); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 4) Décalage parallèle, copie
  const Curve up = c.shift_parallel(10.0);
  for (std::size_t i = 0; i < c.size(); ++i) {
    assert(std::abs(up.zero_rates()[i] - c.zero_rates()[i] - 0.001) < 1e-15);
  }
  assert(c.zero_rate(1.0) == 0.038); // l'original est intact

  const Curve cp = c.clone();
  for (double t : c.times()) assert(cp.zero_rate(t) == c.zero_rate(t));

  // 5) Stratégie explicite, abandonnée au prochain add_point
  Curve s = c.clone();
  s.set_interpolator(Interpolator::cubic_spline(s.times(), s.zero_rates(), true));
  assert(s.interpolator().kind() == InterpolationKind::CubicSpline);
  assert(c.interpolator().kind() == InterpolationKind::Linear);
  s.add_point(3.0, 0.034);
  assert(s.interpolator().kind() == InterpolationKind::Linear);
  threw = false;
  try { s.set_interpolator(nullptr); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 6) Roll de 3 mois (courbe inchangée)
  const Date val = ref.add_months(3);
  const double delta = sc::core::year_fraction(ref, val);
  assert(std::abs(c.time_of(val) - delta) < 1e-15);

  const Curve rolled = sc::curves::roll_curve(c, val);
  assert(rolled.reference_date() == val);
  assert(rolled.size() == c.size());
  for (std::size_t i = 0; i < c.size(); ++i) {
    assert(std::abs(rolled.times()[i] - (c.times()[i] - delta)) < 1e-15);
    assert(rolled.zero_rates()[i] == c.zero_rates()[i]);
  }

  // noeud échu retiré
  const Curve far = sc::curves::roll_curve(c, ref.add_months(9));
  assert(far.size() == 2);

  const Curve rs = sc::curves::roll_curve_spline(c, val);
  assert(rs.interpolator().kind() == InterpolationKind::CubicSpline);
  assert(rs.zero_rate(0.0) == rs.zero_rate(rs.times().front()));

  const Curve sh = sc::curves::roll_curve_shifted(c, val);
  assert(sh.interpolator().kind() == InterpolationKind::ShiftedSpline);
  const auto orig = Interpolator::cubic_spline(c.times(), c.zero_rates(), true);
  for (double t : {0.0, 0.4, 1.2, 1.9}) {
    assert(sh.zero_rate(t) == orig->interpolate(t + delta));
  }

  threw = false;
  try { (void)sc::curves::roll_curve(c, ref.add_years(3)); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  threw = false;
  try { (void)sc::curves::roll_curve(c, ref.add_days(-1)); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  std::cout << "OK: curve queries, shift, clone and roll\n";
  return 0;
}
