#include <sc/curves/curve_roll.hpp>

#include <sc/core/daycount.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

namespace {

struct RolledKnots {
  double delta;
  std::vector<double> t;
  std::vector<double> r;
};

RolledKnots rolled_knots(const sc::curves::Curve& curve, const sc::core::Date& new_ref) {
  if (new_ref < curve.reference_date()) {
    throw std::invalid_argument("roll_curve: new reference date is before the curve reference date");
  }
  RolledKnots k;
  k.delta = sc::core::year_fraction(curve.reference_date(), new_ref);
  const auto& ts = curve.times();
  const auto& rs = curve.zero_rates();
  for (std::size_t i = 0; i < ts.size(); ++i) {
    const double t = ts[i] - k.delta;
    if (t <= 0.0) continue; // noeud échu
    k.t.push_back(t);
    k.r.push_back(rs[i]);
  }
  if (k.t.empty()) {
    throw std::invalid_argument("roll_curve: no knot left after the roll");
  }
  return k;
}

} // namespace

namespace sc::curves {

Curve roll_curve(const Curve& curve, const core::Date& new_reference) {
  const auto k = rolled_knots(curve, new_reference);
  return Curve(new_reference, k.t, k.r);
}

Curve roll_curve_spline(const Curve& curve, const core::Date& new_reference) {
  const auto k = rolled_knots(curve, new_reference);
  Curve out(new_reference, k.t, k.r);
  out.set_interpolator(Interpolator::cubic_spline(k.t, k.r, /*add_zero_point=*/true));
  return out;
}

Curve roll_curve_shifted(const Curve& curve, const core::Date& new_reference) {
  const auto k = rolled_knots(curve, new_reference);
  auto base = Interpolator::cubic_spline(curve.times(), curve.zero_rates(), /*add_zero_point=*/true);

  Curve out(new_reference, k.t, k.r);
  out.set_interpolator(Interpolator::shifted(std::move(base), k.delta));
  return out;
}

} // namespace sc::curves
