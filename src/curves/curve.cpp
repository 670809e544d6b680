#include <sc/curves/curve.hpp>

#include <sc/core/daycount.hpp>

#include <algorithm>  // std::lower_bound
#include <cmath>      // std::exp, std::isfinite
#include <iterator>   // std::distance
#include <stdexcept>  // std::invalid_argument, std::logic_error

namespace sc {
namespace curves {

Curve::Curve(const core::Date& reference_date) : ref_(reference_date) {}

Curve::Curve(const core::Date& reference_date,
             const std::vector<double>& times,
             const std::vector<double>& zero_rates)
    : ref_(reference_date) {
  if (times.size() != zero_rates.size()) {
    throw std::invalid_argument("Curve: times and zero_rates must have the same length");
  }
  for (std::size_t i = 0; i < times.size(); ++i) add_point(times[i], zero_rates[i]);
}

void Curve::add_point(double t, double zero_rate) {
  if (!std::isfinite(t) || !std::isfinite(zero_rate)) {
    throw std::invalid_argument("Curve: knot must be finite");
  }
  if (t < 0.0) {
    throw std::invalid_argument("Curve: knot time must be >= 0");
  }

  auto it = std::lower_bound(times_.begin(), times_.end(), t);
  if (it != times_.end() && *it == t) {
    throw std::invalid_argument("Curve: duplicate knot time");
  }
  const auto idx = std::distance(times_.begin(), it);
  times_.insert(it, t);
  rates_.insert(rates_.begin() + idx, zero_rate);

  // reconstruction immédiate de l'interpolation par défaut
  interp_ = Interpolator::linear(times_, rates_);
}

void Curve::set_interpolator(std::shared_ptr<const Interpolator> interpolator) {
  if (!interpolator) {
    throw std::invalid_argument("Curve: interpolator is null");
  }
  interp_ = std::move(interpolator);
}

void Curve::require_not_empty() const {
  if (!interp_) {
    throw std::logic_error("Curve: no knots (query on an empty curve)");
  }
}

const Interpolator& Curve::interpolator() const {
  require_not_empty();
  return *interp_;
}

double Curve::zero_rate(double t) const {
  require_not_empty();
  return interp_->interpolate(t);
}

double Curve::discount_factor(double t) const {
  if (t <= 0.0) return 1.0;
  return std::exp(-zero_rate(t) * t);
}

double Curve::discount_factor_simple(double t) const {
  if (t <= 0.0) return 1.0;
  return 1.0 / (1.0 + zero_rate(t) * t);
}

double Curve::forward_rate(double t1, double t2) const {
  if (!(t2 > t1)) {
    throw std::invalid_argument("Curve: forward_rate requires t2 > t1");
  }
  const double df1 = discount_factor(t1);
  const double df2 = discount_factor(t2);
  return (df1 / df2 - 1.0) / (t2 - t1);
}

double Curve::time_of(const core::Date& d) const noexcept {
  return core::time_in_years(ref_, d);
}

Curve Curve::shift_parallel(double bps) const {
  const double shift = bps / 10000.0;
  Curve out(ref_);
  for (std::size_t i = 0; i < times_.size(); ++i) {
    out.add_point(times_[i], rates_[i] + shift);
  }
  return out;
}

} // namespace curves
} // namespace sc
