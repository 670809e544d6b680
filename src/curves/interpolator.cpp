#include <sc/curves/interpolator.hpp>

#include <cmath>      // std::isfinite
#include <stdexcept>  // std::invalid_argument
#include <string>

namespace {

void check_knots(const std::vector<double>& x, const std::vector<double>& y,
                 std::size_t min_size, const char* who)
{
  if (x.size() != y.size()) {
    throw std::invalid_argument(std::string(who) + ": x and y must have the same length");
  }
  if (x.size() < min_size) {
    throw std::invalid_argument(std::string(who) + ": need at least "
                                + std::to_string(min_size) + " knot(s)");
  }
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
      throw std::invalid_argument(std::string(who) + ": non-finite knot");
    }
    if (i > 0 && !(x[i] > x[i-1])) {
      throw std::invalid_argument(std::string(who) + ": times must be strictly increasing");
    }
  }
}

} // namespace

namespace sc::curves {

// ============================================================================
// Linear
// ============================================================================

LinearInterpolator::LinearInterpolator(std::vector<double> x, std::vector<double> y)
    : x_(std::move(x)), y_(std::move(y)) {
  check_knots(x_, y_, 1, "LinearInterpolator");
}

double LinearInterpolator::interpolate(double t) const {
  const std::size_t n = x_.size();
  if (n == 1) return y_[0];

  // extrapolation plate
  if (t <= x_.front()) return y_.front();
  if (t >= x_.back())  return y_.back();

  // x_[i] <= t < x_[i+1] (peu de noeuds : parcours linéaire)
  std::size_t i = 0;
  while (i + 2 < n && x_[i+1] <= t) ++i;

  const double w = (t - x_[i]) / (x_[i+1] - x_[i]);
  // forme barycentrique : w=0 redonne y_i exactement
  return (1.0 - w) * y_[i] + w * y_[i+1];
}

// ============================================================================
// Cubic spline (naturelle)
// ============================================================================

CubicSplineInterpolator::CubicSplineInterpolator(std::vector<double> x,
                                                 std::vector<double> y,
                                                 bool add_zero_point) {
  check_knots(x, y, 2, "CubicSplineInterpolator");

  if (add_zero_point && x.front() > 0.0) {
    // f(0) = f(premier noeud)
    x.insert(x.begin(), 0.0);
    y.insert(y.begin(), y.front());
  }
  x_ = std::move(x);
  y_ = std::move(y);
  build();
}

void CubicSplineInterpolator::build() {
  const std::size_t n = x_.size();
  a_ = y_;
  b_.assign(n, 0.0);
  c_.assign(n, 0.0);
  d_.assign(n, 0.0);

  if (n == 2) {
    // deux points : droite
    b_[0] = (y_[1] - y_[0]) / (x_[1] - x_[0]);
    return;
  }

  std::vector<double> h(n - 1);
  for (std::size_t i = 0; i + 1 < n; ++i) h[i] = x_[i+1] - x_[i];

  std::vector<double> alpha(n, 0.0);
  for (std::size_t i = 1; i + 1 < n; ++i) {
    alpha[i] = (3.0 / h[i]) * (a_[i+1] - a_[i]) - (3.0 / h[i-1]) * (a_[i] - a_[i-1]);
  }

  // Thomas, c_0 = c_{n-1} = 0
  std::vector<double> l(n, 0.0), mu(n, 0.0), z(n, 0.0);
  l[0] = 1.0;
  for (std::size_t i = 1; i + 1 < n; ++i) {
    l[i]  = 2.0 * (x_[i+1] - x_[i-1]) - h[i-1] * mu[i-1];
    mu[i] = h[i] / l[i];
    z[i]  = (alpha[i] - h[i-1] * z[i-1]) / l[i];
  }
  l[n-1] = 1.0;
  z[n-1] = 0.0;
  c_[n-1] = 0.0;

  // remontée
  for (std::size_t k = n - 1; k-- > 0;) {
    c_[k] = z[k] - mu[k] * c_[k+1];
    b_[k] = (a_[k+1] - a_[k]) / h[k] - h[k] * (c_[k+1] + 2.0 * c_[k]) / 3.0;
    d_[k] = (c_[k+1] - c_[k]) / (3.0 * h[k]);
  }
}

std::size_t CubicSplineInterpolator::segment(double t) const noexcept {
  const std::size_t n = x_.size();
  std::size_t i = 0;
  while (i + 2 < n && x_[i+1] <= t) ++i;
  return i;
}

double CubicSplineInterpolator::interpolate(double t) const {
  if (t <= x_.front()) return y_.front();
  if (t >= x_.back())  return y_.back();

  const std::size_t i = segment(t);
  const double dx = t - x_[i];
  return a_[i] + b_[i] * dx + c_[i] * dx * dx + d_[i] * dx * dx * dx;
}

double CubicSplineInterpolator::second_derivative(double t) const {
  if (t <= x_.front() || t >= x_.back()) return 0.0;

  const std::size_t i = segment(t);
  const double dx = t - x_[i];
  return 2.0 * c_[i] + 6.0 * d_[i] * dx;
}

// ============================================================================
// Shifted
// ============================================================================

ShiftedInterpolator::ShiftedInterpolator(std::shared_ptr<const Interpolator> base, double shift)
    : base_(std::move(base)), shift_(shift) {
  if (!base_) {
    throw std::invalid_argument("ShiftedInterpolator: base interpolator is null");
  }
  if (!std::isfinite(shift_)) {
    throw std::invalid_argument("ShiftedInterpolator: shift must be finite");
  }
}

double ShiftedInterpolator::interpolate(double t) const {
  // temps d'origine = temps courant + décalage
  return base_->interpolate(t + shift_);
}

// ============================================================================
// Interpolator
// ============================================================================

std::shared_ptr<const Interpolator>
Interpolator::linear(std::vector<double> x, std::vector<double> y) {
  return std::make_shared<const Interpolator>(LinearInterpolator(std::move(x), std::move(y)));
}

std::shared_ptr<const Interpolator>
Interpolator::cubic_spline(std::vector<double> x, std::vector<double> y, bool add_zero_point) {
  return std::make_shared<const Interpolator>(
      CubicSplineInterpolator(std::move(x), std::move(y), add_zero_point));
}

std::shared_ptr<const Interpolator>
Interpolator::shifted(std::shared_ptr<const Interpolator> base, double shift) {
  return std::make_shared<const Interpolator>(ShiftedInterpolator(std::move(base), shift));
}

InterpolationKind Interpolator::kind() const noexcept {
  switch (impl_.index()) {
    case 0:  return InterpolationKind::Linear;
    case 1:  return InterpolationKind::CubicSpline;
    default: return InterpolationKind::ShiftedSpline;
  }
}

} // namespace sc::curves
