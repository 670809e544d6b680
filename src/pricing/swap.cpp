#include <sc/pricing/swap.hpp>

#include <sc/core/daycount.hpp>

#include <cmath>      // std::isfinite
#include <stdexcept>  // std::invalid_argument

namespace sc {
namespace pricing {

Swap::Swap(const core::Date& start_date,
           const core::Date& end_date,
           double notional,
           double fixed_rate,
           int fixed_frequency_months,
           int float_frequency_months)
    : start_(start_date),
      end_(end_date),
      notional_(notional),
      fixed_rate_(fixed_rate),
      fixed_freq_(fixed_frequency_months),
      float_freq_(float_frequency_months) {
  if (end_ <= start_) {
    throw std::invalid_argument("Swap: end_date must be after start_date");
  }
  if (!(notional_ > 0.0)) {
    throw std::invalid_argument("Swap: notional must be > 0");
  }
  if (fixed_freq_ <= 0 || float_freq_ <= 0) {
    throw std::invalid_argument("Swap: leg frequencies must be > 0");
  }
  if (!std::isfinite(fixed_rate_)) {
    throw std::invalid_argument("Swap: fixed_rate must be finite");
  }
}

void Swap::set_fixed_rate(double rate) {
  if (!std::isfinite(rate)) {
    throw std::invalid_argument("Swap: fixed_rate must be finite");
  }
  fixed_rate_ = rate;
}

double Swap::tenor_years() const noexcept {
  return core::year_fraction(start_, end_);
}

std::vector<CashFlow> Swap::fixed_leg_cashflows() const {
  const auto pay_dates = core::generate_payment_dates(start_, end_, fixed_freq_);

  std::vector<CashFlow> flows;
  flows.reserve(pay_dates.size());
  core::Date prev = start_;
  for (const auto& pay : pay_dates) {
    const double tau = core::year_fraction(prev, pay);
    flows.push_back(CashFlow{ prev, pay, pay, tau, fixed_rate_, notional_ * fixed_rate_ * tau });
    prev = pay;
  }
  return flows;
}

std::vector<FloatPeriod> Swap::float_leg_periods() const {
  const auto pay_dates = core::generate_payment_dates(start_, end_, float_freq_);

  std::vector<FloatPeriod> periods;
  periods.reserve(pay_dates.size());
  core::Date prev = start_;
  for (const auto& pay : pay_dates) {
    periods.push_back(FloatPeriod{ prev, pay, pay, core::year_fraction(prev, pay) });
    prev = pay;
  }
  return periods;
}

} // namespace pricing
} // namespace sc
