#include <sc/pricing/swap_pricer.hpp>

#include <sc/core/daycount.hpp>
#include <sc/curves/curve.hpp>

#include <limits>
#include <optional>
#include <stdexcept>

namespace {

// début de période considéré comme "t=0" de la courbe
constexpr double FIRST_PERIOD_EPS = 1e-4;

// fraction écoulée de la période à valuation_date (Act/Act)
inline double elapsed_fraction(const sc::core::Date& start, const sc::core::Date& val, double tau) {
  if (tau <= 0.0) return 0.0;
  return sc::core::year_fraction(start, val) / tau;
}

// taux d'une période : fixing connu si elle a commencé avant la référence de la projection
inline double period_rate(const sc::pricing::FloatPeriod& p, const sc::curves::Curve& projection,
                          const std::optional<double>& current_fixing) {
  if (current_fixing && p.accrual_start < projection.reference_date()) return *current_fixing;
  return sc::pricing::float_period_rate(p, projection);
}

} // namespace

namespace sc::pricing {

double fixed_leg_pv(const Swap& swap, const curves::Curve& discount,
                    const core::Date& valuation_date)
{
  double pv = 0.0;
  for (const auto& cf : swap.fixed_leg_cashflows()) {
    if (cf.payment_date <= valuation_date) continue; // déjà payé
    const double t = discount.time_of(cf.payment_date);
    pv += cf.amount * discount.discount_factor(t);
  }
  return pv;
}

double float_period_rate(const FloatPeriod& period, const curves::Curve& projection) {
  const double t_start = projection.time_of(period.accrual_start);
  const double t_end   = projection.time_of(period.accrual_end);
  if (t_end <= 0.0) {
    throw std::invalid_argument("float_period_rate: period ends before the projection reference date");
  }
  if (t_start <= FIRST_PERIOD_EPS) {
    return (1.0 / projection.discount_factor(t_end) - 1.0) / t_end;
  }
  return projection.forward_rate(t_start, t_end);
}

std::optional<double> current_float_fixing(const Swap& swap,
                                           const curves::Curve& fixing_projection,
                                           const core::Date& valuation_date)
{
  for (const auto& p : swap.float_leg_periods()) {
    if (p.accrual_start <= valuation_date && valuation_date < p.accrual_end) {
      return float_period_rate(p, fixing_projection);
    }
  }
  return std::nullopt;
}

double float_leg_pv(const Swap& swap, const curves::Curve& projection,
                    const curves::Curve& discount, const core::Date& valuation_date,
                    std::optional<double> current_fixing)
{
  double pv = 0.0;
  for (const auto& p : swap.float_leg_periods()) {
    if (p.payment_date <= valuation_date) continue;
    const double fwd    = period_rate(p, projection, current_fixing);
    const double amount = swap.notional() * fwd * p.day_fraction;
    pv += amount * discount.discount_factor(discount.time_of(p.payment_date));
  }
  return pv;
}

double fixed_annuity(const Swap& swap, const curves::Curve& discount,
                     const core::Date& valuation_date)
{
  double annuity = 0.0;
  for (const auto& cf : swap.fixed_leg_cashflows()) {
    if (cf.payment_date <= valuation_date) continue;
    annuity += discount.discount_factor(discount.time_of(cf.payment_date)) * cf.day_fraction;
  }
  return annuity;
}

double par_rate(const Swap& swap, const curves::Curve& projection,
                const curves::Curve& discount, const core::Date& valuation_date,
                std::optional<double> current_fixing)
{
  const double annuity = fixed_annuity(swap, discount, valuation_date);
  if (annuity <= 0.0) {
    throw std::runtime_error("par_rate: no remaining fixed payments (zero annuity)");
  }
  return float_leg_pv(swap, projection, discount, valuation_date, current_fixing)
       / (swap.notional() * annuity);
}

double swap_pv(const Swap& swap, const curves::Curve& projection,
               const curves::Curve& discount, const core::Date& valuation_date,
               std::optional<double> current_fixing)
{
  return fixed_leg_pv(swap, discount, valuation_date)
       - float_leg_pv(swap, projection, discount, valuation_date, current_fixing);
}

double fixed_accrual(const Swap& swap, const core::Date& valuation_date) {
  for (const auto& cf : swap.fixed_leg_cashflows()) {
    if (cf.accrual_start <= valuation_date && valuation_date < cf.accrual_end) {
      return cf.amount * elapsed_fraction(cf.accrual_start, valuation_date, cf.day_fraction);
    }
  }
  return 0.0;
}

double float_accrual(const Swap& swap, const curves::Curve& projection,
                     const core::Date& valuation_date,
                     std::optional<double> current_fixing)
{
  for (const auto& p : swap.float_leg_periods()) {
    if (p.accrual_start <= valuation_date && valuation_date < p.accrual_end) {
      const double full = swap.notional() * period_rate(p, projection, current_fixing) * p.day_fraction;
      return full * elapsed_fraction(p.accrual_start, valuation_date, p.day_fraction);
    }
  }
  return 0.0;
}

SwapValuation price(const Swap& swap, const curves::Curve& projection,
                    const curves::Curve& discount, const core::Date& valuation_date,
                    std::optional<double> current_fixing)
{
  SwapValuation v;
  v.fixed_leg_pv  = fixed_leg_pv(swap, discount, valuation_date);
  v.float_leg_pv  = float_leg_pv(swap, projection, discount, valuation_date, current_fixing);
  v.annuity       = fixed_annuity(swap, discount, valuation_date);
  v.dirty_pv      = v.fixed_leg_pv - v.float_leg_pv;
  v.par_rate      = (v.annuity > 0.0) ? v.float_leg_pv / (swap.notional() * v.annuity)
                                     : std::numeric_limits<double>::quiet_NaN();
  v.fixed_accrual = fixed_accrual(swap, valuation_date);
  v.float_accrual = float_accrual(swap, projection, valuation_date, current_fixing);
  // receveur : on retire le fixe couru (à recevoir), on rajoute le variable couru (à payer)
  v.clean_pv      = v.dirty_pv - v.fixed_accrual + v.float_accrual;
  return v;
}

} // namespace sc::pricing
