#include <sc/risk/risk_calculator.hpp>

#include <sc/curves/bootstrap.hpp>
#include <sc/pricing/swap_pricer.hpp>

namespace sc {
namespace risk {

double RiskCalculator::pv_under_quote_bump(const pricing::Swap& swap,
                                           const std::vector<market::MarketQuote>& quotes,
                                           const core::Date& reference_date,
                                           double bump_bps) const
{
  const auto bumped = market::bump_par_quotes(quotes, bump_bps);
  const auto pair = curves::bootstrap_curves(reference_date, bumped, cfg_.spread_bps,
                                             cfg_.bootstrap);
  return pricing::swap_pv(swap, pair.projection, pair.discount, reference_date);
}

double RiskCalculator::dv01(const pricing::Swap& swap,
                            const std::vector<market::MarketQuote>& quotes,
                            const core::Date& reference_date) const
{
  const double pv0  = pv_under_quote_bump(swap, quotes, reference_date, 0.0);
  const double pvUp = pv_under_quote_bump(swap, quotes, reference_date, cfg_.bump_bps);
  return pvUp - pv0;
}

double RiskCalculator::gamma(const pricing::Swap& swap,
                             const std::vector<market::MarketQuote>& quotes,
                             const core::Date& reference_date) const
{
  const double pv0  = pv_under_quote_bump(swap, quotes, reference_date, 0.0);
  const double pvUp = pv_under_quote_bump(swap, quotes, reference_date, cfg_.bump_bps);
  const double pvDn = pv_under_quote_bump(swap, quotes, reference_date, -cfg_.bump_bps);
  return pvUp - 2.0 * pv0 + pvDn;
}

RiskMetrics RiskCalculator::compute(const pricing::Swap& swap,
                                    const std::vector<market::MarketQuote>& quotes,
                                    const core::Date& reference_date) const
{
  const double pv0  = pv_under_quote_bump(swap, quotes, reference_date, 0.0);
  const double pvUp = pv_under_quote_bump(swap, quotes, reference_date, cfg_.bump_bps);
  const double pvDn = pv_under_quote_bump(swap, quotes, reference_date, -cfg_.bump_bps);

  RiskMetrics m;
  m.dv01  = pvUp - pv0;
  m.gamma = pvUp - 2.0 * pv0 + pvDn;
  return m;
}

RiskMetrics RiskCalculator::curve_shift_risk(const pricing::Swap& swap,
                                             const curves::Curve& projection,
                                             const curves::Curve& discount,
                                             const core::Date& valuation_date) const
{
  const double h = cfg_.bump_bps;
  const double pv0  = pricing::swap_pv(swap, projection, discount, valuation_date);
  const double pvUp = pricing::swap_pv(swap, projection.shift_parallel(h),
                                       discount.shift_parallel(h), valuation_date);
  const double pvDn = pricing::swap_pv(swap, projection.shift_parallel(-h),
                                       discount.shift_parallel(-h), valuation_date);

  RiskMetrics m;
  m.dv01  = 0.5 * (pvUp - pvDn);
  m.gamma = pvUp - 2.0 * pv0 + pvDn;
  return m;
}

} // namespace risk
} // namespace sc
