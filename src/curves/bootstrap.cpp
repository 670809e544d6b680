#include <sc/curves/bootstrap.hpp>

#include <sc/core/daycount.hpp>
#include <sc/pricing/swap.hpp>
#include <sc/pricing/swap_pricer.hpp>

#include <algorithm>  // std::max
#include <cmath>      // std::abs, std::lround
#include <sstream>
#include <stdexcept>

namespace sc {
namespace curves {

namespace {

// Swap coté de nominal 1 : [ref, ref + round(12T) mois], taux fixe = taux pair.
pricing::Swap quoted_swap(const core::Date& ref, double tenor_years, double par_rate,
                          const config::BootstrapConfig& cfg)
{
  const int months = static_cast<int>(std::lround(12.0 * tenor_years));
  if (months <= 0) {
    throw std::invalid_argument("bootstrap_curves: par tenor shorter than one month");
  }
  return pricing::Swap(ref, ref.add_months(months), 1.0, par_rate,
                       cfg.fixed_frequency_months, cfg.float_frequency_months);
}

// NPV variable - fixe sur les courbes résolues + le noeud candidat (t_knot, x) / (t_knot, x + spread).
double trial_npv(const CurvePair& solved, const pricing::Swap& swap,
                 double knot_time, double x, double spread)
{
  Curve proj = solved.projection.clone();
  Curve disc = solved.discount.clone();
  proj.add_point(knot_time, x);
  disc.add_point(knot_time, x + spread);

  const core::Date& ref = proj.reference_date();
  return pricing::float_leg_pv(swap, proj, disc, ref) - pricing::fixed_leg_pv(swap, disc, ref);
}

} // namespace

bool BootstrapReport::all_converged() const noexcept {
  for (const auto& t : tenors) {
    if (!t.converged) return false;
  }
  return true;
}

double BootstrapReport::max_abs_residual() const noexcept {
  double m = 0.0;
  for (const auto& t : tenors) m = std::max(m, std::abs(t.residual));
  return m;
}

double par_swap_npv(const CurvePair& curves, double tenor_years, double par_rate,
                    const config::BootstrapConfig& cfg)
{
  const core::Date& ref = curves.projection.reference_date();
  const pricing::Swap swap = quoted_swap(ref, tenor_years, par_rate, cfg);
  return pricing::float_leg_pv(swap, curves.projection, curves.discount, ref)
       - pricing::fixed_leg_pv(swap, curves.discount, ref);
}

CurvePair bootstrap_curves(const core::Date& reference_date,
                           const std::vector<market::MarketQuote>& quotes,
                           double spread_bps,
                           const config::BootstrapConfig& cfg,
                           BootstrapReport* report,
                           std::vector<std::string>* warnings)
{
  if (!std::isfinite(spread_bps)) {
    throw std::invalid_argument("bootstrap_curves: spread_bps must be finite");
  }
  if (cfg.newton_max_iter <= 0 || !(cfg.npv_tolerance > 0.0) || !(cfg.derivative_bump > 0.0)) {
    throw std::invalid_argument("bootstrap_curves: invalid BootstrapConfig");
  }

  const auto ordered = market::sorted_quotes(quotes);
  const double spread = spread_bps / 10000.0;

  CurvePair out{ Curve(reference_date), Curve(reference_date) };
  if (report) report->tenors.clear();

  for (const auto& q : ordered) {
    const double T = q.tenor_years();

    if (q.is_fixing()) {
      out.projection.add_point(T, q.rate());
      out.discount.add_point(T, q.rate() + spread);
      if (report) {
        TenorSolve s;
        s.tenor_years = T;
        s.knot_time   = T;
        s.zero_rate   = q.rate();
        s.converged   = true;
        s.is_fixing   = true;
        report->tenors.push_back(s);
      }
      continue;
    }

    const pricing::Swap swap = quoted_swap(reference_date, T, q.rate(), cfg);
    // noeud à l'échéance réelle : aucun flux du swap coté au-delà de son noeud
    const double t_knot = core::year_fraction(reference_date, swap.end_date());

    TenorSolve s;
    s.tenor_years = T;
    s.knot_time   = t_knot;

    double x = q.rate();
    for (int it = 0; it < cfg.newton_max_iter; ++it) {
      const double f = trial_npv(out, swap, t_knot, x, spread);
      s.iters = it;
      if (std::abs(f) <= cfg.npv_tolerance) {
        s.converged = true;
        break;
      }
      const double f_up  = trial_npv(out, swap, t_knot, x + cfg.derivative_bump, spread);
      const double deriv = (f_up - f) / cfg.derivative_bump;
      if (std::abs(deriv) < cfg.derivative_floor) {
        s.stalled = true;
        break;
      }
      x -= f / deriv;
      s.iters = it + 1;
    }

    s.zero_rate = x;
    s.residual  = trial_npv(out, swap, t_knot, x, spread);
    if (!s.converged && std::abs(s.residual) <= cfg.npv_tolerance) s.converged = true;

    if (!s.converged && warnings) {
      std::ostringstream msg;
      msg << "bootstrap_curves: tenor " << T << "y "
          << (s.stalled ? "stalled (derivative below floor)" : "did not converge")
          << " after " << s.iters << " iterations, residual=" << s.residual;
      warnings->push_back(msg.str());
    }

    out.projection.add_point(t_knot, x);
    out.discount.add_point(t_knot, x + spread);
    if (report) report->tenors.push_back(s);
  }

  return out;
}

} // namespace curves
} // namespace sc
