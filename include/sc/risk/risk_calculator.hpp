#pragma once
/**
 * @file risk_calculator.hpp
 * @brief Sensibilités taux d'un swap par choc des cotations et re-bootstrap complet.
 *
 * # Principe
 * Chaque scénario choque tous les taux de swap cotés (le fixing reste inchangé),
 * reconstruit la paire (projection, actualisation) et revalorise le swap
 * (convention receveur, PV sale, valorisation à la date de référence) :
 *   DV01  = PV(+h) - PV(0)
 *   Gamma = PV(+h) - 2 PV(0) + PV(-h)
 * avec h = RiskConfig::bump_bps (1bp par défaut). Gamma n'est pas normalisé par h².
 *
 * # Repli
 * curve_shift_risk décale directement les deux courbes (shift_parallel) sans
 * re-bootstrap : DV01 central (PV+ - PV-)/2, même Gamma.
 */

#include <vector>

#include <sc/config/risk_config.hpp>
#include <sc/core/date.hpp>
#include <sc/curves/curve.hpp>
#include <sc/market/market_quote.hpp>
#include <sc/pricing/swap.hpp>

namespace sc {
namespace risk {

struct RiskMetrics {
  double dv01{0.0};
  double gamma{0.0};
};

class RiskCalculator {
public:
  explicit RiskCalculator(config::RiskConfig cfg) : cfg_(cfg) {}

  const config::RiskConfig& config() const noexcept { return cfg_; }

  /**
   * @brief PV du swap sur des courbes bootstrapées à partir des cotations
   *        choquées de bump_bps (0 = scénario de base).
   * @throws std::invalid_argument si l'ensemble de cotations est invalide.
   */
  [[nodiscard]] double pv_under_quote_bump(const pricing::Swap& swap,
                                           const std::vector<market::MarketQuote>& quotes,
                                           const core::Date& reference_date,
                                           double bump_bps) const;

  [[nodiscard]] double dv01(const pricing::Swap& swap,
                            const std::vector<market::MarketQuote>& quotes,
                            const core::Date& reference_date) const;

  [[nodiscard]] double gamma(const pricing::Swap& swap,
                             const std::vector<market::MarketQuote>& quotes,
                             const core::Date& reference_date) const;

  /// @brief DV01 et Gamma avec un PV de base commun (3 bootstraps au lieu de 5).
  [[nodiscard]] RiskMetrics compute(const pricing::Swap& swap,
                                    const std::vector<market::MarketQuote>& quotes,
                                    const core::Date& reference_date) const;

  /// @brief Version par décalage parallèle des courbes déjà construites.
  [[nodiscard]] RiskMetrics curve_shift_risk(const pricing::Swap& swap,
                                             const curves::Curve& projection,
                                             const curves::Curve& discount,
                                             const core::Date& valuation_date) const;

private:
  config::RiskConfig cfg_;
};

} // namespace risk
} // namespace sc
