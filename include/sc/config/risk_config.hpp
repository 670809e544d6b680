#pragma once
/**
 * @file risk_config.hpp
 * @brief Configuration des sensibilités taux par choc des cotations (bump & re-strip).
 *
 * # Méthode
 * Chaque scénario choque les taux de swap cotés (jamais le fixing) de bump_bps,
 * relance le bootstrap complet, puis revalorise le swap :
 *   DV01  = PV(+1bp) - PV(0)                    (unilatéral)
 *   Gamma = PV(+1bp) - 2 PV(0) + PV(-1bp)
 *
 * # Remarques
 * - spread_bps est obligatoire : c'est l'écart courbe d'actualisation /
 *   courbe de projection utilisé par chaque re-bootstrap.
 * - Les paramètres Newton viennent de BootstrapConfig.
 */

#include <sc/config/bootstrap_config.hpp>

namespace sc {
namespace config {

struct RiskConfig {
  double spread_bps;            ///< Spread discount - projection (ex: -38).
  double bump_bps = 1.0;        ///< Taille du choc sur les cotations.
  BootstrapConfig bootstrap{};  ///< Paramètres de chaque re-bootstrap.

  explicit RiskConfig(double spreadBps) : spread_bps(spreadBps) {}

  RiskConfig(double spreadBps, double bumpBps, BootstrapConfig bcfg)
  : spread_bps(spreadBps),
    bump_bps(bumpBps),
    bootstrap(bcfg) {}
};

} // namespace config
} // namespace sc
