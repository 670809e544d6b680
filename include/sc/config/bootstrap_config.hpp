#pragma once
/**
 * @file bootstrap_config.hpp
 * @brief Paramètres numériques du bootstrap dual-curve (Newton–Raphson).
 *
 * # Contenu
 * - newton_max_iter  : plafond d'itérations par ténor (borne la latence).
 * - npv_tolerance    : |NPV| cible sur un swap de nominal 1.
 * - derivative_bump  : bump avant (en taux) pour la dérivée numérique.
 * - derivative_floor : |dNPV/dx| en dessous duquel on arrête (itération bloquée),
 *                      on garde alors la dernière estimation.
 *
 * # Conventions des swaps de calibration
 * - Jambe fixe annuelle, jambe variable semestrielle, Act/Act ISDA, sans lag.
 */

namespace sc {
namespace config {

/// @brief Configuration d'un bootstrap (défauts = exercice de référence).
struct BootstrapConfig {
  int    newton_max_iter  = 100;    ///< Itérations max par ténor.
  double npv_tolerance    = 1e-10;  ///< Tolérance absolue sur NPV (nominal 1).
  double derivative_bump  = 1e-4;   ///< Bump pour dNPV/dx (différence avant).
  double derivative_floor = 1e-14;  ///< Seuil de dérivée "nulle".

  int fixed_frequency_months = 12;  ///< Jambe fixe des swaps cotés.
  int float_frequency_months = 6;   ///< Jambe variable des swaps cotés.
};

} // namespace config
} // namespace sc
