#pragma once
/**
 * @file bootstrap.hpp
 * @brief Bootstrap dual-curve : courbe de projection (IBOR) + courbe d'actualisation
 *        = projection + spread fixe, à partir d'un fixing et de taux de swap au pair.
 *
 * # Algorithme (ténors croissants, jamais dans le désordre)
 * 1. Fixing (ténor T_f, taux f) : (T_f, f) dans la projection, (T_f, f + spread)
 *    dans l'actualisation. Pas de résolution.
 * 2. Swap au pair de ténor T, taux S : swap [ref, ref + 12T mois], fixe annuel,
 *    variable semestriel. Le noeud est placé à l'échéance réelle du swap,
 *    t_T = YF(ref, ref + 12T mois) (Act/Act, peut différer de T de quelques
 *    jours) : aucun flux du swap n'est au-delà de son noeud, les noeuds
 *    ajoutés ensuite ne le déplacent donc pas.
 *    Inconnue unique : le taux zéro de projection x en t_T
 *    (l'actualisation en t_T vaut toujours x + spread). Newton–Raphson :
 *      NPV(x) = PV_variable(x) - PV_fixe(x)   (nominal 1, taux fixe S)
 *    évalué sur les courbes déjà construites + le noeud candidat (t_T, x) ;
 *    les noeuds précédents sont figés. Départ x0 = S, dérivée par bump avant,
 *    arrêt si |NPV| <= tolérance ou après newton_max_iter itérations.
 * 3. (t_T, x) et (t_T, x + spread) sont ajoutés aux courbes.
 *    Le fixing reste au ténor nominal.
 *
 * # Itération bloquée
 * Si |dNPV/dx| < derivative_floor, on s'arrête et on garde la dernière
 * estimation (stalled = true). Aucune exception : la non-convergence est
 * signalée dans BootstrapReport et, si fourni, dans `warnings`.
 *
 * # Sortie
 * Paire de courbes aux mêmes temps de noeuds, interpolation linéaire,
 * actualisation = projection + spread à chaque noeud.
 */

#include <string>
#include <vector>

#include <sc/config/bootstrap_config.hpp>
#include <sc/core/date.hpp>
#include <sc/curves/curve.hpp>
#include <sc/market/market_quote.hpp>

namespace sc {
namespace curves {

struct CurvePair {
  Curve projection;  ///< Courbe de projection des forwards (IBOR).
  Curve discount;    ///< Courbe d'actualisation = projection + spread.
};

/// @brief Diagnostic d'un ténor.
struct TenorSolve {
  double tenor_years{0.0};
  double knot_time{0.0};   ///< Temps du noeud (échéance Act/Act du swap coté).
  double zero_rate{0.0};   ///< Taux de projection retenu.
  int    iters{0};         ///< Itérations Newton (0 pour le fixing).
  bool   converged{false};
  bool   stalled{false};   ///< Dérivée sous le seuil.
  double residual{0.0};    ///< NPV finale (nominal 1), 0 pour le fixing.
  bool   is_fixing{false};
};

struct BootstrapReport {
  std::vector<TenorSolve> tenors;

  bool all_converged() const noexcept;
  double max_abs_residual() const noexcept;
};

/**
 * @brief Construit la paire (projection, actualisation).
 * @param reference_date Date d'origine des deux courbes.
 * @param quotes         Un fixing + au moins un taux de swap (ordre libre).
 * @param spread_bps     Spread actualisation - projection en bps (ex : -38).
 * @param cfg            Paramètres Newton / fréquences.
 * @param report         (optionnel) diagnostic par ténor.
 * @param warnings       (optionnel) messages de non-convergence.
 * @throws std::invalid_argument si l'ensemble de cotations est invalide.
 */
CurvePair bootstrap_curves(const core::Date& reference_date,
                           const std::vector<market::MarketQuote>& quotes,
                           double spread_bps,
                           const config::BootstrapConfig& cfg = {},
                           BootstrapReport* report = nullptr,
                           std::vector<std::string>* warnings = nullptr);

/// @brief NPV (variable - fixe, nominal 1) du swap coté de ténor T au taux S sur une paire de courbes.
double par_swap_npv(const CurvePair& curves, double tenor_years, double par_rate,
                    const config::BootstrapConfig& cfg = {});

} // namespace curves
} // namespace sc
