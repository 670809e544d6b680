#pragma once
#include <sc/core/date.hpp>
#include <sc/curves/curve.hpp>

namespace sc::curves {

// Déplacement de l'origine d'une courbe à new_reference (valorisation forward
// sans re-bootstrap). Delta = YF(ancienne ref, nouvelle ref), doit être >= 0.

// Noeuds ré-exprimés en t - Delta, ceux avec t - Delta <= 0 sont retirés ; linéaire.
// Lève std::invalid_argument si aucun noeud ne survit ou si new_reference < ref.
Curve roll_curve(const Curve& curve, const core::Date& new_reference);

// Mêmes noeuds que roll_curve, spline naturelle avec ancrage f(0) = f(premier noeud).
// Au moins 2 noeuds doivent survivre.
Curve roll_curve_spline(const Curve& curve, const core::Date& new_reference);

// Spline (avec ancrage) ajustée sur les noeuds d'ORIGINE puis décalée de Delta :
// r'(t) = r(t + Delta). La courbe garde la table de noeuds roulés pour affichage.
Curve roll_curve_shifted(const Curve& curve, const core::Date& new_reference);

} // namespace sc::curves
