#pragma once
/**
 * @file curve.hpp
 * @brief Courbe de taux zéro : noeuds (t, r) triés + stratégie d'interpolation.
 *
 * # Contenu
 * - reference_date : date d'origine des temps (t = Act/Act depuis cette date).
 * - noeuds (t_i, r_i) triés par t croissant, t_i >= 0, t_i uniques.
 * - interpolateur immuable partagé (std::shared_ptr<const Interpolator>).
 *
 * # Construction en deux temps
 * - add_point insère un noeud puis reconstruit IMMÉDIATEMENT l'interpolateur
 *   linéaire par défaut (toute stratégie personnalisée posée avant est abandonnée).
 * - set_interpolator pose une stratégie explicite (ex : spline) après les noeuds.
 * Aucune requête const ne modifie la courbe (pas de cache paresseux).
 *
 * # Conventions
 * - Taux zéro composés en continu : DF(t) = exp(-r(t) t), DF(t<=0) = 1.
 *   C'est la seule convention utilisée par le bootstrap et le pricer.
 * - discount_factor_simple : DF(t) = 1 / (1 + r(t) t), méthode distincte,
 *   pour une courbe alimentée en taux simples ; ne jamais mélanger.
 * - forward_rate(t1,t2) = (DF(t1)/DF(t2) - 1) / (t2 - t1) (taux simple).
 *
 * # Erreurs
 * - requête sur courbe vide : std::logic_error ;
 * - t dupliqué, t < 0, valeur non finie, t2 <= t1 : std::invalid_argument.
 */

#include <cstddef>
#include <memory>
#include <vector>

#include <sc/core/date.hpp>
#include <sc/curves/interpolator.hpp>

namespace sc {
namespace curves {

class Curve {
public:
  explicit Curve(const core::Date& reference_date);

  /// @brief Construction en bloc (noeuds non triés acceptés, mêmes règles que add_point).
  Curve(const core::Date& reference_date,
        const std::vector<double>& times,
        const std::vector<double>& zero_rates);

  const core::Date& reference_date() const noexcept { return ref_; }
  const std::vector<double>& times() const noexcept { return times_; }
  const std::vector<double>& zero_rates() const noexcept { return rates_; }
  std::size_t size() const noexcept { return times_.size(); }
  bool empty() const noexcept { return times_.empty(); }

  /// @brief Insertion triée ; remet l'interpolation linéaire par défaut.
  void add_point(double t, double zero_rate);

  /// @brief Pose une stratégie explicite (jusqu'au prochain add_point).
  void set_interpolator(std::shared_ptr<const Interpolator> interpolator);

  /// @throws std::logic_error si la courbe est vide.
  const Interpolator& interpolator() const;

  double zero_rate(double t) const;
  double discount_factor(double t) const;
  double discount_factor_simple(double t) const;
  double forward_rate(double t1, double t2) const;

  /// @return Temps Act/Act signé depuis la date de référence.
  double time_of(const core::Date& d) const noexcept;

  /// @return Nouvelle courbe, chaque taux + bps/10000, interpolation linéaire.
  [[nodiscard]] Curve shift_parallel(double bps) const;

  /// @return Copie profonde (noeuds + interpolateur immuable partagé).
  [[nodiscard]] Curve clone() const { return *this; }

private:
  void require_not_empty() const;

  core::Date ref_;
  std::vector<double> times_;
  std::vector<double> rates_;
  std::shared_ptr<const Interpolator> interp_;
};

} // namespace curves
} // namespace sc
