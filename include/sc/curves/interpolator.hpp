#pragma once
/**
 * @file interpolator.hpp
 * @brief Stratégies d'interpolation des taux zéro : linéaire, spline cubique naturelle,
 *        spline décalée en temps.
 *
 * # Stratégies (ensemble fermé)
 * - LinearInterpolator      : linéaire par morceaux, extrapolation PLATE des deux côtés.
 * - CubicSplineInterpolator : spline cubique naturelle (S'' = 0 aux deux bords),
 *                             système tridiagonal résolu par Thomas.
 *                             Option add_zero_point : ajoute (0, y_0) avant l'ajustement
 *                             si le premier noeud est > 0, d'où f(0) = f(t_0).
 *                             Extrapolation plate (pas de polynôme hors domaine).
 * - ShiftedInterpolator     : f(t) = g(t + shift) pour une stratégie g existante ;
 *                             sert à réexprimer une courbe construite à une ancienne
 *                             date de référence sans la réajuster.
 *
 * # Interpolator
 * Variante étiquetée (std::variant) sur les trois stratégies. Objet immuable une fois
 * construit : partagé entre courbes via std::shared_ptr<const Interpolator>.
 *
 * # Erreurs (std::invalid_argument)
 * - tailles x/y différentes ;
 * - aucun noeud (linéaire), moins de 2 noeuds (spline) ;
 * - temps non strictement croissants.
 *
 * # Exactitude aux noeuds
 * interpolate(x_i) == y_i exactement pour les deux stratégies (pas d'arrondi sur le
 * poids ou le dx quand t tombe sur un noeud).
 */

#include <cstddef>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace sc::curves {

class Interpolator;

class LinearInterpolator {
public:
  LinearInterpolator(std::vector<double> x, std::vector<double> y);

  double interpolate(double t) const;

  const std::vector<double>& x() const noexcept { return x_; }
  const std::vector<double>& y() const noexcept { return y_; }

private:
  std::vector<double> x_;
  std::vector<double> y_;
};

class CubicSplineInterpolator {
public:
  CubicSplineInterpolator(std::vector<double> x, std::vector<double> y,
                          bool add_zero_point = false);

  double interpolate(double t) const;

  /// @brief S''(t) ; vaut 0 sur et au-delà des bords (condition naturelle).
  double second_derivative(double t) const;

  /// @return Noeuds effectivement ajustés (avec l'éventuel point t=0).
  const std::vector<double>& x() const noexcept { return x_; }
  const std::vector<double>& y() const noexcept { return y_; }

  // c_i de S_i(t) = a_i + b_i dx + c_i dx^2 + d_i dx^3, soit S''(x_i) / 2
  const std::vector<double>& c() const noexcept { return c_; }

private:
  void build();
  std::size_t segment(double t) const noexcept;

  std::vector<double> x_, y_;
  std::vector<double> a_, b_, c_, d_;
};

class ShiftedInterpolator {
public:
  /// @throws std::invalid_argument si base est nul.
  ShiftedInterpolator(std::shared_ptr<const Interpolator> base, double shift);

  double interpolate(double t) const;

  double shift() const noexcept { return shift_; }
  const Interpolator& base() const noexcept { return *base_; }

private:
  std::shared_ptr<const Interpolator> base_;
  double shift_;
};

enum class InterpolationKind { Linear, CubicSpline, ShiftedSpline };

class Interpolator {
public:
  using Impl = std::variant<LinearInterpolator, CubicSplineInterpolator, ShiftedInterpolator>;

  explicit Interpolator(LinearInterpolator li) : impl_(std::move(li)) {}
  explicit Interpolator(CubicSplineInterpolator cs) : impl_(std::move(cs)) {}
  explicit Interpolator(ShiftedInterpolator sh) : impl_(std::move(sh)) {}

  // Fabriques (construction + partage immuable)
  static std::shared_ptr<const Interpolator>
  linear(std::vector<double> x, std::vector<double> y);

  static std::shared_ptr<const Interpolator>
  cubic_spline(std::vector<double> x, std::vector<double> y, bool add_zero_point = false);

  static std::shared_ptr<const Interpolator>
  shifted(std::shared_ptr<const Interpolator> base, double shift);

  double interpolate(double t) const {
    return std::visit([t](const auto& s) { return s.interpolate(t); }, impl_);
  }

  InterpolationKind kind() const noexcept;

  /// @return La spline si kind()==CubicSpline, sinon nullptr.
  const CubicSplineInterpolator* as_spline() const noexcept {
    return std::get_if<CubicSplineInterpolator>(&impl_);
  }

private:
  Impl impl_;
};

} // namespace sc::curves
