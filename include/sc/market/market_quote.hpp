#pragma once
/**
 * @file market_quote.hpp
 * @brief Cotation de marché pour le bootstrap : un fixing direct ou un taux de swap au pair.
 *
 * # Contenu
 * - tenor_years : maturité en années (> 0), ex : 0.5 pour le fixing 6M.
 * - rate        : taux en décimal (peut être négatif).
 * - is_fixing   : true pour le fixing (entré tel quel dans la courbe).
 *
 * # Ensemble de cotations valide
 * - exactement un fixing ;
 * - au moins un taux de swap ;
 * - ténors tous distincts.
 * L'ordre d'entrée est libre : le bootstrap trie par ténor croissant.
 */

#include <vector>

namespace sc {
namespace market {

/// @brief Cotation immuable.
class MarketQuote {
public:
  /// @throws std::invalid_argument si tenor <= 0 ou valeurs non finies.
  MarketQuote(double tenor_years, double rate, bool is_fixing = false);

  double tenor_years() const noexcept { return tenor_years_; }
  double rate()        const noexcept { return rate_; }
  bool   is_fixing()   const noexcept { return is_fixing_; }

  /// @return Copie avec rate + bps/10000.
  [[nodiscard]] MarketQuote bumped(double bps) const;

private:
  double tenor_years_;
  double rate_;
  bool   is_fixing_;
};

/// @brief Vérifie l'ensemble et le renvoie trié par ténor croissant.
/// @throws std::invalid_argument si l'ensemble est invalide (voir en-tête).
std::vector<MarketQuote> sorted_quotes(const std::vector<MarketQuote>& quotes);

/// @brief Choque tous les taux de swap de bps (le fixing est inchangé).
std::vector<MarketQuote> bump_par_quotes(const std::vector<MarketQuote>& quotes, double bps);

} // namespace market
} // namespace sc
