#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <sc/market/market_quote.hpp>

namespace sc::io {

// Lit un CSV de cotations (fixing + taux de swap). En-tête obligatoire,
// lignes '#' ignorées. Colonnes (synonymes acceptés) :
//   tenor | tenor_years | t       maturité en années
//   rate  | quote                 taux (décimal, ou % si unit = pct/%)
//   type  | kind | instrument     fixing/deposit/depo ou swap/par/irs (défaut : swap)
//   unit                          optionnel
// Les lignes invalides sont ignorées (compteur + message dans warnings).
// Lève std::runtime_error si le fichier ne peut pas être ouvert ou n'a pas
// de colonnes tenor/rate. La cohérence de l'ensemble (un seul fixing, ténors
// distincts) est vérifiée au bootstrap, pas ici.
std::vector<market::MarketQuote>
read_quotes_csv(const std::string& path,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

} // namespace sc::io
