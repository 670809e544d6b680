#pragma once
/**
 * @file daycount.hpp
 * @brief Fractions d'année Actual/Actual (ISDA) et échéanciers de paiement.
 *
 * # Actual/Actual (ISDA)
 * La période [start, end) est découpée aux 1er janvier ; chaque morceau
 * contribue (jours dans cette année civile) / (365 ou 366).
 * Ce n'est PAS Act/365 : la différence se voit à la 6e décimale des taux.
 *
 * # Échéanciers
 * - Dates start + k*freq (k = 1, 2, ...) calculées depuis start (pas de dérive
 *   de fin de mois), tant que <= end.
 * - Si la dernière date n'est pas end, on ajoute end (période courte finale).
 * - start est exclu des dates de paiement.
 *
 * # Additivité
 * year_fraction(a, c) == year_fraction(a, b) + year_fraction(b, c) pour a<=b<=c
 * (aux arrondis flottants près).
 */

#include <vector>
#include <sc/core/date.hpp>

namespace sc {
namespace core {

/// @return 0 si start >= end, sinon fraction Act/Act ISDA.
double year_fraction(const Date& start, const Date& end) noexcept;

/// @return Fraction d'année signée (négative si target < ref).
double time_in_years(const Date& ref, const Date& target) noexcept;

/// @brief Dates de paiement (start exclu, end inclus).
/// @throws std::invalid_argument si frequency_months <= 0 ou end <= start.
std::vector<Date> generate_payment_dates(const Date& start, const Date& end, int frequency_months);

/// @brief Bornes d'accrual : start suivi des dates de paiement.
std::vector<Date> generate_schedule(const Date& start, const Date& end, int frequency_months);

} // namespace core
} // namespace sc
