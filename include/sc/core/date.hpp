#pragma once
/**
 * @file date.hpp
 * @brief Date calendaire (grégorien proleptique), sans calendrier de jours ouvrés.
 *
 * # Représentation
 * - year, month (1..12), day (1..jours du mois).
 * - Conversion vers un numéro de jour (serial) pour les différences en jours.
 *
 * # Arithmétique
 * - add_months : le jour est ramené au dernier jour du mois cible si besoin
 *   (31 janv. + 1M = 28/29 févr.).
 * - Pas d'ajustement jours ouvrés (pas de calendrier de fériés).
 */

#include <string>

namespace sc {
namespace core {

bool is_leap_year(int year) noexcept;
int  days_in_month(int month, int year) noexcept;
int  days_in_year(int year) noexcept;

class Date {
public:
  /// @brief 1970-01-01 par défaut.
  Date() noexcept : year_(1970), month_(1), day_(1) {}

  /// @throws std::invalid_argument si (y,m,d) n'est pas une date valide.
  Date(int year, int month, int day);

  int year()  const noexcept { return year_;  }
  int month() const noexcept { return month_; }
  int day()   const noexcept { return day_;   }

  /// @return Nombre de jours depuis 1970-01-01 (négatif avant).
  long serial() const noexcept;
  static Date from_serial(long serial) noexcept;

  [[nodiscard]] Date add_days(long n) const noexcept;
  [[nodiscard]] Date add_months(int n) const noexcept;
  [[nodiscard]] Date add_years(int n) const noexcept { return add_months(12 * n); }

  /// @brief Format ISO "YYYY-MM-DD".
  std::string to_string() const;

  /// @brief Parse "YYYY-MM-DD".
  /// @throws std::invalid_argument si le format ou la date est invalide.
  static Date parse(const std::string& iso);

  /// @brief Date locale du jour (pour les programmes).
  static Date today();

private:
  int year_;
  int month_;
  int day_;
};

inline bool operator==(const Date& a, const Date& b) noexcept {
  return a.year() == b.year() && a.month() == b.month() && a.day() == b.day();
}
inline bool operator!=(const Date& a, const Date& b) noexcept { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) noexcept { return a.serial() < b.serial(); }
inline bool operator>(const Date& a, const Date& b) noexcept { return b < a; }
inline bool operator<=(const Date& a, const Date& b) noexcept { return !(b < a); }
inline bool operator>=(const Date& a, const Date& b) noexcept { return !(a < b); }

/// @return b - a en jours calendaires.
inline long days_between(const Date& a, const Date& b) noexcept { return b.serial() - a.serial(); }

} // namespace core
} // namespace sc
