#pragma once
/**
 * @file swap.hpp
 * @brief Swap de taux vanille fixe / variable (nominal constant, sans lag, sans calendrier).
 *
 * # Contenu
 * - start_date, end_date (end > start).
 * - notional (> 0).
 * - fixed_rate : seul champ modifiable (typiquement posé une fois au taux pair).
 * - fréquences : fixe 12M (annuel), variable 6M (semestriel) par défaut.
 *
 * # Flux
 * Recalculés à chaque appel (jamais mis en cache), Act/Act ISDA :
 * - CashFlow    (jambe fixe)     : amount = notional * fixed_rate * day_fraction.
 * - FloatPeriod (jambe variable) : le taux est résolu plus tard sur une courbe.
 */

#include <vector>
#include <sc/core/date.hpp>

namespace sc {
namespace pricing {

struct CashFlow {
  core::Date accrual_start;
  core::Date accrual_end;
  core::Date payment_date;
  double day_fraction;
  double rate;
  double amount;
};

struct FloatPeriod {
  core::Date accrual_start;
  core::Date accrual_end;
  core::Date payment_date;
  double day_fraction;
};

class Swap {
public:
  /// @throws std::invalid_argument si end <= start, notional <= 0 ou fréquence <= 0.
  Swap(const core::Date& start_date,
       const core::Date& end_date,
       double notional,
       double fixed_rate = 0.0,
       int fixed_frequency_months = 12,
       int float_frequency_months = 6);

  const core::Date& start_date() const noexcept { return start_; }
  const core::Date& end_date()   const noexcept { return end_;   }
  double notional()   const noexcept { return notional_;   }
  double fixed_rate() const noexcept { return fixed_rate_; }
  int fixed_frequency_months() const noexcept { return fixed_freq_; }
  int float_frequency_months() const noexcept { return float_freq_; }

  void set_fixed_rate(double rate);

  /// @return Durée Act/Act ISDA en années.
  double tenor_years() const noexcept;

  std::vector<CashFlow>    fixed_leg_cashflows() const;
  std::vector<FloatPeriod> float_leg_periods() const;

private:
  core::Date start_;
  core::Date end_;
  double notional_;
  double fixed_rate_;
  int fixed_freq_;
  int float_freq_;
};

} // namespace pricing
} // namespace sc
