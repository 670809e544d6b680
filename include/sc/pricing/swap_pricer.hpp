#pragma once
#include <optional>

#include <sc/pricing/swap.hpp>

namespace sc { namespace curves { class Curve; } }

namespace sc::pricing {

// Résultat complet d'une valorisation (convention receveur du fixe).
struct SwapValuation {
  double fixed_leg_pv{0.0};
  double float_leg_pv{0.0};
  double annuity{0.0};        // somme DF * day_fraction des paiements fixes futurs
  double dirty_pv{0.0};       // fixed_leg_pv - float_leg_pv
  double par_rate{0.0};       // NaN si plus aucun paiement fixe
  double fixed_accrual{0.0};
  double float_accrual{0.0};
  double clean_pv{0.0};       // dirty_pv - fixed_accrual + float_accrual
};

// Seuls les paiements strictement après valuation_date comptent.
// Les temps sont mesurés depuis la date de référence de chaque courbe ;
// DF = exp(-r t) (composition continue) partout.
//
// current_fixing : taux déjà fixé de la période variable commencée avant la
// date de référence de la projection (courbe roulée). Sans lui, cette période
// est recalculée sur la projection comme une première période.

double fixed_leg_pv(const Swap& swap, const curves::Curve& discount,
                    const core::Date& valuation_date);

double float_leg_pv(const Swap& swap, const curves::Curve& projection,
                    const curves::Curve& discount, const core::Date& valuation_date,
                    std::optional<double> current_fixing = std::nullopt);

double fixed_annuity(const Swap& swap, const curves::Curve& discount,
                     const core::Date& valuation_date);

// FloatLegPV / (notional * annuity). Lève std::runtime_error si annuité nulle.
double par_rate(const Swap& swap, const curves::Curve& projection,
                const curves::Curve& discount, const core::Date& valuation_date,
                std::optional<double> current_fixing = std::nullopt);

// Receveur : fixe - variable.
double swap_pv(const Swap& swap, const curves::Curve& projection,
               const curves::Curve& discount, const core::Date& valuation_date,
               std::optional<double> current_fixing = std::nullopt);

// Taux forward d'une période variable sur la courbe de projection.
// Première période (début à/avant le t=0 de la courbe) : taux implicite du zéro
// à la fin de période, (1/DF(t_end) - 1) / t_end.
double float_period_rate(const FloatPeriod& period, const curves::Curve& projection);

// Taux fixé en début de la période variable en cours à valuation_date
// (start <= val < end), lu sur la projection de la date de fixation
// (celle de l'origine du swap). nullopt si aucune période n'est en cours.
std::optional<double> current_float_fixing(const Swap& swap,
                                           const curves::Curve& fixing_projection,
                                           const core::Date& valuation_date);

// Couru de la période qui chevauche valuation_date (start <= val < end), 0 sinon.
double fixed_accrual(const Swap& swap, const core::Date& valuation_date);
double float_accrual(const Swap& swap, const curves::Curve& projection,
                     const core::Date& valuation_date,
                     std::optional<double> current_fixing = std::nullopt);

SwapValuation price(const Swap& swap, const curves::Curve& projection,
                    const curves::Curve& discount, const core::Date& valuation_date,
                    std::optional<double> current_fixing = std::nullopt);

} // namespace sc::pricing
