#include "sc/curves/bootstrap.hpp"
#include "sc/core/daycount.hpp"
#include "sc/pricing/swap.hpp"
#include "sc/pricing/swap_pricer.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using sc::core::Date;
using sc::market::MarketQuote;

static std::vector<MarketQuote> market_table() {
  return {
    MarketQuote(0.5,  0.0411, true),
    MarketQuote(1.0,  0.0414),
    MarketQuote(2.0,  0.0373),
    MarketQuote(3.0,  0.0348),
    MarketQuote(5.0,  0.0321),
    MarketQuote(7.0,  0.0311),
    MarketQuote(10.0, 0.0308),
  };
}

template <class F>
static bool throws_invalid(F f) {
  try { f(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

// Convergence, structure de la paire et revalorisation au pair sur les courbes finales.
static void check_bootstrap(const Date& ref, const std::vector<MarketQuote>& quotes, double spread_bps) {
  sc::curves::BootstrapReport report;
  std::vector<std::string> warnings;
  const auto curves = sc::curves::bootstrap_curves(ref, quotes, spread_bps, {}, &report, &warnings);

  assert(report.tenors.size() == quotes.size());
  assert(report.all_converged());
  assert(report.max_abs_residual() < 1e-8);
  assert(warnings.empty());
  assert(report.tenors.front().is_fixing && report.tenors.front().iters == 0);
  for (std::size_t i = 1; i < report.tenors.size(); ++i) {
    assert(!report.tenors[i].stalled);
    assert(report.tenors[i].iters <= 100);
  }

  // Paire de courbes : mêmes temps, actualisation = projection + spread
  const auto& P = curves.projection;
  const auto& D = curves.discount;
  assert(P.size() == quotes.size() && D.size() == quotes.size());
  assert(P.times()[0] == quotes[0].tenor_years()); // fixing au ténor nominal
  assert(P.zero_rates()[0] == 0.0411);             // et entré tel quel
  for (std::size_t i = 0; i < P.size(); ++i) {
    assert(P.times()[i] == D.times()[i]);
    assert(P.times()[i] == report.tenors[i].knot_time);
    assert(std::abs(D.zero_rates()[i] - P.zero_rates()[i] - spread_bps / 10000.0) < 1e-15);
  }

  // Chaque swap coté se revalorise au pair une fois TOUS les ténors ajoutés
  for (std::size_t i = 1; i < quotes.size(); ++i) {
    const auto& q = quotes[i];
    const Date end = ref.add_months(static_cast<int>(std::lround(12.0 * q.tenor_years())));
    assert(P.times()[i] == sc::core::year_fraction(ref, end)); // noeud à l'échéance réelle

    const double npv = sc::curves::par_swap_npv(curves, q.tenor_years(), q.rate());
    assert(std::abs(npv) < 1e-9);

    sc::pricing::Swap swap(ref, end, 1'000'000.0, q.rate());
    const double par = sc::pricing::par_rate(swap, P, D, ref);
    assert(std::abs(par - q.rate()) < 1e-9);
    assert(std::abs(sc::pricing::swap_pv(swap, P, D, ref)) < 1e-3);
  }
}

int main() {
  const double spread_bps = -38.0;
  const auto quotes = market_table();

  // 1-3) Plusieurs dates de référence, dont des périodes qui traversent un 29 février
  for (const Date& d : {Date(2025, 1, 15), Date(2024, 1, 15), Date(2023, 3, 15),
                        Date(2024, 2, 29), Date::today()}) {
    check_bootstrap(d, quotes, spread_bps);
  }

  const Date ref(2024, 1, 15);
  const auto curves = sc::curves::bootstrap_curves(ref, quotes, spread_bps);
  const auto& P = curves.projection;

  // 4) L'ordre d'entrée est indifférent
  auto shuffled = quotes;
  std::reverse(shuffled.begin(), shuffled.end());
  std::rotate(shuffled.begin(), shuffled.begin() + 2, shuffled.end());
  const auto curves2 = sc::curves::bootstrap_curves(ref, shuffled, spread_bps);
  for (std::size_t i = 0; i < P.size(); ++i) {
    assert(curves2.projection.times()[i] == P.times()[i]);
    assert(std::abs(curves2.projection.zero_rates()[i] - P.zero_rates()[i]) < 1e-14);
  }

  // 5) Ensembles de cotations invalides
  assert(throws_invalid([&]{
    (void)sc::curves::bootstrap_curves(ref, {MarketQuote(1.0, 0.04), MarketQuote(2.0, 0.04)}, 0.0);
  }));
  assert(throws_invalid([&]{
    (void)sc::curves::bootstrap_curves(ref, {MarketQuote(0.5, 0.04, true), MarketQuote(1.0, 0.04, true),
                                             MarketQuote(2.0, 0.04)}, 0.0);
  }));
  assert(throws_invalid([&]{
    (void)sc::curves::bootstrap_curves(ref, {MarketQuote(0.5, 0.04, true)}, 0.0);
  }));
  assert(throws_invalid([&]{
    (void)sc::curves::bootstrap_curves(ref, {MarketQuote(0.5, 0.04, true), MarketQuote(2.0, 0.04),
                                             MarketQuote(2.0, 0.05)}, 0.0);
  }));
  assert(throws_invalid([]{ (void)MarketQuote(0.0, 0.04); }));

  // 6) Itération bloquée : signalée, pas d'exception
  sc::config::BootstrapConfig stiff;
  stiff.derivative_floor = 1e6;
  sc::curves::BootstrapReport stall;
  std::vector<std::string> stall_warn;
  (void)sc::curves::bootstrap_curves(ref, quotes, spread_bps, stiff, &stall, &stall_warn);
  assert(!stall.all_converged());
  assert(stall.tenors[1].stalled);
  assert(stall.tenors[1].zero_rate == quotes[1].rate());
  assert(stall_warn.size() == quotes.size() - 1);
  assert(stall_warn.front().find("stalled") != std::string::npos);

  std::cout << "OK: dual-curve bootstrap (" << P.size() << " tenors, 5 reference dates)\n";
  return 0;
}
