#include <sc/market/market_quote.hpp>

#include <algorithm>  // std::sort, std::adjacent_find
#include <cmath>      // std::isfinite
#include <stdexcept>  // std::invalid_argument

namespace sc {
namespace market {

MarketQuote::MarketQuote(double tenor_years, double rate, bool is_fixing)
    : tenor_years_(tenor_years), rate_(rate), is_fixing_(is_fixing) {
  if (!std::isfinite(tenor_years) || tenor_years <= 0.0) {
    throw std::invalid_argument("MarketQuote: tenor must be > 0");
  }
  if (!std::isfinite(rate)) {
    throw std::invalid_argument("MarketQuote: rate must be finite");
  }
}

MarketQuote MarketQuote::bumped(double bps) const {
  return MarketQuote(tenor_years_, rate_ + bps / 10000.0, is_fixing_);
}

std::vector<MarketQuote> sorted_quotes(const std::vector<MarketQuote>& quotes) {
  const auto n_fixing = std::count_if(quotes.begin(), quotes.end(),
                                      [](const MarketQuote& q){ return q.is_fixing(); });
  if (n_fixing != 1) {
    throw std::invalid_argument("sorted_quotes: exactly one fixing quote is required");
  }
  if (quotes.size() < 2) {
    throw std::invalid_argument("sorted_quotes: at least one par swap quote is required");
  }

  std::vector<MarketQuote> out = quotes;
  std::sort(out.begin(), out.end(),
            [](const MarketQuote& a, const MarketQuote& b){ return a.tenor_years() < b.tenor_years(); });

  auto dup = std::adjacent_find(out.begin(), out.end(),
                                [](const MarketQuote& a, const MarketQuote& b){
                                  return a.tenor_years() == b.tenor_years();
                                });
  if (dup != out.end()) {
    throw std::invalid_argument("sorted_quotes: duplicate tenor in quote set");
  }
  return out;
}

std::vector<MarketQuote> bump_par_quotes(const std::vector<MarketQuote>& quotes, double bps) {
  std::vector<MarketQuote> out;
  out.reserve(quotes.size());
  for (const auto& q : quotes) {
    out.push_back(q.is_fixing() ? q : q.bumped(bps));
  }
  return out;
}

} // namespace market
} // namespace sc
