#include "sc/io/quotes_csv.hpp"
#include "sc/market/market_quote.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <exception>

int main(int argc, char** argv) {
  std::string path;
  bool show_warnings = false;
  bool check_set     = false;

  for (int i=1;i<argc;++i) {
    std::string a = argv[i];
    if ((a=="-f" || a=="--file") && i+1<argc) { path = argv[++i]; }
    else if (a=="-w" || a=="--show-warnings") { show_warnings = true; }
    else if (a=="-c" || a=="--check")         { check_set     = true; }
    else if (a=="-h" || a=="--help") {
      std::cout << "Usage: quotes_csv_info -f <file.csv> [-w] [-c]\n";
      return 0;
    } else if (path.empty()) { path = a; }
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <file.csv>).\n";
    return 2;
  }

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  std::vector<sc::market::MarketQuote> quotes;
  try {
    quotes = sc::io::read_quotes_csv(path, &ignored, &warnings);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  std::size_t n_fixing = 0;
  for (const auto& q : quotes) if (q.is_fixing()) ++n_fixing;

  std::cout << "File: " << path << "\n";
  std::cout << "Valid rows: " << quotes.size() << "\n";
  std::cout << "Ignored rows: " << ignored << "\n";
  std::cout << "Fixings: " << n_fixing << "  Par swaps: " << quotes.size() - n_fixing << "\n";

  if (check_set) {
    try {
      const auto sorted = sc::market::sorted_quotes(quotes);
      std::cout << "Tenors:";
      for (const auto& q : sorted) std::cout << " " << q.tenor_years() << (q.is_fixing() ? "(f)" : "");
      std::cout << "\n";
    } catch (const std::exception& e) {
      std::cerr << "Invalid quote set: " << e.what() << "\n";
      return 3;
    }
  }

  if (show_warnings) {
    for (auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  }
  return 0;
}
