#include "sc/io/quotes_csv.hpp"
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// découpe sur ',' avec champs "..." (guillemets doublés = guillemet littéral)
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// "" ou texte non numérique -> NaN ; "4.11%" accepté (le % est traité par l'appelant)
static double parse_double(const std::string& s, bool* had_percent = nullptr) {
  if (had_percent) *had_percent = false;
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  std::string rest = trim(std::string(end));
  if (rest == "%") { if (had_percent) *had_percent = true; }
  else if (!rest.empty()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

enum class Kind { Fixing, Swap, Unknown };

static Kind parse_kind(std::string s) {
  s = lower(trim(s));
  if (s.empty()) return Kind::Swap;
  if (s=="fixing" || s=="deposit" || s=="depo") return Kind::Fixing;
  if (s=="swap" || s=="par" || s=="irs") return Kind::Swap;
  return Kind::Unknown;
}

static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace sc::io {

std::vector<market::MarketQuote>
read_quotes_csv(const std::string& path,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<market::MarketQuote> out;

  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("read_quotes_csv: cannot open file: " + path);
  }

  std::string line;
  bool header_seen = false;
  int iT = -1, iRate = -1, iType = -1, iUnit = -1;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(trim(cells[i]))] = i;
      iT    = col(idx, {"tenor","tenor_years","t"});
      iRate = col(idx, {"rate","quote"});
      iType = col(idx, {"type","kind","instrument"});
      iUnit = col(idx, {"unit"});
      if (iT < 0 || iRate < 0) {
        throw std::runtime_error("read_quotes_csv: header must contain tenor and rate columns: " + path);
      }
      header_seen = true;
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    bool pct = false;
    const double T    = parse_double(get(iT));
    double       rate = parse_double(get(iRate), &pct);
    const Kind   kind = parse_kind(get(iType));
    const std::string unit = lower(get(iUnit));
    if (unit == "pct" || unit == "%") pct = true;

    std::string why;
    if (!std::isfinite(T) || T <= 0.0)  why = "tenor<=0 ou invalide";
    else if (!std::isfinite(rate))      why = "taux invalide";
    else if (kind == Kind::Unknown)     why = "type inconnu '" + get(iType) + "'";

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) {
        std::ostringstream msg;
        msg << "Ligne " << line_no << " ignorée: " << why;
        warnings->push_back(msg.str());
      }
      continue;
    }

    if (pct) rate /= 100.0;
    out.emplace_back(T, rate, kind == Kind::Fixing);
  }

  return out;
}

} // namespace sc::io
