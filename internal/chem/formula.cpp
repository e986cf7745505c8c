#include "internal/chem/formula.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>

namespace mc3d::chem {

namespace {

constexpr double kPositionTolerance  = 1e-4;
constexpr double kOccupancyTolerance = 1e-6;

// Pauling scale; noble gases without a value sort last.
const std::unordered_map<std::string, double>& Electronegativity() {
  static const std::unordered_map<std::string, double> kTable = {
      {"H", 2.20},  {"Li", 0.98}, {"Be", 1.57}, {"B", 2.04},  {"C", 2.55},  {"N", 3.04},  {"O", 3.44},  {"F", 3.98},
      {"Na", 0.93}, {"Mg", 1.31}, {"Al", 1.61}, {"Si", 1.90}, {"P", 2.19},  {"S", 2.58},  {"Cl", 3.16}, {"K", 0.82},
      {"Ca", 1.00}, {"Sc", 1.36}, {"Ti", 1.54}, {"V", 1.63},  {"Cr", 1.66}, {"Mn", 1.55}, {"Fe", 1.83}, {"Co", 1.88},
      {"Ni", 1.91}, {"Cu", 1.90}, {"Zn", 1.65}, {"Ga", 1.81}, {"Ge", 2.01}, {"As", 2.18}, {"Se", 2.55}, {"Br", 2.96},
      {"Kr", 3.00}, {"Rb", 0.82}, {"Sr", 0.95}, {"Y", 1.22},  {"Zr", 1.33}, {"Nb", 1.60}, {"Mo", 2.16}, {"Tc", 1.90},
      {"Ru", 2.20}, {"Rh", 2.28}, {"Pd", 2.20}, {"Ag", 1.93}, {"Cd", 1.69}, {"In", 1.78}, {"Sn", 1.96}, {"Sb", 2.05},
      {"Te", 2.10}, {"I", 2.66},  {"Xe", 2.60}, {"Cs", 0.79}, {"Ba", 0.89}, {"La", 1.10}, {"Ce", 1.12}, {"Pr", 1.13},
      {"Nd", 1.14}, {"Pm", 1.13}, {"Sm", 1.17}, {"Eu", 1.20}, {"Gd", 1.20}, {"Tb", 1.10}, {"Dy", 1.22}, {"Ho", 1.23},
      {"Er", 1.24}, {"Tm", 1.25}, {"Yb", 1.10}, {"Lu", 1.27}, {"Hf", 1.30}, {"Ta", 1.50}, {"W", 2.36},  {"Re", 1.90},
      {"Os", 2.20}, {"Ir", 2.20}, {"Pt", 2.28}, {"Au", 2.54}, {"Hg", 2.00}, {"Tl", 1.62}, {"Pb", 2.33}, {"Bi", 2.02},
      {"Po", 2.00}, {"At", 2.20}, {"Rn", 2.20}, {"Fr", 0.70}, {"Ra", 0.90}, {"Ac", 1.10}, {"Th", 1.30}, {"Pa", 1.50},
      {"U", 1.38},  {"Np", 1.36}, {"Pu", 1.28}, {"Am", 1.30}, {"Cm", 1.30},
  };
  return kTable;
}

double ElectronegativityOf(const std::string& element) {
  const auto& table = Electronegativity();
  auto        it    = table.find(element);
  return it == table.end() ? std::numeric_limits<double>::infinity() : it->second;
}

long CountsGcd(const ElementCounts& counts) {
  long divisor = 0;
  for (const auto& [_, count] : counts) {
    divisor = std::gcd(divisor, count);
  }
  return divisor == 0 ? 1 : divisor;
}

std::string Render(const std::vector<std::string>& order, const ElementCounts& counts) {
  const long  divisor = CountsGcd(counts);
  std::string formula;
  for (const auto& element : order) {
    const long count = counts.at(element) / divisor;
    formula += element;
    if (count != 1) formula += std::to_string(count);
  }
  return formula;
}

double PeriodicDistance(const model::Vec3& a, const model::Vec3& b) {
  double sum = 0.0;
  for (int i = 0; i < 3; ++i) {
    double d = a[i] - b[i];
    d -= std::round(d);
    sum += d * d;
  }
  return std::sqrt(sum);
}

} // namespace

ElementCounts CountElements(const model::Geometry& geometry) {
  ElementCounts counts;
  for (const auto& site : geometry.sites) {
    ++counts[site.element];
  }
  return counts;
}

std::string HillCompactFormula(const ElementCounts& counts) {
  std::vector<std::string> order;
  order.reserve(counts.size());

  const bool has_carbon = counts.contains("C");
  if (has_carbon) {
    order.push_back("C");
    if (counts.contains("H")) order.push_back("H");
  }
  // std::map iterates alphabetically
  for (const auto& [element, _] : counts) {
    if (has_carbon && (element == "C" || element == "H")) continue;
    order.push_back(element);
  }
  return Render(order, counts);
}

std::string ReducedFormula(const ElementCounts& counts) {
  std::vector<std::string> order;
  order.reserve(counts.size());
  for (const auto& [element, _] : counts) order.push_back(element);

  std::stable_sort(order.begin(), order.end(), [](const std::string& a, const std::string& b) {
    return ElectronegativityOf(a) < ElectronegativityOf(b);
  });
  return Render(order, counts);
}

std::string ChemicalSystem(const ElementCounts& counts) {
  std::string system = "-";
  for (const auto& [element, _] : counts) {
    system += element;
    system += '-';
  }
  return system;
}

std::vector<std::string> SplitChemicalSystem(const std::string& chemical_system) {
  std::vector<std::string> elements;
  std::string              current;
  for (char c : chemical_system) {
    if (c == '-') {
      if (!current.empty()) elements.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) elements.push_back(std::move(current));
  return elements;
}

bool HasPartialOccupancies(const model::Geometry& geometry) {
  const auto&       sites = geometry.sites;
  std::vector<bool> grouped(sites.size(), false);

  for (size_t i = 0; i < sites.size(); ++i) {
    if (grouped[i]) continue;

    double occupancy = sites[i].occupancy;
    bool   mixed     = false;
    for (size_t j = i + 1; j < sites.size(); ++j) {
      if (grouped[j] || PeriodicDistance(sites[i].frac, sites[j].frac) > kPositionTolerance) continue;
      grouped[j] = true;
      occupancy += sites[j].occupancy;
      mixed = mixed || sites[j].element != sites[i].element;
    }

    if (mixed || occupancy < 1.0 - kOccupancyTolerance) return true;
  }
  return false;
}

} // namespace mc3d::chem
