#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/model/geometry.hpp"

namespace mc3d::chem {

// element symbol -> number of sites
using ElementCounts = std::map<std::string, long>;

ElementCounts CountElements(const model::Geometry& geometry);

/*
  Hill order, counts divided by their gcd:
    C first, H second, the rest alphabetical (all alphabetical without C).
  "Fe2O2" -> "FeO", {C:2,H:6,O:1} -> "C2H6O".
*/
std::string HillCompactFormula(const ElementCounts& counts);

// gcd-reduced, elements ordered by Pauling electronegativity: {Cl:1,Na:1} -> "NaCl".
std::string ReducedFormula(const ElementCounts& counts);

// "-Cl-Na-": sorted symbols wrapped in dashes so "%-H-%" style filters match whole symbols.
std::string ChemicalSystem(const ElementCounts& counts);

std::vector<std::string> SplitChemicalSystem(const std::string& chemical_system);

// Any site shared by several species (alloy) or with occupancy below one (vacancy).
bool HasPartialOccupancies(const model::Geometry& geometry);

} // namespace mc3d::chem
