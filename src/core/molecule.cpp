// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/core/molecule.h>

#include <array>
#include <stdexcept>

namespace relnmr {

Vector3 center_of_charge(const Molecule& mol) {
  Vector3 center = {0.0, 0.0, 0.0};
  double total = 0.0;
  for (size_t i = 0; i < mol.n_atoms; ++i) {
    const double q = mol.atomic_charges.at(i);
    for (int k = 0; k < 3; ++k) center[k] += q * mol.coords.at(i)[k];
    total += q;
  }
  if (total == 0.0)
    throw std::invalid_argument("center of charge of an uncharged molecule");
  for (auto& x : center) x /= total;
  return center;
}

std::string element_symbol(uint64_t atomic_number) {
  static const std::array<const char*, 119> symbols = {
      "X",  "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne", "Na",
      "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar", "K",  "Ca", "Sc", "Ti", "V",
      "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br",
      "Kr", "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag",
      "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe", "Cs", "Ba", "La", "Ce", "Pr",
      "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb", "Lu",
      "Hf", "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg", "Tl", "Pb", "Bi",
      "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th", "Pa", "U",  "Np", "Pu", "Am",
      "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh",
      "Hs", "Mt", "Ds", "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"};
  if (atomic_number >= symbols.size()) return "X";
  return symbols[atomic_number];
}

}  // namespace relnmr
