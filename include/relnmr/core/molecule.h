// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Molecular structure data
 *
 * Atomic numbers, nuclear charges and Cartesian positions of the nuclei.
 * All units are atomic.
 */
struct Molecule {
  uint64_t n_atoms = 0;                ///< Number of atoms in the molecule
  std::vector<uint64_t> atomic_nums;   ///< Atomic numbers for each atom
  std::vector<double> atomic_charges;  ///< Nuclear charges for each atom
  std::vector<Vector3> coords;  ///< Cartesian coordinates in Bohr per atom
};

/**
 * @brief Charge-weighted mean of the nuclear positions
 *
 * @throws std::invalid_argument for a molecule without nuclear charge
 */
Vector3 center_of_charge(const Molecule& mol);

/**
 * @brief Element symbol for an atomic number ("X" outside the table)
 */
std::string element_symbol(uint64_t atomic_number);
}  // namespace relnmr
