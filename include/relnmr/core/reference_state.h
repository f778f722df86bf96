// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/types.h>

#include <cstddef>

namespace relnmr {
/**
 * @brief Converged zeroth-order Dirac-Hartree-Fock solution
 *
 * Read-only snapshot consumed by the shielding calculation. The first n2c
 * molecular orbitals are the negative-energy states.
 */
struct ReferenceState {
  ComplexMatrix mo_coeff;    ///< MO coefficients (size: (n4c, nmo))
  Eigen::VectorXd mo_energy;  ///< Orbital energies (size: nmo)
  Eigen::VectorXd mo_occ;     ///< Orbital occupations (size: nmo)

  /// Number of orbitals with positive occupation
  size_t num_occupied() const;

  /// Columns of mo_coeff with positive occupation (size: (n4c, nocc))
  ComplexMatrix occupied_coefficients() const;

  /// Occupations of the occupied orbitals (size: nocc)
  Eigen::VectorXd occupied_occupations() const;

  /// Orbital energies of the occupied orbitals (size: nocc)
  Eigen::VectorXd occupied_energies() const;

  /**
   * @brief Zeroth-order density C_occ diag(occ) C_occ^H
   */
  ComplexMatrix make_rdm1() const;

  /**
   * @brief Check the shapes against a spinor basis of size n4c
   *
   * @throws DimensionMismatch on any inconsistency
   */
  void validate(size_t n4c) const;
};
}  // namespace relnmr
