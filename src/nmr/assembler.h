// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/integral_oracle.h>
#include <relnmr/core/nmr.h>
#include <relnmr/core/spinor_matrix.h>

#include <optional>
#include <vector>

#include "nmr/cphf.h"

namespace relnmr::nmr {

/**
 * @brief Diamagnetic tensors in atomic units
 */
struct DiamagneticTerms {
  std::vector<Eigen::Matrix3d> tensors;  ///< One tensor per requested nucleus
  double max_imaginary = 0.0;  ///< Largest discarded imaginary component
};

/**
 * @brief Check atom indices against the molecule
 *
 * @throws DimensionMismatch for an index outside [0, n_atoms)
 */
void validate_nuclei(const Molecule& mol, const std::vector<size_t>& nuclei);

/**
 * @brief Diamagnetic shielding, Re tr(D0 h11) per nucleus
 *
 * The nine components XX, XY, ..., ZZ of the second-derivative operator
 * centered on each nucleus are folded into the SL/LS blocks with a factor
 * one half and reshaped row-major into 3x3. RKB with a common gauge origin
 * has no diamagnetic operator and yields zero tensors.
 */
DiamagneticTerms diamagnetic(const IntegralOracle& oracle,
                             const SpinorMatrix& dm0,
                             const std::vector<size_t>& nuclei,
                             MagneticBalance balance,
                             const std::optional<Vector3>& gauge_origin);

/**
 * @brief Paramagnetic shielding per nucleus in atomic units
 *
 * sigma[b, m] = 2 Re sum_pi conj(mo1[b])_pi h01[m]_pi, split by MO row into
 * the negative-energy rows [0, n2c), the occupied rows and the remaining
 * positive-energy virtual rows.
 */
std::vector<ParamagneticTerms> paramagnetic(const IntegralOracle& oracle,
                                            const MOTriple& mo1,
                                            const ReferenceState& ref,
                                            const std::vector<size_t>& nuclei);

}  // namespace relnmr::nmr
