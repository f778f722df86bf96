// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/config.h>
#include <relnmr/constants.h>
#include <relnmr/core/enums.h>
#include <relnmr/core/integral_oracle.h>
#include <relnmr/core/reference_state.h>
#include <relnmr/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Coupled-perturbed Hartree-Fock input configuration
 *
 * With the defaults the induced potential is evaluated exactly once, which
 * is adequate when the self-consistency term is weak.
 */
struct CPHFInput {
  bool coupled = true;  ///< Include the induced two-electron potential
  int max_iteration = 1;    ///< Maximum potential evaluations
  double tolerance = 1e-9;  ///< Convergence threshold on |Δmo1|
};

/**
 * @brief Nuclear magnetic shielding configuration
 */
struct ShieldingConfig {
  MagneticBalance balance =
      MagneticBalance::RestrictedMagneticBalance;  ///< Small-component balance
  std::optional<Vector3>
      gauge_origin;  ///< Common gauge origin in Bohr (unset = GIAO)
  std::optional<std::vector<size_t>>
      shielding_nuclei;     ///< 0-based atom indices (unset = every atom)
  bool with_gaunt = false;  ///< Gaunt two-electron term (not implemented)
  double ppm_light_speed =
      constants::speed_of_light_au;  ///< Light speed in the ppm conversion
  std::string checkpoint_file =
      "";  ///< HDF5 file receiving h1 (empty = no checkpoint)
  double imaginary_tolerance =
      1e-8;  ///< Largest tolerated imaginary part of the dia contraction
  CPHFInput cphf;   ///< Response equation controls
  int verbose = 3;  ///< Verbosity level (0=quiet, >=4 prints partitions)
};

/**
 * @brief First-order orbital response for the three field directions
 */
struct FirstOrderResponse {
  std::array<ComplexMatrix, 3>
      mo1;  ///< MO coefficients response (size: (nmo, nocc) each)
  std::array<ComplexMatrix, 3>
      mo_e1;  ///< First-order occupied Fock matrix (size: (nocc, nocc) each)
  CPHFStatus status = CPHFStatus::Uncoupled;  ///< How the solve terminated
  int iterations = 0;     ///< Number of induced-potential evaluations
  double residual = 0.0;  ///< Norm of the last mo1 update
};

/**
 * @brief Paramagnetic tensors split by orbital subspace
 */
struct ParamagneticTerms {
  Eigen::Matrix3d total = Eigen::Matrix3d::Zero();  ///< Sum over all orbitals
  Eigen::Matrix3d occupied =
      Eigen::Matrix3d::Zero();  ///< Occupied orbital contribution
  Eigen::Matrix3d positive_virtual =
      Eigen::Matrix3d::Zero();  ///< Positive-energy virtual contribution
  Eigen::Matrix3d negative_energy =
      Eigen::Matrix3d::Zero();  ///< Negative-energy state contribution
};

/**
 * @brief Shielding tensors of one nucleus in ppm
 */
struct NucleusShielding {
  size_t atom_index = 0;       ///< 0-based index in the molecule
  uint64_t atomic_number = 0;  ///< Atomic number of the nucleus
  Eigen::Matrix3d total =
      Eigen::Matrix3d::Zero();  ///< Diamagnetic + paramagnetic tensor
  Eigen::Matrix3d diamagnetic =
      Eigen::Matrix3d::Zero();  ///< Diamagnetic tensor
  ParamagneticTerms paramagnetic;  ///< Paramagnetic tensor and partitions

  /// Isotropic shielding, tr(total) / 3
  double isotropic() const { return total.trace() / 3.0; }
};

/**
 * @brief Results of a shielding calculation
 */
struct ShieldingResult {
  std::vector<NucleusShielding> nuclei;  ///< One entry per requested nucleus
  CPHFStatus cphf_status = CPHFStatus::Uncoupled;  ///< Response solve state
  int cphf_iterations = 0;     ///< Induced-potential evaluations
  double cphf_residual = 0.0;  ///< Last response residual
  double max_imaginary_residual =
      0.0;  ///< Largest discarded imaginary part of the dia contraction
  bool numerically_consistent =
      true;  ///< max_imaginary_residual below imaginary_tolerance
};

/**
 * @brief Complete context of a shielding calculation
 */
struct ShieldingContext {
  const ShieldingConfig* cfg;         ///< Configuration settings
  const IntegralOracle* oracle;       ///< Integral source
  const ReferenceState* reference;    ///< Zeroth-order solution
  ShieldingResult result;             ///< Results of the last run
};
}  // namespace relnmr
