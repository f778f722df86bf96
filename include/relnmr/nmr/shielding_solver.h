// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/checkpoint.h>
#include <relnmr/core/integral_oracle.h>
#include <relnmr/core/nmr.h>
#include <relnmr/core/reference_state.h>
#include <relnmr/core/response_potential.h>
#include <relnmr/core/spinor_matrix.h>

#include <memory>
#include <vector>

namespace relnmr {

// Forward declarations
class ShieldingImpl;

/**
 * @brief Four-component Dirac-Hartree-Fock NMR shielding
 *
 * Builds the magnetic perturbation operators, solves the first-order
 * response and assembles the diamagnetic and paramagnetic tensors of the
 * requested nuclei.
 */
class Shielding {
 public:
  /**
   * @brief Create a DHF shielding calculation
   *
   * When cfg.checkpoint_file is set and no sink is passed, an HDF5Checkpoint
   * on that file receives h1.
   *
   * @param oracle Integral source of the molecule and spinor basis
   * @param reference Converged zeroth-order solution
   * @param scf Response potential of the SCF, may be null when
   *            cfg.cphf.coupled is false
   * @param cfg Shielding configuration
   * @param checkpoint Optional sink for h1
   * @return Unique pointer to the calculation
   *
   * @throws DimensionMismatch if the reference does not fit the basis
   */
  static std::unique_ptr<Shielding> make_dhf_shielding(
      std::shared_ptr<const IntegralOracle> oracle,
      std::shared_ptr<const ReferenceState> reference,
      std::shared_ptr<ResponsePotential> scf, const ShieldingConfig& cfg,
      std::shared_ptr<CheckpointSink> checkpoint = nullptr);

  /**
   * @brief Virtual destructor
   */
  virtual ~Shielding() noexcept;

  /**
   * @brief Execute the shielding calculation
   *
   * Tensors in the result are in ppm. A CPHF solve that exhausts its budget
   * and an imaginary dia remainder above tolerance are reported in the
   * result, not thrown.
   *
   * @return Reference to the context containing the results
   * @throws UnsupportedFeature if cfg.with_gaunt is set
   * @throws DimensionMismatch for a nucleus index out of range
   */
  const ShieldingContext& run();

  /**
   * @brief Get the current context
   *
   * @return Const reference to configuration and results of the last run
   */
  const ShieldingContext& context() const;

  /**
   * @brief First-order Fock matrix for the three field directions
   *
   * @return h1 (size: 3 x (n4c, n4c)); stored to the checkpoint if any
   */
  SpinorTriple make_h10() const;

  /**
   * @brief First-order overlap matrix for the three field directions
   */
  SpinorTriple make_s10() const;

  /**
   * @brief Solve for the first-order orbital response
   *
   * @return mo1 (size: 3 x (nmo, nocc)) with its solve status
   */
  FirstOrderResponse solve_mo1() const;

  /**
   * @brief Diamagnetic tensors of the requested nuclei in atomic units
   */
  std::vector<Eigen::Matrix3d> dia() const;

  /**
   * @brief Paramagnetic tensors of the requested nuclei in atomic units
   *
   * @param mo1 Response from solve_mo1()
   */
  std::vector<ParamagneticTerms> para(const FirstOrderResponse& mo1) const;

 private:
  /**
   * @brief Private constructor for factory pattern
   * @param impl Implementation object
   */
  explicit Shielding(std::unique_ptr<ShieldingImpl> impl);

  std::unique_ptr<ShieldingImpl> impl_;  ///< Implementation object
};

}  // namespace relnmr
