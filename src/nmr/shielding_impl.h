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

#include "nmr/assembler.h"
#include "nmr/cphf.h"

namespace relnmr {

/**
 * @brief Dirac-Hartree-Fock shielding implementation
 *
 * Holds the collaborators and configuration of one calculation. Apart from
 * the result stored by run(), no state is kept between calls.
 */
class ShieldingImpl {
 public:
  /**
   * @brief Construct the shielding implementation
   *
   * @param oracle Integral source
   * @param reference Converged zeroth-order solution
   * @param scf Response potential, may be null for an uncoupled calculation
   * @param cfg Shielding configuration
   * @param checkpoint Optional sink for h1
   *
   * @throws DimensionMismatch if the reference does not fit the basis
   * @throws std::invalid_argument if a coupled solve has no collaborator
   */
  ShieldingImpl(std::shared_ptr<const IntegralOracle> oracle,
                std::shared_ptr<const ReferenceState> reference,
                std::shared_ptr<ResponsePotential> scf,
                const ShieldingConfig& cfg,
                std::shared_ptr<CheckpointSink> checkpoint);

  /**
   * @brief Execute the shielding calculation
   * @see Shielding::run() for API details
   */
  const ShieldingContext& run();

  /**
   * @brief Get the shielding context
   * @see Shielding::context() for API details
   */
  const ShieldingContext& context() const { return ctx_; }

  /// @see Shielding::make_h10()
  SpinorTriple make_h10() const;

  /// @see Shielding::make_s10()
  SpinorTriple make_s10() const;

  /// @see Shielding::solve_mo1()
  FirstOrderResponse solve_mo1() const;

  /// @see Shielding::dia()
  std::vector<Eigen::Matrix3d> dia() const;

  /// @see Shielding::para()
  std::vector<ParamagneticTerms> para(const FirstOrderResponse& mo1) const;

 private:
  /// Requested atom indices, validated against the molecule
  std::vector<size_t> nuclei_() const;

  /// Zeroth-order density as a spinor matrix
  SpinorMatrix density_() const;

  void log_banner_() const;
  void log_results_() const;

  std::shared_ptr<const IntegralOracle> oracle_;
  std::shared_ptr<const ReferenceState> reference_;
  std::shared_ptr<ResponsePotential> scf_;
  std::shared_ptr<CheckpointSink> checkpoint_;
  ShieldingConfig cfg_;
  ShieldingContext ctx_;
};

}  // namespace relnmr
