// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/types.h>

#include <mutex>
#include <vector>

namespace relnmr {
/**
 * @brief Effective-potential operator of the converged SCF
 *
 * Maps first-order trial densities to first-order two-electron potentials
 * over the four-component basis. Owned by the SCF engine.
 */
class ResponsePotential {
 public:
  virtual ~ResponsePotential() = default;

  /**
   * @brief Potential induced by trial densities
   *
   * @param trial_densities First-order densities (size: (n4c, n4c) each)
   * @param hermitian Whether the densities are Hermitian
   * @return One potential matrix per density
   */
  virtual std::vector<ComplexMatrix> get_response_potential(
      const std::vector<ComplexMatrix>& trial_densities, bool hermitian) = 0;

  /// Whether the incremental (direct-SCF) Fock build is enabled
  virtual bool direct_scf() const = 0;

  /// Enable or disable the incremental (direct-SCF) Fock build
  virtual void set_direct_scf(bool enabled) = 0;

  /// Mutex guarding the response mode of this collaborator
  std::mutex& response_mode_mutex() { return response_mode_mutex_; }

 private:
  std::mutex response_mode_mutex_;
};

/**
 * @brief Scoped exclusive ownership of a collaborator's response mode
 *
 * Locks the response-mode mutex, disables direct SCF, and restores the
 * previous flag when the scope ends on any path.
 */
class DirectSCFGuard {
 public:
  explicit DirectSCFGuard(ResponsePotential& scf)
      : scf_(scf), lock_(scf.response_mode_mutex()), saved_(scf.direct_scf()) {
    scf_.set_direct_scf(false);
  }

  ~DirectSCFGuard() { scf_.set_direct_scf(saved_); }

  DirectSCFGuard(const DirectSCFGuard&) = delete;
  DirectSCFGuard& operator=(const DirectSCFGuard&) = delete;

 private:
  ResponsePotential& scf_;
  std::lock_guard<std::mutex> lock_;
  bool saved_;
};
}  // namespace relnmr
