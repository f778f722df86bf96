// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/response_potential.h>

#include <memory>
#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Dirac-Coulomb response potential from a stored four-component ERI
 *
 * Holds (ab|cd) over the n4c spinor basis as an (n4c^2, n4c^2) matrix with
 * the small-component scaling already applied, and builds v = J - K with
 *   J[a,b] = sum_cd (ab|cd) D[d,c],   K[a,d] = sum_bc (ab|cd) D[b,c].
 *
 * The in-core build has no incremental path; the direct-SCF flag is only
 * tracked so callers can follow the response-mode protocol.
 */
class IncoreCoulombPotential : public ResponsePotential {
 public:
  /**
   * @throws DimensionMismatch if eri_4c is not (n^2, n^2) with even n
   */
  explicit IncoreCoulombPotential(ComplexMatrix eri_4c);

  size_t n4c() const { return n4c_; }

  /**
   * @brief J - K for each trial density
   *
   * With hermitian = true only the lower triangle of K is contracted and
   * the upper triangle is filled by conjugation.
   */
  std::vector<ComplexMatrix> get_response_potential(
      const std::vector<ComplexMatrix>& trial_densities,
      bool hermitian) override;

  bool direct_scf() const override { return direct_scf_; }
  void set_direct_scf(bool enabled) override { direct_scf_ = enabled; }

  /// Append the ERI as dataset "scf/eri_4c" of an existing HDF5 file
  void save(const std::string& path) const;

  /// Read dataset "scf/eri_4c"
  static std::unique_ptr<IncoreCoulombPotential> load(const std::string& path);

 private:
  ComplexMatrix eri_;
  size_t n4c_ = 0;
  bool direct_scf_ = true;
};
}  // namespace relnmr
