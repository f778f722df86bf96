// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/integral_oracle.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Integral oracle backed by integrals held in memory
 *
 * One-electron operators are stored as ncomp (n2c, n2c) matrices and
 * two-electron operators as ncomp (n2c^2, n2c^2) matrices whose element
 * [(i*n2c + j), (k*n2c + l)] is (ij|kl). Entries are keyed by operator name
 * and origins; origins match within 1e-10 Bohr.
 *
 * Memory scaling: O(N⁴) per two-electron component, so this backend is
 * meant for small systems and recorded reference data.
 */
class IncoreIntegralOracle : public IntegralOracle {
 public:
  IncoreIntegralOracle(Molecule mol, size_t n2c, double light_speed);
  ~IncoreIntegralOracle() noexcept override;

  /**
   * @brief Register a one-electron operator
   *
   * @param key Name and origins the operator is evaluated at (ncomp ignored)
   * @param components Matrices of size (n2c, n2c)
   * @throws DimensionMismatch on wrong shapes
   */
  void add_one_electron(const OneElectronRequest& key,
                        std::vector<ComplexMatrix> components);

  /**
   * @brief Register a two-electron operator
   *
   * @param name Operator name
   * @param common_origin Gauge origin of "cg" operators
   * @param components Matrices of size (n2c^2, n2c^2)
   * @throws DimensionMismatch on wrong shapes
   */
  void add_two_electron(const std::string& name,
                        const std::optional<Vector3>& common_origin,
                        std::vector<ComplexMatrix> components);

  size_t num_one_electron() const { return int1e_.size(); }
  size_t num_two_electron() const { return int2e_.size(); }

  /**
   * @brief Write molecule, constants and all integrals to an HDF5 file
   * @throws std::runtime_error on HDF5 failure
   */
  void save(const std::string& path) const;

  /**
   * @brief Read an oracle written by save()
   * @throws std::runtime_error if the file is missing or malformed
   */
  static std::unique_ptr<IncoreIntegralOracle> load(const std::string& path);

  const Molecule& molecule() const override { return mol_; }
  size_t num_spinors() const override { return n2c_; }
  double light_speed() const override { return light_speed_; }

  std::vector<ComplexMatrix> evaluate(
      const OneElectronRequest& request) const override;

  /**
   * @brief Contract a stored two-electron operator
   *
   * The full tensor is stored, so the symmetry label only documents the
   * request. S2 outputs are computed on the lower triangle only.
   */
  std::vector<std::vector<ComplexMatrix>> contract(
      const TwoElectronRequest& request,
      const std::vector<ComplexMatrix>& densities) const override;

 private:
  struct OneElectronEntry {
    std::string name;
    std::optional<Vector3> common_origin;
    std::optional<Vector3> rinv_origin;
    std::vector<ComplexMatrix> components;
  };

  struct TwoElectronEntry {
    std::string name;
    std::optional<Vector3> common_origin;
    std::vector<ComplexMatrix> components;
  };

  const OneElectronEntry& find_one_(const OneElectronRequest& request) const;
  const TwoElectronEntry& find_two_(const TwoElectronRequest& request) const;

  ComplexMatrix contract_component_(const ComplexMatrix& eri,
                                    const ContractionPattern& pattern,
                                    const ComplexMatrix& dm) const;

  Molecule mol_;
  size_t n2c_;
  double light_speed_;
  std::vector<OneElectronEntry> int1e_;
  std::vector<TwoElectronEntry> int2e_;
};
}  // namespace relnmr
