// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/enums.h>
#include <relnmr/core/molecule.h>
#include <relnmr/core/types.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relnmr {
/**
 * @brief Request for a family of one-electron integral matrices
 *
 * Origins that the operator depends on travel with the request, so an oracle
 * never carries a mutable "current origin".
 */
struct OneElectronRequest {
  std::string name;  ///< Operator name, e.g. "int1e_giao_sa10sp"
  int ncomp = 1;     ///< Number of Cartesian components returned
  std::optional<Vector3>
      common_origin;  ///< Common gauge origin for "cg" operators
  std::optional<Vector3>
      rinv_origin;  ///< Center of 1/r operators (a nucleus position)
};

/**
 * @brief One two-index contraction of a two-electron integral (ij|kl)
 *
 * The density is indexed by two of {i,j,k,l} and the output by the other
 * two, e.g. "ji->s2kl" computes v[k,l] = sum_ij (ij|kl) dm[j,i] and keeps the
 * lower triangle only.
 */
struct ContractionPattern {
  std::array<char, 2> density;  ///< Density index labels
  std::array<char, 2> output;   ///< Output index labels
  OutputStorage storage = OutputStorage::S1;  ///< Full or lower triangle

  /**
   * @brief Parse the "ji->s2kl" notation
   *
   * @throws std::invalid_argument for malformed descriptors
   */
  static ContractionPattern parse(std::string_view descriptor);

  std::string to_string() const;
};

/**
 * @brief Request for contractions of a two-electron integral family
 */
struct TwoElectronRequest {
  std::string name;  ///< Operator name, e.g. "int2e_giao_sa10sp1spsp2"
  int ncomp = 1;     ///< Number of Cartesian components
  IntegralSymmetry symmetry = IntegralSymmetry::S1;  ///< Exploitable symmetry
  std::vector<ContractionPattern> patterns;  ///< Contractions to perform
  std::optional<Vector3> common_origin;  ///< Common gauge origin for "cg"
};

/**
 * @brief Source of spinor integrals over the two-component basis
 *
 * Implementations must be pure functions of their inputs and safe to call
 * concurrently through a const reference.
 */
class IntegralOracle {
 public:
  virtual ~IntegralOracle() = default;

  /// Molecule the basis is centered on
  virtual const Molecule& molecule() const = 0;

  /// Number of two-component spinor functions (n2c)
  virtual size_t num_spinors() const = 0;

  /// Speed of light in atomic units used in the Dirac Hamiltonian
  virtual double light_speed() const = 0;

  /**
   * @brief Evaluate a one-electron operator
   *
   * @return request.ncomp matrices of size (n2c, n2c)
   * @throws IntegralNotAvailable if the operator is unknown
   */
  virtual std::vector<ComplexMatrix> evaluate(
      const OneElectronRequest& request) const = 0;

  /**
   * @brief Contract a two-electron operator with densities
   *
   * @param request Operator and contraction patterns
   * @param densities Either one density used for every pattern or one
   * density per pattern, each of size (n2c, n2c)
   * @return result[p][c] is pattern p, component c, of size (n2c, n2c)
   * @throws IntegralNotAvailable if the operator is unknown
   * @throws DimensionMismatch on inconsistent density counts or shapes
   */
  virtual std::vector<std::vector<ComplexMatrix>> contract(
      const TwoElectronRequest& request,
      const std::vector<ComplexMatrix>& densities) const = 0;
};
}  // namespace relnmr
