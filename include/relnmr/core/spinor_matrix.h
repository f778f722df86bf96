// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/enums.h>
#include <relnmr/core/types.h>

#include <array>
#include <cstddef>

namespace relnmr {
/**
 * @brief Complex matrix over the four-component spinor basis
 *
 * Holds an n4c x n4c matrix with n4c = 2 * n2c. The large component
 * functions occupy the first n2c rows/columns and the small component
 * functions the last n2c. Quadrants are addressed by name through block().
 */
class SpinorMatrix {
 public:
  using BlockRef = Eigen::Block<ComplexMatrix>;
  using ConstBlockRef = Eigen::Block<const ComplexMatrix>;

  SpinorMatrix() = default;

  /**
   * @brief Zero matrix over a spinor basis of n2c two-component functions
   */
  explicit SpinorMatrix(size_t n2c);

  /**
   * @brief Wrap an existing n4c x n4c matrix
   *
   * @throws DimensionMismatch if the matrix is not square or has odd dimension
   */
  explicit SpinorMatrix(ComplexMatrix data);

  size_t n2c() const { return n2c_; }
  size_t n4c() const { return 2 * n2c_; }

  BlockRef block(SpinorBlock b);
  ConstBlockRef block(SpinorBlock b) const;

  ComplexMatrix& data() { return data_; }
  const ComplexMatrix& data() const { return data_; }

  /**
   * @brief Check M = M^H elementwise within an absolute tolerance
   */
  bool is_hermitian(double tol = 1e-10) const;

  /// M <- M + M^H
  void add_adjoint();

  SpinorMatrix& operator+=(const SpinorMatrix& other);

 private:
  size_t n2c_ = 0;      ///< Number of two-component spinor functions
  ComplexMatrix data_;  ///< Full n4c x n4c storage
};

/// One matrix per Cartesian field direction (x, y, z)
using SpinorTriple = std::array<SpinorMatrix, 3>;

/**
 * @brief Zero-initialized triple over a spinor basis of n2c functions
 */
SpinorTriple make_spinor_triple(size_t n2c);
}  // namespace relnmr
