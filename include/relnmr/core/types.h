// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <array>
#include <complex>

namespace relnmr {
/// Double precision row-major matrix
using RowMajorMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Double precision complex row-major matrix
using ComplexMatrix = Eigen::Matrix<std::complex<double>, Eigen::Dynamic,
                                    Eigen::Dynamic, Eigen::RowMajor>;

/// Cartesian coordinate in Bohr
using Vector3 = std::array<double, 3>;
}  // namespace relnmr
