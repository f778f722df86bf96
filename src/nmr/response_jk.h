// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/integral_oracle.h>
#include <relnmr/core/spinor_matrix.h>

#include <optional>

namespace relnmr::nmr {
/**
 * @brief First-order Coulomb and exchange matrices per field direction
 */
struct ResponseJK {
  SpinorTriple vj;  ///< Coulomb-like response
  SpinorTriple vk;  ///< Exchange-like response
};

/**
 * @brief Fill the strict upper triangle from the conjugated lower triangle
 *
 * The diagonal is left untouched, so the result is Hermitian only when the
 * diagonal is real.
 */
void hermitian_fill_upper(ComplexMatrix& m);

/**
 * @brief Fill the strict upper triangle with minus the conjugated lower
 * triangle
 *
 * The diagonal is left untouched.
 */
void antihermitian_fill_upper(ComplexMatrix& m);

/**
 * @brief Two-electron part of the magnetically balanced field derivative
 *
 * Contracts the "sa10" two-electron families of the chosen gauge with the
 * density blocks. Only half of each Hermitian operator is contracted; the
 * result is completed with vj += vj^H and vk += vk^H.
 *
 * @param oracle Integral source
 * @param dm Zeroth-order density over the four-component basis
 * @param gauge GIAO or common gauge integral family
 * @param gauge_origin Common gauge origin, required for CommonGauge
 * @throws DimensionMismatch if dm does not match the oracle basis
 * @throws std::invalid_argument for CommonGauge without an origin
 */
ResponseJK rmb_response_jk(const IntegralOracle& oracle, const SpinorMatrix& dm,
                           GaugeMode gauge,
                           const std::optional<Vector3>& gauge_origin);

/**
 * @brief Two-electron part of the GIAO basis-function derivative
 *
 * vj is contracted on one triangle and re-expanded Hermitian, vk is
 * completed with vk += vk^H.
 */
ResponseJK giao_response_jk(const IntegralOracle& oracle,
                            const SpinorMatrix& dm);
}  // namespace relnmr::nmr
