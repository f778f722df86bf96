// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/checkpoint.h>
#include <relnmr/core/integral_oracle.h>
#include <relnmr/core/spinor_matrix.h>

#include <optional>
#include <vector>

namespace relnmr::nmr {

/**
 * @brief Restricted magnetic balance first-order Fock matrix
 *
 * One-electron "sa10" terms fill the LS, SL and SS blocks and the two-electron
 * response of rmb_response_jk enters as vj - vk.
 *
 * @param gauge_origin Common gauge origin, unset for GIAO integrals
 * @throws UnsupportedFeature if with_gaunt is set
 */
SpinorTriple make_h10_rmb(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                          const std::optional<Vector3>& gauge_origin,
                          bool with_gaunt);

/**
 * @brief Restricted kinetic balance first-order Fock matrix
 *
 * Only the one-electron LS/SL coupling; no two-electron contraction.
 *
 * @throws UnsupportedFeature if with_gaunt is set
 */
SpinorTriple make_h10_rkb(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                          const std::optional<Vector3>& gauge_origin,
                          bool with_gaunt);

/**
 * @brief Correction from the field dependence of GIAO basis functions
 *
 * @throws UnsupportedFeature if with_gaunt is set
 */
SpinorTriple make_h10_giao(const IntegralOracle& oracle,
                           const SpinorMatrix& dm0, bool with_gaunt);

/**
 * @brief Complete first-order Fock matrix
 *
 * The balance-scheme operator is stored under "nmr/h1" and the returned
 * operator under "nmr/h1giao". The GIAO correction is only added when no
 * gauge origin is given, so both entries agree for a common gauge.
 *
 * @param checkpoint Optional sink, may be null
 * @throws UnsupportedFeature if with_gaunt is set, before any integral work
 */
SpinorTriple make_h10(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                      MagneticBalance balance,
                      const std::optional<Vector3>& gauge_origin,
                      bool with_gaunt, CheckpointSink* checkpoint);

/**
 * @brief First-order overlap matrix
 *
 * RMB contributes the field-dependent small-component metric; GIAO adds the
 * basis-function derivative overlaps.
 */
SpinorTriple make_s10(const IntegralOracle& oracle, MagneticBalance balance,
                      const std::optional<Vector3>& gauge_origin);

/// Copy the full matrices of a triple, e.g. for checkpointing
std::vector<ComplexMatrix> to_matrices(const SpinorTriple& t);

}  // namespace relnmr::nmr
