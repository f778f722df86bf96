// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/nmr.h>
#include <relnmr/core/reference_state.h>
#include <relnmr/core/response_potential.h>
#include <relnmr/core/spinor_matrix.h>

#include <array>
#include <functional>
#include <vector>

namespace relnmr::nmr {

/// Three (nmo, nocc) matrices, one per field direction
using MOTriple = std::array<ComplexMatrix, 3>;

/// Induced potential in the MO basis as a function of mo1
using InducedPotential = std::function<MOTriple(const MOTriple& mo1)>;

/**
 * @brief Transform an AO operator to the (all, occupied) MO block
 *
 * @return C^H M C_occ (size: (nmo, nocc))
 */
ComplexMatrix mat_ao2mo(const ComplexMatrix& m, const ReferenceState& ref);

/// mat_ao2mo applied per direction
MOTriple mat_ao2mo(const SpinorTriple& m, const ReferenceState& ref);

/**
 * @brief First-order density C mo1 (C_occ occ)^H + h.c. per direction
 */
std::vector<ComplexMatrix> make_rdm1_1(const MOTriple& mo1,
                                       const ReferenceState& ref);

/**
 * @brief Induced potential of the SCF collaborator in the MO basis
 *
 * Each evaluation builds the first-order density, calls the collaborator
 * once with hermitian = true while holding a DirectSCFGuard, and transforms
 * the potential back with mat_ao2mo.
 */
InducedPotential make_induced_potential(ResponsePotential& scf,
                                        const ReferenceState& ref);

/**
 * @brief Sum-over-states response without the induced potential
 *
 * @param h1 First-order Fock matrix (nmo, nocc) per direction
 * @param s1 First-order overlap (nmo, nocc) per direction
 */
FirstOrderResponse solve_uncoupled(const ReferenceState& ref,
                                   const MOTriple& h1, const MOTriple& s1);

/**
 * @brief Coupled-perturbed Hartree-Fock fixed-point solve
 *
 * Virtual rows are updated as -(h1 - s1 e_i + v1)/(e_a - e_i), occupied rows
 * are fixed at -s1/2. With max_iteration = 1 the potential is evaluated once
 * and the status is SinglePass. Exhausting a larger budget is reported as
 * MaxIterationsReached, never thrown.
 */
FirstOrderResponse solve_cphf(const InducedPotential& vind,
                              const ReferenceState& ref, const MOTriple& h1,
                              const MOTriple& s1, const CPHFInput& input);

}  // namespace relnmr::nmr
