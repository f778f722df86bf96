// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/core/reference_state.h>

#include <complex>
#include <vector>

namespace relnmr {

namespace {
std::vector<Eigen::Index> occupied_indices(const Eigen::VectorXd& occ) {
  std::vector<Eigen::Index> idx;
  for (Eigen::Index i = 0; i < occ.size(); ++i) {
    if (occ[i] > 0) idx.push_back(i);
  }
  return idx;
}
}  // namespace

size_t ReferenceState::num_occupied() const {
  return occupied_indices(mo_occ).size();
}

ComplexMatrix ReferenceState::occupied_coefficients() const {
  const auto idx = occupied_indices(mo_occ);
  ComplexMatrix c_occ(mo_coeff.rows(), idx.size());
  for (size_t k = 0; k < idx.size(); ++k) c_occ.col(k) = mo_coeff.col(idx[k]);
  return c_occ;
}

Eigen::VectorXd ReferenceState::occupied_occupations() const {
  const auto idx = occupied_indices(mo_occ);
  Eigen::VectorXd occ(idx.size());
  for (size_t k = 0; k < idx.size(); ++k) occ[k] = mo_occ[idx[k]];
  return occ;
}

Eigen::VectorXd ReferenceState::occupied_energies() const {
  const auto idx = occupied_indices(mo_occ);
  Eigen::VectorXd e(idx.size());
  for (size_t k = 0; k < idx.size(); ++k) e[k] = mo_energy[idx[k]];
  return e;
}

ComplexMatrix ReferenceState::make_rdm1() const {
  ComplexMatrix c_occ = occupied_coefficients();
  ComplexMatrix weighted =
      c_occ * occupied_occupations().cast<std::complex<double>>().asDiagonal();
  return weighted * c_occ.adjoint();
}

void ReferenceState::validate(size_t n4c) const {
  const auto nmo = mo_coeff.cols();
  if (static_cast<size_t>(mo_coeff.rows()) != n4c) {
    throw DimensionMismatch(fmt::format(
        "mo_coeff has {} rows, the spinor basis has {} functions",
        mo_coeff.rows(), n4c));
  }
  if (mo_energy.size() != nmo || mo_occ.size() != nmo) {
    throw DimensionMismatch(fmt::format(
        "{} orbitals but {} energies and {} occupations", nmo,
        mo_energy.size(), mo_occ.size()));
  }
  if (static_cast<size_t>(nmo) < n4c / 2) {
    throw DimensionMismatch(fmt::format(
        "{} orbitals cannot hold the {} negative-energy states", nmo,
        n4c / 2));
  }
}

}  // namespace relnmr
