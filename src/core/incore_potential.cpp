// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/core/incore_potential.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <utility>

#include "util/hdf5_io.h"
#include "util/macros.h"

namespace relnmr {

IncoreCoulombPotential::IncoreCoulombPotential(ComplexMatrix eri_4c)
    : eri_(std::move(eri_4c)) {
  const auto n2 = eri_.rows();
  const auto n = static_cast<Eigen::Index>(std::llround(std::sqrt(double(n2))));
  if (eri_.cols() != n2 || n * n != n2 || n % 2 != 0) {
    throw DimensionMismatch(fmt::format(
        "four-component ERI must be (n^2, n^2) with even n, got ({}, {})",
        eri_.rows(), eri_.cols()));
  }
  n4c_ = n;
}

std::vector<ComplexMatrix> IncoreCoulombPotential::get_response_potential(
    const std::vector<ComplexMatrix>& trial_densities, bool hermitian) {
  AutoTimer t("scf::incore_response_potential");
  const size_t n = n4c_;
  const size_t n2 = n * n;
  std::vector<ComplexMatrix> v(trial_densities.size());

  for (size_t idm = 0; idm < trial_densities.size(); ++idm) {
    const auto& dm = trial_densities[idm];
    RELNMR_VERIFY_DIMENSION(
        dm.rows() == Eigen::Index(n) && dm.cols() == Eigen::Index(n),
        fmt::format("trial density {} is ({}, {}), expected ({}, {})", idm,
                    dm.rows(), dm.cols(), n, n));

    // J as a matrix-vector product over compound indices, D^T row-major
    ComplexMatrix dm_t = dm.transpose();
    Eigen::Map<const Eigen::VectorXcd> dvec(dm_t.data(), n2);
    Eigen::VectorXcd jvec = eri_ * dvec;
    ComplexMatrix vj = Eigen::Map<const ComplexMatrix>(jvec.data(), n, n);

    ComplexMatrix vk = ComplexMatrix::Zero(n, n);
    for (size_t a = 0; a < n; ++a)
      for (size_t d = 0; d < (hermitian ? a + 1 : n); ++d) {
        std::complex<double> sum = 0.0;
        for (size_t b = 0; b < n; ++b) {
          const auto* eri_ab = eri_.data() + (a * n + b) * n2;
          for (size_t c = 0; c < n; ++c) sum += eri_ab[c * n + d] * dm(b, c);
        }
        vk(a, d) = sum;
      }
    if (hermitian) {
      for (size_t a = 0; a < n; ++a)
        for (size_t d = a + 1; d < n; ++d) vk(a, d) = std::conj(vk(d, a));
    }
    v[idm] = vj - vk;
  }
  return v;
}

void IncoreCoulombPotential::save(const std::string& path) const {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_RDWR);
    auto scf = hdf5::open_or_create_group(file, "scf");
    hdf5::save_complex_matrix(scf, "eri_4c", eri_);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::unique_ptr<IncoreCoulombPotential> IncoreCoulombPotential::load(
    const std::string& path) {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_RDONLY);
    auto scf = file.openGroup("scf");
    auto potential = std::make_unique<IncoreCoulombPotential>(
        hdf5::load_complex_matrix(scf, "eri_4c"));
    spdlog::debug("loaded four-component ERI over {} spinors from {}",
                  potential->n4c(), path);
    return potential;
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace relnmr
