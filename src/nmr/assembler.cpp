// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "nmr/assembler.h"

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/util/logger.h>

#include <algorithm>
#include <cmath>
#include <complex>

#include "util/macros.h"
#include "util/parallel.h"

namespace relnmr::nmr {

namespace {
std::vector<ComplexMatrix> nucleus_operator(const IntegralOracle& oracle,
                                            const std::string& name, int ncomp,
                                            const std::optional<Vector3>& origin,
                                            const Vector3& nucleus) {
  auto ints = oracle.evaluate({name, ncomp, origin, nucleus});
  const Eigen::Index n2c = oracle.num_spinors();
  RELNMR_VERIFY_DIMENSION(ints.size() == static_cast<size_t>(ncomp),
                          fmt::format("{} returned {} components", name,
                                      ints.size()));
  for (const auto& m : ints) {
    RELNMR_VERIFY_DIMENSION(m.rows() == n2c && m.cols() == n2c,
                            fmt::format("{} returned a ({}, {}) block", name,
                                        m.rows(), m.cols()));
  }
  return ints;
}
}  // namespace

void validate_nuclei(const Molecule& mol, const std::vector<size_t>& nuclei) {
  for (auto atm : nuclei) {
    if (atm >= mol.n_atoms) {
      throw DimensionMismatch(fmt::format(
          "nucleus index {} out of range for a molecule of {} atoms", atm,
          mol.n_atoms));
    }
  }
}

DiamagneticTerms diamagnetic(const IntegralOracle& oracle,
                             const SpinorMatrix& dm0,
                             const std::vector<size_t>& nuclei,
                             MagneticBalance balance,
                             const std::optional<Vector3>& gauge_origin) {
  RELNMR_LOG_TRACE_ENTERING();
  const auto& mol = oracle.molecule();
  validate_nuclei(mol, nuclei);
  RELNMR_VERIFY_DIMENSION(dm0.n2c() == oracle.num_spinors(),
                          fmt::format("density over {} spinors, basis has {}",
                                      dm0.n2c(), oracle.num_spinors()));

  DiamagneticTerms dia;
  dia.tensors.assign(nuclei.size(), Eigen::Matrix3d::Zero());
  if (balance == MagneticBalance::RestrictedKineticBalance && gauge_origin) {
    return dia;
  }

  const auto dm_ls = dm0.block(SpinorBlock::LS);
  const auto dm_sl = dm0.block(SpinorBlock::SL);
  std::vector<double> max_imag(nuclei.size(), 0.0);

  parallel_for(nuclei.size(), [&](size_t n) {
    const Vector3& center = mol.coords[nuclei[n]];
    std::vector<ComplexMatrix> t11;
    if (balance == MagneticBalance::RestrictedMagneticBalance) {
      if (gauge_origin) {
        t11 = nucleus_operator(oracle, "int1e_cg_sa10sa01", 9, gauge_origin,
                               center);
      } else {
        t11 = nucleus_operator(oracle, "int1e_giao_sa10sa01", 9, std::nullopt,
                               center);
        auto g = nucleus_operator(oracle, "int1e_spgsa01", 9, std::nullopt,
                                  center);
        for (int i = 0; i < 9; ++i) t11[i] += g[i];
      }
    } else {
      t11 = nucleus_operator(oracle, "int1e_spgsa01", 9, std::nullopt, center);
    }

    // h11[SL] = t/2, h11[LS] = t^H/2, tr(D h) = sum(D o h^T)
    for (int i = 0; i < 9; ++i) {
      const std::complex<double> value =
          0.5 * (dm_ls.cwiseProduct(t11[i].transpose()).sum() +
                 dm_sl.cwiseProduct(t11[i].conjugate()).sum());
      dia.tensors[n](i / 3, i % 3) = value.real();
      max_imag[n] = std::max(max_imag[n], std::abs(value.imag()));
    }
  });

  if (!max_imag.empty())
    dia.max_imaginary = *std::max_element(max_imag.begin(), max_imag.end());
  return dia;
}

std::vector<ParamagneticTerms> paramagnetic(const IntegralOracle& oracle,
                                            const MOTriple& mo1,
                                            const ReferenceState& ref,
                                            const std::vector<size_t>& nuclei) {
  RELNMR_LOG_TRACE_ENTERING();
  const auto& mol = oracle.molecule();
  validate_nuclei(mol, nuclei);
  const size_t n2c = oracle.num_spinors();
  ref.validate(2 * n2c);
  const auto nmo = ref.mo_coeff.cols();
  const auto nocc = static_cast<Eigen::Index>(ref.num_occupied());
  for (const auto& m : mo1) {
    RELNMR_VERIFY_DIMENSION(m.rows() == nmo && m.cols() == nocc,
                            fmt::format("mo1 is ({}, {}), expected ({}, {})",
                                        m.rows(), m.cols(), nmo, nocc));
  }

  std::vector<ParamagneticTerms> para(nuclei.size());
  parallel_for(nuclei.size(), [&](size_t n) {
    const Vector3& center = mol.coords[nuclei[n]];
    auto t01 =
        nucleus_operator(oracle, "int1e_sa01sp", 3, std::nullopt, center);
    SpinorTriple h01 = make_spinor_triple(n2c);
    for (int m = 0; m < 3; ++m) {
      h01[m].block(SpinorBlock::LS) = 0.5 * t01[m];
      h01[m].block(SpinorBlock::SL) = 0.5 * t01[m].adjoint();
    }
    const auto h01_mo = mat_ao2mo(h01, ref);

    auto& terms = para[n];
    for (int b = 0; b < 3; ++b)
      for (int m = 0; m < 3; ++m) {
        // + c.c.
        Eigen::VectorXd p =
            2.0 * mo1[b].conjugate().cwiseProduct(h01_mo[m]).rowwise().sum().real();
        double neg = p.head(static_cast<Eigen::Index>(n2c)).sum();
        double occ = 0.0;
        for (Eigen::Index i = 0; i < nmo; ++i) {
          if (ref.mo_occ[i] > 0) occ += p[i];
        }
        terms.total(b, m) = p.sum();
        terms.negative_energy(b, m) = neg;
        terms.occupied(b, m) = occ;
        terms.positive_virtual(b, m) = p.sum() - neg - occ;
      }
  });
  return para;
}

}  // namespace relnmr::nmr
