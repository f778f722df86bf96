// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "nmr/cphf.h"

#include <fmt/format.h>
#include <relnmr/util/logger.h>

#include <cmath>
#include <complex>
#include <utility>

#include "util/macros.h"

namespace relnmr::nmr {

namespace {
/**
 * @brief Orbital partition and energy denominators of a reference
 */
struct OrbitalSpaces {
  std::vector<Eigen::Index> occ;  ///< Rows with occupation > 0
  std::vector<Eigen::Index> vir;  ///< Rows with zero occupation
  Eigen::VectorXd e_occ;          ///< Occupied energies e_i
  RowMajorMatrix e_ai;            ///< 1 / (e_a - e_i) (size: (nvir, nocc))
};

OrbitalSpaces make_spaces(const ReferenceState& ref) {
  OrbitalSpaces s;
  for (Eigen::Index p = 0; p < ref.mo_occ.size(); ++p) {
    (ref.mo_occ[p] > 0 ? s.occ : s.vir).push_back(p);
  }
  s.e_occ = ref.occupied_energies();
  s.e_ai.resize(s.vir.size(), s.occ.size());
  for (size_t a = 0; a < s.vir.size(); ++a)
    for (size_t i = 0; i < s.occ.size(); ++i)
      s.e_ai(a, i) = 1.0 / (ref.mo_energy[s.vir[a]] - s.e_occ[i]);
  return s;
}

void check_shapes(const MOTriple& m, const ReferenceState& ref,
                  const char* what) {
  const auto nmo = ref.mo_coeff.cols();
  const auto nocc = static_cast<Eigen::Index>(ref.num_occupied());
  for (const auto& x : m) {
    RELNMR_VERIFY_DIMENSION(
        x.rows() == nmo && x.cols() == nocc,
        fmt::format("{} is ({}, {}), expected ({}, {})", what, x.rows(),
                    x.cols(), nmo, nocc));
  }
}

/// Occupied rows of an (nmo, nocc) matrix
ComplexMatrix occupied_rows(const ComplexMatrix& m, const OrbitalSpaces& s) {
  ComplexMatrix out(s.occ.size(), m.cols());
  for (size_t i = 0; i < s.occ.size(); ++i) out.row(i) = m.row(s.occ[i]);
  return out;
}

/**
 * @brief Zeroth iterate: h1 - s1 e_i scaled by -e_ai on virtual rows,
 * -s1/2 on occupied rows
 */
void initial_guess(const MOTriple& h1, const MOTriple& s1,
                   const OrbitalSpaces& s, MOTriple& hs, MOTriple& mo1base) {
  for (int x = 0; x < 3; ++x) {
    hs[x] = h1[x] - s1[x] * s.e_occ.cast<std::complex<double>>().asDiagonal();
    mo1base[x] = hs[x];
    for (size_t a = 0; a < s.vir.size(); ++a)
      mo1base[x].row(s.vir[a]).array() *=
          -s.e_ai.row(a).array().cast<std::complex<double>>();
    for (auto i : s.occ) mo1base[x].row(i) = -0.5 * s1[x].row(i);
  }
}

/// hs[occ] + mo1[occ] * (e_i - e_j) (+ v1[occ])
MOTriple first_order_energies(const MOTriple& hs, const MOTriple& mo1,
                              const MOTriple* v1, const OrbitalSpaces& s) {
  const auto nocc = s.occ.size();
  MOTriple mo_e1;
  for (int x = 0; x < 3; ++x) {
    mo_e1[x] = occupied_rows(hs[x], s);
    ComplexMatrix mo1_occ = occupied_rows(mo1[x], s);
    for (size_t i = 0; i < nocc; ++i)
      for (size_t j = 0; j < nocc; ++j)
        mo_e1[x](i, j) += mo1_occ(i, j) * (s.e_occ[i] - s.e_occ[j]);
    if (v1) mo_e1[x] += occupied_rows((*v1)[x], s);
  }
  return mo_e1;
}
}  // namespace

ComplexMatrix mat_ao2mo(const ComplexMatrix& m, const ReferenceState& ref) {
  RELNMR_VERIFY_DIMENSION(
      m.rows() == ref.mo_coeff.rows() && m.cols() == ref.mo_coeff.rows(),
      fmt::format("AO operator is ({}, {}), basis has {} functions", m.rows(),
                  m.cols(), ref.mo_coeff.rows()));
  return ref.mo_coeff.adjoint() * m * ref.occupied_coefficients();
}

MOTriple mat_ao2mo(const SpinorTriple& m, const ReferenceState& ref) {
  const ComplexMatrix c_occ = ref.occupied_coefficients();
  MOTriple out;
  for (int x = 0; x < 3; ++x) {
    RELNMR_VERIFY_DIMENSION(
        static_cast<Eigen::Index>(m[x].n4c()) == ref.mo_coeff.rows(),
        fmt::format("AO operator over {} functions, basis has {}", m[x].n4c(),
                    ref.mo_coeff.rows()));
    out[x] = ref.mo_coeff.adjoint() * m[x].data() * c_occ;
  }
  return out;
}

std::vector<ComplexMatrix> make_rdm1_1(const MOTriple& mo1,
                                       const ReferenceState& ref) {
  check_shapes(mo1, ref, "mo1");
  const ComplexMatrix mocc =
      ref.occupied_coefficients() *
      ref.occupied_occupations().cast<std::complex<double>>().asDiagonal();
  std::vector<ComplexMatrix> dm1(3);
  for (int x = 0; x < 3; ++x) {
    ComplexMatrix tmp = ref.mo_coeff * mo1[x] * mocc.adjoint();
    dm1[x] = tmp + tmp.adjoint();
  }
  return dm1;
}

InducedPotential make_induced_potential(ResponsePotential& scf,
                                        const ReferenceState& ref) {
  return [&scf, &ref](const MOTriple& mo1) {
    AutoTimer timer("nmr::induced_potential");
    auto dm1 = make_rdm1_1(mo1, ref);
    std::vector<ComplexMatrix> v_ao;
    {
      DirectSCFGuard guard(scf);
      // dm1 = C^1 C^0+ + C^0 C^1+ is Hermitian
      v_ao = scf.get_response_potential(dm1, true);
    }
    RELNMR_VERIFY_DIMENSION(v_ao.size() == 3,
                            fmt::format("response potential returned {} "
                                        "matrices for 3 densities",
                                        v_ao.size()));
    MOTriple v_mo;
    for (int x = 0; x < 3; ++x) v_mo[x] = mat_ao2mo(v_ao[x], ref);
    return v_mo;
  };
}

FirstOrderResponse solve_uncoupled(const ReferenceState& ref,
                                   const MOTriple& h1, const MOTriple& s1) {
  RELNMR_LOG_TRACE_ENTERING();
  check_shapes(h1, ref, "h1");
  check_shapes(s1, ref, "s1");
  const auto s = make_spaces(ref);

  FirstOrderResponse r;
  MOTriple hs;
  initial_guess(h1, s1, s, hs, r.mo1);
  r.mo_e1 = first_order_energies(hs, r.mo1, nullptr, s);
  r.status = CPHFStatus::Uncoupled;
  return r;
}

FirstOrderResponse solve_cphf(const InducedPotential& vind,
                              const ReferenceState& ref, const MOTriple& h1,
                              const MOTriple& s1, const CPHFInput& input) {
  RELNMR_LOG_TRACE_ENTERING();
  RELNMR_VERIFY_INPUT(input.max_iteration >= 1,
                      "CPHF needs at least one iteration");
  check_shapes(h1, ref, "h1");
  check_shapes(s1, ref, "s1");
  const auto s = make_spaces(ref);

  MOTriple hs, mo1base;
  initial_guess(h1, s1, s, hs, mo1base);

  FirstOrderResponse r;
  r.mo1 = mo1base;
  MOTriple v1;
  bool converged = false;
  for (int it = 1; it <= input.max_iteration; ++it) {
    v1 = vind(r.mo1);
    check_shapes(v1, ref, "induced potential");

    double norm2 = 0.0;
    for (int x = 0; x < 3; ++x) {
      ComplexMatrix next = mo1base[x];
      for (size_t a = 0; a < s.vir.size(); ++a) {
        const auto p = s.vir[a];
        next.row(p).array() -=
            v1[x].row(p).array() *
            s.e_ai.row(a).array().cast<std::complex<double>>();
      }
      norm2 += (next - r.mo1[x]).squaredNorm();
      r.mo1[x] = std::move(next);
    }
    r.iterations = it;
    r.residual = std::sqrt(norm2);
    spdlog::info("CPHF iteration {:3d}  |mo1 - mo1_last| = {:.6e}", it,
                 r.residual);
    if (r.residual < input.tolerance) {
      converged = true;
      break;
    }
  }

  r.mo_e1 = first_order_energies(hs, r.mo1, &v1, s);
  if (input.max_iteration == 1) {
    r.status = CPHFStatus::SinglePass;
  } else if (converged) {
    r.status = CPHFStatus::Converged;
  } else {
    r.status = CPHFStatus::MaxIterationsReached;
    spdlog::warn("CPHF not converged in {} iterations, residual {:.3e} > {:.1e}",
                 input.max_iteration, r.residual, input.tolerance);
  }
  return r;
}

}  // namespace relnmr::nmr
