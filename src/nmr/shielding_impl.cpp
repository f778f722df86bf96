// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "nmr/shielding_impl.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <relnmr/config.h>
#include <relnmr/constants.h>
#include <relnmr/core/molecule.h>
#include <relnmr/util/logger.h>
#include <spdlog/spdlog.h>

#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "nmr/perturbation.h"
#include "util/macros.h"
#include "util/timer.h"

namespace relnmr {

namespace {
std::string format_tensor(const Eigen::Matrix3d& t) {
  static constexpr const char* axes[] = {"x", "y", "z"};
  std::ostringstream oss;
  oss << fmt::format("{:>6} {:>15} {:>15} {:>15}\n", "B_", "x", "y", "z");
  for (int i = 0; i < 3; ++i) {
    oss << fmt::format("{:>5}  {:15.8f} {:15.8f} {:15.8f}\n", axes[i], t(i, 0),
                       t(i, 1), t(i, 2));
  }
  return oss.str();
}
}  // namespace

ShieldingImpl::ShieldingImpl(std::shared_ptr<const IntegralOracle> oracle,
                             std::shared_ptr<const ReferenceState> reference,
                             std::shared_ptr<ResponsePotential> scf,
                             const ShieldingConfig& cfg,
                             std::shared_ptr<CheckpointSink> checkpoint)
    : oracle_(std::move(oracle)),
      reference_(std::move(reference)),
      scf_(std::move(scf)),
      checkpoint_(std::move(checkpoint)),
      cfg_(cfg) {
  RELNMR_VERIFY_INPUT(oracle_ != nullptr, "integral oracle is null");
  RELNMR_VERIFY_INPUT(reference_ != nullptr, "reference state is null");
  RELNMR_VERIFY_INPUT(scf_ != nullptr || !cfg_.cphf.coupled,
                      "coupled CPHF requires a response potential");
  RELNMR_VERIFY_INPUT(cfg_.cphf.max_iteration >= 1,
                      "cphf.max_iteration must be at least 1");
  RELNMR_VERIFY_INPUT(cfg_.ppm_light_speed > 0.0,
                      "ppm_light_speed must be positive");
  reference_->validate(2 * oracle_->num_spinors());

  ctx_.cfg = &cfg_;
  ctx_.oracle = oracle_.get();
  ctx_.reference = reference_.get();
}

std::vector<size_t> ShieldingImpl::nuclei_() const {
  const auto& mol = oracle_->molecule();
  std::vector<size_t> nuclei;
  if (cfg_.shielding_nuclei) {
    nuclei = *cfg_.shielding_nuclei;
  } else {
    nuclei.resize(mol.n_atoms);
    std::iota(nuclei.begin(), nuclei.end(), size_t(0));
  }
  nmr::validate_nuclei(mol, nuclei);
  return nuclei;
}

SpinorMatrix ShieldingImpl::density_() const {
  return SpinorMatrix(reference_->make_rdm1());
}

SpinorTriple ShieldingImpl::make_h10() const {
  RELNMR_LOG_TRACE_ENTERING();
  return nmr::make_h10(*oracle_, density_(), cfg_.balance, cfg_.gauge_origin,
                       cfg_.with_gaunt, checkpoint_.get());
}

SpinorTriple ShieldingImpl::make_s10() const {
  RELNMR_LOG_TRACE_ENTERING();
  return nmr::make_s10(*oracle_, cfg_.balance, cfg_.gauge_origin);
}

FirstOrderResponse ShieldingImpl::solve_mo1() const {
  RELNMR_LOG_TRACE_ENTERING();
  const auto h1 = nmr::mat_ao2mo(make_h10(), *reference_);
  const auto s1 = nmr::mat_ao2mo(make_s10(), *reference_);

  AutoTimer t("nmr::cphf");
  if (!cfg_.cphf.coupled) {
    return nmr::solve_uncoupled(*reference_, h1, s1);
  }
  auto vind = nmr::make_induced_potential(*scf_, *reference_);
  return nmr::solve_cphf(vind, *reference_, h1, s1, cfg_.cphf);
}

std::vector<Eigen::Matrix3d> ShieldingImpl::dia() const {
  RELNMR_LOG_TRACE_ENTERING();
  AutoTimer t("nmr::dia");
  return nmr::diamagnetic(*oracle_, density_(), nuclei_(), cfg_.balance,
                          cfg_.gauge_origin)
      .tensors;
}

std::vector<ParamagneticTerms> ShieldingImpl::para(
    const FirstOrderResponse& mo1) const {
  RELNMR_LOG_TRACE_ENTERING();
  AutoTimer t("nmr::para");
  return nmr::paramagnetic(*oracle_, mo1.mo1, *reference_, nuclei_());
}

void ShieldingImpl::log_banner_() const {
  if (cfg_.verbose <= 0) return;
  spdlog::info("******** DHF shielding (relnmr {}) ********", RELNMR_VERSION);
  spdlog::info("balance={}, gauge={}", to_string(cfg_.balance),
               cfg_.gauge_origin
                   ? fmt::format("common origin ({:.6f}, {:.6f}, {:.6f})",
                                 (*cfg_.gauge_origin)[0],
                                 (*cfg_.gauge_origin)[1],
                                 (*cfg_.gauge_origin)[2])
                   : std::string("GIAO"));
  if (cfg_.shielding_nuclei) {
    spdlog::info("shielding_nuclei=[{}]",
                 fmt::join(*cfg_.shielding_nuclei, ", "));
  } else {
    spdlog::info("shielding_nuclei=all");
  }
  spdlog::info("cphf: coupled={}, max_iteration={}, tolerance={:.2e}",
               cfg_.cphf.coupled, cfg_.cphf.max_iteration,
               cfg_.cphf.tolerance);
  spdlog::info("n2c={}, light_speed={:.10f}, ppm_light_speed={:.10f}",
               oracle_->num_spinors(), oracle_->light_speed(),
               cfg_.ppm_light_speed);
}

const ShieldingContext& ShieldingImpl::run() {
  RELNMR_LOG_TRACE_ENTERING();
  AutoTimer timer("nmr::shielding");
  log_banner_();

  ctx_.result = ShieldingResult{};
  auto& res = ctx_.result;
  const auto nuclei = nuclei_();
  if (nuclei.empty()) {
    spdlog::info("No nuclei requested, nothing to compute");
    return ctx_;
  }

  // The Gaunt check in make_h10 fires before any integral work
  auto mo1 = solve_mo1();
  res.cphf_status = mo1.status;
  res.cphf_iterations = mo1.iterations;
  res.cphf_residual = mo1.residual;

  nmr::DiamagneticTerms dia;
  TIMEIT(dia = nmr::diamagnetic(*oracle_, density_(), nuclei, cfg_.balance,
                                cfg_.gauge_origin),
         "nmr::dia");
  const auto para = this->para(mo1);

  const double facppm = constants::ppm_factor(cfg_.ppm_light_speed);
  const auto& mol = oracle_->molecule();
  res.nuclei.reserve(nuclei.size());
  for (size_t n = 0; n < nuclei.size(); ++n) {
    NucleusShielding s;
    s.atom_index = nuclei[n];
    s.atomic_number = mol.atomic_nums[nuclei[n]];
    s.diamagnetic = dia.tensors[n] * facppm;
    s.paramagnetic.total = para[n].total * facppm;
    s.paramagnetic.occupied = para[n].occupied * facppm;
    s.paramagnetic.positive_virtual = para[n].positive_virtual * facppm;
    s.paramagnetic.negative_energy = para[n].negative_energy * facppm;
    s.total = s.diamagnetic + s.paramagnetic.total;
    res.nuclei.push_back(std::move(s));
  }

  res.max_imaginary_residual = dia.max_imaginary;
  res.numerically_consistent = dia.max_imaginary <= cfg_.imaginary_tolerance;
  if (!res.numerically_consistent) {
    spdlog::warn(
        "Diamagnetic contraction has an imaginary part of {:.3e} "
        "(tolerance {:.1e}); the density or h11 is not Hermitian",
        dia.max_imaginary, cfg_.imaginary_tolerance);
  }

  log_results_();
  if (cfg_.verbose >= 5) Timer::print_summary();
  return ctx_;
}

void ShieldingImpl::log_results_() const {
  if (cfg_.verbose <= 0) return;
  for (const auto& s : ctx_.result.nuclei) {
    const auto sym = element_symbol(s.atomic_number);
    spdlog::info("total shielding of atom {} {} (isotropic {:.8f})\n{}",
                 s.atom_index, sym, s.isotropic(), format_tensor(s.total));
    spdlog::info("dia-magnetism\n{}", format_tensor(s.diamagnetic));
    spdlog::info("para-magnetism\n{}", format_tensor(s.paramagnetic.total));
    if (cfg_.verbose >= 4) {
      spdlog::info("occ part of para-magnetism\n{}",
                   format_tensor(s.paramagnetic.occupied));
      spdlog::info("vir-pos part of para-magnetism\n{}",
                   format_tensor(s.paramagnetic.positive_virtual));
      spdlog::info("vir-neg part of para-magnetism\n{}",
                   format_tensor(s.paramagnetic.negative_energy));
    }
  }
}

}  // namespace relnmr
