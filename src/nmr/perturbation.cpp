// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "nmr/perturbation.h"

#include <relnmr/core/exceptions.h>
#include <relnmr/util/logger.h>

#include <string>

#include "nmr/response_jk.h"
#include "util/macros.h"

namespace relnmr::nmr {

namespace {
void reject_gaunt(bool with_gaunt) {
  if (with_gaunt) {
    throw UnsupportedFeature(
        "Gaunt two-electron term of the magnetic response operator");
  }
}

std::vector<ComplexMatrix> one_electron(const IntegralOracle& oracle,
                                        const std::string& name,
                                        const std::optional<Vector3>& origin) {
  auto ints = oracle.evaluate({name, 3, origin, std::nullopt});
  const Eigen::Index n2c = oracle.num_spinors();
  RELNMR_VERIFY_DIMENSION(ints.size() == 3,
                          fmt::format("{} returned {} components", name,
                                      ints.size()));
  for (const auto& m : ints) {
    RELNMR_VERIFY_DIMENSION(m.rows() == n2c && m.cols() == n2c,
                            fmt::format("{} returned a ({}, {}) block", name,
                                        m.rows(), m.cols()));
  }
  return ints;
}

GaugeMode gauge_of(const std::optional<Vector3>& gauge_origin) {
  return gauge_origin ? GaugeMode::CommonGauge : GaugeMode::GIAO;
}
}  // namespace

SpinorTriple make_h10_rmb(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                          const std::optional<Vector3>& gauge_origin,
                          bool with_gaunt) {
  RELNMR_LOG_TRACE_ENTERING();
  reject_gaunt(with_gaunt);
  spdlog::debug("first order Fock matrix / RMB");
  const double c = oracle.light_speed();
  const auto gauge = gauge_of(gauge_origin);
  const std::string key = to_string(gauge);
  auto t1 = one_electron(oracle, "int1e_" + key + "_sa10sp", gauge_origin);
  auto v1 = one_electron(oracle, "int1e_" + key + "_sa10nucsp", gauge_origin);

  auto jk = rmb_response_jk(oracle, dm0, gauge, gauge_origin);
  SpinorTriple h1 = make_spinor_triple(dm0.n2c());
  for (int x = 0; x < 3; ++x) {
    h1[x].data() = jk.vj[x].data() - jk.vk[x].data();
    ComplexMatrix t1cc = t1[x] + t1[x].adjoint();
    ComplexMatrix v1cc = v1[x] + v1[x].adjoint();
    h1[x].block(SpinorBlock::LS) += t1cc * 0.5;
    h1[x].block(SpinorBlock::SL) += t1cc * 0.5;
    h1[x].block(SpinorBlock::SS) += -t1cc * 0.5 + v1cc * (0.25 / (c * c));
  }
  return h1;
}

SpinorTriple make_h10_rkb(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                          const std::optional<Vector3>& gauge_origin,
                          bool with_gaunt) {
  RELNMR_LOG_TRACE_ENTERING();
  reject_gaunt(with_gaunt);
  spdlog::debug("first order Fock matrix / RKB");
  RELNMR_VERIFY_DIMENSION(dm0.n2c() == oracle.num_spinors(),
                          fmt::format("density over {} spinors, basis has {}",
                                      dm0.n2c(), oracle.num_spinors()));
  const std::string key = to_string(gauge_of(gauge_origin));
  auto t1 = one_electron(oracle, "int1e_" + key + "_sa10sp", gauge_origin);

  SpinorTriple h1 = make_spinor_triple(dm0.n2c());
  for (int x = 0; x < 3; ++x) {
    h1[x].block(SpinorBlock::LS) += t1[x] * 0.5;
    h1[x].block(SpinorBlock::SL) += t1[x].adjoint() * 0.5;
  }
  return h1;
}

SpinorTriple make_h10_giao(const IntegralOracle& oracle,
                           const SpinorMatrix& dm0, bool with_gaunt) {
  RELNMR_LOG_TRACE_ENTERING();
  reject_gaunt(with_gaunt);
  spdlog::debug("first order Fock matrix / GIAOs");
  const double c = oracle.light_speed();
  auto tg = one_electron(oracle, "int1e_spgsp", std::nullopt);
  auto vg = one_electron(oracle, "int1e_gnuc", std::nullopt);
  auto wg = one_electron(oracle, "int1e_spgnucsp", std::nullopt);

  auto jk = giao_response_jk(oracle, dm0);
  SpinorTriple h1 = make_spinor_triple(dm0.n2c());
  for (int x = 0; x < 3; ++x) {
    h1[x].data() = jk.vj[x].data() - jk.vk[x].data();
    h1[x].block(SpinorBlock::LL) += vg[x];
    h1[x].block(SpinorBlock::SL) += tg[x] * 0.5;
    h1[x].block(SpinorBlock::LS) += tg[x].adjoint() * 0.5;
    h1[x].block(SpinorBlock::SS) += wg[x] * (0.25 / (c * c)) - tg[x] * 0.5;
  }
  return h1;
}

SpinorTriple make_h10(const IntegralOracle& oracle, const SpinorMatrix& dm0,
                      MagneticBalance balance,
                      const std::optional<Vector3>& gauge_origin,
                      bool with_gaunt, CheckpointSink* checkpoint) {
  RELNMR_LOG_TRACE_ENTERING();
  reject_gaunt(with_gaunt);

  SpinorTriple h1;
  {
    AutoTimer timer(to_string(balance) + " h1");
    switch (balance) {
      case MagneticBalance::RestrictedMagneticBalance:
        h1 = make_h10_rmb(oracle, dm0, gauge_origin, with_gaunt);
        break;
      case MagneticBalance::RestrictedKineticBalance:
        h1 = make_h10_rkb(oracle, dm0, gauge_origin, with_gaunt);
        break;
    }
  }
  if (checkpoint) checkpoint->store("nmr/h1", to_matrices(h1));

  if (!gauge_origin) {
    AutoTimer timer("GIAO");
    auto h1giao = make_h10_giao(oracle, dm0, with_gaunt);
    for (int x = 0; x < 3; ++x) h1[x] += h1giao[x];
  }
  if (checkpoint) checkpoint->store("nmr/h1giao", to_matrices(h1));
  return h1;
}

SpinorTriple make_s10(const IntegralOracle& oracle, MagneticBalance balance,
                      const std::optional<Vector3>& gauge_origin) {
  RELNMR_LOG_TRACE_ENTERING();
  const double c = oracle.light_speed();
  SpinorTriple s1 = make_spinor_triple(oracle.num_spinors());

  if (balance == MagneticBalance::RestrictedMagneticBalance) {
    const std::string key = to_string(gauge_of(gauge_origin));
    auto t1 = one_electron(oracle, "int1e_" + key + "_sa10sp", gauge_origin);
    for (int x = 0; x < 3; ++x) {
      s1[x].block(SpinorBlock::SS) =
          (t1[x] + t1[x].adjoint()) * (0.25 / (c * c));
    }
  }

  if (!gauge_origin) {
    auto sg = one_electron(oracle, "int1e_govlp", std::nullopt);
    auto tg = one_electron(oracle, "int1e_spgsp", std::nullopt);
    for (int x = 0; x < 3; ++x) {
      s1[x].block(SpinorBlock::LL) += sg[x];
      s1[x].block(SpinorBlock::SS) += tg[x] * (0.25 / (c * c));
    }
  }
  return s1;
}

std::vector<ComplexMatrix> to_matrices(const SpinorTriple& t) {
  return {t[0].data(), t[1].data(), t[2].data()};
}

}  // namespace relnmr::nmr
