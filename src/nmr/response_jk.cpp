// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "nmr/response_jk.h"

#include <fmt/format.h>
#include <relnmr/util/logger.h>

#include <cmath>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "util/macros.h"

namespace relnmr::nmr {

namespace {
std::vector<ContractionPattern> make_patterns(
    std::initializer_list<std::string_view> descriptors) {
  std::vector<ContractionPattern> patterns;
  for (auto d : descriptors) patterns.push_back(ContractionPattern::parse(d));
  return patterns;
}

/// Oracle contraction with the result shape checked against the request
std::vector<std::vector<ComplexMatrix>> contract(
    const IntegralOracle& oracle, const TwoElectronRequest& request,
    const std::vector<ComplexMatrix>& densities) {
  auto vx = oracle.contract(request, densities);
  const Eigen::Index n2c = oracle.num_spinors();
  RELNMR_VERIFY_DIMENSION(vx.size() == request.patterns.size(),
                          fmt::format("{} returned {} contractions", request.name,
                                      vx.size()));
  for (const auto& per_pattern : vx) {
    RELNMR_VERIFY_DIMENSION(
        per_pattern.size() == static_cast<size_t>(request.ncomp),
        fmt::format("{} returned {} components", request.name,
                    per_pattern.size()));
    for (const auto& m : per_pattern) {
      RELNMR_VERIFY_DIMENSION(m.rows() == n2c && m.cols() == n2c,
                              fmt::format("{} returned a ({}, {}) block",
                                          request.name, m.rows(), m.cols()));
    }
  }
  return vx;
}

struct DensityBlocks {
  ComplexMatrix ll, ls, sl, ss;
};

DensityBlocks split_density(const IntegralOracle& oracle,
                            const SpinorMatrix& dm) {
  RELNMR_VERIFY_DIMENSION(
      dm.n2c() == oracle.num_spinors(),
      fmt::format("density over {} spinors, basis has {}", dm.n2c(),
                  oracle.num_spinors()));
  return {dm.block(SpinorBlock::LL), dm.block(SpinorBlock::LS),
          dm.block(SpinorBlock::SL), dm.block(SpinorBlock::SS)};
}
}  // namespace

void hermitian_fill_upper(ComplexMatrix& m) {
  for (Eigen::Index i = 0; i < m.rows(); ++i)
    for (Eigen::Index j = 0; j < i; ++j) m(j, i) = std::conj(m(i, j));
}

void antihermitian_fill_upper(ComplexMatrix& m) {
  for (Eigen::Index i = 0; i < m.rows(); ++i)
    for (Eigen::Index j = 0; j < i; ++j) m(j, i) = -std::conj(m(i, j));
}

ResponseJK rmb_response_jk(const IntegralOracle& oracle, const SpinorMatrix& dm,
                           GaugeMode gauge,
                           const std::optional<Vector3>& gauge_origin) {
  RELNMR_LOG_TRACE_ENTERING();
  const auto d = split_density(oracle, dm);
  const size_t n2c = dm.n2c();
  const double c1 = 0.5 / oracle.light_speed();
  const double c1_2 = c1 * c1;
  const double c1_4 = c1_2 * c1_2;
  const std::string key = to_string(gauge);

  std::optional<Vector3> origin;
  if (gauge == GaugeMode::CommonGauge) {
    RELNMR_VERIFY_INPUT(gauge_origin.has_value(),
                        "common gauge contraction needs a gauge origin");
    origin = gauge_origin;
  }

  ResponseJK jk{make_spinor_triple(n2c), make_spinor_triple(n2c)};

  // (SS|SS) type: density on the small-small block only
  TwoElectronRequest ssss{"int2e_" + key + "_sa10sp1spsp2", 3,
                          IntegralSymmetry::S2kl,
                          make_patterns({"ji->s2kl", "lk->s1ij", "jk->s1il",
                                         "li->s1kj"}),
                          origin};
  auto vx = contract(oracle, ssss, {d.ss});
  for (int x = 0; x < 3; ++x) {
    antihermitian_fill_upper(vx[0][x]);
    jk.vj[x].block(SpinorBlock::SS) = (vx[0][x] + vx[1][x]) * c1_4;
    jk.vk[x].block(SpinorBlock::SS) = (vx[2][x] + vx[3][x]) * c1_4;
  }

  // (SS|LL) type: one density block per pattern
  TwoElectronRequest ssll{"int2e_" + key + "_sa10sp1", 3,
                          IntegralSymmetry::S2kl,
                          make_patterns({"lk->s1ij", "ji->s2kl", "jk->s1il",
                                         "li->s1kj"}),
                          origin};
  vx = contract(oracle, ssll, {d.ll, d.ss, d.sl, d.ls});
  for (int x = 0; x < 3; ++x) {
    antihermitian_fill_upper(vx[1][x]);
    jk.vj[x].block(SpinorBlock::SS) += vx[0][x] * c1_2;
    jk.vj[x].block(SpinorBlock::LL) += vx[1][x] * c1_2;
    jk.vk[x].block(SpinorBlock::SL) += vx[2][x] * c1_2;
    jk.vk[x].block(SpinorBlock::LS) += vx[3][x] * c1_2;
  }

  for (int x = 0; x < 3; ++x) {
    jk.vj[x].add_adjoint();
    jk.vk[x].add_adjoint();
  }
  return jk;
}

ResponseJK giao_response_jk(const IntegralOracle& oracle,
                            const SpinorMatrix& dm) {
  RELNMR_LOG_TRACE_ENTERING();
  const auto d = split_density(oracle, dm);
  const size_t n2c = dm.n2c();
  const double c1 = 0.5 / oracle.light_speed();
  const double c1_2 = c1 * c1;
  const double c1_4 = c1_2 * c1_2;
  const auto patterns = make_patterns({"lk->s2ij", "jk->s1il"});

  ResponseJK jk{make_spinor_triple(n2c), make_spinor_triple(n2c)};

  auto vx = contract(
      oracle, {"int2e_g1", 3, IntegralSymmetry::A4ij, patterns, std::nullopt},
      {d.ll});
  for (int x = 0; x < 3; ++x) {
    jk.vj[x].block(SpinorBlock::LL) = vx[0][x];
    jk.vk[x].block(SpinorBlock::LL) = vx[1][x];
  }

  vx = contract(oracle,
                {"int2e_spgsp1spsp2", 3, IntegralSymmetry::A4ij, patterns,
                 std::nullopt},
                {d.ss});
  for (int x = 0; x < 3; ++x) {
    jk.vj[x].block(SpinorBlock::SS) = vx[0][x] * c1_4;
    jk.vk[x].block(SpinorBlock::SS) = vx[1][x] * c1_4;
  }

  vx = contract(oracle,
                {"int2e_g1spsp2", 3, IntegralSymmetry::A4ij, patterns,
                 std::nullopt},
                {d.ss, d.ls});
  for (int x = 0; x < 3; ++x) {
    jk.vj[x].block(SpinorBlock::LL) += vx[0][x] * c1_2;
    jk.vk[x].block(SpinorBlock::LS) += vx[1][x] * c1_2;
  }

  vx = contract(oracle,
                {"int2e_spgsp1", 3, IntegralSymmetry::A4ij, patterns,
                 std::nullopt},
                {d.ll, d.sl});
  for (int x = 0; x < 3; ++x) {
    jk.vj[x].block(SpinorBlock::SS) += vx[0][x] * c1_2;
    jk.vk[x].block(SpinorBlock::SL) += vx[1][x] * c1_2;
  }

  for (int x = 0; x < 3; ++x) {
    hermitian_fill_upper(jk.vj[x].data());
    jk.vk[x].add_adjoint();
  }
  return jk;
}

}  // namespace relnmr::nmr
