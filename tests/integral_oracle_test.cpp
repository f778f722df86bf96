// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/core/incore_oracle.h>

#include <filesystem>
#include <random>
#include <string>

#include "nmr/response_jk.h"
#include "test_common.h"

namespace {
// out[r, s] = sum (ij|kl) dm[a, b] with explicit index bookkeeping
ComplexMatrix reference_contraction(const ComplexMatrix& eri,
                                    const ComplexMatrix& dm, size_t n,
                                    const ContractionPattern& p) {
  ComplexMatrix out = ComplexMatrix::Zero(n, n);
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j)
      for (size_t k = 0; k < n; ++k)
        for (size_t l = 0; l < n; ++l) {
          size_t idx[4] = {i, j, k, l};
          const size_t r = idx[p.output[0] - 'i'], s = idx[p.output[1] - 'i'];
          if (p.storage == OutputStorage::S2 && r < s) continue;
          out(r, s) += eri(i * n + j, k * n + l) *
                       dm(idx[p.density[0] - 'i'], idx[p.density[1] - 'i']);
        }
  return out;
}

std::filesystem::path temp_file(const std::string& name) {
  return std::filesystem::temp_directory_path() / name;
}
}  // namespace

//==============================================================================
// Contraction patterns
//==============================================================================

TEST(ContractionPatternTest, ParsesConventionalNotation) {
  auto p = ContractionPattern::parse("ji->s2kl");
  EXPECT_EQ(p.density[0], 'j');
  EXPECT_EQ(p.density[1], 'i');
  EXPECT_EQ(p.output[0], 'k');
  EXPECT_EQ(p.output[1], 'l');
  EXPECT_EQ(p.storage, OutputStorage::S2);
  EXPECT_EQ(p.to_string(), "ji->s2kl");

  auto q = ContractionPattern::parse("jk->s1il");
  EXPECT_EQ(q.storage, OutputStorage::S1);
  EXPECT_EQ(q.to_string(), "jk->s1il");
}

TEST(ContractionPatternTest, RejectsMalformedDescriptors) {
  EXPECT_THROW(ContractionPattern::parse("ji-s2kl"), std::invalid_argument);
  EXPECT_THROW(ContractionPattern::parse("ji->s3kl"), std::invalid_argument);
  EXPECT_THROW(ContractionPattern::parse("ji->s2km"), std::invalid_argument);
  EXPECT_THROW(ContractionPattern::parse("jj->s2kl"), std::invalid_argument);
  EXPECT_THROW(ContractionPattern::parse("ji->s2ij"), std::invalid_argument);
}

//==============================================================================
// Triangle re-expansion
//==============================================================================

TEST(TriangleFillTest, HermitianAndAntiHermitian) {
  std::mt19937 gen(5);
  ComplexMatrix lower = random_matrix(5, 5, gen);
  for (Eigen::Index i = 0; i < 5; ++i) lower(i, i) = lower(i, i).real();

  ComplexMatrix h = lower;
  nmr::hermitian_fill_upper(h);
  EXPECT_LT(max_abs_diff(h, h.adjoint()), 1e-15);
  EXPECT_EQ(h(3, 1), lower(3, 1));

  ComplexMatrix a = lower;
  for (Eigen::Index i = 0; i < 5; ++i) a(i, i) = {0.0, lower(i, i).real()};
  nmr::antihermitian_fill_upper(a);
  ComplexMatrix minus_adj = -a.adjoint();
  EXPECT_LT(max_abs_diff(a, minus_adj), 1e-15);
  EXPECT_EQ(a(4, 0), lower(4, 0));
}

TEST(TriangleFillTest, DiagonalIsLeftUntouched) {
  ComplexMatrix m = ComplexMatrix::Zero(2, 2);
  m(0, 0) = {1.0, 2.0};
  m(1, 0) = {3.0, 4.0};
  nmr::hermitian_fill_upper(m);
  EXPECT_EQ(m(0, 0), std::complex<double>(1.0, 2.0));
  EXPECT_EQ(m(0, 1), std::complex<double>(3.0, -4.0));
}

//==============================================================================
// In-core oracle
//==============================================================================

TEST(IncoreOracleTest, ContractionsMatchExplicitLoops) {
  const size_t n = 3;
  std::mt19937 gen(9);
  std::vector<ComplexMatrix> eri = {random_matrix(9, 9, gen),
                                    random_matrix(9, 9, gen)};
  IncoreIntegralOracle oracle(make_he(), n, 2.0);
  oracle.add_two_electron("int2e_test", std::nullopt, eri);

  std::vector<ContractionPattern> patterns;
  for (auto d : {"ji->s2kl", "lk->s1ij", "jk->s1il", "li->s1kj"})
    patterns.push_back(ContractionPattern::parse(d));
  TwoElectronRequest req{"int2e_test", 2, IntegralSymmetry::S2kl, patterns,
                         std::nullopt};
  std::vector<ComplexMatrix> dms;
  for (int p = 0; p < 4; ++p) dms.push_back(random_matrix(3, 3, gen));

  auto out = oracle.contract(req, dms);
  ASSERT_EQ(out.size(), 4u);
  for (size_t p = 0; p < 4; ++p) {
    ASSERT_EQ(out[p].size(), 2u);
    for (int c = 0; c < 2; ++c) {
      auto ref = reference_contraction(eri[c], dms[p], n, patterns[p]);
      EXPECT_LT(max_abs_diff(out[p][c], ref), 1e-13) << patterns[p].to_string();
    }
  }
  // S2 output keeps the strict upper triangle empty
  EXPECT_EQ(out[0][0](0, 2), std::complex<double>(0.0, 0.0));

  // A single density is used for every pattern
  auto shared = oracle.contract(req, {dms[1]});
  ASSERT_EQ(shared.size(), 4u);
  EXPECT_LT(max_abs_diff(shared[3][1],
                         reference_contraction(eri[1], dms[1], n, patterns[3])),
            1e-13);
}

TEST(IncoreOracleTest, LookupErrors) {
  std::mt19937 gen(2);
  IncoreIntegralOracle oracle(make_he(), 2, 2.0);
  Vector3 origin = {0.0, 0.0, 1.0};
  oracle.add_one_electron({"int1e_cg_sa10sp", 3, origin, std::nullopt},
                          random_components(3, 2, gen));

  EXPECT_EQ(oracle.evaluate({"int1e_cg_sa10sp", 3, origin, std::nullopt}).size(),
            3u);
  // Origins match within tolerance only
  Vector3 nearby = {0.0, 0.0, 1.0 + 1e-12};
  EXPECT_NO_THROW(oracle.evaluate({"int1e_cg_sa10sp", 3, nearby, std::nullopt}));
  Vector3 elsewhere = {0.0, 0.0, 1.1};
  EXPECT_THROW(oracle.evaluate({"int1e_cg_sa10sp", 3, elsewhere, std::nullopt}),
               IntegralNotAvailable);
  EXPECT_THROW(oracle.evaluate({"int1e_cg_sa10sp", 3, std::nullopt, std::nullopt}),
               IntegralNotAvailable);
  EXPECT_THROW(oracle.evaluate({"int1e_cg_sa10sp", 9, origin, std::nullopt}),
               DimensionMismatch);

  TwoElectronRequest req{"int2e_g1", 3, IntegralSymmetry::A4ij,
                         {ContractionPattern::parse("lk->s2ij")}, std::nullopt};
  EXPECT_THROW(oracle.contract(req, {ComplexMatrix::Zero(2, 2)}),
               IntegralNotAvailable);

  EXPECT_THROW(oracle.add_one_electron({"bad", 1, std::nullopt, std::nullopt},
                                       {ComplexMatrix::Zero(3, 3)}),
               DimensionMismatch);
  EXPECT_THROW(oracle.add_two_electron("bad", std::nullopt,
                                       {ComplexMatrix::Zero(2, 2)}),
               DimensionMismatch);
}

TEST(IncoreOracleTest, DensityCountMustMatchPatterns) {
  std::mt19937 gen(4);
  IncoreIntegralOracle oracle(make_he(), 2, 2.0);
  oracle.add_two_electron("int2e_test", std::nullopt, {random_matrix(4, 4, gen)});
  TwoElectronRequest req{"int2e_test", 1, IntegralSymmetry::S1,
                         {ContractionPattern::parse("lk->s1ij"),
                          ContractionPattern::parse("jk->s1il"),
                          ContractionPattern::parse("li->s1kj")},
                         std::nullopt};
  ComplexMatrix d = ComplexMatrix::Zero(2, 2);
  EXPECT_THROW(oracle.contract(req, {d, d}), DimensionMismatch);
  EXPECT_THROW(oracle.contract(req, {ComplexMatrix::Zero(3, 3)}),
               DimensionMismatch);
}

TEST(IncoreOracleTest, RejectsInconsistentMolecule) {
  Molecule mol = make_heh();
  mol.coords.pop_back();
  EXPECT_THROW(IncoreIntegralOracle(mol, 2, 2.0), DimensionMismatch);
}

TEST(IncoreOracleTest, HDF5RoundTrip) {
  const auto path = temp_file("relnmr_oracle_roundtrip.h5");
  SyntheticOptions opt;
  opt.n2c = 2;
  opt.gauge_origins = {{0.1, 0.2, 0.3}};
  auto mol = make_heh();
  auto oracle = make_synthetic_oracle(mol, opt);
  oracle->save(path.string());

  auto loaded = IncoreIntegralOracle::load(path.string());
  EXPECT_EQ(loaded->num_spinors(), 2u);
  EXPECT_DOUBLE_EQ(loaded->light_speed(), opt.light_speed);
  EXPECT_EQ(loaded->molecule().n_atoms, 2u);
  EXPECT_EQ(loaded->molecule().atomic_nums[1], 1u);
  EXPECT_DOUBLE_EQ(loaded->molecule().coords[1][2], mol.coords[1][2]);
  EXPECT_EQ(loaded->num_one_electron(), oracle->num_one_electron());
  EXPECT_EQ(loaded->num_two_electron(), oracle->num_two_electron());

  OneElectronRequest req{"int1e_cg_sa10sa01", 9, opt.gauge_origins[0],
                         mol.coords[1]};
  auto a = oracle->evaluate(req);
  auto b = loaded->evaluate(req);
  ASSERT_EQ(b.size(), 9u);
  for (int c = 0; c < 9; ++c) EXPECT_EQ(max_abs_diff(a[c], b[c]), 0.0);

  TwoElectronRequest req2{"int2e_giao_sa10sp1", 3, IntegralSymmetry::S2kl,
                          {ContractionPattern::parse("jk->s1il")},
                          std::nullopt};
  std::mt19937 gen(3);
  ComplexMatrix dm = random_hermitian(2, gen);
  auto va = oracle->contract(req2, {dm});
  auto vb = loaded->contract(req2, {dm});
  EXPECT_LT(max_abs_diff(va[0][2], vb[0][2]), 1e-15);
  std::filesystem::remove(path);
}
