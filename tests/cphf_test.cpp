// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>
#include <relnmr/core/exceptions.h>

#include <random>
#include <stdexcept>

#include "nmr/cphf.h"
#include "test_common.h"

using nmr::MOTriple;

class CPHFTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ref = make_reference(n2c, nocc, light_speed);
    std::mt19937 gen(17);
    const auto nmo = static_cast<Eigen::Index>(2 * n2c);
    for (int x = 0; x < 3; ++x) {
      h1[x] = random_matrix(nmo, nocc, gen);
      s1[x] = random_matrix(nmo, nocc, gen) * 0.1;
    }
  }

  const size_t n2c = 4;
  const size_t nocc = 2;
  const double light_speed = 3.0;
  ReferenceState ref;
  MOTriple h1, s1;
};

TEST_F(CPHFTest, UncoupledSumOverStates) {
  auto r = nmr::solve_uncoupled(ref, h1, s1);
  EXPECT_EQ(r.status, CPHFStatus::Uncoupled);
  EXPECT_EQ(r.iterations, 0);

  const auto e = ref.mo_energy;
  for (int x = 0; x < 3; ++x) {
    ASSERT_EQ(r.mo1[x].rows(), 8);
    ASSERT_EQ(r.mo1[x].cols(), 2);
    for (Eigen::Index i = 0; i < 2; ++i) {
      const double ei = e[n2c + i];
      for (Eigen::Index a = 0; a < 8; ++a) {
        if (ref.mo_occ[a] > 0) {
          EXPECT_LT(std::abs(r.mo1[x](a, i) + 0.5 * s1[x](a, i)), 1e-14);
        } else {
          auto expected = -(h1[x](a, i) - s1[x](a, i) * ei) / (e[a] - ei);
          EXPECT_LT(std::abs(r.mo1[x](a, i) - expected), 1e-13);
        }
      }
      for (Eigen::Index j = 0; j < 2; ++j) {
        const double ej = e[n2c + j];
        const auto row = static_cast<Eigen::Index>(n2c) + i;
        auto expected = h1[x](row, j) - s1[x](row, j) * 0.5 * (ei + ej);
        EXPECT_LT(std::abs(r.mo_e1[x](i, j) - expected), 1e-13);
      }
    }
  }
}

TEST_F(CPHFTest, SinglePassEvaluatesPotentialOnce) {
  FakeResponsePotential scf(2 * n2c, 0.05);
  CPHFInput input;
  auto r = nmr::solve_cphf(nmr::make_induced_potential(scf, ref), ref, h1, s1,
                           input);
  EXPECT_EQ(r.status, CPHFStatus::SinglePass);
  EXPECT_EQ(r.iterations, 1);
  EXPECT_EQ(scf.calls, 1);
  ASSERT_EQ(scf.seen_direct_scf.size(), 1u);
  EXPECT_FALSE(scf.seen_direct_scf[0]);
  EXPECT_TRUE(scf.seen_hermitian[0]);
  EXPECT_TRUE(scf.direct_scf());

  // The potential shifts the virtual rows away from the uncoupled answer
  auto plain = nmr::solve_uncoupled(ref, h1, s1);
  EXPECT_GT(max_abs_diff(plain.mo1[0], r.mo1[0]), 1e-8);
}

TEST_F(CPHFTest, CoupledIterationReachesFixedPoint) {
  FakeResponsePotential scf(2 * n2c, 0.05);
  auto vind = nmr::make_induced_potential(scf, ref);
  CPHFInput input;
  input.max_iteration = 100;
  input.tolerance = 1e-11;
  auto r = nmr::solve_cphf(vind, ref, h1, s1, input);
  EXPECT_EQ(r.status, CPHFStatus::Converged);
  EXPECT_LT(r.residual, 1e-11);
  EXPECT_GT(r.iterations, 1);
  EXPECT_LT(r.iterations, 100);

  // mo1[a,i] = -(h1 - s1 e_i + v1[mo1])[a,i] / (e_a - e_i) on virtual rows
  auto v1 = vind(r.mo1);
  for (int x = 0; x < 3; ++x)
    for (Eigen::Index i = 0; i < 2; ++i) {
      const double ei = ref.mo_energy[n2c + i];
      for (Eigen::Index a = 0; a < 8; ++a) {
        if (ref.mo_occ[a] > 0) continue;
        auto rhs = -(h1[x](a, i) - s1[x](a, i) * ei + v1[x](a, i)) /
                   (ref.mo_energy[a] - ei);
        EXPECT_LT(std::abs(r.mo1[x](a, i) - rhs), 1e-9);
      }
    }
  EXPECT_TRUE(scf.direct_scf());
}

TEST_F(CPHFTest, ReportsExhaustedIterationBudget) {
  FakeResponsePotential scf(2 * n2c, 0.05);
  CPHFInput input;
  input.max_iteration = 2;
  input.tolerance = 1e-300;
  auto r = nmr::solve_cphf(nmr::make_induced_potential(scf, ref), ref, h1, s1,
                           input);
  EXPECT_EQ(r.status, CPHFStatus::MaxIterationsReached);
  EXPECT_EQ(r.iterations, 2);
  EXPECT_GT(r.residual, 0.0);
  EXPECT_EQ(scf.calls, 2);
  EXPECT_TRUE(r.mo1[2].allFinite());
}

TEST_F(CPHFTest, RejectsEmptyIterationBudget) {
  FakeResponsePotential scf(2 * n2c, 0.05);
  CPHFInput input;
  input.max_iteration = 0;
  EXPECT_THROW(nmr::solve_cphf(nmr::make_induced_potential(scf, ref), ref, h1,
                               s1, input),
               std::invalid_argument);
  EXPECT_EQ(scf.calls, 0);
}

TEST_F(CPHFTest, DirectSCFRestoredWhenPotentialThrows) {
  FakeResponsePotential scf(2 * n2c, 0.05);
  scf.throw_on_call = true;
  EXPECT_THROW(nmr::solve_cphf(nmr::make_induced_potential(scf, ref), ref, h1,
                               s1, CPHFInput{}),
               std::runtime_error);
  EXPECT_TRUE(scf.direct_scf());
  ASSERT_EQ(scf.seen_direct_scf.size(), 1u);
  EXPECT_FALSE(scf.seen_direct_scf[0]);

  // The response-mode lock is released as well
  ASSERT_TRUE(scf.response_mode_mutex().try_lock());
  scf.response_mode_mutex().unlock();

  // A disabled flag stays disabled
  scf.set_direct_scf(false);
  EXPECT_THROW(nmr::solve_cphf(nmr::make_induced_potential(scf, ref), ref, h1,
                               s1, CPHFInput{}),
               std::runtime_error);
  EXPECT_FALSE(scf.direct_scf());
}

TEST_F(CPHFTest, ShapeChecks) {
  MOTriple bad = h1;
  bad[1] = ComplexMatrix::Zero(8, 3);
  EXPECT_THROW(nmr::solve_uncoupled(ref, bad, s1), DimensionMismatch);
  EXPECT_THROW(nmr::mat_ao2mo(ComplexMatrix::Zero(6, 6), ref),
               DimensionMismatch);
  EXPECT_THROW(nmr::make_rdm1_1(bad, ref), DimensionMismatch);
}

TEST_F(CPHFTest, FirstOrderDensityIsHermitian) {
  auto dm1 = nmr::make_rdm1_1(h1, ref);
  ASSERT_EQ(dm1.size(), 3u);
  for (const auto& d : dm1) {
    ASSERT_EQ(d.rows(), 8);
    EXPECT_LT(max_abs_diff(d, d.adjoint()), 1e-13);
  }
}

TEST(ReferenceStateTest, DensityAndValidation) {
  auto ref = make_reference(3, 2, 3.0);
  EXPECT_EQ(ref.num_occupied(), 2u);
  auto dm = ref.make_rdm1();
  EXPECT_LT(max_abs_diff(dm, dm.adjoint()), 1e-13);
  // Orthonormal orbitals: tr(D) = number of electrons
  EXPECT_NEAR(dm.trace().real(), 2.0, 1e-12);
  EXPECT_NO_THROW(ref.validate(6));
  EXPECT_THROW(ref.validate(8), DimensionMismatch);

  ReferenceState broken = ref;
  broken.mo_occ.conservativeResize(5);
  EXPECT_THROW(broken.validate(6), DimensionMismatch);
}
