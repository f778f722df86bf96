// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <relnmr/core/checkpoint.h>
#include <relnmr/core/incore_oracle.h>
#include <relnmr/core/molecule.h>
#include <relnmr/core/reference_state.h>
#include <relnmr/core/response_potential.h>

#include <Eigen/QR>
#include <atomic>
#include <complex>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
using namespace relnmr;

inline ComplexMatrix random_matrix(Eigen::Index rows, Eigen::Index cols,
                                   std::mt19937& gen) {
  std::uniform_real_distribution<double> dist(-0.5, 0.5);
  ComplexMatrix m(rows, cols);
  for (Eigen::Index i = 0; i < rows; ++i)
    for (Eigen::Index j = 0; j < cols; ++j) {
      const double re = dist(gen);
      m(i, j) = std::complex<double>(re, dist(gen));
    }
  return m;
}

inline ComplexMatrix random_hermitian(Eigen::Index n, std::mt19937& gen) {
  ComplexMatrix m = random_matrix(n, n, gen);
  return (m + m.adjoint()) * 0.5;
}

inline std::vector<ComplexMatrix> random_components(int ncomp, Eigen::Index n,
                                                    std::mt19937& gen,
                                                    bool hermitian = false) {
  std::vector<ComplexMatrix> comps;
  for (int c = 0; c < ncomp; ++c)
    comps.push_back(hermitian ? random_hermitian(n, gen)
                              : random_matrix(n, n, gen));
  return comps;
}

// (ij|kl) = conj((ji|lk)), the symmetry of the GIAO two-electron families
inline ComplexMatrix random_eri(size_t n, std::mt19937& gen) {
  const auto n2 = static_cast<Eigen::Index>(n * n);
  ComplexMatrix t = random_matrix(n2, n2, gen);
  ComplexMatrix s(n2, n2);
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j)
      for (size_t k = 0; k < n; ++k)
        for (size_t l = 0; l < n; ++l)
          s(i * n + j, k * n + l) =
              0.5 * (t(i * n + j, k * n + l) + std::conj(t(j * n + i, l * n + k)));
  return s;
}

inline std::vector<ComplexMatrix> random_eri_components(size_t n,
                                                        std::mt19937& gen) {
  return {random_eri(n, gen), random_eri(n, gen), random_eri(n, gen)};
}

inline Molecule make_he() {
  Molecule mol;
  mol.atomic_nums = {2};
  mol.n_atoms = mol.atomic_nums.size();
  mol.atomic_charges = {2.0};
  mol.coords = {{0.0, 0.0, 0.0}};
  return mol;
}

inline Molecule make_heh() {
  Molecule mol;
  mol.atomic_nums = {2, 1};
  mol.n_atoms = mol.atomic_nums.size();
  mol.atomic_charges = {2.0, 1.0};
  mol.coords = {{0.0, 0.0, 0.0}, {0.0, 0.0, 1.4632}};
  return mol;
}

/**
 * @brief Settings of the synthetic integral source
 */
struct SyntheticOptions {
  size_t n2c = 4;             ///< Two-component basis size
  double light_speed = 3.0;   ///< Small value so small-component terms matter
  unsigned seed = 7;          ///< Random seed
  std::vector<Vector3> gauge_origins;  ///< Origins that get "cg" integrals
  bool single_center = false;  ///< All basis functions on one center
};

/**
 * @brief In-core oracle filled with every operator the shielding requests
 *
 * Integrals are random but carry the Hermiticity of the physical operators.
 * With single_center the GIAO derivative families vanish and the "cg"
 * integrals equal the GIAO ones, as they do for one atom when the gauge
 * origin sits on the nucleus.
 */
inline std::shared_ptr<IncoreIntegralOracle> make_synthetic_oracle(
    const Molecule& mol, const SyntheticOptions& opt = {}) {
  std::mt19937 gen(opt.seed);
  const size_t n = opt.n2c;
  const auto ni = static_cast<Eigen::Index>(n);
  auto oracle =
      std::make_shared<IncoreIntegralOracle>(mol, n, opt.light_speed);

  auto zeros = [&](int ncomp) {
    ComplexMatrix z = ComplexMatrix::Zero(ni, ni);
    return std::vector<ComplexMatrix>(ncomp, z);
  };
  auto zero_eri = [&]() {
    ComplexMatrix z = ComplexMatrix::Zero(ni * ni, ni * ni);
    return std::vector<ComplexMatrix>(3, z);
  };
  auto add1 = [&](const std::string& name, std::optional<Vector3> origin,
                  std::optional<Vector3> rinv, std::vector<ComplexMatrix> c) {
    OneElectronRequest key{name, static_cast<int>(c.size()), origin, rinv};
    oracle->add_one_electron(key, std::move(c));
  };
  const bool g_terms = !opt.single_center;

  auto sa10sp = random_components(3, ni, gen);
  auto sa10nucsp = random_components(3, ni, gen);
  add1("int1e_giao_sa10sp", std::nullopt, std::nullopt, sa10sp);
  add1("int1e_giao_sa10nucsp", std::nullopt, std::nullopt, sa10nucsp);
  for (auto name : {"int1e_spgsp", "int1e_gnuc", "int1e_spgnucsp",
                    "int1e_govlp"}) {
    add1(name, std::nullopt, std::nullopt,
         g_terms ? random_components(3, ni, gen, true) : zeros(3));
  }

  auto ssss = random_eri_components(n, gen);
  auto ssll = random_eri_components(n, gen);
  oracle->add_two_electron("int2e_giao_sa10sp1spsp2", std::nullopt, ssss);
  oracle->add_two_electron("int2e_giao_sa10sp1", std::nullopt, ssll);
  for (auto name : {"int2e_g1", "int2e_spgsp1spsp2", "int2e_g1spsp2",
                    "int2e_spgsp1"}) {
    oracle->add_two_electron(name, std::nullopt,
                             g_terms ? random_eri_components(n, gen)
                                     : zero_eri());
  }

  for (const auto& origin : opt.gauge_origins) {
    add1("int1e_cg_sa10sp", origin, std::nullopt,
         opt.single_center ? sa10sp : random_components(3, ni, gen));
    add1("int1e_cg_sa10nucsp", origin, std::nullopt,
         opt.single_center ? sa10nucsp : random_components(3, ni, gen));
    oracle->add_two_electron(
        "int2e_cg_sa10sp1spsp2", origin,
        opt.single_center ? ssss : random_eri_components(n, gen));
    oracle->add_two_electron(
        "int2e_cg_sa10sp1", origin,
        opt.single_center ? ssll : random_eri_components(n, gen));
  }

  for (const auto& center : mol.coords) {
    auto t11 = random_components(9, ni, gen);
    add1("int1e_giao_sa10sa01", std::nullopt, center, t11);
    add1("int1e_spgsa01", std::nullopt, center,
         g_terms ? random_components(9, ni, gen) : zeros(9));
    add1("int1e_sa01sp", std::nullopt, center, random_components(3, ni, gen));
    for (const auto& origin : opt.gauge_origins) {
      add1("int1e_cg_sa10sa01", origin, center,
           opt.single_center ? t11 : random_components(9, ni, gen));
    }
  }
  return oracle;
}

/**
 * @brief Orthonormal orbitals with n2c negative-energy states first
 *
 * Positive-energy levels start at -1 Hartree in steps of 0.4; the lowest
 * nocc of them are singly occupied.
 */
inline ReferenceState make_reference(size_t n2c, size_t nocc,
                                     double light_speed, unsigned seed = 11) {
  std::mt19937 gen(seed);
  const auto n4c = static_cast<Eigen::Index>(2 * n2c);
  Eigen::HouseholderQR<ComplexMatrix> qr(random_matrix(n4c, n4c, gen));
  ReferenceState ref;
  ref.mo_coeff = qr.householderQ() * ComplexMatrix::Identity(n4c, n4c);
  ref.mo_energy.resize(n4c);
  ref.mo_occ = Eigen::VectorXd::Zero(n4c);
  const double mc2 = 2.0 * light_speed * light_speed;
  for (size_t p = 0; p < n2c; ++p) {
    ref.mo_energy[p] = -mc2 - 0.3 * static_cast<double>(n2c - p);
    ref.mo_energy[n2c + p] = -1.0 + 0.4 * static_cast<double>(p);
    if (p < nocc) ref.mo_occ[n2c + p] = 1.0;
  }
  return ref;
}

/**
 * @brief Linear response potential v = s B D B^H that records its calls
 */
class FakeResponsePotential : public ResponsePotential {
 public:
  FakeResponsePotential(size_t n4c, double strength, unsigned seed = 3)
      : strength_(strength) {
    std::mt19937 gen(seed);
    const auto n = static_cast<Eigen::Index>(n4c);
    b_ = random_matrix(n, n, gen);
    b_ /= b_.norm();
  }

  std::vector<ComplexMatrix> get_response_potential(
      const std::vector<ComplexMatrix>& trial_densities,
      bool hermitian) override {
    ++calls;
    seen_direct_scf.push_back(direct_scf_);
    seen_hermitian.push_back(hermitian);
    if (throw_on_call) throw std::runtime_error("potential build failed");
    std::vector<ComplexMatrix> v;
    for (const auto& d : trial_densities) {
      ComplexMatrix vd = strength_ * (b_ * d * b_.adjoint());
      v.push_back(std::move(vd));
    }
    return v;
  }

  bool direct_scf() const override { return direct_scf_; }
  void set_direct_scf(bool enabled) override { direct_scf_ = enabled; }

  int calls = 0;
  bool throw_on_call = false;
  std::vector<bool> seen_direct_scf;
  std::vector<bool> seen_hermitian;

 private:
  ComplexMatrix b_;
  double strength_;
  bool direct_scf_ = true;
};

/**
 * @brief Oracle decorator counting evaluate and contract calls
 */
class CountingOracle : public IntegralOracle {
 public:
  explicit CountingOracle(std::shared_ptr<const IntegralOracle> inner)
      : inner_(std::move(inner)) {}

  const Molecule& molecule() const override { return inner_->molecule(); }
  size_t num_spinors() const override { return inner_->num_spinors(); }
  double light_speed() const override { return inner_->light_speed(); }

  std::vector<ComplexMatrix> evaluate(
      const OneElectronRequest& request) const override {
    ++one_electron_calls;
    return inner_->evaluate(request);
  }

  std::vector<std::vector<ComplexMatrix>> contract(
      const TwoElectronRequest& request,
      const std::vector<ComplexMatrix>& densities) const override {
    ++two_electron_calls;
    return inner_->contract(request, densities);
  }

  mutable std::atomic<int> one_electron_calls{0};
  mutable std::atomic<int> two_electron_calls{0};

 private:
  std::shared_ptr<const IntegralOracle> inner_;
};

class RecordingCheckpoint : public CheckpointSink {
 public:
  void store(const std::string& key,
             const std::vector<ComplexMatrix>& matrices) override {
    keys.push_back(key);
    stored.push_back(matrices);
  }

  std::vector<std::string> keys;
  std::vector<std::vector<ComplexMatrix>> stored;
};

/// Largest elementwise |a - b|
inline double max_abs_diff(const ComplexMatrix& a, const ComplexMatrix& b) {
  return (a - b).cwiseAbs().maxCoeff();
}
