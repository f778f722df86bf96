// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/core/incore_oracle.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <string>
#include <stdexcept>
#include <utility>

#include "util/hdf5_io.h"
#include "util/parallel.h"

namespace relnmr {

namespace {
constexpr double origin_match_tolerance = 1e-10;

bool same_origin(const std::optional<Vector3>& a,
                 const std::optional<Vector3>& b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a) return true;
  for (int k = 0; k < 3; ++k) {
    if (std::abs((*a)[k] - (*b)[k]) > origin_match_tolerance) return false;
  }
  return true;
}

std::string describe_origin(const std::optional<Vector3>& o) {
  if (!o) return "none";
  return fmt::format("({:.6f}, {:.6f}, {:.6f})", (*o)[0], (*o)[1], (*o)[2]);
}

int label_position(char label) { return label - 'i'; }
}  // namespace

IncoreIntegralOracle::IncoreIntegralOracle(Molecule mol, size_t n2c,
                                           double light_speed)
    : mol_(std::move(mol)), n2c_(n2c), light_speed_(light_speed) {
  if (mol_.atomic_nums.size() != mol_.n_atoms ||
      mol_.atomic_charges.size() != mol_.n_atoms ||
      mol_.coords.size() != mol_.n_atoms) {
    throw DimensionMismatch(
        fmt::format("molecule with {} atoms has inconsistent per-atom data",
                    mol_.n_atoms));
  }
}

IncoreIntegralOracle::~IncoreIntegralOracle() noexcept = default;

void IncoreIntegralOracle::add_one_electron(
    const OneElectronRequest& key, std::vector<ComplexMatrix> components) {
  const Eigen::Index n = n2c_;
  for (const auto& m : components) {
    if (m.rows() != n || m.cols() != n) {
      throw DimensionMismatch(
          fmt::format("{}: expected ({}, {}) matrices, got ({}, {})", key.name,
                      n, n, m.rows(), m.cols()));
    }
  }
  int1e_.push_back(
      {key.name, key.common_origin, key.rinv_origin, std::move(components)});
}

void IncoreIntegralOracle::add_two_electron(
    const std::string& name, const std::optional<Vector3>& common_origin,
    std::vector<ComplexMatrix> components) {
  const Eigen::Index n2 = n2c_ * n2c_;
  for (const auto& m : components) {
    if (m.rows() != n2 || m.cols() != n2) {
      throw DimensionMismatch(
          fmt::format("{}: expected ({}, {}) tensors, got ({}, {})", name, n2,
                      n2, m.rows(), m.cols()));
    }
  }
  int2e_.push_back({name, common_origin, std::move(components)});
}

const IncoreIntegralOracle::OneElectronEntry& IncoreIntegralOracle::find_one_(
    const OneElectronRequest& request) const {
  for (const auto& e : int1e_) {
    if (e.name == request.name &&
        same_origin(e.common_origin, request.common_origin) &&
        same_origin(e.rinv_origin, request.rinv_origin)) {
      return e;
    }
  }
  throw IntegralNotAvailable(fmt::format(
      "{} (common origin {}, rinv origin {})", request.name,
      describe_origin(request.common_origin),
      describe_origin(request.rinv_origin)));
}

const IncoreIntegralOracle::TwoElectronEntry& IncoreIntegralOracle::find_two_(
    const TwoElectronRequest& request) const {
  for (const auto& e : int2e_) {
    if (e.name == request.name &&
        same_origin(e.common_origin, request.common_origin)) {
      return e;
    }
  }
  throw IntegralNotAvailable(fmt::format("{} (common origin {})", request.name,
                                         describe_origin(request.common_origin)));
}

std::vector<ComplexMatrix> IncoreIntegralOracle::evaluate(
    const OneElectronRequest& request) const {
  const auto& entry = find_one_(request);
  if (static_cast<size_t>(request.ncomp) != entry.components.size()) {
    throw DimensionMismatch(
        fmt::format("{}: requested {} components, {} available", request.name,
                    request.ncomp, entry.components.size()));
  }
  return entry.components;
}

ComplexMatrix IncoreIntegralOracle::contract_component_(
    const ComplexMatrix& eri, const ContractionPattern& pattern,
    const ComplexMatrix& dm) const {
  const size_t n = n2c_;
  const int d0 = label_position(pattern.density[0]);
  const int d1 = label_position(pattern.density[1]);
  const int o0 = label_position(pattern.output[0]);
  const int o1 = label_position(pattern.output[1]);
  const bool lower_only = pattern.storage == OutputStorage::S2;

  ComplexMatrix out = ComplexMatrix::Zero(n, n);
  std::array<size_t, 4> idx;
  for (size_t i = 0; i < n; ++i)
    for (size_t j = 0; j < n; ++j) {
      idx[0] = i;
      idx[1] = j;
      const auto* eri_ij = eri.data() + (i * n + j) * n * n;
      for (size_t k = 0; k < n; ++k)
        for (size_t l = 0; l < n; ++l) {
          idx[2] = k;
          idx[3] = l;
          const size_t r = idx[o0], s = idx[o1];
          if (lower_only && r < s) continue;
          out(r, s) += eri_ij[k * n + l] * dm(idx[d0], idx[d1]);
        }
    }
  return out;
}

std::vector<std::vector<ComplexMatrix>> IncoreIntegralOracle::contract(
    const TwoElectronRequest& request,
    const std::vector<ComplexMatrix>& densities) const {
  const auto& entry = find_two_(request);
  if (static_cast<size_t>(request.ncomp) != entry.components.size()) {
    throw DimensionMismatch(
        fmt::format("{}: requested {} components, {} available", request.name,
                    request.ncomp, entry.components.size()));
  }
  const size_t npat = request.patterns.size();
  if (densities.size() != 1 && densities.size() != npat) {
    throw DimensionMismatch(
        fmt::format("{}: {} densities for {} contraction patterns",
                    request.name, densities.size(), npat));
  }
  const Eigen::Index n = n2c_;
  for (const auto& dm : densities) {
    if (dm.rows() != n || dm.cols() != n) {
      throw DimensionMismatch(fmt::format(
          "{}: density of size ({}, {}) in a basis of {} spinors",
          request.name, dm.rows(), dm.cols(), n));
    }
  }

  spdlog::trace("contracting {} [{}] with {} patterns", request.name,
                to_string(request.symmetry), npat);

  const size_t ncomp = entry.components.size();
  std::vector<std::vector<ComplexMatrix>> result(
      npat, std::vector<ComplexMatrix>(ncomp));
  parallel_for(npat * ncomp, [&](size_t task) {
    const size_t p = task / ncomp, c = task % ncomp;
    const auto& dm = densities.size() == 1 ? densities.front() : densities[p];
    result[p][c] =
        contract_component_(entry.components[c], request.patterns[p], dm);
  });
  return result;
}

void IncoreIntegralOracle::save(const std::string& path) const {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_TRUNC);
    hdf5::write_uint_attribute(file, "num_spinors", n2c_);
    hdf5::write_double_attribute(file, "light_speed", light_speed_);

    auto mol = file.createGroup("molecule");
    hdf5::save_uint_vector(mol, "atomic_nums", mol_.atomic_nums);
    Eigen::VectorXd charges = Eigen::Map<const Eigen::VectorXd>(
        mol_.atomic_charges.data(), mol_.atomic_charges.size());
    hdf5::save_vector(mol, "atomic_charges", charges);
    hdf5::save_coordinates(mol, "coords", mol_.coords);

    auto int1e = file.createGroup("int1e");
    for (size_t e = 0; e < int1e_.size(); ++e) {
      auto group = int1e.createGroup("e" + std::to_string(e));
      hdf5::write_string_attribute(group, "name", int1e_[e].name);
      if (int1e_[e].common_origin)
        hdf5::write_vector3_attribute(group, "common_origin",
                                      *int1e_[e].common_origin);
      if (int1e_[e].rinv_origin)
        hdf5::write_vector3_attribute(group, "rinv_origin",
                                      *int1e_[e].rinv_origin);
      hdf5::save_complex_stack(group, "data", int1e_[e].components);
    }

    auto int2e = file.createGroup("int2e");
    for (size_t e = 0; e < int2e_.size(); ++e) {
      auto group = int2e.createGroup("e" + std::to_string(e));
      hdf5::write_string_attribute(group, "name", int2e_[e].name);
      if (int2e_[e].common_origin)
        hdf5::write_vector3_attribute(group, "common_origin",
                                      *int2e_[e].common_origin);
      hdf5::save_complex_stack(group, "data", int2e_[e].components);
    }
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::unique_ptr<IncoreIntegralOracle> IncoreIntegralOracle::load(
    const std::string& path) {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_RDONLY);

    Molecule mol;
    auto mgroup = file.openGroup("molecule");
    mol.atomic_nums = hdf5::load_uint_vector(mgroup, "atomic_nums");
    const auto charges = hdf5::load_vector(mgroup, "atomic_charges");
    mol.atomic_charges.assign(charges.data(), charges.data() + charges.size());
    mol.coords = hdf5::load_coordinates(mgroup, "coords");
    mol.n_atoms = mol.atomic_nums.size();

    auto oracle = std::make_unique<IncoreIntegralOracle>(
        std::move(mol), hdf5::read_uint_attribute(file, "num_spinors"),
        hdf5::read_double_attribute(file, "light_speed"));

    auto int1e = file.openGroup("int1e");
    for (hsize_t e = 0; e < int1e.getNumObjs(); ++e) {
      auto group = int1e.openGroup(int1e.getObjnameByIdx(e));
      OneElectronRequest key;
      key.name = hdf5::read_string_attribute(group, "name");
      key.common_origin = hdf5::read_vector3_attribute(group, "common_origin");
      key.rinv_origin = hdf5::read_vector3_attribute(group, "rinv_origin");
      oracle->add_one_electron(key, hdf5::load_complex_stack(group, "data"));
    }

    auto int2e = file.openGroup("int2e");
    for (hsize_t e = 0; e < int2e.getNumObjs(); ++e) {
      auto group = int2e.openGroup(int2e.getObjnameByIdx(e));
      oracle->add_two_electron(
          hdf5::read_string_attribute(group, "name"),
          hdf5::read_vector3_attribute(group, "common_origin"),
          hdf5::load_complex_stack(group, "data"));
    }

    spdlog::debug(
        "loaded {} one-electron and {} two-electron operators from {}",
        oracle->num_one_electron(), oracle->num_two_electron(), path);
    return oracle;
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace relnmr
