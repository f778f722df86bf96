// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/nmr/shielding_solver.h>
#include <relnmr/util/hdf5_checkpoint.h>

#include <utility>

#include "nmr/shielding_impl.h"

namespace relnmr {
std::unique_ptr<Shielding> Shielding::make_dhf_shielding(
    std::shared_ptr<const IntegralOracle> oracle,
    std::shared_ptr<const ReferenceState> reference,
    std::shared_ptr<ResponsePotential> scf, const ShieldingConfig& cfg,
    std::shared_ptr<CheckpointSink> checkpoint) {
  if (!checkpoint && !cfg.checkpoint_file.empty()) {
    checkpoint = std::make_shared<HDF5Checkpoint>(cfg.checkpoint_file);
  }
  auto impl = std::make_unique<ShieldingImpl>(
      std::move(oracle), std::move(reference), std::move(scf), cfg,
      std::move(checkpoint));
  return std::unique_ptr<Shielding>(new Shielding(std::move(impl)));
}

Shielding::Shielding(std::unique_ptr<ShieldingImpl> impl)
    : impl_(std::move(impl)) {}

Shielding::~Shielding() noexcept = default;

const ShieldingContext& Shielding::run() { return impl_->run(); }

const ShieldingContext& Shielding::context() const { return impl_->context(); }

SpinorTriple Shielding::make_h10() const { return impl_->make_h10(); }

SpinorTriple Shielding::make_s10() const { return impl_->make_s10(); }

FirstOrderResponse Shielding::solve_mo1() const { return impl_->solve_mo1(); }

std::vector<Eigen::Matrix3d> Shielding::dia() const { return impl_->dia(); }

std::vector<ParamagneticTerms> Shielding::para(
    const FirstOrderResponse& mo1) const {
  return impl_->para(mo1);
}
}  // namespace relnmr
