// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <relnmr/config.h>

#include <string>

namespace relnmr {
/// An enum to classify the available magnetic balance schemes relating the
/// small-component basis to the large-component basis
enum class MagneticBalance {
  RestrictedMagneticBalance,  ///< RMB, field-dependent small-component basis
  RestrictedKineticBalance    ///< RKB, field-independent small-component basis
};

/// Convert a MagneticBalance to a `std::string`
inline std::string to_string(MagneticBalance b) {
  switch (b) {
    case MagneticBalance::RestrictedMagneticBalance:
      return "RMB";
    case MagneticBalance::RestrictedKineticBalance:
      return "RKB";
    default:
      return "<Unknown>";
  }
}

/**
 * @brief Parse a magnetic balance label
 *
 * @param label "RMB" or "RKB" (case-insensitive)
 * @throws std::invalid_argument for any other label
 */
MagneticBalance magnetic_balance_from_string(const std::string& label);

/// An enum to classify the gauge treatment of the magnetic vector potential
enum class GaugeMode {
  GIAO,        ///< Gauge-including atomic orbitals
  CommonGauge  ///< Fixed common gauge origin
};

/// Integral-name key of a GaugeMode ("giao" or "cg")
inline std::string to_string(GaugeMode g) {
  switch (g) {
    case GaugeMode::GIAO:
      return "giao";
    case GaugeMode::CommonGauge:
      return "cg";
    default:
      return "<Unknown>";
  }
}

/// Named n2c x n2c quadrant of a four-component spinor matrix
enum class SpinorBlock {
  LL,  ///< large-large
  LS,  ///< large-small
  SL,  ///< small-large
  SS   ///< small-small
};

/// Convert a SpinorBlock to a `std::string`
inline std::string to_string(SpinorBlock b) {
  switch (b) {
    case SpinorBlock::LL:
      return "LL";
    case SpinorBlock::LS:
      return "LS";
    case SpinorBlock::SL:
      return "SL";
    case SpinorBlock::SS:
      return "SS";
    default:
      return "<Unknown>";
  }
}

/// Permutation symmetry an integral oracle may exploit in a two-electron
/// contraction
enum class IntegralSymmetry {
  S1,    ///< No symmetry
  S2kl,  ///< Hermitian in the ket pair (ij|kl) = (ij|lk)*
  A4ij   ///< Anti-symmetric in the bra pair, Hermitian in the ket pair
};

/// Convert an IntegralSymmetry to a `std::string`
inline std::string to_string(IntegralSymmetry s) {
  switch (s) {
    case IntegralSymmetry::S1:
      return "s1";
    case IntegralSymmetry::S2kl:
      return "s2kl";
    case IntegralSymmetry::A4ij:
      return "a4ij";
    default:
      return "<Unknown>";
  }
}

/// Storage of a contracted two-index result
enum class OutputStorage {
  S1,  ///< Full square matrix
  S2   ///< Lower triangle only, the upper triangle is left zero
};

/// Final state of a coupled-perturbed Hartree-Fock solve
enum class CPHFStatus {
  Uncoupled,            ///< Sum-over-states solution without response
  SinglePass,           ///< One explicit evaluation of the induced potential
  Converged,            ///< Iterated until the residual met the tolerance
  MaxIterationsReached  ///< Iteration budget exhausted above tolerance
};

/// Convert a CPHFStatus to a `std::string`
inline std::string to_string(CPHFStatus s) {
  switch (s) {
    case CPHFStatus::Uncoupled:
      return "uncoupled";
    case CPHFStatus::SinglePass:
      return "single-pass";
    case CPHFStatus::Converged:
      return "converged";
    case CPHFStatus::MaxIterationsReached:
      return "max-iterations-reached";
    default:
      return "<Unknown>";
  }
}
}  // namespace relnmr
