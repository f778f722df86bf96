// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <stdexcept>
#include <string>

namespace relnmr {
/**
 * @brief Raised when a physical term is requested that has no
 * implementation (e.g. the Gaunt two-electron correction)
 */
class UnsupportedFeature : public std::logic_error {
 public:
  explicit UnsupportedFeature(const std::string& what)
      : std::logic_error("UnsupportedFeature: " + what) {}
};

/**
 * @brief Raised when matrix dimensions disagree with the spinor basis or when
 * an atom index lies outside the molecule
 */
class DimensionMismatch : public std::invalid_argument {
 public:
  explicit DimensionMismatch(const std::string& what)
      : std::invalid_argument("DimensionMismatch: " + what) {}
};

/**
 * @brief Raised by an integral oracle that cannot provide a requested
 * operator
 */
class IntegralNotAvailable : public std::out_of_range {
 public:
  explicit IntegralNotAvailable(const std::string& what)
      : std::out_of_range("IntegralNotAvailable: " + what) {}
};
}  // namespace relnmr
