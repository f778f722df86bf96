// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

// CODATA version selectors
#define RELNMR_CODATA_2022 2022
#define RELNMR_CODATA_2018 2018
#define RELNMR_CODATA_2014 2014

#ifndef RELNMR_CODATA_VERSION
#define RELNMR_CODATA_VERSION RELNMR_CODATA_2022
#endif

/**
 * @file constants.h
 * @brief Physical constants entering relativistic magnetic properties
 *
 * Values are kept per CODATA release in version-specific namespaces. The
 * default namespace relnmr::constants exposes the release selected by
 * RELNMR_CODATA_VERSION.
 */
namespace relnmr::constants {

namespace codata_2022 {
static constexpr double fine_structure_constant = 7.2973525643e-3;  // α
}  // namespace codata_2022

namespace codata_2018 {
static constexpr double fine_structure_constant = 7.2973525693e-3;  // α
}  // namespace codata_2018

namespace codata_2014 {
static constexpr double fine_structure_constant = 7.2973525664e-3;  // α
}  // namespace codata_2014

#if RELNMR_CODATA_VERSION == RELNMR_CODATA_2022
using namespace codata_2022;
#elif RELNMR_CODATA_VERSION == RELNMR_CODATA_2018
using namespace codata_2018;
#elif RELNMR_CODATA_VERSION == RELNMR_CODATA_2014
using namespace codata_2014;
#else
#error "Unsupported RELNMR_CODATA_VERSION"
#endif

/// Speed of light in atomic units, c = 1/α
static constexpr double speed_of_light_au = 1.0 / fine_structure_constant;

/**
 * @brief Conversion of a shielding tensor in atomic units to ppm
 *
 * @param light_speed Speed of light in atomic units
 * @return 1e6 / c^2
 */
constexpr double ppm_factor(double light_speed) {
  return 1e6 / (light_speed * light_speed);
}
}  // namespace relnmr::constants
