// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/reference_state.h>

#include <string>

namespace relnmr {
/**
 * @brief Write mo_coeff, mo_energy and mo_occ to group "reference" of an
 * HDF5 file, creating the file if it does not exist
 * @throws std::runtime_error on HDF5 failure
 */
void save_reference_state(const std::string& path, const ReferenceState& ref);

/**
 * @brief Read group "reference" written by save_reference_state
 * @throws std::runtime_error if the file is missing or malformed
 */
ReferenceState load_reference_state(const std::string& path);
}  // namespace relnmr
