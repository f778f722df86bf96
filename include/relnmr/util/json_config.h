// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/nmr.h>

#include <nlohmann/json.hpp>
#include <string>

namespace relnmr {
void to_json(nlohmann::json& j, const CPHFInput& input);

/**
 * @brief Read CPHF controls, keeping defaults for absent keys
 */
void from_json(const nlohmann::json& j, CPHFInput& input);

void to_json(nlohmann::json& j, const ShieldingConfig& cfg);

/**
 * @brief Read a shielding configuration, keeping defaults for absent keys
 *
 * @throws std::invalid_argument for an unknown balance label or a gauge
 * origin that is not a 3-vector
 */
void from_json(const nlohmann::json& j, ShieldingConfig& cfg);

/**
 * @brief Parse a JSON configuration file
 *
 * @throws std::runtime_error if the file cannot be read or parsed
 * @throws std::invalid_argument for invalid values
 */
ShieldingConfig load_shielding_config(const std::string& filename);

/**
 * @brief Write a configuration as pretty-printed JSON
 *
 * @throws std::runtime_error if the file cannot be written
 */
void save_shielding_config(const std::string& filename,
                           const ShieldingConfig& cfg);
}  // namespace relnmr
