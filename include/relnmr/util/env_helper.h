// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>

namespace relnmr::env {

/**
 * @brief Get environment variable value with type conversion
 * @tparam T Type to convert the environment variable to
 * @param key Environment variable name
 * @param default_value Default value if variable not set
 * @return Environment variable value, or default_value when the variable is
 * unset or does not parse as T
 */
template <class T>
T get(const std::string& key, const T& default_value = {}) {
  const char* var = std::getenv(key.c_str());
  if (var == nullptr) return default_value;
  T value = default_value;
  std::istringstream ss(var);
  if (!(ss >> value)) return default_value;
  return value;
}

/**
 * @brief spdlog level named by an environment variable
 *
 * Accepts the spdlog level names (trace, debug, info, warn, err, critical,
 * off). An unrecognized name falls back to @p fallback.
 */
inline spdlog::level::level_enum log_level(
    const std::string& key, spdlog::level::level_enum fallback) {
  const auto name = get<std::string>(key, "");
  if (name.empty()) return fallback;
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") return fallback;
  return level;
}

}  // namespace relnmr::env
