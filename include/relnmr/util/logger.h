// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <source_location>

namespace relnmr::util {
/**
 * @brief Log entry into a function at trace level
 *
 * @param location Call site, defaults to the caller
 */
inline void log_trace_entering(
    const std::source_location& location = std::source_location::current()) {
  spdlog::trace("Entering {}", location.function_name());
}
}  // namespace relnmr::util

/// Trace-level marker placed at the top of public operations
#define RELNMR_LOG_TRACE_ENTERING() \
  ::relnmr::util::log_trace_entering(std::source_location::current())
