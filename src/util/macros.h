// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>

#include <stdexcept>
#include <string>

#include "util/timer.h"

/**
 * @brief Macro to time a code block execution
 * @param call Code to execute
 * @param name Name for the timer
 */
#define TIMEIT(call, name)                  \
  {                                         \
    ::relnmr::AutoTimer timeit_timer(name); \
    call;                                   \
  }

/**
 * @brief Verify input and raise std::invalid_argument if false
 * @param expr Expression to verify
 * @param msg Error message
 */
#define RELNMR_VERIFY_INPUT(expr, msg) \
  if (!static_cast<bool>(expr))        \
    throw std::invalid_argument(std::string("InputError: ") + std::string(msg));

/**
 * @brief Verify a shape relation and raise DimensionMismatch if false
 * @param expr Expression to verify
 * @param msg Error message
 */
#define RELNMR_VERIFY_DIMENSION(expr, msg) \
  if (!static_cast<bool>(expr))            \
    throw ::relnmr::DimensionMismatch(     \
        fmt::format("{}:{}: {}", __FILE__, __LINE__, std::string(msg)));
