// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <relnmr/config.h>

#include <cstddef>
#include <cstdint>
#include <exception>

#ifdef RELNMR_ENABLE_OPENMP
#include <omp.h>
#endif

namespace relnmr {
/**
 * @brief Run f(0) ... f(n-1), in parallel when built with OpenMP
 *
 * Iterations must write disjoint outputs. The first exception raised by any
 * iteration is rethrown on the calling thread after the loop.
 */
template <class Func>
void parallel_for(size_t n, Func&& f) {
#ifdef RELNMR_ENABLE_OPENMP
  std::exception_ptr error = nullptr;
#pragma omp parallel for schedule(dynamic)
  for (int64_t i = 0; i < static_cast<int64_t>(n); ++i) {
    try {
      f(static_cast<size_t>(i));
    } catch (...) {
#pragma omp critical(relnmr_parallel_for_error)
      {
        if (!error) error = std::current_exception();
      }
    }
  }
  if (error) std::rethrow_exception(error);
#else
  for (size_t i = 0; i < n; ++i) f(i);
#endif
}
}  // namespace relnmr
