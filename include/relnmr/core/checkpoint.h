// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/types.h>

#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Write-only side channel for intermediate operators
 *
 * Nothing stored here is read back by the shielding calculation.
 */
class CheckpointSink {
 public:
  virtual ~CheckpointSink() = default;

  /**
   * @brief Store a stack of matrices under a slash-separated key
   *
   * An existing entry with the same key is replaced.
   */
  virtual void store(const std::string& key,
                     const std::vector<ComplexMatrix>& matrices) = 0;
};
}  // namespace relnmr
