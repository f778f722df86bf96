// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <relnmr/core/checkpoint.h>

#include <string>
#include <vector>

namespace relnmr {
/**
 * @brief Checkpoint sink writing complex matrix stacks to an HDF5 file
 *
 * Each store() opens the file, writes a (n, rows, cols) dataset of the
 * h5py-compatible {r, i} compound type at the slash-separated key (creating
 * intermediate groups) and closes the file again. HDF5 failures surface
 * as std::runtime_error.
 */
class HDF5Checkpoint : public CheckpointSink {
 public:
  /**
   * @param path File to write; created when it does not exist
   */
  explicit HDF5Checkpoint(std::string path);

  void store(const std::string& key,
             const std::vector<ComplexMatrix>& matrices) override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/**
 * @brief Read back a stack written by HDF5Checkpoint::store
 * @throws std::runtime_error if the file or dataset cannot be read
 */
std::vector<ComplexMatrix> load_checkpoint_matrices(const std::string& path,
                                                    const std::string& key);
}  // namespace relnmr
