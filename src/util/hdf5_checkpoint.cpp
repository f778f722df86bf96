// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/util/hdf5_checkpoint.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "util/hdf5_io.h"

namespace relnmr {

namespace {
std::pair<std::string, std::string> split_key(const std::string& key) {
  const auto pos = key.find_last_of('/');
  if (pos == std::string::npos) return {"", key};
  return {key.substr(0, pos), key.substr(pos + 1)};
}
}  // namespace

HDF5Checkpoint::HDF5Checkpoint(std::string path) : path_(std::move(path)) {}

void HDF5Checkpoint::store(const std::string& key,
                           const std::vector<ComplexMatrix>& matrices) {
  hdf5::configure_error_printing();
  try {
    const auto mode =
        std::filesystem::exists(path_) ? H5F_ACC_RDWR : H5F_ACC_TRUNC;
    H5::H5File file(path_, mode);
    auto [group_path, name] = split_key(key);
    auto group = hdf5::open_or_create_group(file, group_path);
    hdf5::save_complex_stack(group, name, matrices);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
  spdlog::debug("checkpoint {}:{} ({} matrices)", path_, key, matrices.size());
}

std::vector<ComplexMatrix> load_checkpoint_matrices(const std::string& path,
                                                    const std::string& key) {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_RDONLY);
    auto [group_path, name] = split_key(key);
    H5::Group group = file.openGroup(group_path.empty() ? "/" : group_path);
    return hdf5::load_complex_stack(group, name);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace relnmr
