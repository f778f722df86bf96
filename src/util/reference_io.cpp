// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <relnmr/util/reference_io.h>

#include <filesystem>
#include <stdexcept>

#include "util/hdf5_io.h"

namespace relnmr {

void save_reference_state(const std::string& path, const ReferenceState& ref) {
  hdf5::configure_error_printing();
  try {
    const auto mode =
        std::filesystem::exists(path) ? H5F_ACC_RDWR : H5F_ACC_TRUNC;
    H5::H5File file(path, mode);
    auto group = hdf5::open_or_create_group(file, "reference");
    hdf5::save_complex_matrix(group, "mo_coeff", ref.mo_coeff);
    hdf5::save_vector(group, "mo_energy", ref.mo_energy);
    hdf5::save_vector(group, "mo_occ", ref.mo_occ);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

ReferenceState load_reference_state(const std::string& path) {
  hdf5::configure_error_printing();
  try {
    H5::H5File file(path, H5F_ACC_RDONLY);
    auto group = file.openGroup("reference");
    ReferenceState ref;
    ref.mo_coeff = hdf5::load_complex_matrix(group, "mo_coeff");
    ref.mo_energy = hdf5::load_vector(group, "mo_energy");
    ref.mo_occ = hdf5::load_vector(group, "mo_occ");
    return ref;
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

}  // namespace relnmr
