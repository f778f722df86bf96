// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>
#include <relnmr/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace relnmr::hdf5 {

/**
 * @brief Silence the HDF5 error stack printer unless
 * RELNMR_PRINT_VERBOSE_HDF5_ERRORS is set to a true value
 */
void configure_error_printing();

/**
 * @brief Compound type {r, i} matching numpy/h5py complex128
 */
H5::CompType complex_type();

/**
 * @brief Open a slash-separated group path below the file root, creating
 * missing groups
 */
H5::Group open_or_create_group(H5::H5File& file, const std::string& path);

/**
 * @brief Write matrices as a (n, rows, cols) complex dataset
 *
 * An existing dataset of the same name is replaced.
 *
 * @throws std::invalid_argument for an empty stack or unequal shapes
 */
void save_complex_stack(H5::Group& group, const std::string& name,
                        const std::vector<ComplexMatrix>& matrices);

/**
 * @brief Read a (n, rows, cols) complex dataset
 */
std::vector<ComplexMatrix> load_complex_stack(H5::Group& group,
                                              const std::string& name);

/**
 * @brief Write a rank-2 complex dataset
 */
void save_complex_matrix(H5::Group& group, const std::string& name,
                         const ComplexMatrix& matrix);

/**
 * @brief Read a rank-2 complex dataset
 */
ComplexMatrix load_complex_matrix(H5::Group& group, const std::string& name);

void save_vector(H5::Group& group, const std::string& name,
                 const Eigen::VectorXd& vector);
Eigen::VectorXd load_vector(H5::Group& group, const std::string& name);

void save_uint_vector(H5::Group& group, const std::string& name,
                      const std::vector<uint64_t>& vector);
std::vector<uint64_t> load_uint_vector(H5::Group& group,
                                       const std::string& name);

void save_coordinates(H5::Group& group, const std::string& name,
                      const std::vector<Vector3>& coords);
std::vector<Vector3> load_coordinates(H5::Group& group,
                                      const std::string& name);

void write_string_attribute(H5::H5Object& obj, const std::string& name,
                            const std::string& value);
std::string read_string_attribute(H5::H5Object& obj, const std::string& name);

void write_double_attribute(H5::H5Object& obj, const std::string& name,
                            double value);
double read_double_attribute(H5::H5Object& obj, const std::string& name);

void write_uint_attribute(H5::H5Object& obj, const std::string& name,
                          uint64_t value);
uint64_t read_uint_attribute(H5::H5Object& obj, const std::string& name);

void write_vector3_attribute(H5::H5Object& obj, const std::string& name,
                             const Vector3& value);

/// Empty if the attribute is absent
std::optional<Vector3> read_vector3_attribute(H5::H5Object& obj,
                                              const std::string& name);

}  // namespace relnmr::hdf5
