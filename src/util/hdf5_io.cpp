// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "util/hdf5_io.h"

#include <relnmr/util/env_helper.h>

#include <algorithm>
#include <cctype>
#include <complex>
#include <sstream>
#include <stdexcept>

namespace relnmr::hdf5 {

void configure_error_printing() {
  auto value = env::get<std::string>("RELNMR_PRINT_VERBOSE_HDF5_ERRORS", "");
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const bool verbose =
      value == "1" || value == "true" || value == "yes" || value == "on";
  if (!verbose) H5::Exception::dontPrint();
}

H5::CompType complex_type() {
  H5::CompType type(sizeof(std::complex<double>));
  type.insertMember("r", 0, H5::PredType::NATIVE_DOUBLE);
  type.insertMember("i", sizeof(double), H5::PredType::NATIVE_DOUBLE);
  return type;
}

H5::Group open_or_create_group(H5::H5File& file, const std::string& path) {
  H5::Group group = file.openGroup("/");
  std::istringstream ss(path);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (part.empty()) continue;
    if (group.nameExists(part)) {
      group = group.openGroup(part);
    } else {
      group = group.createGroup(part);
    }
  }
  return group;
}

void save_complex_stack(H5::Group& group, const std::string& name,
                        const std::vector<ComplexMatrix>& matrices) {
  if (matrices.empty())
    throw std::invalid_argument("cannot store an empty matrix stack: " + name);
  const auto rows = matrices.front().rows();
  const auto cols = matrices.front().cols();
  std::vector<std::complex<double>> buffer;
  buffer.reserve(matrices.size() * rows * cols);
  for (const auto& m : matrices) {
    if (m.rows() != rows || m.cols() != cols)
      throw std::invalid_argument("unequal matrix shapes in stack: " + name);
    // ComplexMatrix is row-major, matching the C order of HDF5
    buffer.insert(buffer.end(), m.data(), m.data() + m.size());
  }

  if (group.nameExists(name)) group.unlink(name);
  hsize_t dims[3] = {static_cast<hsize_t>(matrices.size()),
                     static_cast<hsize_t>(rows), static_cast<hsize_t>(cols)};
  H5::DataSpace dataspace(3, dims);
  auto type = complex_type();
  H5::DataSet dataset = group.createDataSet(name, type, dataspace);
  dataset.write(buffer.data(), type);
}

std::vector<ComplexMatrix> load_complex_stack(H5::Group& group,
                                              const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 3)
    throw std::runtime_error("dataset " + name + " is not rank 3");
  hsize_t dims[3];
  dataspace.getSimpleExtentDims(dims);
  std::vector<std::complex<double>> buffer(dims[0] * dims[1] * dims[2]);
  dataset.read(buffer.data(), complex_type());

  std::vector<ComplexMatrix> matrices(dims[0]);
  const size_t stride = dims[1] * dims[2];
  for (size_t n = 0; n < dims[0]; ++n) {
    matrices[n] = Eigen::Map<const ComplexMatrix>(buffer.data() + n * stride,
                                                  dims[1], dims[2]);
  }
  return matrices;
}

void save_complex_matrix(H5::Group& group, const std::string& name,
                         const ComplexMatrix& matrix) {
  if (group.nameExists(name)) group.unlink(name);
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  auto type = complex_type();
  H5::DataSet dataset = group.createDataSet(name, type, dataspace);
  dataset.write(matrix.data(), type);
}

ComplexMatrix load_complex_matrix(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2)
    throw std::runtime_error("dataset " + name + " is not rank 2");
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  ComplexMatrix matrix(dims[0], dims[1]);
  dataset.read(matrix.data(), complex_type());
  return matrix;
}

void save_vector(H5::Group& group, const std::string& name,
                 const Eigen::VectorXd& vector) {
  if (group.nameExists(name)) group.unlink(name);
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, dataspace);
  dataset.write(vector.data(), H5::PredType::NATIVE_DOUBLE);
}

Eigen::VectorXd load_vector(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 1)
    throw std::runtime_error("dataset " + name + " is not rank 1");
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  Eigen::VectorXd vector(dims[0]);
  dataset.read(vector.data(), H5::PredType::NATIVE_DOUBLE);
  return vector;
}

void save_uint_vector(H5::Group& group, const std::string& name,
                      const std::vector<uint64_t>& vector) {
  if (group.nameExists(name)) group.unlink(name);
  hsize_t dims[1] = {vector.size()};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(name, H5::PredType::NATIVE_UINT64, dataspace);
  dataset.write(vector.data(), H5::PredType::NATIVE_UINT64);
}

std::vector<uint64_t> load_uint_vector(H5::Group& group,
                                       const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 1)
    throw std::runtime_error("dataset " + name + " is not rank 1");
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  std::vector<uint64_t> vector(dims[0]);
  dataset.read(vector.data(), H5::PredType::NATIVE_UINT64);
  return vector;
}

void save_coordinates(H5::Group& group, const std::string& name,
                      const std::vector<Vector3>& coords) {
  if (group.nameExists(name)) group.unlink(name);
  hsize_t dims[2] = {coords.size(), 3};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset =
      group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, dataspace);
  dataset.write(coords.data(), H5::PredType::NATIVE_DOUBLE);
}

std::vector<Vector3> load_coordinates(H5::Group& group,
                                      const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2)
    throw std::runtime_error("dataset " + name + " is not rank 2");
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  if (dims[1] != 3)
    throw std::runtime_error("dataset " + name + " is not (n, 3)");
  std::vector<Vector3> coords(dims[0]);
  dataset.read(coords.data(), H5::PredType::NATIVE_DOUBLE);
  return coords;
}

void write_string_attribute(H5::H5Object& obj, const std::string& name,
                            const std::string& value) {
  H5::StrType type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attr = obj.createAttribute(name, type, scalar);
  attr.write(type, value);
}

std::string read_string_attribute(H5::H5Object& obj, const std::string& name) {
  H5::Attribute attr = obj.openAttribute(name);
  std::string value;
  attr.read(attr.getStrType(), value);
  return value;
}

void write_double_attribute(H5::H5Object& obj, const std::string& name,
                            double value) {
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attr =
      obj.createAttribute(name, H5::PredType::NATIVE_DOUBLE, scalar);
  attr.write(H5::PredType::NATIVE_DOUBLE, &value);
}

double read_double_attribute(H5::H5Object& obj, const std::string& name) {
  H5::Attribute attr = obj.openAttribute(name);
  double value = 0.0;
  attr.read(H5::PredType::NATIVE_DOUBLE, &value);
  return value;
}

void write_uint_attribute(H5::H5Object& obj, const std::string& name,
                          uint64_t value) {
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attr =
      obj.createAttribute(name, H5::PredType::NATIVE_UINT64, scalar);
  attr.write(H5::PredType::NATIVE_UINT64, &value);
}

uint64_t read_uint_attribute(H5::H5Object& obj, const std::string& name) {
  H5::Attribute attr = obj.openAttribute(name);
  uint64_t value = 0;
  attr.read(H5::PredType::NATIVE_UINT64, &value);
  return value;
}

void write_vector3_attribute(H5::H5Object& obj, const std::string& name,
                             const Vector3& value) {
  hsize_t dims[1] = {3};
  H5::DataSpace dataspace(1, dims);
  H5::Attribute attr =
      obj.createAttribute(name, H5::PredType::NATIVE_DOUBLE, dataspace);
  attr.write(H5::PredType::NATIVE_DOUBLE, value.data());
}

std::optional<Vector3> read_vector3_attribute(H5::H5Object& obj,
                                              const std::string& name) {
  if (!obj.attrExists(name)) return std::nullopt;
  H5::Attribute attr = obj.openAttribute(name);
  Vector3 value;
  attr.read(H5::PredType::NATIVE_DOUBLE, value.data());
  return value;
}

}  // namespace relnmr::hdf5
