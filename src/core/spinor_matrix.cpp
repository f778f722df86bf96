// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fmt/format.h>
#include <relnmr/core/exceptions.h>
#include <relnmr/core/spinor_matrix.h>

#include <utility>

namespace relnmr {

namespace {
std::pair<Eigen::Index, Eigen::Index> block_offset(SpinorBlock b,
                                                   Eigen::Index n2c) {
  switch (b) {
    case SpinorBlock::LL:
      return {0, 0};
    case SpinorBlock::LS:
      return {0, n2c};
    case SpinorBlock::SL:
      return {n2c, 0};
    case SpinorBlock::SS:
      return {n2c, n2c};
  }
  throw std::invalid_argument("unknown spinor block");
}
}  // namespace

SpinorMatrix::SpinorMatrix(size_t n2c)
    : n2c_(n2c), data_(ComplexMatrix::Zero(2 * n2c, 2 * n2c)) {}

SpinorMatrix::SpinorMatrix(ComplexMatrix data) {
  if (data.rows() != data.cols() || data.rows() % 2 != 0) {
    throw DimensionMismatch(fmt::format(
        "spinor matrix must be square with even dimension, got ({}, {})",
        data.rows(), data.cols()));
  }
  n2c_ = data.rows() / 2;
  data_ = std::move(data);
}

SpinorMatrix::BlockRef SpinorMatrix::block(SpinorBlock b) {
  const Eigen::Index n = n2c_;
  auto [r, c] = block_offset(b, n);
  return data_.block(r, c, n, n);
}

SpinorMatrix::ConstBlockRef SpinorMatrix::block(SpinorBlock b) const {
  const Eigen::Index n = n2c_;
  auto [r, c] = block_offset(b, n);
  return data_.block(r, c, n, n);
}

bool SpinorMatrix::is_hermitian(double tol) const {
  if (data_.size() == 0) return true;
  return (data_ - data_.adjoint()).cwiseAbs().maxCoeff() <= tol;
}

void SpinorMatrix::add_adjoint() {
  ComplexMatrix adj = data_.adjoint();
  data_ += adj;
}

SpinorMatrix& SpinorMatrix::operator+=(const SpinorMatrix& other) {
  if (other.n2c_ != n2c_) {
    throw DimensionMismatch(
        fmt::format("cannot add spinor matrices of n2c {} and {}", n2c_,
                    other.n2c_));
  }
  data_ += other.data_;
  return *this;
}

SpinorTriple make_spinor_triple(size_t n2c) {
  return {SpinorMatrix(n2c), SpinorMatrix(n2c), SpinorMatrix(n2c)};
}

}  // namespace relnmr
