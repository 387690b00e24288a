/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "pcmgen/core/extension_point.h"
#include "pcmgen/core/tensor_impl.h"
#include "pcmgen/core/type_traits.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pcmgen {

/// @brief A dense tensor implementing the PIMPL idiom. The flattened data is
/// stored row major (strides grow from right to left, like a
/// multi-dimensional C array). Parity-check matrices are rank-2
/// `tensor<uint8_t>`s.
template <typename Scalar = std::uint8_t>
class tensor {
private:
  std::shared_ptr<details::tensor_impl<Scalar>> pimpl;

  static std::string backend_name() {
    return std::string("xtensor") + std::string(ScalarAsString);
  }

public:
  using scalar_type = typename details::tensor_impl<Scalar>::scalar_type;
  static constexpr auto ScalarAsString = type_to_string<Scalar>();

  /// @brief Construct an empty (rank 0) tensor
  tensor() : pimpl(details::tensor_impl<Scalar>::get(backend_name(), {})) {}

  /// @brief Construct a zero-initialized tensor with the given shape
  tensor(const std::vector<std::size_t> &shape)
      : pimpl(details::tensor_impl<Scalar>::get(backend_name(), shape)) {}

  std::size_t rank() const { return pimpl->rank(); }

  /// @brief Total number of elements (0 for a rank 0 tensor)
  std::size_t size() const { return pimpl->size(); }

  std::vector<std::size_t> shape() const { return pimpl->shape(); }

  /// @brief Access a mutable element of the tensor
  /// @throw std::runtime_error if the indices are out of range or do not
  /// match the rank
  scalar_type &at(const std::vector<size_t> &indices) {
    if (indices.size() != rank())
      throw std::runtime_error("Invalid indices provided to tensor::at(), size "
                               "must be equal to rank.");
    return pimpl->at(indices);
  }

  const scalar_type &at(const std::vector<size_t> &indices) const {
    return pimpl->at(indices);
  }

  Scalar sum_all() const { return pimpl->sum_all(); }

  bool any() const { return pimpl->any(); }

  tensor<Scalar> operator%(Scalar value) const {
    tensor<Scalar> result(shape());
    pimpl->scalar_modulo(value, result.pimpl.get());
    return result;
  }

  /// @brief Matrix product of two rank-2 tensors
  tensor<Scalar> dot(const tensor<Scalar> &other) const {
    if (rank() != 2 || other.rank() != 2)
      throw std::runtime_error("Dot product requires rank-2 tensors");
    if (shape()[1] != other.shape()[0])
      throw std::runtime_error("Invalid matrix dimensions for dot product");

    tensor<Scalar> result({shape()[0], other.shape()[1]});
    pimpl->matrix_dot(other.pimpl.get(), result.pimpl.get());
    return result;
  }

  tensor<Scalar> transpose() const {
    if (rank() != 2)
      throw std::runtime_error("Transpose requires rank-2 tensors");

    tensor<Scalar> result({shape()[1], shape()[0]});
    pimpl->matrix_transpose(result.pimpl.get());
    return result;
  }

  /// @brief Element-wise equality. Tensors of different shape are unequal.
  bool operator==(const tensor<Scalar> &other) const {
    if (shape() != other.shape())
      return false;
    const auto *lhs = data();
    const auto *rhs = other.data();
    for (std::size_t i = 0; i < size(); i++)
      if (lhs[i] != rhs[i])
        return false;
    return true;
  }

  /// @brief Get a pointer to the raw, row-major data of the tensor.
  ///
  /// @note Care should be taken when directly manipulating the raw data to
  /// avoid invalidating the tensor's internal state.
  scalar_type *data() { return pimpl->data(); }
  const scalar_type *data() const { return pimpl->data(); }
};

} // namespace pcmgen
