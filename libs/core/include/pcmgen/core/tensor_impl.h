/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/
#pragma once

#include "pcmgen/core/extension_point.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace pcmgen::details {

/// @brief Storage and numerics backend behind pcmgen::tensor. Backends register
/// themselves under "<backend><scalar>", e.g. "xtensoruint8", and are created
/// with zero-initialized storage for a shape.
template <typename Scalar>
class tensor_impl
    : public extension_point<tensor_impl<Scalar>,
                             const std::vector<std::size_t>> {
public:
  using scalar_type = Scalar;

  virtual std::size_t rank() const = 0;
  virtual std::size_t size() const = 0;
  virtual std::vector<std::size_t> shape() const = 0;

  virtual Scalar &at(const std::vector<std::size_t> &indices) = 0;
  virtual const Scalar &at(const std::vector<std::size_t> &indices) const = 0;

  virtual Scalar sum_all() const = 0;
  virtual bool any() const = 0;

  virtual void scalar_modulo(Scalar value, tensor_impl<Scalar> *result) const = 0;
  virtual void matrix_dot(const tensor_impl<Scalar> *other,
                          tensor_impl<Scalar> *result) const = 0;
  virtual void matrix_transpose(tensor_impl<Scalar> *result) const = 0;

  virtual Scalar *data() = 0;
  virtual const Scalar *data() const = 0;

  virtual ~tensor_impl() = default;
};

} // namespace pcmgen::details
