/****************************************************************-*- C++ -*-****
 * Copyright (c) 2024 - 2025 NVIDIA Corporation & Affiliates.                  *
 * All rights reserved.                                                        *
 *                                                                             *
 * This source code and the accompanying materials are made available under    *
 * the terms of the Apache License 2.0 which accompanies this distribution.    *
 ******************************************************************************/

#include "pcmgen/core/tensor_impl.h"
#include "pcmgen/core/type_traits.h"

#include <xtensor-blas/xlinalg.hpp>
#include <xtensor/xadapt.hpp>

#include <fmt/ranges.h>

#include <algorithm>
#include <functional>
#include <numeric>

namespace pcmgen {

/// @brief An implementation of tensor_impl using the xtensor library
template <typename Scalar>
class xtensor : public details::tensor_impl<Scalar> {
private:
  Scalar *m_data = nullptr;
  std::vector<std::size_t> m_shape;

  bool validIndices(const std::vector<std::size_t> &idxs) const {
    if (idxs.size() != m_shape.size())
      return false;
    for (std::size_t dim = 0; auto idx : idxs)
      if (idx >= m_shape[dim++])
        return false;
    return true;
  }

  static std::size_t num_elements(const std::vector<std::size_t> &shape) {
    if (shape.empty())
      return 0;
    return std::accumulate(shape.begin(), shape.end(), std::size_t(1),
                           std::multiplies<std::size_t>());
  }

  auto view() const {
    return xt::adapt(m_data, size(), xt::no_ownership(), m_shape);
  }

public:
  /// @brief Allocate zero-initialized storage for @p s.
  xtensor(const std::vector<std::size_t> &s) : m_shape(s) {
    if (auto n = num_elements(s); n > 0)
      m_data = new Scalar[n]();
  }

  xtensor(const xtensor &) = delete;
  xtensor &operator=(const xtensor &) = delete;

  std::size_t rank() const override { return m_shape.size(); }

  std::size_t size() const override { return num_elements(m_shape); }

  std::vector<std::size_t> shape() const override { return m_shape; }

  Scalar &at(const std::vector<size_t> &indices) override {
    if (!validIndices(indices))
      throw std::runtime_error("Invalid tensor indices: " +
                               fmt::format("{}", fmt::join(indices, ", ")));

    return xt::adapt(m_data, size(), xt::no_ownership(), m_shape)[indices];
  }

  const Scalar &at(const std::vector<size_t> &indices) const override {
    if (!validIndices(indices))
      throw std::runtime_error("Invalid constant tensor indices: " +
                               fmt::format("{}", fmt::join(indices, ", ")));
    return view()[indices];
  }

  Scalar sum_all() const override {
    if (size() == 0)
      return Scalar();
    return xt::sum(view())[0];
  }

  bool any() const override {
    if (size() == 0)
      return false;
    return xt::any(view());
  }

  void scalar_modulo(Scalar value,
                     details::tensor_impl<Scalar> *result) const override {
    auto *result_xt = dynamic_cast<xtensor<Scalar> *>(result);
    if (!result_xt)
      throw std::runtime_error("Invalid tensor implementation type");

    auto z = view() % value;
    std::copy(z.begin(), z.end(), result_xt->data());
  }

  void matrix_dot(const details::tensor_impl<Scalar> *other,
                  details::tensor_impl<Scalar> *result) const override {
    auto *other_xt = dynamic_cast<const xtensor<Scalar> *>(other);
    auto *result_xt = dynamic_cast<xtensor<Scalar> *>(result);

    if (!other_xt || !result_xt)
      throw std::runtime_error("Invalid tensor implementation type");

    auto z = xt::linalg::dot(view(), other_xt->view());
    std::copy(z.begin(), z.end(), result_xt->data());
  }

  void matrix_transpose(details::tensor_impl<Scalar> *result) const override {
    auto *result_xt = dynamic_cast<xtensor<Scalar> *>(result);
    if (!result_xt)
      throw std::runtime_error("Invalid tensor implementation type");

    auto z = xt::transpose(view(), {1, 0});
    std::copy(z.begin(), z.end(), result_xt->data());
  }

  Scalar *data() override { return m_data; }
  const Scalar *data() const override { return m_data; }

  static constexpr auto ScalarAsString = pcmgen::type_to_string<Scalar>();

  PCMGEN_EXTENSION_CUSTOM_CREATOR_FUNCTION_WITH_NAME(
      xtensor<Scalar>, std::string("xtensor") + std::string(ScalarAsString),
      static std::unique_ptr<details::tensor_impl<Scalar>> create(
          const std::vector<std::size_t> s) {
        return std::make_unique<xtensor<Scalar>>(s);
      })

  ~xtensor() { delete[] m_data; }
};

#define PCMGEN_INSTANTIATE_REGISTRY_TENSOR_IMPL(TYPE)                          \
  PCMGEN_INSTANTIATE_REGISTRY(::pcmgen::details::tensor_impl<TYPE>,            \
                              const std::vector<std::size_t>)

PCMGEN_INSTANTIATE_REGISTRY_TENSOR_IMPL(std::uint8_t)
PCMGEN_INSTANTIATE_REGISTRY_TENSOR_IMPL(int)

template <>
const bool xtensor<std::uint8_t>::registered_ =
    xtensor<std::uint8_t>::register_type();
template <>
const bool xtensor<int>::registered_ = xtensor<int>::register_type();

} // namespace pcmgen
