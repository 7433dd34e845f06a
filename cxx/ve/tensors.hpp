#pragma once

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif
// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include "sys/threads.hpp"

namespace ve {

template <typename T> typename T::Scalar Sum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> s;
  s.device(ve::Threads::TensorDevice()) = a.sum();
  return s();
}

template <typename T> typename T::Scalar Maximum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> m;
  m.device(ve::Threads::TensorDevice()) = a.maximum();
  return m();
}

/* Inner product <a, b> = sum(a conj(b)). Set threads to false for small tensors or inside a pool thread */
template <bool threads, typename T, typename U> inline decltype(auto) Dot(T const &a, U const &b)
{
  using Scalar = typename std::remove_reference<T>::type::Scalar;
  Eigen::TensorFixedSize<Scalar, Eigen::Sizes<>> d0;
  if constexpr (threads) {
    d0.device(ve::Threads::TensorDevice()) = (a * b.conjugate()).sum();
  } else {
    d0 = (a * b.conjugate()).sum();
  }
  Scalar const d = d0();
  return d;
}

template <bool threads, typename T> inline decltype(auto) Norm2(T const &a) { return std::real(Dot<threads>(a, a)); }
template <bool threads, typename T> inline decltype(auto) Norm(T const &a) { return std::sqrt(Norm2<threads>(a)); }

template <typename T> inline decltype(auto) CollapseToConstVector(T const &t)
{
  using Scalar = typename T::Scalar;
  using Map = typename Eigen::Map<Eigen::Matrix<Scalar, Eigen::Dynamic, 1> const, Eigen::AlignedMax>;
  Map mapped(t.data(), t.size(), 1);
  return mapped;
}

} // namespace ve
