#pragma once

// This doesn't actually help with complex matrices as std::complex has no NaN
#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <algorithm>
#include <complex>
#include <numeric>

using Index = Eigen::Index;

namespace ve {

using FixOne = Eigen::type2index<1>; // Fix a dimension to one in reshape/broadcast

template <int N> using ReN = Eigen::Tensor<float, N>;
using Re1 = ReN<1>;
using Re2 = ReN<2>;
using Re3 = ReN<3>;
using Re4 = ReN<4>;

using Cx = std::complex<float>;

/*
 * Layouts used throughout, first index fastest:
 *   images      [Nx, Ny, Nz, Nt, nVC]
 *   samples     [nSamp, Nt, nEnc, nC]
 *   trajectory  [nCoords, nSamp, Nt, nEnc]
 *   weights     [nSamp, Nt, nEnc]
 *   maps        [Nx, Ny, Nz, nC]
 *   encoding    [nEnc, nVC]
 */

template <int N> using CxN = Eigen::Tensor<Cx, N>;
using Cx1 = CxN<1>;
using Cx2 = CxN<2>;
using Cx3 = CxN<3>;
using Cx4 = CxN<4>;
using Cx5 = CxN<5>;

template <int N> using CxNMap = Eigen::TensorMap<CxN<N>>;
using Cx2Map = CxNMap<2>;
using Cx3Map = CxNMap<3>;
using Cx4Map = CxNMap<4>;
using Cx5Map = CxNMap<5>;

template <int N> using CxNCMap = Eigen::TensorMap<CxN<N> const>;
using Cx2CMap = CxNCMap<2>;
using Cx3CMap = CxNCMap<3>;
using Cx4CMap = CxNCMap<4>;
using Cx5CMap = CxNCMap<5>;

// Useful shorthands
template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz1 = Sz<1>;
using Sz2 = Sz<2>;
using Sz3 = Sz<3>;
using Sz4 = Sz<4>;
using Sz5 = Sz<5>;

template <int N> auto Constant(Index const c) -> Sz<N>
{
  Sz<N> C;
  C.fill(c);
  return C;
}

template <typename T, int N, typename... Args> decltype(auto) AddBack(Eigen::DSizes<T, N> const &front, Args... toAdd)
{
  static_assert(sizeof...(Args) > 0);
  Eigen::DSizes<T, sizeof...(Args)>     back{{toAdd...}};
  Eigen::DSizes<T, sizeof...(Args) + N> out;

  std::copy_n(front.begin(), N, out.begin());
  std::copy_n(back.begin(), sizeof...(Args), out.begin() + N);
  return out;
}

template <size_t N, typename T> auto FirstN(T const &sz) -> Eigen::DSizes<typename T::value_type, N>
{
  Eigen::DSizes<typename T::value_type, N> first;
  std::copy_n(sz.begin(), N, first.begin());
  return first;
}

template <size_t N> Index Product(std::array<Index, N> const &indices)
{
  return std::accumulate(indices.begin(), indices.end(), 1L, std::multiplies<Index>());
}

template <int N> auto Mul(Eigen::DSizes<Index, N> const &sz, Index const m) -> Eigen::DSizes<Index, N>
{
  Eigen::DSizes<Index, N> result;
  std::transform(sz.begin(), sz.begin() + N, result.begin(), [m](Index const i) { return i * m; });
  return result;
}

template <typename T> auto Wrap(T const index, T const sz) -> T
{
  T const t = index + sz;
  T const w = t - sz * (t / sz);
  return w;
}

} // namespace ve
