#pragma once

#include "../kernel/kernel.hpp"
#include "../trajectory.hpp"
#include "nufft-opts.hpp"
#include "top.hpp"

#include <mutex>
#include <optional>

namespace ve {

namespace TOps {

/*
 * Convolution-interpolation between a Cartesian grid [G..., nC] and non-Cartesian samples [nC, nSamples]. The forward
 * direction gathers, the adjoint spreads. The grid is periodic.
 */
template <int ND_, typename KF = ve::ExpSemi<6>, int SGSZ_ = 8> struct Grid final : TOp<ND_ + 1, 2>
{
  static constexpr int ND = ND_;
  static constexpr int SGSZ = SGSZ_;
  static constexpr int SGFW = SGSZ + 2 * (KF::FullWidth / 2);
  using KType = Kernel<ND, KF>;
  using TType = Kernel<ND, Tabulated<KF>>;

  TOP_INHERIT(ND + 1, 2)
  TOP_DECLARE(Grid)

  Grid(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nC);
  void  iforward(InCMap x, OutMap y, float const s = 1.f) const;
  void  iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  KType kernel;

private:
  using CoordList = typename TrajectoryN<ND>::CoordList;
  std::vector<CoordList>                               gridLists;
  std::vector<std::vector<typename KType::Tensor>>     weights; // Empty in low-memory mode
  std::optional<TType>                                 table;
  std::vector<std::mutex> mutable mutexes;

  auto weight(Index const is, Index const im) const -> typename KType::Tensor;
  void forwardTask(Index const start, Index const stride, float const s, InCMap const x, OutMap y) const;
  void adjointTask(Index const start, Index const stride, float const s, OutCMap y, InMap x) const;
};

} // namespace TOps
} // namespace ve
