#pragma once

#include "apodize.hpp"
#include "grid.hpp"

namespace ve::TOps {

/*
 * Non-uniform FFT from an image [N..., nC] to samples [nC, nSamples].
 * Forward is y_j = sum_n x_n exp(-i k_j.(n - shift)) up to the kernel approximation error.
 */
template <int ND, typename KF = ExpSemi<6>> struct NUFFT final : TOp<ND + 1, 2>
{
  TOP_INHERIT(ND + 1, 2)
  NUFFT(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nC);
  TOP_DECLARE(NUFFT)

  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  void iforward(InCMap x, OutMap y, float const s = 1.f) const;

private:
  Grid<ND, KF>    gridder;
  Apodize<ND, KF> apo;
  Sz<ND>          fftDims;
  Cx1             phase; // Empty unless the shift is away from the image centre

  void fromGrid(InMap ws, OutMap y, bool const ip) const;
  void toGrid(OutCMap y, InMap ws) const;
};

template <int ND> auto MakeNUFFT(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nC)
  -> typename TOp<ND + 1, 2>::Ptr;

/* The interpolation stage on its own, [G..., nC] to [nC, nSamples] */
template <int ND> auto MakeGrid(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nC)
  -> typename TOp<ND + 1, 2>::Ptr;

} // namespace ve::TOps
