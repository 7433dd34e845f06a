#pragma once

#include "../kernel/expsemi.hpp"
#include "../types.hpp"
#include "top.hpp"

namespace ve::TOps {

/*
 * Deapodisation and zero-padding from the image [N..., nC] onto the oversampled grid [G..., nC]. The correction is the
 * reciprocal of the kernel's discrete Fourier transform, so gridding followed by this undoes the kernel's roll-off.
 */
template <int ND, typename KF> struct Apodize final : TOp<ND + 1, ND + 1>
{
  TOP_INHERIT(ND + 1, ND + 1)
  Apodize(Sz<ND + 1> const shape, Sz<ND + 1> const gshape, float const osamp);
  TOP_DECLARE(Apodize)

  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  void iforward(InCMap x, OutMap y, float const s = 1.f) const;

private:
  InTensor                                    apo_;
  InDims                                      apoBrd_, padLeft_;
  std::array<std::pair<Index, Index>, ND + 1> paddings_;
};

} // namespace ve::TOps
