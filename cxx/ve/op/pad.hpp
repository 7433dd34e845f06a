#pragma once

#include "top.hpp"

namespace ve::TOps {

/*
 * Zero-pad symmetrically about the centre, the larger half of an odd difference on the left. The adjoint crops the
 * unpadded region back out. Used to place coil images on the doubled Toeplitz grid.
 */
template <int Rank> struct Pad final : TOp<Rank, Rank>
{
  TOP_INHERIT(Rank, Rank)
  Pad(InDims const ishape, OutDims const oshape);
  TOP_DECLARE(Pad)

  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  void iforward(InCMap x, OutMap y, float const s = 1.f) const;

  auto left() const -> InDims const & { return left_; }

private:
  InDims                                      left_;
  Eigen::array<std::pair<Index, Index>, Rank> paddings_;
};

} // namespace ve::TOps
