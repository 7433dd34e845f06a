#pragma once

#include "top.hpp"

#include <vector>

namespace ve::TOps {

/*
 * Coil sensitivity encoding, [Nx, Ny, Nz, Nb] to [Nx, Ny, Nz, Nb, nC]. Only the coils listed in subset are applied; an
 * empty subset means all of them.
 */
struct SENSE final : TOp<4, 5>
{
  TOP_INHERIT(4, 5)
  TOP_DECLARE(SENSE)
  SENSE(Cx4 const &maps, Index const nB, std::vector<Index> const &subset = {});
  void        iforward(InCMap x, OutMap y, float const s = 1.f) const;
  void        iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  auto        nChannels() const -> Index;
  auto        mapDimensions() const -> Sz3;
  auto        maps() const -> Cx4 const &;

private:
  Cx4                                                   maps_; // Subset only, [Nx, Ny, Nz, nC]
  Eigen::IndexList<int, int, int, int, FixOne>          resX;
  Eigen::IndexList<FixOne, FixOne, FixOne, FixOne, int> brdX;
  Eigen::IndexList<int, int, int, FixOne, int>          resMaps;
  Eigen::IndexList<FixOne, FixOne, FixOne, int, FixOne> brdMaps;
};

auto MakeSENSE(Cx4 const &maps, Index const nB, std::vector<Index> const &subset = {}) -> SENSE::Ptr;

} // namespace ve::TOps
