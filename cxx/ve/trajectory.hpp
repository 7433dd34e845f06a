#pragma once

#include "types.hpp"

#include <vector>

namespace ve {

/*
 * One readout's worth of k-space locations in radians, [ND, nSamples]. Coordinates outside [-π, π) wrap.
 */
template <int ND> struct TrajectoryN
{
  using SzN = Sz<ND>;
  using Point = Eigen::Vector<float, ND>;

  struct Coord
  {
    template <typename T> using Array = Eigen::Array<T, ND, 1>;
    Array<int16_t> cart;
    int32_t        sample;
    Array<float>   offset;
  };

  struct CoordList
  {
    template <typename T> using Array = Eigen::Array<T, ND, 1>;
    Array<int16_t>     corner;
    std::vector<Coord> coords;
  };

  TrajectoryN(Re2 const &points);
  auto nSamples() const -> Index;
  auto nValid() const -> Index;
  auto point(int32_t const sample) const -> Point;
  auto points() const -> Re2 const &;

  /* Bin the samples into subgrids of size subgridSize on a grid of gridShape points, for a kernel of width kW */
  auto toCoordLists(SzN const &gridShape, Index const kW, Index const subgridSize) const -> std::vector<CoordList>;

private:
  Re2   points_;
  Index valid_;
};

/* Pull the (t, enc) readout out of a [nCoords, nSamples, nT, nEnc] trajectory */
template <int ND> auto ExtractTrajectory(Re4 const &k, Index const t, Index const enc) -> TrajectoryN<ND>;

} // namespace ve
