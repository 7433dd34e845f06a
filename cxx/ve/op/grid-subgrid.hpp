#pragma once

#include "../types.hpp"

#include <mutex>
#include <vector>

namespace ve {

/*
 * Copy a subgrid window out of the full grid. The Slow variants wrap periodically at the grid edges.
 */
template <int ND, int SGFW> struct GridToSubgrid
{
};

template <int SGFW> struct GridToSubgrid<2, SGFW>
{
  inline static void FastCopy(Eigen::Array<int16_t, 2, 1> const sg, Cx3CMap x, Cx3 &sx)
  {
    for (Index ic = 0; ic < sx.dimension(2); ic++) {
      for (Index iy = 0; iy < SGFW; iy++) {
        Index const iiy = iy + sg[1];
        for (Index ix = 0; ix < SGFW; ix++) {
          sx(ix, iy, ic) = x(ix + sg[0], iiy, ic);
        }
      }
    }
  }

  inline static void SlowCopy(Eigen::Array<int16_t, 2, 1> const sg, Cx3CMap x, Cx3 &sx)
  {
    for (Index ic = 0; ic < sx.dimension(2); ic++) {
      for (Index iy = 0; iy < SGFW; iy++) {
        Index const iiy = Wrap(iy + sg[1], x.dimension(1));
        for (Index ix = 0; ix < SGFW; ix++) {
          sx(ix, iy, ic) = x(Wrap(ix + sg[0], x.dimension(0)), iiy, ic);
        }
      }
    }
  }
};

template <int SGFW> struct GridToSubgrid<3, SGFW>
{
  inline static void FastCopy(Eigen::Array<int16_t, 3, 1> const sg, Cx4CMap x, Cx4 &sx)
  {
    for (Index ic = 0; ic < sx.dimension(3); ic++) {
      for (Index iz = 0; iz < SGFW; iz++) {
        Index const iiz = iz + sg[2];
        for (Index iy = 0; iy < SGFW; iy++) {
          Index const iiy = iy + sg[1];
          for (Index ix = 0; ix < SGFW; ix++) {
            sx(ix, iy, iz, ic) = x(ix + sg[0], iiy, iiz, ic);
          }
        }
      }
    }
  }

  inline static void SlowCopy(Eigen::Array<int16_t, 3, 1> const sg, Cx4CMap x, Cx4 &sx)
  {
    for (Index ic = 0; ic < sx.dimension(3); ic++) {
      for (Index iz = 0; iz < SGFW; iz++) {
        Index const iiz = Wrap(iz + sg[2], x.dimension(2));
        for (Index iy = 0; iy < SGFW; iy++) {
          Index const iiy = Wrap(iy + sg[1], x.dimension(1));
          for (Index ix = 0; ix < SGFW; ix++) {
            sx(ix, iy, iz, ic) = x(Wrap(ix + sg[0], x.dimension(0)), iiy, iiz, ic);
          }
        }
      }
    }
  }
};

/*
 * Accumulate a subgrid back into the full grid. Each plane of the last spatial axis is guarded by its own mutex.
 */
template <int ND, int SGFW> struct SubgridToGrid
{
};

template <int SGFW> struct SubgridToGrid<2, SGFW>
{
  inline static void FastCopy(std::vector<std::mutex> &m, Eigen::Array<int16_t, 2, 1> const corner, Cx3 const &sx, Cx3Map x)
  {
    for (Index iy = 0; iy < SGFW; iy++) {
      Index const      iiy = iy + corner[1];
      std::scoped_lock lock(m[iiy]);
      for (Index ic = 0; ic < sx.dimension(2); ic++) {
        for (Index ix = 0; ix < SGFW; ix++) {
          x(ix + corner[0], iiy, ic) += sx(ix, iy, ic);
        }
      }
    }
  }

  inline static void SlowCopy(std::vector<std::mutex> &m, Eigen::Array<int16_t, 2, 1> const corner, Cx3 const &sx, Cx3Map x)
  {
    for (Index iy = 0; iy < SGFW; iy++) {
      Index const      iiy = Wrap(iy + corner[1], x.dimension(1));
      std::scoped_lock lock(m[iiy]);
      for (Index ic = 0; ic < sx.dimension(2); ic++) {
        for (Index ix = 0; ix < SGFW; ix++) {
          x(Wrap(ix + corner[0], x.dimension(0)), iiy, ic) += sx(ix, iy, ic);
        }
      }
    }
  }
};

template <int SGFW> struct SubgridToGrid<3, SGFW>
{
  inline static void FastCopy(std::vector<std::mutex> &m, Eigen::Array<int16_t, 3, 1> const corner, Cx4 const &sx, Cx4Map x)
  {
    for (Index iz = 0; iz < SGFW; iz++) {
      Index const      iiz = iz + corner[2];
      std::scoped_lock lock(m[iiz]);
      for (Index ic = 0; ic < sx.dimension(3); ic++) {
        for (Index iy = 0; iy < SGFW; iy++) {
          Index const iiy = iy + corner[1];
          for (Index ix = 0; ix < SGFW; ix++) {
            x(ix + corner[0], iiy, iiz, ic) += sx(ix, iy, iz, ic);
          }
        }
      }
    }
  }

  inline static void SlowCopy(std::vector<std::mutex> &m, Eigen::Array<int16_t, 3, 1> const corner, Cx4 const &sx, Cx4Map x)
  {
    for (Index iz = 0; iz < SGFW; iz++) {
      Index const      iiz = Wrap(iz + corner[2], x.dimension(2));
      std::scoped_lock lock(m[iiz]);
      for (Index ic = 0; ic < sx.dimension(3); ic++) {
        for (Index iy = 0; iy < SGFW; iy++) {
          Index const iiy = Wrap(iy + corner[1], x.dimension(1));
          for (Index ix = 0; ix < SGFW; ix++) {
            x(Wrap(ix + corner[0], x.dimension(0)), iiy, iiz, ic) += sx(ix, iy, iz, ic);
          }
        }
      }
    }
  }
};

} // namespace ve
