#pragma once

#include "../kernel/kernel.hpp"
#include "../types.hpp"

namespace ve {

template <int ND, int SGSZ, int KW>
inline auto SubgridCorner(Eigen::Array<int16_t, ND, 1> const sgInd) -> Eigen::Array<int16_t, ND, 1>
{
  return (sgInd * SGSZ) - (KW / 2);
}

template <int ND, int SGFW> inline auto InBounds(Eigen::Array<int16_t, ND, 1> const corner, Sz<ND> const gSz)
{
  bool inBounds = true;
  for (Index ii = 0; ii < ND; ii++) {
    if (corner[ii] < 0 || (corner[ii] + SGFW >= gSz[ii])) { inBounds = false; }
  }
  return inBounds;
}

/*
 * Kernel-weighted gather from a subgrid to one sample, and the matching scatter. The subgrid is [SGFW..., nC] and the
 * samples are [nC, nSamples].
 */
template <int ND, int FW> struct GFunc
{
};

template <int FW> struct GFunc<2, FW>
{
  using KT = FixedTensor<float, 2, FW>;

  inline static void Scatter(Eigen::Array<int16_t, 2, 1> const c, int32_t const sample, KT const &k, Cx2CMap y, Cx3 &sg)
  {
    for (Index ic = 0; ic < y.dimension(0); ic++) {
      Cx const yv = y(ic, sample);
      for (Index iy = 0; iy < FW; iy++) {
        Index const iiy = iy + c[1] - FW / 2;
        for (Index ix = 0; ix < FW; ix++) {
          Index const iix = ix + c[0] - FW / 2;
          sg(iix, iiy, ic) += yv * k(ix, iy);
        }
      }
    }
  }

  inline static void Gather(Eigen::Array<int16_t, 2, 1> const c, int32_t const sample, KT const &k, Cx3 const &sg, Cx2Map y)
  {
    for (Index ic = 0; ic < y.dimension(0); ic++) {
      Cx yv = 0.f;
      for (Index iy = 0; iy < FW; iy++) {
        Index const iiy = iy + c[1] - FW / 2;
        for (Index ix = 0; ix < FW; ix++) {
          Index const iix = ix + c[0] - FW / 2;
          yv += sg(iix, iiy, ic) * k(ix, iy);
        }
      }
      y(ic, sample) += yv;
    }
  }
};

template <int FW> struct GFunc<3, FW>
{
  using KT = FixedTensor<float, 3, FW>;

  inline static void Scatter(Eigen::Array<int16_t, 3, 1> const c, int32_t const sample, KT const &k, Cx2CMap y, Cx4 &sg)
  {
    for (Index ic = 0; ic < y.dimension(0); ic++) {
      Cx const yv = y(ic, sample);
      for (Index iz = 0; iz < FW; iz++) {
        Index const iiz = iz + c[2] - FW / 2;
        for (Index iy = 0; iy < FW; iy++) {
          Index const iiy = iy + c[1] - FW / 2;
          for (Index ix = 0; ix < FW; ix++) {
            Index const iix = ix + c[0] - FW / 2;
            sg(iix, iiy, iiz, ic) += yv * k(ix, iy, iz);
          }
        }
      }
    }
  }

  inline static void Gather(Eigen::Array<int16_t, 3, 1> const c, int32_t const sample, KT const &k, Cx4 const &sg, Cx2Map y)
  {
    for (Index ic = 0; ic < y.dimension(0); ic++) {
      Cx yv = 0.f;
      for (Index iz = 0; iz < FW; iz++) {
        Index const iiz = iz + c[2] - FW / 2;
        for (Index iy = 0; iy < FW; iy++) {
          Index const iiy = iy + c[1] - FW / 2;
          for (Index ix = 0; ix < FW; ix++) {
            Index const iix = ix + c[0] - FW / 2;
            yv += sg(iix, iiy, iiz, ic) * k(ix, iy, iz);
          }
        }
      }
      y(ic, sample) += yv;
    }
  }
};

} // namespace ve
