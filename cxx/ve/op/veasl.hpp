#pragma once

#include "encode.hpp"
#include "nufft-opts.hpp"
#include "sense.hpp"
#include "top.hpp"

#include <vector>

namespace ve {

/* Where the density compensation weights come from */
enum struct Density
{
  Estimate, // Pipe iterations for every (t, enc) readout
  Shared,   // Pipe iterations for (0, 0), copied to the rest
  Scalar,   // VEASLOpts::scalar everywhere
  Given     // Supplied by the caller
};

struct VEASLOpts
{
  Sz3                           matrix;
  Sz3                           width = Sz3{6, 6, 6};
  Sz3                           grid = Sz3{0, 0, 0}; // All zero means twice the matrix
  std::optional<Eigen::Array3f> shift = std::nullopt;
  bool                          lowmem = false;
  Density                       density = Density::Estimate;
  float                         scalar = 1.f;

  template <int ND> auto nufft() const -> NUFFTOpts<ND>;
};

namespace TOps {

/*
 * Vessel-encoded multi-coil non-Cartesian encoding. [Nx, Ny, Nz, Nt, nVC] images to [nSamp, Nt, nEnc, nC] samples.
 *
 * For each (t, enc) the components are mixed with H, multiplied by each coil sensitivity, passed through that readout's
 * NUFFT and weighted by sqrt(w) and the global norm. Everything is fixed at construction.
 */
template <int ND> struct VEASL final : TOp<5, 4>
{
  TOP_INHERIT(5, 4)
  TOP_DECLARE(VEASL)
  using Plan = typename TOp<ND + 1, 2>::Ptr;

  VEASL(VEASLOpts const &opts, Re4 const &k, Cx4 const &S, Cx2 const &H, Re3 const &w);

  void iforward(InCMap x, OutMap y, float const s = 1.f) const;
  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;

  auto plan(Index const t, Index const enc) const -> Plan const &;
  auto sqrtWeights() const -> Re3 const &;
  auto sense() const -> SENSE const &;
  auto encode() const -> VesselEncode const &;
  /* Fixed gain 1/sqrt(Nx Ny Nz), which makes the operator unitary on a full Cartesian grid. It is not derived from the
   * kernel scaling factor at the grid centre, the deapodisation already removes that */
  auto norm() const -> float;
  auto matrix() const -> Sz3;
  auto nSamp() const -> Index;
  auto nTime() const -> Index;
  auto nEnc() const -> Index;

private:
  std::vector<Plan> plans_; // Encoding-major, plans_[t + nT * enc]
  Re3               sqrtW_;
  SENSE             sense_;
  VesselEncode      encode_;
  float             norm_;

  void toSamples(Cx5 const &mixed, OutMap y, float const s, bool const ip) const;
  void fromSamples(OutCMap y, Cx5 &mixed) const;
};

/* Chooses the 2D or 3D operator from matrix[2]. Empty S or H select the defaults. w is only read for Density::Given */
auto MakeVEASL(VEASLOpts const &opts, Re4 const &k, Cx4 const &S = Cx4(), Cx2 const &H = Cx2(), Re3 const &w = Re3())
  -> TOp<5, 4>::Ptr;

} // namespace TOps
} // namespace ve
