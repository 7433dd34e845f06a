#pragma once

#include "top.hpp"

namespace ve {

/* Sylvester Hadamard matrix of order n, which must be a power of two */
auto Hadamard(Index const n) -> Cx2;

/* Tag/control pair, [[1, 1], [1, -1]] */
auto TagControl() -> Cx2;

namespace TOps {

/*
 * Mixes vessel components into encodings with H [nEnc, nVC]. [Nx, Ny, Nz, Nt, nVC] to [Nx, Ny, Nz, Nt, nEnc].
 */
struct VesselEncode final : TOp<5, 5>
{
  TOP_INHERIT(5, 5)
  TOP_DECLARE(VesselEncode)
  VesselEncode(Cx2 const &H, Sz4 const shape);
  void iforward(InCMap x, OutMap y, float const s = 1.f) const;
  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  auto matrix() const -> Cx2 const &;

private:
  Cx2 H_;
};

} // namespace TOps
} // namespace ve
