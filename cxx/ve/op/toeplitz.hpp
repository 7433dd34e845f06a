#pragma once

#include "encode.hpp"
#include "pad.hpp"
#include "sense.hpp"

namespace ve::TOps {

/*
 * Normal operator of VEASL evaluated with FFTs on a doubled grid. Holds a copy of the embedding T from
 * Toeplitz::Embedding together with the sensitivities and encoding matrix. Self-adjoint.
 */
struct Toeplitz final : TOp<5, 5>
{
  TOP_INHERIT(5, 5)
  TOP_DECLARE(Toeplitz)
  Toeplitz(Cx5 const &T, Cx4 const &S, Cx2 const &H);

  void iforward(InCMap x, OutMap y, float const s = 1.f) const;
  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const;
  auto embedding() const -> Cx5 const &;

private:
  Cx5          T_;
  SENSE        sense_;
  VesselEncode encode_;
  Pad<4>       pad_;
  Index        nd_;

  void apply(InCMap x, OutMap y, float const s, bool const ip) const;
};

/* Builds the embedding of a VEASL operator and wraps it */
auto MakeToeplitz(TOp<5, 4>::Ptr const &op) -> TOp<5, 5>::Ptr;

} // namespace ve::TOps
