#include "encode.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "top-impl.hpp"

namespace ve {

auto Hadamard(Index const n) -> Cx2
{
  if (n < 1 || (n & (n - 1)) != 0) { throw Log::Failure("Hadamard", "Order {} is not a power of two", n); }
  Cx2 H(n, n);
  H.setZero();
  H(0, 0) = 1.f;
  for (Index m = 1; m < n; m *= 2) {
    H.slice(Sz2{m, 0}, Sz2{m, m}) = H.slice(Sz2{0, 0}, Sz2{m, m});
    H.slice(Sz2{0, m}, Sz2{m, m}) = H.slice(Sz2{0, 0}, Sz2{m, m});
    H.slice(Sz2{m, m}, Sz2{m, m}) = -H.slice(Sz2{0, 0}, Sz2{m, m});
  }
  return H;
}

auto TagControl() -> Cx2 { return Hadamard(2); }

namespace TOps {

namespace {
using ForwardContract = Eigen::IndexPairList<Eigen::type2indexpair<4, 1>>;
using AdjointContract = Eigen::IndexPairList<Eigen::type2indexpair<4, 0>>;
} // namespace

VesselEncode::VesselEncode(Cx2 const &H, Sz4 const shape)
  : Parent("VesselEncode", AddBack(shape, H.dimension(1)), AddBack(shape, H.dimension(0)))
  , H_{H}
{
  if (H_.size() == 0) { throw Log::Failure("VesselEncode", "Encoding matrix is empty"); }
  Log::Debug("VesselEncode", "{} components to {} encodings", H_.dimension(1), H_.dimension(0));
}

void VesselEncode::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  y.device(Threads::TensorDevice()) = x.contract(H_, ForwardContract()) * y.constant(s);
  this->finishForward(y, time, false);
}

void VesselEncode::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  y.device(Threads::TensorDevice()) += x.contract(H_, ForwardContract()) * y.constant(s);
  this->finishForward(y, time, true);
}

void VesselEncode::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  x.device(Threads::TensorDevice()) = y.contract(H_.conjugate(), AdjointContract()) * x.constant(s);
  this->finishAdjoint(x, time, false);
}

void VesselEncode::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  x.device(Threads::TensorDevice()) += y.contract(H_.conjugate(), AdjointContract()) * x.constant(s);
  this->finishAdjoint(x, time, true);
}

auto VesselEncode::matrix() const -> Cx2 const & { return H_; }

} // namespace TOps
} // namespace ve
