#include "pad.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "top-impl.hpp"

namespace ve::TOps {

template <int Rank> Pad<Rank>::Pad(InDims const is, OutDims const os)
  : Parent(fmt::format("Pad {}D", Rank), is, os)
{
  for (Index ii = 0; ii < Rank; ii++) {
    if (ishape[ii] > oshape[ii]) { throw Log::Failure("Pad", "Cannot pad {} to smaller {}", ishape, oshape); }
    // The larger half of an odd difference goes on the left so the centres line up
    left_[ii] = (oshape[ii] - ishape[ii] + 1) / 2;
    paddings_[ii] = std::make_pair(left_[ii], (oshape[ii] - ishape[ii]) / 2);
  }
}

template <int Rank> void Pad<Rank>::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  y.device(Threads::TensorDevice()) = x.pad(paddings_) * y.constant(s);
  this->finishForward(y, time, false);
}

template <int Rank> void Pad<Rank>::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  x.device(Threads::TensorDevice()) = y.slice(left_, ishape) * x.constant(s);
  this->finishAdjoint(x, time, false);
}

template <int Rank> void Pad<Rank>::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  y.device(Threads::TensorDevice()) += x.pad(paddings_) * y.constant(s);
  this->finishForward(y, time, true);
}

template <int Rank> void Pad<Rank>::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  x.device(Threads::TensorDevice()) += y.slice(left_, ishape) * x.constant(s);
  this->finishAdjoint(x, time, true);
}

template struct Pad<4>;

} // namespace ve::TOps
