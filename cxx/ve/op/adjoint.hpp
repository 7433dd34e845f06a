#pragma once

#include "top-impl.hpp"

namespace ve::TOps {

/*
 * Transposed view of an operator. Forward calls the wrapped adjoint and vice versa, the wrapped operator is untouched.
 */
template <typename Op> struct Adjoint final : TOp<Op::OutRank, Op::InRank>
{
  TOP_INHERIT(Op::OutRank, Op::InRank)
  using Parent::adjoint;
  using Parent::forward;
  using Ptr = std::shared_ptr<Adjoint>;

  Adjoint(std::shared_ptr<Op> op)
    : Parent(op->name + "'", op->oshape, op->ishape)
    , op_{op}
  {
  }

  void forward(InCMap x, OutMap y, float const s = 1.f) const
  {
    auto const time = this->startForward(x, y, false);
    op_->adjoint(x, y, s);
    this->finishForward(y, time, false);
  }

  void adjoint(OutCMap y, InMap x, float const s = 1.f) const
  {
    auto const time = this->startAdjoint(y, x, false);
    op_->forward(y, x, s);
    this->finishAdjoint(x, time, false);
  }

  void iforward(InCMap x, OutMap y, float const s = 1.f) const
  {
    auto const time = this->startForward(x, y, true);
    op_->iadjoint(x, y, s);
    this->finishForward(y, time, true);
  }

  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const
  {
    auto const time = this->startAdjoint(y, x, true);
    op_->iforward(y, x, s);
    this->finishAdjoint(x, time, true);
  }

private:
  std::shared_ptr<Op> op_;
};

template <typename Op> auto MakeAdjoint(std::shared_ptr<Op> op) -> typename Adjoint<Op>::Ptr { return std::make_shared<Adjoint<Op>>(op); }

} // namespace ve::TOps
