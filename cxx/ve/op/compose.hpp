#pragma once

#include "top-impl.hpp"

#include <fmt/format.h>

namespace ve::TOps {

/*
 * Op2 * Op1. The intermediate is allocated on every call.
 */
template <typename Op1, typename Op2> struct Compose final : TOp<Op1::InRank, Op2::OutRank>
{
  TOP_INHERIT(Op1::InRank, Op2::OutRank)
  using Parent::adjoint;
  using Parent::forward;
  using Ptr = std::shared_ptr<Compose>;

  Compose(std::shared_ptr<Op1> op1, std::shared_ptr<Op2> op2)
    : Parent(fmt::format("{}+{}", op1->name, op2->name), op1->ishape, op2->oshape)
    , op1_{op1}
    , op2_{op2}
  {
    static_assert(Op1::OutRank == Op2::InRank);
    if (op1_->oshape != op2_->ishape) {
      throw Log::Failure(this->name, "{} oshape {} did not match {} ishape {}", op1_->name, op1_->oshape, op2_->name,
                         op2_->ishape);
    }
  }

  void forward(InCMap x, OutMap y, float const s = 1.f) const
  {
    auto const              time = this->startForward(x, y, false);
    typename Op1::OutTensor temp(op1_->oshape);
    op1_->forward(x, typename Op1::OutMap(temp.data(), op1_->oshape));
    op2_->forward(typename Op1::OutCMap(temp.data(), op1_->oshape), y, s);
    this->finishForward(y, time, false);
  }

  void adjoint(OutCMap y, InMap x, float const s = 1.f) const
  {
    auto const              time = this->startAdjoint(y, x, false);
    typename Op1::OutTensor temp(op1_->oshape);
    op2_->adjoint(y, typename Op1::OutMap(temp.data(), op1_->oshape));
    op1_->adjoint(typename Op1::OutCMap(temp.data(), op1_->oshape), x, s);
    this->finishAdjoint(x, time, false);
  }

  void iforward(InCMap x, OutMap y, float const s = 1.f) const
  {
    auto const              time = this->startForward(x, y, true);
    typename Op1::OutTensor temp(op1_->oshape);
    op1_->forward(x, typename Op1::OutMap(temp.data(), op1_->oshape));
    op2_->iforward(typename Op1::OutCMap(temp.data(), op1_->oshape), y, s);
    this->finishForward(y, time, true);
  }

  void iadjoint(OutCMap y, InMap x, float const s = 1.f) const
  {
    auto const              time = this->startAdjoint(y, x, true);
    typename Op1::OutTensor temp(op1_->oshape);
    op2_->adjoint(y, typename Op1::OutMap(temp.data(), op1_->oshape));
    op1_->iadjoint(typename Op1::OutCMap(temp.data(), op1_->oshape), x, s);
    this->finishAdjoint(x, time, true);
  }

private:
  std::shared_ptr<Op1> op1_;
  std::shared_ptr<Op2> op2_;
};

template <typename Op1, typename Op2> auto MakeCompose(std::shared_ptr<Op1> op1, std::shared_ptr<Op2> op2)
  -> typename Compose<Op1, Op2>::Ptr
{
  return std::make_shared<Compose<Op1, Op2>>(op1, op2);
}

} // namespace ve::TOps
