#include "toeplitz.hpp"

#include "../fft.hpp"
#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "../toeplitz.hpp"
#include "top-impl.hpp"

namespace ve::TOps {

namespace {
auto EmbeddedShape(Cx4 const &S) -> Sz3
{
  if (S.size() == 0) { throw Log::Failure("Toeplitz", "Sensitivity maps are empty"); }
  Sz3 const m = FirstN<3>(S.dimensions());
  return Sz3{2 * m[0], 2 * m[1], m[2] == 1 ? 1 : 2 * m[2]};
}
} // namespace

Toeplitz::Toeplitz(Cx5 const &T, Cx4 const &S, Cx2 const &H)
  : Parent("Toeplitz")
  , T_{T}
  , sense_{S, 1}
  , encode_{H, AddBack(FirstN<3>(S.dimensions()), T.dimension(3))}
  , pad_{AddBack(FirstN<3>(S.dimensions()), S.dimension(3)), AddBack(EmbeddedShape(S), S.dimension(3))}
  , nd_{S.dimension(2) == 1 ? 2 : 3}
{
  if (FirstN<3>(T_.dimensions()) != FirstN<3>(pad_.oshape)) {
    throw Log::Failure("Toeplitz", "Embedding {} does not match doubled matrix {}", T_.dimensions(), FirstN<3>(pad_.oshape));
  }
  if (T_.dimension(4) != encode_.oshape[4]) {
    throw Log::Failure("Toeplitz", "Embedding has {} encodings but H has {} rows", T_.dimension(4), encode_.oshape[4]);
  }
  ishape = encode_.ishape;
  oshape = encode_.ishape;
}

void Toeplitz::apply(InCMap x, OutMap y, float const s, bool const ip) const
{
  Index const nT = T_.dimension(3), nE = T_.dimension(4), nC = sense_.nChannels();
  Index const nVox = Product(sense_.mapDimensions());
  Cx5         mixed(encode_.oshape), result(encode_.oshape);
  encode_.forward(x, Cx5Map(mixed.data(), mixed.dimensions()));
  Cx5       coils(sense_.oshape);
  Cx4       padded(pad_.oshape);
  Cx4Map    pm(padded.data(), padded.dimensions());
  Sz4 const tshape = AddBack(FirstN<3>(T_.dimensions()), 1);
  for (Index ie = 0; ie < nE; ie++) {
    for (Index it = 0; it < nT; it++) {
      Log::Debug("Toeplitz", "Time {} encoding {}", it, ie);
      sense_.forward(Cx4CMap(mixed.data() + nVox * (it + nT * ie), sense_.ishape), Cx5Map(coils.data(), coils.dimensions()));
      pad_.forward(Cx4CMap(coils.data(), pad_.ishape), pm);
      if (nd_ == 2) {
        FFT::Forward(pm, Sz2{0, 1}, false);
      } else {
        FFT::Forward(pm, Sz3{0, 1, 2}, false);
      }
      pm.device(Threads::TensorDevice()) = pm * T_.chip<4>(ie).chip<3>(it).reshape(tshape).broadcast(Sz4{1, 1, 1, nC});
      if (nd_ == 2) {
        FFT::Adjoint(pm, Sz2{0, 1}, false);
      } else {
        FFT::Adjoint(pm, Sz3{0, 1, 2}, false);
      }
      pad_.adjoint(Cx4CMap(padded.data(), padded.dimensions()), Cx4Map(coils.data(), pad_.ishape));
      sense_.adjoint(Cx5CMap(coils.data(), coils.dimensions()), Cx4Map(result.data() + nVox * (it + nT * ie), sense_.ishape));
    }
  }
  if (ip) {
    encode_.iadjoint(Cx5CMap(result.data(), result.dimensions()), y, s);
  } else {
    encode_.adjoint(Cx5CMap(result.data(), result.dimensions()), y, s);
  }
}

void Toeplitz::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  apply(x, y, s, false);
  this->finishForward(y, time, false);
}

void Toeplitz::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  apply(y, x, s, false);
  this->finishAdjoint(x, time, false);
}

void Toeplitz::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  apply(x, y, s, true);
  this->finishForward(y, time, true);
}

void Toeplitz::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  apply(y, x, s, true);
  this->finishAdjoint(x, time, true);
}

auto Toeplitz::embedding() const -> Cx5 const & { return T_; }

auto MakeToeplitz(TOp<5, 4>::Ptr const &op) -> TOp<5, 5>::Ptr
{
  if (auto const v2 = std::dynamic_pointer_cast<VEASL<2>>(op)) {
    return std::make_shared<Toeplitz>(ve::Toeplitz::Embedding(*v2), v2->sense().maps(), v2->encode().matrix());
  } else if (auto const v3 = std::dynamic_pointer_cast<VEASL<3>>(op)) {
    return std::make_shared<Toeplitz>(ve::Toeplitz::Embedding(*v3), v3->sense().maps(), v3->encode().matrix());
  }
  throw Log::Failure("Toeplitz", "Operator {} does not have a rectilinear 2D or 3D grid", op ? op->name : "null");
}

} // namespace ve::TOps
