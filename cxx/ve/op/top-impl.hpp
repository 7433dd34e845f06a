#pragma once

#include "top.hpp"

#include "../log/log.hpp"

namespace ve::TOps {

namespace internal {
template <typename D> void CheckDims(std::string const &name, std::string_view const what, D const &got, D const &want)
{
  if (got != want) { throw Log::Failure(name, "{} dims {} expected {}", what, got, want); }
}

inline void CheckSize(std::string const &name, std::string_view const what, Index const got, Index const want)
{
  if (got != want) { throw Log::Failure(name, "{} size {} expected {}", what, got, want); }
}

inline auto InPlace(bool const ip) -> std::string_view { return ip ? "IP " : ""; }
} // namespace internal

template <int I, int O> TOp<I, O>::TOp(std::string const &n)
  : Ops::Op{n}
{
  Log::Debug("TOp", "{} created.", this->name);
}

template <int I, int O> TOp<I, O>::TOp(std::string const &n, InDims const xd, OutDims const yd)
  : Ops::Op{n}
  , ishape{xd}
  , oshape{yd}
{
  Log::Debug("TOp", "{} created. Input dims {} Output dims {}", this->name, ishape, oshape);
}

template <int I, int O> auto TOp<I, O>::rows() const -> Index { return Product(oshape); }
template <int I, int O> auto TOp<I, O>::cols() const -> Index { return Product(ishape); }

template <int I, int O> void TOp<I, O>::forward(typename Base::CMap x, typename Base::Map y, float const s) const
{
  internal::CheckSize(this->name, "Forward x", x.rows(), cols());
  internal::CheckSize(this->name, "Forward y", y.rows(), rows());
  forward(InCMap(x.data(), ishape), OutMap(y.data(), oshape), s);
}

template <int I, int O> void TOp<I, O>::adjoint(typename Base::CMap y, typename Base::Map x, float const s) const
{
  internal::CheckSize(this->name, "Adjoint y", y.rows(), rows());
  internal::CheckSize(this->name, "Adjoint x", x.rows(), cols());
  adjoint(OutCMap(y.data(), oshape), InMap(x.data(), ishape), s);
}

template <int I, int O> void TOp<I, O>::iforward(typename Base::CMap x, typename Base::Map y, float const s) const
{
  internal::CheckSize(this->name, "Forward+ x", x.rows(), cols());
  internal::CheckSize(this->name, "Forward+ y", y.rows(), rows());
  iforward(InCMap(x.data(), ishape), OutMap(y.data(), oshape), s);
}

template <int I, int O> void TOp<I, O>::iadjoint(typename Base::CMap y, typename Base::Map x, float const s) const
{
  internal::CheckSize(this->name, "Adjoint+ y", y.rows(), rows());
  internal::CheckSize(this->name, "Adjoint+ x", x.rows(), cols());
  iadjoint(OutCMap(y.data(), oshape), InMap(x.data(), ishape), s);
}

template <int I, int O> auto TOp<I, O>::forward(InTensor const &x, float const s) const -> OutTensor
{
  OutTensor y(oshape);
  Log::Debug("TOp", "{} forward allocated {}", this->name, oshape);
  forward(x, y, s);
  return y;
}

template <int I, int O> auto TOp<I, O>::adjoint(OutTensor const &y, float const s) const -> InTensor
{
  InTensor x(ishape);
  Log::Debug("TOp", "{} adjoint allocated {}", this->name, ishape);
  adjoint(y, x, s);
  return x;
}

template <int I, int O> void TOp<I, O>::forward(InTensor const &x, OutTensor &y, float const s) const
{
  internal::CheckDims(this->name, "Forward x", x.dimensions(), ishape);
  internal::CheckDims(this->name, "Forward y", y.dimensions(), oshape);
  forward(InCMap(x.data(), ishape), OutMap(y.data(), oshape), s);
}

template <int I, int O> void TOp<I, O>::adjoint(OutTensor const &y, InTensor &x, float const s) const
{
  internal::CheckDims(this->name, "Adjoint y", y.dimensions(), oshape);
  internal::CheckDims(this->name, "Adjoint x", x.dimensions(), ishape);
  adjoint(OutCMap(y.data(), oshape), InMap(x.data(), ishape), s);
}

template <int I, int O> void TOp<I, O>::iforward(InCMap, OutMap, float) const
{
  throw Log::Failure(this->name, "In place forward not implemented");
}

template <int I, int O> void TOp<I, O>::iadjoint(OutCMap, InMap, float) const
{
  throw Log::Failure(this->name, "In place adjoint not implemented");
}

template <int I, int O> auto TOp<I, O>::startForward(InCMap x, OutMap y, bool const ip) const -> Time
{
  internal::CheckDims(this->name, "Forward x", x.dimensions(), ishape);
  internal::CheckDims(this->name, "Forward y", y.dimensions(), oshape);
  if (Log::IsHigh()) {
    Log::Debug(this->name, "{}Forward {}->{} |x| {}", internal::InPlace(ip), ishape, oshape, Norm<true>(x));
  } else {
    Log::Debug(this->name, "{}Forward {}->{}", internal::InPlace(ip), ishape, oshape);
  }
  return Log::Now();
}

template <int I, int O> void TOp<I, O>::finishForward(OutMap y, Time const start, bool const ip) const
{
  if (Log::IsHigh()) {
    Log::Debug(this->name, "{}Forward finished in {} |y| {}", internal::InPlace(ip), Log::ToNow(start), Norm<true>(y));
  } else {
    Log::Debug(this->name, "{}Forward finished in {}", internal::InPlace(ip), Log::ToNow(start));
  }
}

template <int I, int O> auto TOp<I, O>::startAdjoint(OutCMap y, InMap x, bool const ip) const -> Time
{
  internal::CheckDims(this->name, "Adjoint y", y.dimensions(), oshape);
  internal::CheckDims(this->name, "Adjoint x", x.dimensions(), ishape);
  if (Log::IsHigh()) {
    Log::Debug(this->name, "{}Adjoint {}->{} |y| {}", internal::InPlace(ip), oshape, ishape, Norm<true>(y));
  } else {
    Log::Debug(this->name, "{}Adjoint {}->{}", internal::InPlace(ip), oshape, ishape);
  }
  return Log::Now();
}

template <int I, int O> void TOp<I, O>::finishAdjoint(InMap x, Time const start, bool const ip) const
{
  if (Log::IsHigh()) {
    Log::Debug(this->name, "{}Adjoint finished in {} |x| {}", internal::InPlace(ip), Log::ToNow(start), Norm<true>(x));
  } else {
    Log::Debug(this->name, "{}Adjoint finished in {}", internal::InPlace(ip), Log::ToNow(start));
  }
}

} // namespace ve::TOps
