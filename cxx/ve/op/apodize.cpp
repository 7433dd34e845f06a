#include "apodize.hpp"

#include "top-impl.hpp"

#include "../fft.hpp"
#include "../kernel/kernel.hpp"
#include "../log/log.hpp"
#include "../tensors.hpp"

namespace ve::TOps {

namespace {

/*
 * Centre the kernel on the grid and take the unitary adjoint FFT. Cropped to the image this is D / sqrt(prod(G)), where D
 * is the kernel's DTFT at each image position. Its reciprocal therefore carries the sqrt(prod(G)) that the unitary grid
 * FFT removes.
 */
template <int ND, typename KF> auto KernelFFT(Sz<ND> const shape, Sz<ND> const gridshape, float const osamp) -> CxN<ND>
{
  Kernel<ND, KF> kernel(osamp);
  CxN<ND>        k = kernel().template cast<Cx>();
  Sz<ND>         left;
  for (Index ii = 0; ii < ND; ii++) {
    if (gridshape[ii] < k.dimension(ii)) { throw Log::Failure("Apodiz", "Grid {} smaller than kernel", gridshape); }
    left[ii] = (gridshape[ii] - k.dimension(ii) + 1) / 2;
  }
  CxN<ND> temp(gridshape);
  temp.setZero();
  temp.slice(left, k.dimensions()) = k;
  FFT::Adjoint(temp);
  for (Index ii = 0; ii < ND; ii++) {
    left[ii] = (gridshape[ii] - shape[ii] + 1) / 2;
  }
  ReN<ND> const ft = temp.slice(left, shape).abs();
  float const   floor = Maximum(ft) * 1.e-3f;
  Log::Debug("Apodiz", "Shape {} Grid shape {} floor {}", shape, gridshape, floor);
  ReN<ND> const a = ft.cwiseMax(floor).inverse();
  return a.template cast<Cx>();
}
} // namespace

template <int ND, typename KF>
Apodize<ND, KF>::Apodize(Sz<ND + 1> const ish, Sz<ND + 1> const osh, float const osamp)
  : Parent("Apodiz", ish, osh)
{
  if (ishape[ND] != oshape[ND]) { throw Log::Failure("Apodiz", "Channel mismatch {} vs {}", ishape, oshape); }
  auto apo_shape = ishape;
  apo_shape[ND] = 1;
  apoBrd_.fill(1);
  apoBrd_[ND] = ishape[ND];
  apo_ = KernelFFT<ND, KF>(FirstN<ND>(ishape), FirstN<ND>(oshape), osamp).reshape(apo_shape);
  Sz<InRank> padRight;
  padLeft_.fill(0);
  padRight.fill(0);
  for (int ii = 0; ii < ND; ii++) {
    padLeft_[ii] = (oshape[ii] - ishape[ii] + 1) / 2;
    padRight[ii] = (oshape[ii] - ishape[ii]) / 2;
  }
  std::transform(padLeft_.cbegin(), padLeft_.cend(), padRight.cbegin(), paddings_.begin(),
                 [](Index left, Index right) { return std::make_pair(left, right); });
}

template <int ND, typename KF> void Apodize<ND, KF>::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  y.device(Threads::TensorDevice()) = (x * apo_.broadcast(apoBrd_)).pad(paddings_) * y.constant(s);
  this->finishForward(y, time, false);
}

template <int ND, typename KF> void Apodize<ND, KF>::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  x.device(Threads::TensorDevice()) = y.slice(padLeft_, ishape) * apo_.broadcast(apoBrd_) * x.constant(s);
  this->finishAdjoint(x, time, false);
}

template <int ND, typename KF> void Apodize<ND, KF>::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  y.device(Threads::TensorDevice()) += (x * apo_.broadcast(apoBrd_)).pad(paddings_) * y.constant(s);
  this->finishForward(y, time, true);
}

template <int ND, typename KF> void Apodize<ND, KF>::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  x.device(Threads::TensorDevice()) += y.slice(padLeft_, ishape) * apo_.broadcast(apoBrd_) * x.constant(s);
  this->finishAdjoint(x, time, true);
}

template struct Apodize<2, ExpSemi<4>>;
template struct Apodize<3, ExpSemi<4>>;
template struct Apodize<2, ExpSemi<6>>;
template struct Apodize<3, ExpSemi<6>>;
template struct Apodize<2, ExpSemi<8>>;
template struct Apodize<3, ExpSemi<8>>;

} // namespace ve::TOps
