#include "nufft.hpp"

#include "../fft.hpp"
#include "../log/log.hpp"
#include "top-impl.hpp"

namespace ve::TOps {

template <int ND, typename KF>
NUFFT<ND, KF>::NUFFT(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nChan)
  : Parent("NUFFT")
  , gridder{opts, traj, nChan}
  , apo{AddBack(opts.matrix, nChan), gridder.ishape, opts.osamp()}
{
  ishape = apo.ishape;
  oshape = gridder.oshape;
  std::iota(fftDims.begin(), fftDims.end(), 0);
  if (opts.shifted()) {
    auto const delta = opts.centre() - opts.shift.value();
    phase.resize(traj.nSamples());
    for (Index is = 0; is < traj.nSamples(); is++) {
      auto const  p = traj.point(is);
      float const ph = (p.array() * delta).sum();
      phase(is) = std::isfinite(ph) ? std::polar(1.f, -ph) : Cx(1.f);
    }
    Log::Debug("NUFFT", "Shift {} from centre {}", fmt::streamed(opts.shift.value().transpose()),
               fmt::streamed(opts.centre().transpose()));
  }
  Log::Debug("NUFFT", "ishape {} oshape {} grid {}", ishape, oshape, gridder.ishape);
}

template <int ND, typename KF> void NUFFT<ND, KF>::fromGrid(InMap ws, OutMap y, bool const ip) const
{
  InCMap wscm(ws.data(), ws.dimensions());
  FFT::Forward(ws, fftDims);
  if (phase.size() == 0) {
    if (ip) {
      gridder.iforward(wscm, y);
    } else {
      gridder.forward(wscm, y);
    }
  } else {
    OutTensor  temp(oshape);
    OutMap     tm(temp.data(), oshape);
    auto const ph = phase.reshape(Sz2{1, oshape[1]}).broadcast(Sz2{oshape[0], 1});
    gridder.forward(wscm, tm);
    if (ip) {
      y.device(Threads::TensorDevice()) += temp * ph;
    } else {
      y.device(Threads::TensorDevice()) = temp * ph;
    }
  }
}

template <int ND, typename KF> void NUFFT<ND, KF>::toGrid(OutCMap y, InMap ws) const
{
  if (phase.size() == 0) {
    gridder.adjoint(y, ws);
  } else {
    OutTensor const temp = y * phase.conjugate().reshape(Sz2{1, oshape[1]}).broadcast(Sz2{oshape[0], 1});
    gridder.adjoint(OutCMap(temp.data(), oshape), ws);
  }
  FFT::Adjoint(ws, fftDims);
}

template <int ND, typename KF> void NUFFT<ND, KF>::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  InTensor   ws(gridder.ishape);
  InMap      wsm(ws.data(), gridder.ishape);
  apo.forward(x, wsm, s);
  fromGrid(wsm, y, false);
  this->finishForward(y, time, false);
}

template <int ND, typename KF> void NUFFT<ND, KF>::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  InTensor   ws(gridder.ishape);
  InMap      wsm(ws.data(), gridder.ishape);
  toGrid(y, wsm);
  apo.adjoint(InCMap(ws.data(), gridder.ishape), x, s);
  this->finishAdjoint(x, time, false);
}

template <int ND, typename KF> void NUFFT<ND, KF>::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  InTensor   ws(gridder.ishape);
  InMap      wsm(ws.data(), gridder.ishape);
  apo.forward(x, wsm, s);
  fromGrid(wsm, y, true);
  this->finishForward(y, time, true);
}

template <int ND, typename KF> void NUFFT<ND, KF>::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  InTensor   ws(gridder.ishape);
  InMap      wsm(ws.data(), gridder.ishape);
  toGrid(y, wsm);
  apo.iadjoint(InCMap(ws.data(), gridder.ishape), x, s);
  this->finishAdjoint(x, time, true);
}

template struct NUFFT<2, ve::ExpSemi<4>>;
template struct NUFFT<3, ve::ExpSemi<4>>;
template struct NUFFT<2, ve::ExpSemi<6>>;
template struct NUFFT<3, ve::ExpSemi<6>>;
template struct NUFFT<2, ve::ExpSemi<8>>;
template struct NUFFT<3, ve::ExpSemi<8>>;

template <int ND> auto MakeNUFFT(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nChan)
  -> typename TOp<ND + 1, 2>::Ptr
{
  opts.validate();
  switch (opts.width[0]) {
  case 4: return std::make_shared<TOps::NUFFT<ND, ExpSemi<4>>>(opts, traj, nChan);
  case 6: return std::make_shared<TOps::NUFFT<ND, ExpSemi<6>>>(opts, traj, nChan);
  case 8: return std::make_shared<TOps::NUFFT<ND, ExpSemi<8>>>(opts, traj, nChan);
  default: throw(Log::Failure("NUFFT", "Kernel width {} not supported", opts.width[0]));
  }
}

template <int ND> auto MakeGrid(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nChan)
  -> typename TOp<ND + 1, 2>::Ptr
{
  opts.validate();
  switch (opts.width[0]) {
  case 4: return std::make_shared<TOps::Grid<ND, ExpSemi<4>>>(opts, traj, nChan);
  case 6: return std::make_shared<TOps::Grid<ND, ExpSemi<6>>>(opts, traj, nChan);
  case 8: return std::make_shared<TOps::Grid<ND, ExpSemi<8>>>(opts, traj, nChan);
  default: throw(Log::Failure("Grid", "Kernel width {} not supported", opts.width[0]));
  }
}

template auto MakeNUFFT<2>(NUFFTOpts<2> const &, TrajectoryN<2> const &, Index const) -> TOp<3, 2>::Ptr;
template auto MakeNUFFT<3>(NUFFTOpts<3> const &, TrajectoryN<3> const &, Index const) -> TOp<4, 2>::Ptr;
template auto MakeGrid<2>(NUFFTOpts<2> const &, TrajectoryN<2> const &, Index const) -> TOp<3, 2>::Ptr;
template auto MakeGrid<3>(NUFFTOpts<3> const &, TrajectoryN<3> const &, Index const) -> TOp<4, 2>::Ptr;

} // namespace ve::TOps
