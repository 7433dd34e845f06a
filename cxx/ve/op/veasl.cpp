#include "veasl.hpp"

#include "../log/log.hpp"
#include "../sdc.hpp"
#include "../sys/threads.hpp"
#include "../trajectory.hpp"
#include "nufft.hpp"
#include "top-impl.hpp"

namespace ve {

template <int ND> auto VEASLOpts::nufft() const -> NUFFTOpts<ND>
{
  NUFFTOpts<ND> opts{.matrix = FirstN<ND>(matrix), .grid = FirstN<ND>(grid), .width = FirstN<ND>(width), .lowmem = lowmem};
  if (shift) { opts.shift = typename NUFFTOpts<ND>::Arrayf(shift.value().head<ND>()); }
  return opts;
}

template auto VEASLOpts::nufft<2>() const -> NUFFTOpts<2>;
template auto VEASLOpts::nufft<3>() const -> NUFFTOpts<3>;

namespace TOps {

namespace {
auto CheckMaps(Cx4 const &S, Sz3 const matrix) -> Cx4
{
  if (S.size() == 0) {
    Cx4 ones(AddBack(matrix, 1));
    ones.setConstant(1.f);
    return ones;
  }
  if (FirstN<3>(S.dimensions()) != matrix) {
    throw Log::Failure("VEASL", "Sensitivity maps {} do not match matrix {}", S.dimensions(), matrix);
  }
  return S;
}

auto CheckWeights(Re3 const &w, Sz3 const expected) -> Re3
{
  if (w.dimensions() != expected) { throw Log::Failure("VEASL", "Weights {} do not match samples {}", w.dimensions(), expected); }
  for (Index ii = 0; ii < w.size(); ii++) {
    if (!std::isfinite(w.data()[ii]) || w.data()[ii] < 0.f) {
      throw Log::Failure("VEASL", "Weight {} at index {} must be finite and non-negative", w.data()[ii], ii);
    }
  }
  return w.sqrt();
}
} // namespace

template <int ND>
VEASL<ND>::VEASL(VEASLOpts const &opts, Re4 const &k, Cx4 const &S, Cx2 const &H, Re3 const &w)
  : Parent("VEASL")
  , sense_{CheckMaps(S, opts.matrix), 1}
  , encode_{H.size() ? H : TagControl(), AddBack(opts.matrix, k.dimension(2))}
  , norm_{1.f / std::sqrt(float(Product(opts.matrix)))}
{
  if constexpr (ND == 2) {
    if (opts.matrix[2] != 1) { throw Log::Failure("VEASL", "2D operator requested for matrix {}", opts.matrix); }
  }
  Index const nS = k.dimension(1);
  Index const nT = k.dimension(2);
  Index const nE = k.dimension(3);
  Index const nC = sense_.nChannels();
  if (nE != encode_.oshape[4]) {
    throw Log::Failure("VEASL", "Trajectory has {} encodings but H has {} rows", nE, encode_.oshape[4]);
  }
  if (encode_.ishape[4] > nE) {
    throw Log::Failure("VEASL", "H has {} components but only {} encodings", encode_.ishape[4], nE);
  }
  ishape = encode_.ishape;
  oshape = Sz4{nS, nT, nE, nC};

  auto const nopts = opts.nufft<ND>();
  nopts.validate();
  Log::Print("VEASL", "Matrix {} Samples {} Times {} Encodings {} Components {} Coils {}", opts.matrix, nS, nT, nE,
             ishape[4], nC);

  sqrtW_.resize(Sz3{nS, nT, nE});
  switch (opts.density) {
  case Density::Given: sqrtW_ = CheckWeights(w, Sz3{nS, nT, nE}); break;
  case Density::Scalar:
    if (!std::isfinite(opts.scalar) || opts.scalar < 0.f) {
      throw Log::Failure("VEASL", "Density scalar {} must be finite and non-negative", opts.scalar);
    }
    sqrtW_.setConstant(std::sqrt(opts.scalar));
    break;
  case Density::Shared: {
    Re1 const w0 = SDC::Pipe<ND>(nopts, ExtractTrajectory<ND>(k, 0, 0)).sqrt();
    sqrtW_ = w0.reshape(Sz3{nS, 1, 1}).broadcast(Sz3{1, nT, nE});
  } break;
  case Density::Estimate: break;
  }

  plans_.reserve(nT * nE);
  for (Index ie = 0; ie < nE; ie++) {
    for (Index it = 0; it < nT; it++) {
      auto const traj = ExtractTrajectory<ND>(k, it, ie);
      if (opts.density == Density::Estimate) {
        sqrtW_.template chip<2>(ie).template chip<1>(it) = SDC::Pipe<ND>(nopts, traj).sqrt();
      }
      plans_.push_back(MakeNUFFT<ND>(nopts, traj, nC));
    }
  }
  Log::Debug("VEASL", "Norm {} ishape {} oshape {}", norm_, ishape, oshape);
}

template <int ND> void VEASL<ND>::toSamples(Cx5 const &mixed, OutMap y, float const s, bool const ip) const
{
  Index const nS = oshape[0], nT = oshape[1], nE = oshape[2], nC = oshape[3];
  Index const nVox = Product(sense_.mapDimensions());
  Cx5         coils(sense_.oshape);
  Cx2         ks(nC, nS);
  Sz4 const   sz{nS, 1, 1, nC};
  for (Index ie = 0; ie < nE; ie++) {
    for (Index it = 0; it < nT; it++) {
      Log::Debug("VEASL", "Forward time {} encoding {}", it, ie);
      auto const &P = plan(it, ie);
      sense_.forward(Cx4CMap(mixed.data() + nVox * (it + nT * ie), sense_.ishape), Cx5Map(coils.data(), coils.dimensions()));
      P->forward(typename TOp<ND + 1, 2>::InCMap(coils.data(), P->ishape), Cx2Map(ks.data(), ks.dimensions()));
      Sz4 const  st{0, it, ie, 0};
      auto const wt =
        sqrtW_.slice(Sz3{0, it, ie}, Sz3{nS, 1, 1}).reshape(Sz4{nS, 1, 1, 1}).broadcast(Sz4{1, 1, 1, nC}).template cast<Cx>();
      if (ip) {
        y.slice(st, sz).device(Threads::TensorDevice()) +=
          ks.shuffle(Sz2{1, 0}).reshape(sz) * wt * y.slice(st, sz).constant(norm_ * s);
      } else {
        y.slice(st, sz).device(Threads::TensorDevice()) =
          ks.shuffle(Sz2{1, 0}).reshape(sz) * wt * y.slice(st, sz).constant(norm_ * s);
      }
    }
  }
}

template <int ND> void VEASL<ND>::fromSamples(OutCMap y, Cx5 &mixed) const
{
  Index const nS = oshape[0], nT = oshape[1], nE = oshape[2], nC = oshape[3];
  Index const nVox = Product(sense_.mapDimensions());
  Cx5         coils(sense_.oshape);
  Cx2         ks(nC, nS);
  Sz4 const   sz{nS, 1, 1, nC};
  for (Index ie = 0; ie < nE; ie++) {
    for (Index it = 0; it < nT; it++) {
      Log::Debug("VEASL", "Adjoint time {} encoding {}", it, ie);
      auto const &P = plan(it, ie);
      Sz4 const   st{0, it, ie, 0};
      auto const  wt =
        sqrtW_.slice(Sz3{0, it, ie}, Sz3{nS, 1, 1}).reshape(Sz4{nS, 1, 1, 1}).broadcast(Sz4{1, 1, 1, nC}).template cast<Cx>();
      ks.device(Threads::TensorDevice()) = (y.slice(st, sz) * wt).reshape(Sz2{nS, nC}).shuffle(Sz2{1, 0});
      P->adjoint(Cx2CMap(ks.data(), ks.dimensions()), typename TOp<ND + 1, 2>::InMap(coils.data(), P->ishape));
      sense_.adjoint(Cx5CMap(coils.data(), coils.dimensions()), Cx4Map(mixed.data() + nVox * (it + nT * ie), sense_.ishape),
                     norm_);
    }
  }
}

template <int ND> void VEASL<ND>::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  Cx5        mixed(encode_.oshape);
  encode_.forward(x, Cx5Map(mixed.data(), mixed.dimensions()));
  toSamples(mixed, y, s, false);
  this->finishForward(y, time, false);
}

template <int ND> void VEASL<ND>::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  Cx5        mixed(encode_.oshape);
  encode_.forward(x, Cx5Map(mixed.data(), mixed.dimensions()));
  toSamples(mixed, y, s, true);
  this->finishForward(y, time, true);
}

template <int ND> void VEASL<ND>::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  Cx5        mixed(encode_.oshape);
  fromSamples(y, mixed);
  encode_.adjoint(Cx5CMap(mixed.data(), mixed.dimensions()), x, s);
  this->finishAdjoint(x, time, false);
}

template <int ND> void VEASL<ND>::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  Cx5        mixed(encode_.oshape);
  fromSamples(y, mixed);
  encode_.iadjoint(Cx5CMap(mixed.data(), mixed.dimensions()), x, s);
  this->finishAdjoint(x, time, true);
}

template <int ND> auto VEASL<ND>::plan(Index const t, Index const enc) const -> Plan const &
{
  return plans_[t + oshape[1] * enc];
}

template <int ND> auto VEASL<ND>::sqrtWeights() const -> Re3 const & { return sqrtW_; }
template <int ND> auto VEASL<ND>::sense() const -> SENSE const & { return sense_; }
template <int ND> auto VEASL<ND>::encode() const -> VesselEncode const & { return encode_; }
template <int ND> auto VEASL<ND>::norm() const -> float { return norm_; }
template <int ND> auto VEASL<ND>::matrix() const -> Sz3 { return FirstN<3>(ishape); }
template <int ND> auto VEASL<ND>::nSamp() const -> Index { return oshape[0]; }
template <int ND> auto VEASL<ND>::nTime() const -> Index { return oshape[1]; }
template <int ND> auto VEASL<ND>::nEnc() const -> Index { return oshape[2]; }

template struct VEASL<2>;
template struct VEASL<3>;

auto MakeVEASL(VEASLOpts const &opts, Re4 const &k, Cx4 const &S, Cx2 const &H, Re3 const &w) -> TOp<5, 4>::Ptr
{
  if (opts.matrix[2] == 1) {
    return std::make_shared<VEASL<2>>(opts, k, S, H, w);
  } else {
    return std::make_shared<VEASL<3>>(opts, k, S, H, w);
  }
}

} // namespace TOps
} // namespace ve
