#include "toeplitz.hpp"

#include "fft.hpp"
#include "log/log.hpp"
#include "sys/threads.hpp"

namespace ve {
namespace Toeplitz {

namespace {

/* A'A applied to a delta at corner, for a single coil of ones */
template <int ND> auto CornerColumn(TOps::VEASL<ND> const &op, Index const t, Index const enc, Sz3 const corner) -> Cx3
{
  auto const                             &P = op.plan(t, enc);
  typename TOps::TOp<ND + 1, 2>::InTensor delta(P->ishape);
  Eigen::array<Index, ND + 1>             index;
  delta.setZero();
  for (Index ii = 0; ii < ND; ii++) {
    index[ii] = corner[ii];
  }
  index[ND] = 0;
  delta(index) = 1.f;
  Cx2         ks = P->forward(delta);
  Index const nC = ks.dimension(0);
  Index const nS = ks.dimension(1);
  Re1 const   w = op.sqrtWeights().template chip<2>(enc).template chip<1>(t).square();
  ks.device(Threads::TensorDevice()) = ks * w.reshape(Sz2{1, nS}).broadcast(Sz2{nC, 1}).template cast<Cx>();
  auto const col = P->adjoint(ks);
  Cx3 const  c0 = col.template chip<ND>(0).reshape(op.matrix());
  return c0;
}

/* Merge pairs of columns that differ only on axis, then carry on with the next axis */
auto Merge(std::vector<Cx3> const &cols, Index const axis) -> Cx3
{
  if (cols.size() == 1) { return cols.front(); }
  if (cols.size() % 2 != 0) { throw Log::Failure("Toeplitz", "Cannot merge {} corner columns on axis {}", cols.size(), axis); }
  std::vector<Cx3> merged;
  for (size_t ii = 0; ii < cols.size(); ii += 2) {
    merged.push_back(EmbedAxis(cols[ii], cols[ii + 1], axis));
  }
  return Merge(merged, axis + 1);
}

/* Negative lags on the last axis. Reverse it, circularly reverse every axis before it, and conjugate */
auto HermitianMirror(Cx3 const &first, Index const last) -> Cx3
{
  auto const sh = first.dimensions();
  Cx3        m(sh);
  for (Index iz = 0; iz < sh[2]; iz++) {
    for (Index iy = 0; iy < sh[1]; iy++) {
      for (Index ix = 0; ix < sh[0]; ix++) {
        Sz3 src{ix, iy, iz};
        for (Index ia = 0; ia < last; ia++) {
          src[ia] = (sh[ia] - src[ia]) % sh[ia];
        }
        src[last] = sh[last] - 1 - src[last];
        m(ix, iy, iz) = std::conj(first(src[0], src[1], src[2]));
      }
    }
  }
  return m;
}

} // namespace

auto EmbedAxis(Cx3 const &first, Cx3 const &mirror, Index const axis) -> Cx3
{
  if (axis < 0 || axis > 2) { throw Log::Failure("Toeplitz", "Invalid embedding axis {}", axis); }
  if (first.dimensions() != mirror.dimensions()) {
    throw Log::Failure("Toeplitz", "First {} and mirror {} dimensions differ", first.dimensions(), mirror.dimensions());
  }
  Index const N = first.dimension(axis);
  Sz3         shape = first.dimensions();
  shape[axis] = 2 * N;
  Cx3 out(shape);
  out.setZero();
  out.slice(Sz3{0, 0, 0}, first.dimensions()) = first;
  if (N > 1) {
    Sz3 st{0, 0, 0}, sz = first.dimensions();
    st[axis] = N + 1;
    sz[axis] = N - 1;
    out.slice(st, sz) = mirror.slice(Sz3{0, 0, 0}, sz);
  }
  return out;
}

template <int ND> auto Embedding(TOps::VEASL<ND> const &op) -> Cx5
{
  Sz3 const   N = op.matrix();
  Index const nT = op.nTime();
  Index const nE = op.nEnc();
  Sz3         eshape = N;
  for (Index ii = 0; ii < ND; ii++) {
    eshape[ii] = 2 * N[ii];
  }
  float const scale = std::sqrt(float(Product(eshape))) * op.norm() * op.norm();
  Sz<ND>      fftDims;
  std::iota(fftDims.begin(), fftDims.end(), 0);
  Index const nCorners = 1 << (ND - 1);
  Log::Print("Toeplitz", "Embedding shape {} from {} corners for {} times {} encodings", eshape, nCorners, nT, nE);

  Cx5 T(AddBack(eshape, nT, nE));
  for (Index ie = 0; ie < nE; ie++) {
    for (Index it = 0; it < nT; it++) {
      auto const       start = Log::Now();
      std::vector<Cx3> cols;
      for (Index ic = 0; ic < nCorners; ic++) {
        Sz3 corner{0, 0, 0};
        for (Index ia = 0; ia < ND - 1; ia++) {
          corner[ia] = ((ic >> ia) & 1) ? N[ia] - 1 : 0;
        }
        cols.push_back(CornerColumn(op, it, ie, corner));
      }
      Cx3 psf = Merge(cols, 0);
      psf = EmbedAxis(psf, HermitianMirror(psf, ND - 1), ND - 1);
      FFT::Forward(psf, fftDims, false);
      T.template chip<4>(ie).template chip<3>(it).device(Threads::TensorDevice()) = psf * psf.constant(scale);
      Log::Debug("Toeplitz", "Time {} encoding {} took {}", it, ie, Log::ToNow(start));
    }
  }
  return T;
}

template auto Embedding<2>(TOps::VEASL<2> const &) -> Cx5;
template auto Embedding<3>(TOps::VEASL<3> const &) -> Cx5;

auto Embedding(TOps::TOp<5, 4> const &op) -> Cx5
{
  if (auto const *v2 = dynamic_cast<TOps::VEASL<2> const *>(&op)) {
    return Embedding(*v2);
  } else if (auto const *v3 = dynamic_cast<TOps::VEASL<3> const *>(&op)) {
    return Embedding(*v3);
  }
  throw Log::Failure("Toeplitz", "Operator {} does not have a rectilinear 2D or 3D grid", op.name);
}

} // namespace Toeplitz
} // namespace ve
