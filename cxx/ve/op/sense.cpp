#include "sense.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "top-impl.hpp"

namespace ve::TOps {

namespace {
auto SelectCoils(Cx4 const &maps, std::vector<Index> const &subset) -> Cx4
{
  if (subset.empty()) { return maps; }
  Index const nC = maps.dimension(3);
  Cx4         sel(AddBack(FirstN<3>(maps.dimensions()), (Index)subset.size()));
  for (size_t ii = 0; ii < subset.size(); ii++) {
    if (subset[ii] < 0 || subset[ii] >= nC) {
      throw Log::Failure("SENSE", "Coil {} out of range, have {} coils", subset[ii], nC);
    }
    sel.chip<3>(ii) = maps.chip<3>(subset[ii]);
  }
  return sel;
}
} // namespace

SENSE::SENSE(Cx4 const &maps, Index const nB, std::vector<Index> const &subset)
  : Parent("SENSE")
  , maps_{SelectCoils(maps, subset)}
{
  if (nB < 1) { throw Log::Failure("SENSE", "Batch size {} must be positive", nB); }
  for (int ii = 0; ii < 3; ii++) {
    ishape[ii] = maps_.dimension(ii);
    oshape[ii] = maps_.dimension(ii);
    resX.set(ii, maps_.dimension(ii));
    resMaps.set(ii, maps_.dimension(ii));
  }
  ishape[3] = nB;
  oshape[3] = nB;
  resX.set(3, nB);
  oshape[4] = maps_.dimension(3);
  brdX.set(4, maps_.dimension(3));
  resMaps.set(4, maps_.dimension(3));
  brdMaps.set(3, nB);
  Log::Debug("SENSE", "Maps {} batch {} using {} coils", FirstN<3>(maps_.dimensions()), nB, maps_.dimension(3));
}

void SENSE::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  y.device(Threads::TensorDevice()) =
    x.reshape(resX).broadcast(brdX) * maps_.reshape(resMaps).broadcast(brdMaps) * y.constant(s);
  this->finishForward(y, time, false);
}

void SENSE::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  y.device(Threads::TensorDevice()) +=
    x.reshape(resX).broadcast(brdX) * maps_.reshape(resMaps).broadcast(brdMaps) * y.constant(s);
  this->finishForward(y, time, true);
}

void SENSE::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  x.device(Threads::TensorDevice()) =
    (y * maps_.reshape(resMaps).broadcast(brdMaps).conjugate()).sum(Sz1{4}) * x.constant(s);
  this->finishAdjoint(x, time, false);
}

void SENSE::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  x.device(Threads::TensorDevice()) +=
    (y * maps_.reshape(resMaps).broadcast(brdMaps).conjugate()).sum(Sz1{4}) * x.constant(s);
  this->finishAdjoint(x, time, true);
}

auto SENSE::nChannels() const -> Index { return oshape[4]; }
auto SENSE::mapDimensions() const -> Sz3 { return FirstN<3>(ishape); }
auto SENSE::maps() const -> Cx4 const & { return maps_; }

auto MakeSENSE(Cx4 const &maps, Index const nB, std::vector<Index> const &subset) -> SENSE::Ptr
{
  return std::make_shared<SENSE>(maps, nB, subset);
}

} // namespace ve::TOps
