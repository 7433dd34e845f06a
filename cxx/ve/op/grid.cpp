#include "grid.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"
#include "grid-func.hpp"
#include "grid-subgrid.hpp"
#include "top-impl.hpp"

namespace ve {

namespace TOps {

template <int ND, typename KF, int SG>
Grid<ND, KF, SG>::Grid(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const nC)
  : Parent(fmt::format("Grid{}D", ND))
  , kernel(opts.osamp())
{
  opts.validate();
  auto const gshape = opts.gridShape();
  gridLists = traj.toCoordLists(gshape, kernel.FullWidth, SGSZ);
  ishape = AddBack(gshape, nC);
  oshape = Sz2{nC, traj.nSamples()};
  mutexes = std::vector<std::mutex>(gshape[ND - 1]);
  if (opts.lowmem) {
    table.emplace(opts.osamp());
    Log::Debug("Grid", "Low-memory mode, kernel weights from table");
  } else {
    weights.resize(gridLists.size());
    for (size_t is = 0; is < gridLists.size(); is++) {
      auto const &coords = gridLists[is].coords;
      weights[is].reserve(coords.size());
      for (auto const &m : coords) {
        weights[is].push_back(kernel(m.offset.matrix()));
      }
    }
    Log::Debug("Grid", "Precomputed kernel weights for {} subgrids", weights.size());
  }
  Log::Debug("Grid", "ishape {} oshape {}", this->ishape, this->oshape);
}

template <int ND, typename KF, int SG>
auto Grid<ND, KF, SG>::weight(Index const is, Index const im) const -> typename KType::Tensor
{
  if (table) {
    return table.value()(gridLists[is].coords[im].offset.matrix());
  } else {
    return weights[is][im];
  }
}

template <int ND, typename KF, int SG>
void Grid<ND, KF, SG>::forwardTask(Index const start, Index const stride, float const s, InCMap const x, OutMap y) const
{
  CxN<ND + 1> sx(AddBack(Constant<ND>(SGFW), y.dimension(0)));
  for (Index is = start; is < (Index)gridLists.size(); is += stride) {
    auto const &list = gridLists[is];
    auto const  corner = SubgridCorner<ND, SGSZ, KF::FullWidth>(list.corner);
    if (InBounds<ND, SGFW>(corner, FirstN<ND>(x.dimensions()))) {
      GridToSubgrid<ND, SGFW>::FastCopy(corner, x, sx);
    } else {
      GridToSubgrid<ND, SGFW>::SlowCopy(corner, x, sx);
    }
    for (Index im = 0; im < (Index)list.coords.size(); im++) {
      auto const                  &m = list.coords[im];
      typename KType::Tensor const k = weight(is, im) * s;
      GFunc<ND, KF::FullWidth>::Gather(m.cart, m.sample, k, sx, y);
    }
  }
}

template <int ND, typename KF, int SG> void Grid<ND, KF, SG>::forward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, false);
  y.device(Threads::TensorDevice()) = y.constant(0.f);
  Threads::StridedFor(gridLists.size(), [&](Index const st, Index const sz) { forwardTask(st, sz, s, x, y); });
  this->finishForward(y, time, false);
}

template <int ND, typename KF, int SG> void Grid<ND, KF, SG>::iforward(InCMap x, OutMap y, float const s) const
{
  auto const time = this->startForward(x, y, true);
  Threads::StridedFor(gridLists.size(), [&](Index const st, Index const sz) { forwardTask(st, sz, s, x, y); });
  this->finishForward(y, time, true);
}

template <int ND, typename KF, int SG>
void Grid<ND, KF, SG>::adjointTask(Index const start, Index const stride, float const s, OutCMap y, InMap x) const
{
  CxN<ND + 1> sx(AddBack(Constant<ND>(SGFW), y.dimension(0)));
  for (Index is = start; is < (Index)gridLists.size(); is += stride) {
    auto const &list = gridLists[is];
    sx.setZero();
    for (Index im = 0; im < (Index)list.coords.size(); im++) {
      auto const                  &m = list.coords[im];
      typename KType::Tensor const k = weight(is, im) * s;
      GFunc<ND, KF::FullWidth>::Scatter(m.cart, m.sample, k, y, sx);
    }
    auto const corner = SubgridCorner<ND, SGSZ, KF::FullWidth>(list.corner);
    if (InBounds<ND, SGFW>(corner, FirstN<ND>(x.dimensions()))) {
      SubgridToGrid<ND, SGFW>::FastCopy(mutexes, corner, sx, x);
    } else {
      SubgridToGrid<ND, SGFW>::SlowCopy(mutexes, corner, sx, x);
    }
  }
}

template <int ND, typename KF, int SG> void Grid<ND, KF, SG>::adjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, false);
  x.device(Threads::TensorDevice()) = x.constant(0.f);
  Threads::StridedFor(gridLists.size(), [&](Index const st, Index const sz) { adjointTask(st, sz, s, y, x); });
  this->finishAdjoint(x, time, false);
}

template <int ND, typename KF, int SG> void Grid<ND, KF, SG>::iadjoint(OutCMap y, InMap x, float const s) const
{
  auto const time = this->startAdjoint(y, x, true);
  Threads::StridedFor(gridLists.size(), [&](Index const st, Index const sz) { adjointTask(st, sz, s, y, x); });
  this->finishAdjoint(x, time, true);
}

template struct Grid<2, ve::ExpSemi<4>>;
template struct Grid<3, ve::ExpSemi<4>>;
template struct Grid<2, ve::ExpSemi<6>>;
template struct Grid<3, ve::ExpSemi<6>>;
template struct Grid<2, ve::ExpSemi<8>>;
template struct Grid<3, ve::ExpSemi<8>>;

} // namespace TOps
} // namespace ve
