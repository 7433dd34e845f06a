#include "trajectory.hpp"

#include "log/log.hpp"
#include "tensors.hpp"

#include <cfenv>

namespace ve {

template <int ND> TrajectoryN<ND>::TrajectoryN(Re2 const &points)
  : points_{points}
  , valid_{0}
{
  if (points_.dimension(0) != ND) {
    throw Log::Failure("Traj", "Points have {} co-ordinates, expected {}", points_.dimension(0), ND);
  }
  for (Index is = 0; is < points_.dimension(1); is++) {
    if (std::isfinite(Sum(points_.chip<1>(is)))) { valid_++; }
  }
  if (valid_ < nSamples()) { Log::Warn("Traj", "{} of {} samples are NaN and will be skipped", nSamples() - valid_, nSamples()); }
  Log::Debug("Traj", "{}D Samples {}", ND, nSamples());
}

template <int ND> auto TrajectoryN<ND>::nSamples() const -> Index { return points_.dimension(1); }

template <int ND> auto TrajectoryN<ND>::nValid() const -> Index { return valid_; }

template <int ND> auto TrajectoryN<ND>::points() const -> Re2 const & { return points_; }

template <int ND> auto TrajectoryN<ND>::point(int32_t const sample) const -> Point
{
  Point p;
  for (Index ii = 0; ii < ND; ii++) {
    p[ii] = points_(ii, sample);
  }
  return p;
}

template <int ND> inline auto SubgridIndex(Eigen::Array<Index, ND, 1> const &sg, Eigen::Array<Index, ND, 1> const &ngrids)
  -> Index
{
  Index ind = 0;
  Index stride = 1;
  for (Index ii = 0; ii < ND; ii++) {
    ind += stride * sg[ii];
    stride *= ngrids[ii];
  }
  return ind;
}

template <int ND>
auto TrajectoryN<ND>::toCoordLists(SzN const &gshape, Index const kW, Index const sgSz) const -> std::vector<CoordList>
{
  std::fesetround(FE_TONEAREST);
  using Arrayf = typename Coord::template Array<float>;
  using Arrayi = typename Coord::template Array<Index>;

  Arrayf gmat;
  Arrayi gint;
  for (Index ii = 0; ii < ND; ii++) {
    gmat[ii] = gshape[ii];
    gint[ii] = gshape[ii];
  }
  // k = 0 lands on the grid centre, one grid step is 2π / G radians
  Arrayf const scale = gmat / (2.f * (float)M_PI);
  Arrayf const k0 = (gmat / 2.f).floor();
  Arrayi const nSubgrids = (gmat / sgSz).ceil().template cast<Index>();
  Index const  nTotal = nSubgrids.prod();
  Index        invalids = 0;

  std::vector<CoordList> subs(nTotal);
  for (int32_t is = 0; is < nSamples(); is++) {
    Arrayf const p = point(is).array();
    if ((p != p).any()) {
      invalids++;
      continue;
    }
    Arrayf const k = p * scale + k0;
    Arrayf const ki = k.unaryExpr([](float const &e) { return std::nearbyint(e); });
    Arrayf const ko = k - ki;
    Arrayi       kw = ki.template cast<Index>();
    for (Index ii = 0; ii < ND; ii++) {
      kw[ii] = ((kw[ii] % gint[ii]) + gint[ii]) % gint[ii];
    }
    Arrayi const ksub = kw / sgSz;
    Arrayi const kint = kw - (ksub * sgSz) + (kW / 2);
    Index const  sgind = SubgridIndex(ksub, nSubgrids);
    subs[sgind].corner = ksub.template cast<int16_t>();
    subs[sgind].coords.push_back(Coord{.cart = kint.template cast<int16_t>(), .sample = is, .offset = ko});
  }
  if (invalids > 0) { Log::Debug("Traj", "Ignored {} NaN samples", invalids); }
  auto const eraseCount = std::erase_if(subs, [](auto const &s) { return s.coords.empty(); });
  Log::Debug("Traj", "Removed {} empty subgrids, {} remaining", eraseCount, subs.size());
  std::sort(subs.begin(), subs.end(), [](CoordList const &a, CoordList const &b) { return a.coords.size() > b.coords.size(); });
  for (auto &s : subs) {
    std::sort(s.coords.begin(), s.coords.end(), [](Coord const &a, Coord const &b) {
      // Compare on ijk location, last axis slowest
      for (int di = ND - 1; di >= 0; di--) {
        if (a.cart[di] < b.cart[di]) {
          return true;
        } else if (b.cart[di] < a.cart[di]) {
          return false;
        }
      }
      return false;
    });
  }
  return subs;
}

template <int ND> auto ExtractTrajectory(Re4 const &k, Index const t, Index const enc) -> TrajectoryN<ND>
{
  if (k.dimension(0) < ND) { throw Log::Failure("Traj", "Trajectory has {} co-ordinates, need {}", k.dimension(0), ND); }
  if (t >= k.dimension(2) || enc >= k.dimension(3)) {
    throw Log::Failure("Traj", "Requested time {} encoding {} from trajectory {}", t, enc, k.dimensions());
  }
  Re2 const p = k.slice(Sz4{0, 0, t, enc}, Sz4{ND, k.dimension(1), 1, 1}).reshape(Sz2{ND, k.dimension(1)});
  return TrajectoryN<ND>(p);
}

template struct TrajectoryN<2>;
template struct TrajectoryN<3>;

template auto ExtractTrajectory<2>(Re4 const &, Index const, Index const) -> TrajectoryN<2>;
template auto ExtractTrajectory<3>(Re4 const &, Index const, Index const) -> TrajectoryN<3>;

} // namespace ve
