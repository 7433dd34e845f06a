#include "ve/op/grid.hpp"
#include "ve/log/log.hpp"
#include "ve/op/nufft.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;
using namespace Catch;

namespace {
template <int ND> auto RandomTrajectory(Index const nS) -> TrajectoryN<ND>
{
  Re2 points(ND, nS);
  points.setRandom();
  points = points * points.constant(M_PI);
  return TrajectoryN<ND>(points);
}
} // namespace

TEST_CASE("Grid2", "[op]")
{
  // Log::SetDisplayLevel(Log::Display::High);
  Index const M = GENERATE(8, 13);
  auto const  traj = RandomTrajectory<2>(200);
  bool const  lowmem = GENERATE(false, true);
  auto const  grid = TOps::MakeGrid<2>(NUFFTOpts<2>{.matrix = Sz2{M, M}, .lowmem = lowmem}, traj, 2);
  CHECK(grid->ishape == Sz3{2 * M, 2 * M, 2});
  CHECK(grid->oshape == Sz2{2, 200});

  SECTION("Dot Test")
  {
    Cx3 x(grid->ishape);
    Cx2 y(grid->oshape);
    x.setRandom();
    y.setRandom();
    Cx2 const  Ax = grid->forward(x);
    Cx3 const  Aty = grid->adjoint(y);
    auto const yy = Dot<false>(Ax, y);
    auto const xx = Dot<false>(x, Aty);
    INFO("M " << M << " lowmem " << lowmem);
    CHECK(std::abs((yy - xx) / (yy + xx + 1.e-15f)) == Approx(0).margin(1.e-5));
  }

  SECTION("In place")
  {
    Cx3 x(grid->ishape);
    Cx2 y(grid->oshape);
    x.setRandom();
    y.setRandom();
    Cx2 const y0 = y;
    grid->iforward(Cx3CMap(x.data(), x.dimensions()), Cx2Map(y.data(), y.dimensions()), 2.f);
    Cx2 const ref = y0 + grid->forward(x) * Cx(2.f);
    CHECK(Norm<false>(y - ref) / Norm<false>(ref) == Approx(0).margin(1.e-6));
  }
}

TEST_CASE("Grid3", "[op]")
{
  Index const M = 12;
  auto const  traj = RandomTrajectory<3>(300);
  auto const  grid = TOps::MakeGrid<3>(NUFFTOpts<3>{.matrix = Sz3{M, M, M}, .width = Constant<3>(4)}, traj, 1);
  auto const  gridlm = TOps::MakeGrid<3>(NUFFTOpts<3>{.matrix = Sz3{M, M, M}, .width = Constant<3>(4), .lowmem = true}, traj, 1);
  Cx4         x(grid->ishape);
  Cx2         y(grid->oshape);
  x.setRandom();
  y.setRandom();

  SECTION("Dot Test")
  {
    auto const yy = Dot<false>(grid->forward(x), y);
    auto const xx = Dot<false>(x, grid->adjoint(y));
    CHECK(std::abs((yy - xx) / (yy + xx + 1.e-15f)) == Approx(0).margin(1.e-5));
  }

  SECTION("Low memory matches")
  {
    Cx2 const a = grid->forward(x);
    Cx2 const b = gridlm->forward(x);
    CHECK(Norm<false>(a - b) / Norm<false>(a) == Approx(0).margin(1.e-3));
    Cx4 const c = grid->adjoint(y);
    Cx4 const d = gridlm->adjoint(y);
    CHECK(Norm<false>(c - d) / Norm<false>(c) == Approx(0).margin(1.e-3));
  }
}

TEST_CASE("Grid-Cartesian", "[op]")
{
  // Samples on grid points see the kernel at zero offset
  Index const M = 8;
  Re2         points(2, 3);
  points.setZero();
  points(0, 1) = 2.f * M_PI / (2 * M);
  points(1, 2) = -4.f * M_PI / (2 * M);
  TrajectoryN<2> const traj(points);
  auto const           grid = TOps::MakeGrid<2>(NUFFTOpts<2>{.matrix = Sz2{M, M}}, traj, 1);
  Cx3                  x(grid->ishape);
  x.setZero();
  x(M, M, 0) = 1.f;
  x(M + 1, M, 0) = 2.f;
  Kernel<2, ExpSemi<6>> const k(2.f);
  auto const                  kk = k();
  Cx2 const                   y = grid->forward(x);
  CHECK(std::real(y(0, 0)) == Approx(kk(3, 3) * 1.f + kk(4, 3) * 2.f).margin(1.e-5f));
  CHECK(std::real(y(0, 1)) == Approx(kk(3, 3) * 2.f + kk(2, 3) * 1.f).margin(1.e-5f));
  CHECK(std::real(y(0, 2)) == Approx(kk(3, 5) * 1.f + kk(4, 5) * 2.f).margin(1.e-5f));
  CHECK(std::imag(y(0, 2)) == Approx(0.f).margin(1.e-6f));
}
