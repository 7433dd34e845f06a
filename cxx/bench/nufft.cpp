#define CATCH_CONFIG_ENABLE_BENCHMARKING

#include "ve/log/log.hpp"
#include "ve/op/nufft.hpp"

#include <catch2/benchmark/catch_benchmark_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;

namespace {
Index const M = 64;
Index const C = 8;
Index const nS = M * M * 4;

auto RandomPoints(Index const nD) -> Re2
{
  Re2 p(nD, nS);
  p.setRandom();
  return p * p.constant(M_PI);
}
} // namespace

TEST_CASE("NUFFT", "[nufft]")
{
  bool const                lowmem = GENERATE(false, true);
  TrajectoryN<2> const      traj(RandomPoints(2));
  auto const                nufft = TOps::MakeNUFFT<2>(NUFFTOpts<2>{.matrix = Sz2{M, M}, .lowmem = lowmem}, traj, C);
  Cx3                       x(nufft->ishape);
  Cx2                       y(nufft->oshape);
  x.setRandom();
  y.setRandom();
  Cx3Map  mx(x.data(), x.dimensions());
  Cx2Map  my(y.data(), y.dimensions());
  Cx3CMap cx(x.data(), x.dimensions());
  Cx2CMap cy(y.data(), y.dimensions());
  BENCHMARK(fmt::format("forward lowmem {}", lowmem)) { nufft->forward(cx, my); };
  BENCHMARK(fmt::format("adjoint lowmem {}", lowmem)) { nufft->adjoint(cy, mx); };
}
