#define CATCH_CONFIG_ENABLE_BENCHMARKING

#include "ve/log/log.hpp"
#include "ve/op/toeplitz.hpp"
#include "ve/op/veasl.hpp"

#include <catch2/benchmark/catch_benchmark_all.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ve;

TEST_CASE("Toeplitz", "[toeplitz]")
{
  Index const M = 32, nS = 4096, nT = 2, nE = 4, nVC = 4, nC = 4;
  Sz3 const   matrix{M, M, 1};
  Re4         k(2, nS, nT, nE);
  k.setRandom();
  k = k * k.constant(M_PI);
  Cx4 S(AddBack(matrix, nC));
  S.setRandom();
  auto const A = TOps::MakeVEASL(VEASLOpts{.matrix = matrix, .density = Density::Scalar}, k, S, Hadamard(nVC));
  auto const AtA = TOps::MakeToeplitz(A);

  Cx5 x(A->ishape), z(A->ishape);
  Cx4 y(A->oshape);
  x.setRandom();
  Cx5CMap cx(x.data(), x.dimensions());
  Cx5Map  mz(z.data(), z.dimensions());
  Cx4Map  my(y.data(), y.dimensions());
  Cx4CMap cy(y.data(), y.dimensions());

  BENCHMARK("forward+adjoint")
  {
    A->forward(cx, my);
    A->adjoint(cy, mz);
  };
  BENCHMARK("embedded") { AtA->forward(cx, mz); };
}
