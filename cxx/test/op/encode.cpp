#include "ve/op/encode.hpp"
#include "ve/log/log.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("Hadamard", "[encode]")
{
  Index const n = GENERATE(1, 2, 4, 8);
  Cx2 const   H = Hadamard(n);
  Cx2 const   HtH = H.conjugate().contract(H, Eigen::IndexPairList<Eigen::type2indexpair<0, 0>>());
  for (Index ii = 0; ii < n; ii++) {
    for (Index ij = 0; ij < n; ij++) {
      CHECK(std::abs(H(ii, ij)) == Approx(1.f));
      CHECK(std::real(HtH(ii, ij)) == Approx(ii == ij ? n : 0.f).margin(1.e-6f));
    }
  }
  CHECK(std::real(H(0, 0)) == 1.f);
}

TEST_CASE("Hadamard-Bad", "[encode]")
{
  CHECK_THROWS_AS(Hadamard(3), Log::Failure);
  CHECK_THROWS_AS(Hadamard(0), Log::Failure);
  CHECK_THROWS_AS(Hadamard(6), Log::Failure);
  Cx2 const tc = TagControl();
  CHECK(std::real(tc(0, 0)) == 1.f);
  CHECK(std::real(tc(0, 1)) == 1.f);
  CHECK(std::real(tc(1, 0)) == 1.f);
  CHECK(std::real(tc(1, 1)) == -1.f);
}

TEST_CASE("VesselEncode", "[encode]")
{
  Sz4 const shape{4, 3, 2, 3};
  Index const nEnc = 4, nVC = 3;
  Cx2         H(nEnc, nVC);
  H.setRandom();
  TOps::VesselEncode const E(H, shape);
  CHECK(E.ishape == Sz5{4, 3, 2, 3, nVC});
  CHECK(E.oshape == Sz5{4, 3, 2, 3, nEnc});

  Cx5 x(E.ishape), y(E.oshape);
  x.setRandom();
  y.setRandom();

  SECTION("Dot Test")
  {
    auto const yy = Dot<false>(E.forward(x), y);
    auto const xx = Dot<false>(x, E.adjoint(y));
    CHECK(std::abs((yy - xx) / (yy + xx + 1.e-15f)) == Approx(0).margin(1.e-6));
  }

  SECTION("Values")
  {
    Cx5 const Ex = E.forward(x);
    Cx        ref = 0.f;
    for (Index iv = 0; iv < nVC; iv++) {
      ref += H(2, iv) * x(1, 2, 0, 1, iv);
    }
    CHECK(std::abs(Ex(1, 2, 0, 1, 2) - ref) == Approx(0).margin(1.e-5));
  }

  SECTION("Tag control round trip")
  {
    TOps::VesselEncode const TC(TagControl(), shape);
    Cx5                      v(TC.ishape);
    v.setRandom();
    Cx5 const back = TC.adjoint(TC.forward(v));
    CHECK(Norm<false>(back - v * Cx(2.f)) / Norm<false>(v) == Approx(0).margin(1.e-6));
  }
}
