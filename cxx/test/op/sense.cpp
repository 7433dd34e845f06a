#include "ve/op/sense.hpp"
#include "ve/log/log.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("SENSE", "[op]")
{
  Index const channels = 3, mapSz = 4, nB = 2;
  Cx4         maps(mapSz, mapSz, mapSz, channels);
  maps.setRandom();

  // With credit to PyLops
  SECTION("Dot Test")
  {
    Cx4 u(mapSz, mapSz, mapSz, nB);
    Cx5 v(mapSz, mapSz, mapSz, nB, channels);
    v.setRandom();
    u.setRandom();

    TOps::SENSE sense(maps, nB);
    CHECK(sense.nChannels() == channels);
    Cx5 const y = sense.forward(u);
    Cx4 const x = sense.adjoint(v);

    auto const yy = Dot<false>(y, v);
    auto const xx = Dot<false>(u, x);
    CHECK(std::abs((yy - xx) / (yy + xx + 1.e-15f)) == Approx(0).margin(1.e-6));
  }

  SECTION("Values")
  {
    Cx4 u(mapSz, mapSz, mapSz, nB);
    u.setRandom();
    auto const  sense = TOps::MakeSENSE(maps, nB);
    Cx5 const   y = sense->forward(u);
    CHECK(std::abs(y(1, 2, 3, 1, 2) - u(1, 2, 3, 1) * maps(1, 2, 3, 2)) == Approx(0).margin(1.e-6));
    Cx4 const x = sense->adjoint(y);
    Cx        ref = 0.f;
    for (Index ic = 0; ic < channels; ic++) {
      ref += std::norm(maps(0, 1, 2, ic)) * u(0, 1, 2, 0);
    }
    CHECK(std::abs(x(0, 1, 2, 0) - ref) == Approx(0).margin(1.e-5));
  }

  SECTION("Subset")
  {
    Cx4 u(mapSz, mapSz, mapSz, nB);
    u.setRandom();
    TOps::SENSE const all(maps, nB);
    TOps::SENSE const sub(maps, nB, {2, 0});
    CHECK(sub.nChannels() == 2);
    CHECK(sub.oshape == Sz5{mapSz, mapSz, mapSz, nB, 2});
    Cx5 const ya = all.forward(u);
    Cx5 const ys = sub.forward(u);
    CHECK(Norm<false>(ys.chip<4>(0) - ya.chip<4>(2)) == Approx(0).margin(1.e-6));
    CHECK(Norm<false>(ys.chip<4>(1) - ya.chip<4>(0)) == Approx(0).margin(1.e-6));

    Cx4 x(u.dimensions());
    x.setRandom();
    Cx4 const x0 = x;
    sub.iadjoint(Cx5CMap(ys.data(), ys.dimensions()), Cx4Map(x.data(), x.dimensions()), 0.5f);
    Cx4 const ref = x0 + sub.adjoint(ys) * Cx(0.5f);
    CHECK(Norm<false>(x - ref) / Norm<false>(ref) == Approx(0).margin(1.e-6));

    CHECK_THROWS_AS(TOps::SENSE(maps, nB, {3}), Log::Failure);
    CHECK_THROWS_AS(TOps::SENSE(maps, nB, {-1}), Log::Failure);
  }
}
