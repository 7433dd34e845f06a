#include "ve/op/pad.hpp"
#include "ve/log/log.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("Pad", "[op]")
{
  Index const fullSz = 8;

  SECTION("Dot Test")
  {
    Index const cropSz = 3;
    Cx4         y(fullSz, fullSz, fullSz, 2), x(cropSz, cropSz, cropSz, 2);
    x.setRandom();
    y.setRandom();

    TOps::Pad<4> pad(x.dimensions(), Sz4{fullSz, fullSz, fullSz, 2});
    Cx4 const    xy = pad.forward(x);
    Cx4 const    yx = pad.adjoint(y);

    CHECK(std::abs(xy(0, 0, 0, 0)) == 0.f);
    CHECK(std::abs(xy(fullSz - 1, fullSz - 1, fullSz - 1, 1)) == 0.f);
    Index const lC = pad.left()[0];
    CHECK(lC == 3);
    CHECK(xy(lC, lC, lC, 0) == x(0, 0, 0, 0));
    CHECK(xy(lC + cropSz - 1, lC + cropSz - 1, lC + cropSz - 1, 1) == x(cropSz - 1, cropSz - 1, cropSz - 1, 1));

    // Conjugate is on the second argument
    auto const xx = Dot<false>(x, yx);
    auto const yy = Dot<false>(xy, y);
    CHECK(std::abs((yy - xx) / (yy + xx + 1.e-15f)) == Approx(0).margin(1.e-6));
  }

  SECTION("Too big")
  {
    CHECK_THROWS_AS(TOps::Pad<4>(Sz4{4, 4, 4, 1}, Sz4{4, 2, 4, 1}), Log::Failure);
  }
}
