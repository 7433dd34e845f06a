// tabulated.hpp goes first so it is checked to stand on its own
#include "ve/kernel/tabulated.hpp"

#include "ve/kernel/kernel.hpp"
#include "ve/log/log.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("ExpSemi", "[kernel]")
{
  ExpSemi<6> const es(2.f);
  CHECK(es(0.f) == Approx(1.f));
  CHECK(es(1.f) == Approx(std::exp(-es.β)));
  CHECK(es(1.01f) == 0.f);
  CHECK(es(-0.5f) == Approx(es(0.5f)));
  CHECK(ExpSemi<4>::FullWidth == 5);
  CHECK(ExpSemi<6>::FullWidth == 7);
  CHECK(ExpSemi<8>::FullWidth == 9);
}

TEST_CASE("Kernel", "[kernel]")
{
  float const osamp = GENERATE(1.5f, 2.f);

  SECTION("Normalised")
  {
    Kernel<2, ExpSemi<6>> const k(osamp);
    CHECK(Norm<false>(k()) == Approx(1.f).margin(1.e-6f));
    Kernel<3, ExpSemi<4>> const k3(osamp);
    CHECK(Norm<false>(k3()) == Approx(1.f).margin(1.e-6f));
  }

  SECTION("Symmetric offset")
  {
    Kernel<1, ExpSemi<6>> const k(osamp);
    Eigen::Matrix<float, 1, 1>  p;
    p[0] = 0.3f;
    auto const a = k(p);
    p[0] = -0.3f;
    auto const b = k(p);
    for (Index ii = 0; ii < ExpSemi<6>::FullWidth; ii++) {
      CHECK(a(ii) == Approx(b(ExpSemi<6>::FullWidth - 1 - ii)).margin(1.e-6f));
    }
  }

  SECTION("Table")
  {
    Kernel<2, ExpSemi<6>> const             k(osamp);
    Kernel<2, Tabulated<ExpSemi<6>>> const  t(osamp);
    Eigen::Matrix<float, 2, 1>              p;
    p << 0.17f, -0.42f;
    Kernel<2, ExpSemi<6>>::Tensor const diff = k(p) - t(p);
    CHECK(Norm<false>(diff) == Approx(0.f).margin(1.e-4f));
  }
}
