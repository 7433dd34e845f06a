#include "ve/sdc.hpp"
#include "ve/log/log.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("SDC", "[sdc]")
{
  Index const M = 16;

  SECTION("Cartesian")
  {
    // Every sample sits on an equivalent grid point, so the weights must all agree
    Re2 points(2, M * M);
    for (Index iy = 0; iy < M; iy++) {
      for (Index ix = 0; ix < M; ix++) {
        points(0, ix + iy * M) = 2.f * M_PI * (ix - M / 2) / M;
        points(1, ix + iy * M) = 2.f * M_PI * (iy - M / 2) / M;
      }
    }
    TrajectoryN<2> const traj(points);
    Re1 const            w = SDC::Pipe<2>(NUFFTOpts<2>{.matrix = Sz2{M, M}}, traj);
    CHECK(w.dimension(0) == M * M);
    float const mean = Sum(w) / w.size();
    CHECK(mean > 0.f);
    CHECK(Maximum(w) / mean == Approx(1.f).margin(1.e-3f));
    CHECK(Maximum(-w) / mean == Approx(-1.f).margin(1.e-3f));
  }

  SECTION("Radial")
  {
    Index const nRead = 32, nSpoke = 24;
    Re2         points(2, nRead * nSpoke);
    for (Index is = 0; is < nSpoke; is++) {
      float const θ = M_PI * is / nSpoke;
      for (Index ir = 0; ir < nRead; ir++) {
        float const r = M_PI * (ir - nRead / 2) / (nRead / 2);
        points(0, ir + is * nRead) = r * std::cos(θ);
        points(1, ir + is * nRead) = r * std::sin(θ);
      }
    }
    points(0, 5) = std::numeric_limits<float>::quiet_NaN();
    TrajectoryN<2> const traj(points);
    NUFFTOpts<2> const   opts{.matrix = Sz2{M, M}};

    Re1 const w = SDC::Pipe<2>(opts, traj);
    CHECK(w(5) == 0.f);
    CHECK(std::isfinite(Sum(w)));
    CHECK(Maximum(-w) <= 0.f);
    // Radial density falls with radius so the outer samples need more weight than the centre
    CHECK(w(0 + nRead) > w(nRead / 2 + nRead));

    // The change between successive iterations shrinks
    std::vector<Re1> ws;
    for (Index it = 1; it < 6; it++) {
      ws.push_back(SDC::Pipe<2>(opts, traj, it));
    }
    Re1 const d1 = ws[1] - ws[0];
    Re1 const d4 = ws[4] - ws[3];
    CHECK(Norm<false>(d4) < Norm<false>(d1));
  }
}
