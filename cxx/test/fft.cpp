#include "ve/fft.hpp"
#include "ve/log/log.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("FFT", "[FFT]")
{
  auto const sx = GENERATE(2, 4, 8);
  auto const sy = GENERATE(2, 6);
  auto const sz = GENERATE(1, 4);
  INFO("FFT shape: " << sx << "," << sy << "," << sz);
  Index const N = sx * sy * sz;

  SECTION("Centred")
  {
    Cx3 data(sx, sy, sz), ref(sx, sy, sz);
    ref.setConstant(1.f);
    data.setZero();
    data(sx / 2, sy / 2, sz / 2) = std::sqrt(N); // Parseval's theorem
    FFT::Adjoint(data);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-3f));
    FFT::Forward(data);
    ref.setZero();
    ref(sx / 2, sy / 2, sz / 2) = std::sqrt(N);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-3f));
  }

  SECTION("Uncentred")
  {
    Cx3 data(sx, sy, sz), ref(sx, sy, sz);
    ref.setConstant(1.f);
    data.setZero();
    data(0, 0, 0) = std::sqrt(N);
    FFT::Forward(data, Sz3{0, 1, 2}, false);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-3f));
    FFT::Adjoint(data, Sz3{0, 1, 2}, false);
    ref.setZero();
    ref(0, 0, 0) = std::sqrt(N);
    CHECK(Norm<false>(data - ref) == Approx(0.f).margin(1.e-3f));
  }

  SECTION("Round trip over two of four dims")
  {
    Index const nc = 3;
    Cx4         data(sx, sy, sz, nc);
    data.setRandom();
    Cx4 const ref = data;
    Cx4Map    dm(data.data(), data.dimensions());
    FFT::Forward(dm, Sz2{0, 1}, false);
    FFT::Adjoint(dm, Sz2{0, 1}, false);
    CHECK(Norm<false>(data - ref) / Norm<false>(ref) == Approx(0.f).margin(1.e-5f));
    FFT::Forward(dm, Sz2{0, 1});
    CHECK(Norm<false>(data) == Approx(Norm<false>(ref)).epsilon(1.e-5f));
    FFT::Adjoint(dm, Sz2{0, 1});
    CHECK(Norm<false>(data - ref) / Norm<false>(ref) == Approx(0.f).margin(1.e-5f));
  }
}

TEST_CASE("FFT-Odd", "[FFT]")
{
  Cx2 data(5, 4);
  data.setRandom();
  CHECK_THROWS_AS(FFT::Forward(data, Sz2{0, 1}), Log::Failure);
  CHECK_NOTHROW(FFT::Forward(data, Sz2{0, 1}, false));
}
