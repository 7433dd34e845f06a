#include "ve/toeplitz.hpp"
#include "ve/log/log.hpp"
#include "ve/op/adjoint.hpp"
#include "ve/op/compose.hpp"
#include "ve/op/toeplitz.hpp"
#include "ve/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

using namespace ve;
using namespace Catch;

TEST_CASE("EmbedAxis", "[toeplitz]")
{
  Cx3 first(3, 1, 1), mirror(3, 1, 1);
  first.setValues({{{1.f}}, {{2.f}}, {{3.f}}});
  mirror.setValues({{{4.f}}, {{5.f}}, {{6.f}}});
  Cx3 const out = Toeplitz::EmbedAxis(first, mirror, 0);
  REQUIRE(out.dimensions() == Sz3{6, 1, 1});
  std::array<float, 6> const ref{1.f, 2.f, 3.f, 0.f, 4.f, 5.f};
  for (Index ii = 0; ii < 6; ii++) {
    CHECK(std::real(out(ii, 0, 0)) == ref[ii]);
  }

  Cx3 a(2, 2, 1), b(2, 2, 1);
  a.setConstant(1.f);
  b.setConstant(2.f);
  Cx3 const out1 = Toeplitz::EmbedAxis(a, b, 1);
  REQUIRE(out1.dimensions() == Sz3{2, 4, 1});
  CHECK(std::real(out1(1, 1, 0)) == 1.f);
  CHECK(std::real(out1(1, 2, 0)) == 0.f);
  CHECK(std::real(out1(0, 3, 0)) == 2.f);

  CHECK_THROWS_AS(Toeplitz::EmbedAxis(a, first, 0), Log::Failure);
  CHECK_THROWS_AS(Toeplitz::EmbedAxis(a, b, 3), Log::Failure);
}

TEST_CASE("Toeplitz", "[toeplitz]")
{
  // Log::SetDisplayLevel(Log::Display::High);
  Index const nS = 400, nT = 2, nE = 2, nVC = 2, nC = 2;
  Index const Nz = GENERATE(1, 4);
  Sz3 const   matrix{8, 6, Nz};
  Index const nD = Nz == 1 ? 2 : 3;
  Re4         k(nD, nS, nT, nE);
  k.setRandom();
  k = k * k.constant(M_PI);
  Re3 w(nS, nT, nE);
  w.setRandom();
  w = w.abs() + w.constant(0.1f);
  Cx4 S(AddBack(matrix, nC));
  S.setRandom();
  Cx2 H(nE, nVC);
  H.setRandom();
  auto const A = TOps::MakeVEASL(VEASLOpts{.matrix = matrix, .density = Density::Given}, k, S, H, w);
  INFO("Nz " << Nz);

  SECTION("Embedding")
  {
    Cx5 const T = Toeplitz::Embedding(*A);
    CHECK(T.dimensions() == Sz5{16, 12, Nz == 1 ? 1 : 8, nT, nE});
    // The point spread function is Hermitian, so its transform is real
    Cx5 const Ti = T.imag().cast<Cx>();
    CHECK(Norm<false>(Ti) / Norm<false>(T) == Approx(0.f).margin(1.e-3f));
  }

  SECTION("Normal operator")
  {
    auto const AtA = TOps::MakeToeplitz(A);
    auto const ref = TOps::MakeCompose(A, TOps::MakeAdjoint(A));
    CHECK(AtA->ishape == A->ishape);
    CHECK(AtA->oshape == A->ishape);
    auto const top = std::dynamic_pointer_cast<TOps::Toeplitz>(AtA);
    REQUIRE(top);
    CHECK(top->embedding().dimensions() == Toeplitz::Embedding(*A).dimensions());
    Cx5 x(A->ishape);
    x.setRandom();
    Cx5 const a = ref->forward(x);
    Cx5 const b = AtA->forward(x);
    CHECK(Norm<false>(a - b) / Norm<false>(a) == Approx(0.f).margin(1.e-3f));
    Cx5 const c = AtA->adjoint(x);
    CHECK(Norm<false>(c - b) == Approx(0.f).margin(1.e-6f));

    Cx5 y(A->ishape);
    y.setRandom();
    Cx5 const y0 = y;
    AtA->iforward(Cx5CMap(x.data(), x.dimensions()), Cx5Map(y.data(), y.dimensions()), 3.f);
    Cx5 const yref = y0 + b * Cx(3.f);
    CHECK(Norm<false>(y - yref) / Norm<false>(yref) == Approx(0.f).margin(1.e-5f));
  }
}

TEST_CASE("Toeplitz-Options", "[toeplitz]")
{
  Index const nS = 300, nT = 1, nE = 2, nVC = 2, nC = 2;
  bool const  lowmem = GENERATE(false, true);
  bool const  shifted = GENERATE(false, true);
  Sz3 const   matrix{8, 6, 1};
  Re4         k(2, nS, nT, nE);
  k.setRandom();
  k = k * k.constant(M_PI);
  Cx4 S(AddBack(matrix, nC));
  S.setRandom();
  VEASLOpts opts{.matrix = matrix, .lowmem = lowmem, .density = Density::Estimate};
  if (shifted) { opts.shift = Eigen::Array3f(3.f, 2.f, 0.f); }
  auto const A = TOps::MakeVEASL(opts, k, S, Hadamard(nVC));
  auto const AtA = TOps::MakeToeplitz(A);
  INFO("lowmem " << lowmem << " shifted " << shifted);

  Cx5 x(A->ishape);
  x.setRandom();
  Cx5 const a = A->adjoint(A->forward(x));
  Cx5 const b = AtA->forward(x);
  CHECK(Norm<false>(a - b) / Norm<false>(a) == Approx(0.f).margin(5.e-3f));
}

TEST_CASE("Toeplitz-Single", "[toeplitz]")
{
  // A single coil of ones and one component, so T acts directly on the image
  Index const M = 10, nS = 300;
  Re4         k(2, nS, 1, 1);
  k.setRandom();
  k = k * k.constant(M_PI);
  Cx2 H(1, 1);
  H.setConstant(1.f);
  auto const A = TOps::MakeVEASL(VEASLOpts{.matrix = Sz3{M, M, 1}, .density = Density::Scalar, .scalar = 2.f}, k, Cx4(), H);
  Cx5 const  T = Toeplitz::Embedding(*A);
  TOps::Toeplitz const AtA(T, Cx4(AddBack(Sz3{M, M, 1}, 1)).setConstant(1.f), H);

  Cx5 x(A->ishape);
  x.setZero();
  x(0, 0, 0, 0, 0) = 1.f;
  Cx5 const ref = A->adjoint(A->forward(x));
  Cx5 const got = AtA.forward(x);
  CHECK(Norm<false>(got - ref) / Norm<false>(ref) == Approx(0.f).margin(1.e-3f));
  // Diagonal is the total weight scaled by norm^2
  CHECK(std::real(got(0, 0, 0, 0, 0)) == Approx(2.f * nS / (M * M)).epsilon(1.e-2f));
}

TEST_CASE("Toeplitz-Errors", "[toeplitz]")
{
  Cx4 maps(4, 4, 1, 2);
  maps.setRandom();
  auto const                 sense = TOps::MakeSENSE(maps, 1);
  TOps::TOp<5, 4>::Ptr const notVEASL = TOps::MakeAdjoint(sense);
  CHECK_THROWS_AS(TOps::MakeToeplitz(notVEASL), Log::Failure);
  CHECK_THROWS_AS(Toeplitz::Embedding(*notVEASL), Log::Failure);

  Cx5 T(8, 6, 1, 1, 2);
  T.setZero();
  CHECK_THROWS_AS(TOps::Toeplitz(T, maps, TagControl()), Log::Failure);
  Cx5 T3(8, 8, 1, 1, 3);
  T3.setZero();
  CHECK_THROWS_AS(TOps::Toeplitz(T3, maps, TagControl()), Log::Failure);
}
