#define CATCH_CONFIG_ENABLE_BENCHMARKING
#include <catch2/benchmark/catch_benchmark_all.hpp>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>

#include "ve/kernel/kernel.hpp"
#include "ve/log/log.hpp"

using namespace ve;

TEMPLATE_TEST_CASE("Kernels", "[kernels]", (Kernel<2, ExpSemi<4>>), (Kernel<3, ExpSemi<4>>), (Kernel<3, ExpSemi<6>>))
{
  TestType   k(2.f);
  auto const p = TestType::Point::Constant(0.25f);

  BENCHMARK(fmt::format("ES{} {}D", TestType::Width, TestType::Point::RowsAtCompileTime)) { return k(p); };
}
