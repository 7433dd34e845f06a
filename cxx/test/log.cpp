#include "ve/log/log.hpp"
#include "ve/sys/threads.hpp"

#include <atomic>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using namespace ve;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Log", "[log]")
{
  Log::End();
  Log::Print("Test", "Matrix {}", Sz3{4, 5, 6});
  Log::Debug("Test", "Hidden {}", 1);
  auto const saved = Log::Saved();
  REQUIRE(saved.size() == 2);
  CHECK_THAT(saved[0], ContainsSubstring("[Test"));
  CHECK_THAT(saved[0], ContainsSubstring("Matrix [4, 5, 6]"));

  try {
    throw Log::Failure("VEASL", "Bad encoding {}", 3);
  } catch (Log::Failure const &f) {
    CHECK_THAT(f.what(), ContainsSubstring("Bad encoding 3"));
    Log::Fail(f);
  }
  CHECK(Log::Saved().size() == 3);
  Log::End();
  CHECK(Log::Saved().empty());
}

TEST_CASE("Threads", "[threads]")
{
  Threads::SetGlobalThreadCount(3);
  CHECK(Threads::GlobalThreadCount() == 3);
  Index const       N = 1001;
  std::vector<int>  hits(N, 0);
  Threads::ChunkFor(
    [&](Index const lo, Index const hi) {
      for (Index ii = lo; ii < hi; ii++) {
        hits[ii]++;
      }
    },
    N);
  Threads::StridedFor(N, [&](Index const st, Index const sz) {
    for (Index ii = st; ii < N; ii += sz) {
      hits[ii]++;
    }
  });
  CHECK(std::all_of(hits.cbegin(), hits.cend(), [](int const h) { return h == 2; }));

  std::atomic<Index> calls = 0;
  Threads::StridedFor(0, [&](Index, Index) { calls++; });
  CHECK(calls == 0);
}
