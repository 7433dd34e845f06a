#pragma once

#include "../types.hpp"

#include <unsupported/Eigen/CXX11/ThreadPool>

#include <functional>

namespace ve {

namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *;
auto TensorDevice() -> Eigen::ThreadPoolDevice &;

auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index n_threads);

/*
 * Split [0, sz) into contiguous chunks, one per thread. f is called as f(lo, hi)
 */
template <typename F> void ChunkFor(F const &f, Index const sz)
{
  Index const nT = GlobalThreadCount();
  if (sz == 0) {
    return;
  } else {
    Index const    den = sz / nT;
    Index const    rem = sz % nT;
    Index const    nC = std::min<Index>(sz, nT);
    Eigen::Barrier barrier(nC);
    for (Index it = 0; it < nC; it++) {
      Index const lo = it * den + std::min(it, rem);
      Index const hi = (it + 1) * den + std::min(it + 1, rem);
      GlobalPool()->Schedule([&barrier, f, lo, hi] {
        f(lo, hi);
        barrier.Notify();
      });
    }
    barrier.Wait();
  }
}

/*
 * Interleave [0, sz) across threads. f is called as f(start, stride)
 */
template <typename F> void StridedFor(Index const sz, F const &f)
{
  Index const nT = GlobalThreadCount();
  if (sz == 0) {
    return;
  } else {
    Index const    nC = std::min<Index>(sz, nT);
    Eigen::Barrier barrier(nC);
    for (Index it = 0; it < nC; it++) {
      GlobalPool()->Schedule([&barrier, f, it, nC] {
        f(it, nC);
        barrier.Notify();
      });
    }
    barrier.Wait();
  }
}

} // namespace Threads
} // namespace ve
