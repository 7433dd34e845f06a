#pragma once

#include "op/nufft-opts.hpp"
#include "trajectory.hpp"
#include "types.hpp"

namespace ve {
namespace SDC {

/*
 * Pipe & Menon fixed-point density compensation, w <- w / Re(P P' w) starting from w = 1, where P is the gridding stage of
 * the NUFFT described by opts. Runs exactly its iterations. Samples that receive no weight, including NaN samples, get 0.
 */
template <int ND> auto Pipe(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const its = 5) -> Re1;

} // namespace SDC
} // namespace ve
