#include "sdc.hpp"

#include "log/log.hpp"
#include "op/nufft.hpp"
#include "sys/threads.hpp"
#include "tensors.hpp"

namespace ve {
namespace SDC {

template <int ND> auto Pipe(NUFFTOpts<ND> const &opts, TrajectoryN<ND> const &traj, Index const its) -> Re1
{
  Log::Print("SDC", "Pipe/Zwart/Menon density compensation, {} iterations", its);
  auto gridder = TOps::MakeGrid<ND>(opts, traj, 1);
  Cx2  W(gridder->oshape);
  Cx2  Wp(gridder->oshape);
  W.setConstant(1.f);
  for (Index ii = 0; ii < its; ii++) {
    Wp = gridder->forward(gridder->adjoint(W));
    // Avoid divide by zero problems
    Wp.device(Threads::TensorDevice()) = (Wp.real() > 0.f).select(W / Wp.real().template cast<Cx>(), Wp.constant(0.f));
    float const delta = Norm<true>(Wp - W) / Norm<true>(W);
    W.device(Threads::TensorDevice()) = Wp;
    Log::Debug("SDC", "Step {}/{} Delta {}", ii + 1, its, delta);
  }
  Re1 const w = W.real().reshape(Sz1{traj.nSamples()});
  Log::Print("SDC", "Finished, mean weight {}", Sum(w) / std::max<Index>(traj.nValid(), 1));
  return w;
}

template auto Pipe<2>(NUFFTOpts<2> const &, TrajectoryN<2> const &, Index const) -> Re1;
template auto Pipe<3>(NUFFTOpts<3> const &, TrajectoryN<3> const &, Index const) -> Re1;

} // namespace SDC
} // namespace ve
