#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <limits>
#include <optional>

namespace ve {

template <int ND> struct NUFFTOpts
{
  using Arrayf = Eigen::Array<float, ND, 1>;
  Sz<ND>                matrix;
  Sz<ND>                grid = Sz<ND>();       // All zero means twice the matrix
  Sz<ND>                width = Constant<ND>(6); // Must be equal on all axes
  std::optional<Arrayf> shift = std::nullopt; // Image point that sits at the k-space phase origin, default floor(N/2)
  bool                  lowmem = false;

  auto gridShape() const -> Sz<ND>
  {
    if (std::all_of(grid.cbegin(), grid.cend(), [](Index const g) { return g == 0; })) { return Mul(matrix, 2); }
    return grid;
  }

  auto osamp() const -> float
  {
    auto const g = gridShape();
    float      os = std::numeric_limits<float>::max();
    for (Index ii = 0; ii < ND; ii++) {
      os = std::min(os, float(g[ii]) / matrix[ii]);
    }
    return os;
  }

  auto centre() const -> Arrayf
  {
    Arrayf c;
    for (Index ii = 0; ii < ND; ii++) {
      c[ii] = matrix[ii] / 2;
    }
    return c;
  }

  auto shifted() const -> bool { return shift && !(shift.value() == centre()).all(); }

  void validate() const
  {
    auto const g = gridShape();
    for (Index ii = 0; ii < ND; ii++) {
      if (matrix[ii] < 1) { throw Log::Failure("NUFFT", "Matrix {} must be positive", matrix); }
      if (g[ii] < matrix[ii]) { throw Log::Failure("NUFFT", "Grid {} smaller than matrix {}", g, matrix); }
      if (g[ii] % 2 != 0) { throw Log::Failure("NUFFT", "Grid {} must be even", g); }
    }
    if (std::any_of(width.cbegin(), width.cend(), [&](Index const w) { return w != width[0]; })) {
      throw Log::Failure("NUFFT", "Kernel widths {} must be equal on all axes", width);
    }
    if (width[0] != 4 && width[0] != 6 && width[0] != 8) { throw Log::Failure("NUFFT", "Unsupported kernel width {}", width[0]); }
  }
};

} // namespace ve
