#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <cmath>
#include <vector>

namespace ve {

/*
 * Lookup-table version of a symmetric kernel function. The table covers |z| in [0, 1] with Resolution entries per grid
 * unit and is read with linear interpolation.
 */
template <typename Func> struct Tabulated
{
  static constexpr int Width = Func::Width;
  static constexpr int FullWidth = Func::FullWidth;
  static constexpr int Resolution = 1 << 11;

  Func               f;
  std::vector<float> table;

  Tabulated(float const osamp)
    : f(osamp)
  {
    // Half-width in grid units times the per-unit resolution, plus an end point and a guard entry
    Index const n = (Width * Resolution) / 2;
    table.resize(n + 2);
    for (Index ii = 0; ii <= n; ii++) {
      table[ii] = f(float(ii) / n);
    }
    table[n + 1] = 0.f;
    Log::Debug("Kernel", "Tabulated width {} with {} entries", Width, table.size());
  }

  inline auto operator()(float const z) const -> float
  {
    float const az = std::fabs(z);
    if (az >= 1.f) { return 0.f; }
    float const p = az * (table.size() - 2);
    Index const i = (Index)p;
    float const t = p - i;
    return table[i] * (1.f - t) + table[i + 1] * t;
  }
};

} // namespace ve
