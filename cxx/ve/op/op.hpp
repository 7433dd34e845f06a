#pragma once

#include "../types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace ve::Ops {

/*
 * Linear operator on flat complex vectors. Every tensor operator can be driven through this interface.
 */
struct Op
{
  using Vector = Eigen::Vector<Cx, Eigen::Dynamic>;
  using Map = Eigen::Map<Vector, Eigen::AlignedMax>;
  using CMap = Eigen::Map<Vector const, Eigen::AlignedMax>;
  using Ptr = std::shared_ptr<Op>;
  using Time = std::chrono::high_resolution_clock::time_point;

  std::string name;
  Op(std::string const &n);
  virtual ~Op() = default;

  virtual auto rows() const -> Index = 0;
  virtual auto cols() const -> Index = 0;

  virtual void forward(CMap x, Map y, float const s = 1.f) const = 0;
  virtual void adjoint(CMap y, Map x, float const s = 1.f) const = 0;
  virtual auto forward(Vector const &x, float const s = 1.f) const -> Vector;
  virtual auto adjoint(Vector const &y, float const s = 1.f) const -> Vector;
  void         forward(Vector const &x, Vector &y, float const s = 1.f) const;
  void         adjoint(Vector const &y, Vector &x, float const s = 1.f) const;

  /* These versions scale and add in-place to the output */
  virtual void iforward(CMap x, Map y, float const s = 1.f) const = 0;
  virtual void iadjoint(CMap y, Map x, float const s = 1.f) const = 0;
  void         iforward(Vector const &x, Vector &y, float const s = 1.f) const;
  void         iadjoint(Vector const &y, Vector &x, float const s = 1.f) const;
};

} // namespace ve::Ops
