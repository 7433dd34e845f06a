#include "op.hpp"

#include "../log/log.hpp"

namespace ve::Ops {

namespace {
void CheckRows(std::string const &name, std::string_view const what, Index const got, Index const want)
{
  if (got != want) { throw Log::Failure(name, "{} has {} rows, expected {}", what, got, want); }
}
} // namespace

Op::Op(std::string const &n)
  : name{n}
{
}

void Op::forward(Vector const &x, Vector &y, float const s) const
{
  CheckRows(name, "Forward input", x.rows(), cols());
  CheckRows(name, "Forward output", y.rows(), rows());
  this->forward(CMap(x.data(), x.size()), Map(y.data(), y.size()), s);
}

void Op::adjoint(Vector const &y, Vector &x, float const s) const
{
  CheckRows(name, "Adjoint input", y.rows(), rows());
  CheckRows(name, "Adjoint output", x.rows(), cols());
  this->adjoint(CMap(y.data(), y.size()), Map(x.data(), x.size()), s);
}

auto Op::forward(Vector const &x, float const s) const -> Vector
{
  Vector y = Vector::Zero(rows());
  Log::Debug(name, "Forward allocated [{}]", y.size());
  this->forward(x, y, s);
  return y;
}

auto Op::adjoint(Vector const &y, float const s) const -> Vector
{
  Vector x = Vector::Zero(cols());
  Log::Debug(name, "Adjoint allocated [{}]", x.size());
  this->adjoint(y, x, s);
  return x;
}

void Op::iforward(Vector const &x, Vector &y, float const s) const
{
  CheckRows(name, "Forward+ input", x.rows(), cols());
  CheckRows(name, "Forward+ output", y.rows(), rows());
  this->iforward(CMap(x.data(), x.size()), Map(y.data(), y.size()), s);
}

void Op::iadjoint(Vector const &y, Vector &x, float const s) const
{
  CheckRows(name, "Adjoint+ input", y.rows(), rows());
  CheckRows(name, "Adjoint+ output", x.rows(), cols());
  this->iadjoint(CMap(y.data(), y.size()), Map(x.data(), x.size()), s);
}

} // namespace ve::Ops
