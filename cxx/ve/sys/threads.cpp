/*
 * threads.cpp
 *
 * Copyright (c) 2019 Tobias Wood
 *
 *  This Source Code Form is subject to the terms of the Mozilla Public
 *  License, v. 2.0. If a copy of the MPL was not distributed with this
 *  file, You can obtain one at http://mozilla.org/MPL/2.0/.
 *
 */

#include "threads.hpp"

#include "../log/log.hpp"

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <unsupported/Eigen/CXX11/Tensor>
#include <unsupported/Eigen/CXX11/ThreadPool>

#include <memory>
#include <thread>

namespace {
std::unique_ptr<Eigen::ThreadPool>       gp = nullptr;
std::unique_ptr<Eigen::ThreadPoolDevice> tensorDev = nullptr;
} // namespace

namespace ve {
namespace Threads {

auto GlobalPool() -> Eigen::ThreadPool *
{
  if (gp == nullptr) {
    auto const nt = std::max(std::thread::hardware_concurrency(), 1U);
    Log::Debug("Thread", "Creating default thread pool with {} threads", nt);
    gp = std::make_unique<Eigen::ThreadPool>(nt);
  }
  return gp.get();
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

void SetGlobalThreadCount(Index nt)
{
  if (nt < 1) { nt = std::max(std::thread::hardware_concurrency(), 1U); }
  Log::Debug("Thread", "Creating thread pool with {} threads", nt);
  // The device holds a raw pointer to the pool, release it first
  tensorDev.reset();
  gp = std::make_unique<Eigen::ThreadPool>(nt);
  tensorDev = std::make_unique<Eigen::ThreadPoolDevice>(gp.get(), nt);
}

auto TensorDevice() -> Eigen::ThreadPoolDevice &
{
  if (tensorDev == nullptr) {
    auto gp = GlobalPool();
    tensorDev = std::make_unique<Eigen::ThreadPoolDevice>(gp, gp->NumThreads());
  }
  return *tensorDev;
}

} // namespace Threads
} // namespace ve
