#pragma once

// Taskflow core and algorithms
#include <taskflow/taskflow.hpp>                  // tf::Executor, tf::Taskflow, tf::Future
#include <taskflow/algorithm/for_each.hpp>        // tf::Taskflow::for_each_index

// STL
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace geosphere::jobs {

// Shared worker pool for the per-cell passes. One executor per process;
// every run borrows it through Instance().
class JobSystem {
public:
  // Singleton access (defined in JobSystem.cpp)
  static JobSystem& Instance();

  // Index-based parallel for_each_index over [first, last) with step.
  // Non-blocking: returns tf::Future<void> from executor.run(...)
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, tf::Future<void>>
  ParallelForIndexAsync(Index first, Index last, Index step, F&& fn) {
    tf::Taskflow taskflow;
    taskflow.for_each_index(first, last, step, std::forward<F>(fn));
    return _executor.run(std::move(taskflow));
  }

  // Blocking variant for external threads. The first exception thrown by
  // `fn` is rethrown here once every index has been visited or skipped.
  // Do NOT call this from inside a task running on this executor.
  template <typename Index, typename F>
  std::enable_if_t<std::is_integral_v<Index>, void>
  ParallelForIndex(Index first, Index last, Index step, F&& fn) {
    std::mutex errorMutex;
    std::exception_ptr firstError;

    auto guarded = [&](Index i) {
      {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (firstError) return;
      }
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError) firstError = std::current_exception();
      }
    };

    ParallelForIndexAsync(first, last, step, guarded).wait();
    if (firstError)
      std::rethrow_exception(firstError);
  }

  // Discover hardware threads (useful for sizing).
  static unsigned Concurrency() noexcept { return std::thread::hardware_concurrency(); }

private:
  JobSystem();                      // defined in JobSystem.cpp
  ~JobSystem();
  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  tf::Executor _executor;
};

} // namespace geosphere::jobs
