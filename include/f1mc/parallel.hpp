#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <random>
#include <thread>
#include <vector>

namespace f1mc {

// Independent engine for one unit of work (run, grid cell, repetition).
// Same ids -> same stream, regardless of which thread consumes it.
inline std::mt19937 make_stream(std::uint32_t seed, std::uint32_t id, std::uint32_t sub = 0) {
  std::seed_seq seq{seed, id, sub};
  return std::mt19937(seq);
}

// 0 -> hardware concurrency; never more workers than items.
inline unsigned resolve_workers(unsigned requested, std::size_t items) {
  unsigned w = requested == 0 ? std::max(1u, std::thread::hardware_concurrency()) : requested;
  if (items < w) w = static_cast<unsigned>(std::max<std::size_t>(1, items));
  return w;
}

// Calls fn(i) for every i in [0, n), strided across `workers` threads.
// fn must only touch slot i of any shared output. The first exception thrown
// by a worker is rethrown after all threads have joined.
template <class Fn>
void parallel_for(std::size_t n, unsigned workers, Fn&& fn) {
  const unsigned w = resolve_workers(workers, n);
  if (w <= 1) {
    for (std::size_t i = 0; i < n; ++i) fn(i);
    return;
  }

  std::vector<std::exception_ptr> errors(w);
  std::vector<std::thread> pool;
  pool.reserve(w);
  for (unsigned t = 0; t < w; ++t) {
    pool.emplace_back([&, t] {
      try {
        for (std::size_t i = t; i < n; i += w) fn(i);
      } catch (...) {
        errors[t] = std::current_exception();
      }
    });
  }
  for (auto& th : pool) th.join();
  for (auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
}

} // namespace f1mc
