#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <utility>

namespace f1mc {

// Single-producer latest-only value buffer. Readers never observe a value
// while it is being written.
template <class T>
class LatestBuffer {
public:
  void publish(T v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      data_ = std::move(v);
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Copies the value out if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    if (seq_.load(std::memory_order_acquire) == cursor) return false;
    std::lock_guard<std::mutex> lk(mu_);
    out = data_;
    cursor = seq_.load(std::memory_order_acquire);
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

} // namespace f1mc
