#pragma once
#include <cstdint>
#include <mutex>
#include <trailfx/snap.hpp>

namespace trailfx {

// Single-producer single-consumer latest-only snapshot buffer.
// The copy in and the copy out are the only locked sections.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(mu_);
    data_ = v;
    ++seq_;
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (seq_ != cursor) {
      out = data_;
      cursor = seq_;
      return true;
    }
    return false;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::uint64_t seq_{0};
};

using SnapshotBuffer = LatestBuffer<RenderSnapshot>;

} // namespace trailfx
