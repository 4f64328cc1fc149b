/**
 * @file spsc_queue.hpp
 * @brief Single-producer/single-consumer ring buffer (owning, bounded).
 *
 * Used as the per-subscriber mailbox of a display channel: the dispatch side
 * is the only producer, the station client the only consumer.
 *
 * Design goals:
 *  - Non-throwing hot path (push/pop return bool; a full queue is reported, not grown).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Indices padded to avoid false sharing.
 *
 * Construction:
 *  - Use SpscQueue<T>::with_capacity(capacity_pow2) to build.
 *
 * Elements are constructed in place on push and destroyed on pop, so
 * non-trivial types (shared_ptr messages) are safe.
 *
 * @tparam T Element type. Must be nothrow-move-constructible.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "galley/compat/expected.hpp"

namespace galley::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 */
enum class SpscError : std::uint8_t {
  CapacityTooSmall = 1,      ///< Capacity must be at least 2 (one slot stays free)
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed,          ///< Aligned allocation failed
  ElementNotNothrowMovable   ///< T must be nothrow-move-constructible
};

const char* to_string(SpscError e) noexcept;

/// @brief Trait to constrain element types.
template <class T>
struct SpscTraits {
  static constexpr bool ok =
    std::is_trivially_copyable_v<T> ||
    std::is_nothrow_move_constructible_v<T>;
};

/**
 * @brief Single-producer, single-consumer ring buffer (owning).
 *
 * One slot is kept free to tell full from empty, so usable capacity is
 * capacity() - 1.
 */
template <class T>
class SpscQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

public:
  using value_type = T;

  /// @brief Empty shell (use with factory).
  SpscQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once.
   * @param capacity_pow2 Ring capacity (power-of-two, >= 2).
   */
  static galley_detail::expected<SpscQueue, SpscError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 < 2) {
      return galley_detail::unexpected(SpscError::CapacityTooSmall);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return galley_detail::unexpected(SpscError::CapacityNotPowerOfTwo);
    }
    if (!SpscTraits<T>::ok) {
      return galley_detail::unexpected(SpscError::ElementNotNothrowMovable);
    }

    void* raw = ::operator new[](capacity_pow2 * sizeof(T), std::align_val_t(alignof(T)), std::nothrow);
    if (!raw) {
      return galley_detail::unexpected(SpscError::AllocationFailed);
    }

    SpscQueue q;
    q.buf_      = static_cast<T*>(raw);
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    return q;
  }

  SpscQueue(const SpscQueue&)            = delete;
  SpscQueue& operator=(const SpscQueue&) = delete;

  /// @brief Move constructor (never move a queue while threads use it).
  SpscQueue(SpscQueue&& other) noexcept { move_from(std::move(other)); }

  SpscQueue& operator=(SpscQueue&& other) noexcept {
    if (this != &other) {
      release();
      move_from(std::move(other));
    }
    return *this;
  }

  ~SpscQueue() { release(); }

  /**
   * @brief Push by const reference.
   * @return false if queue is full.
   */
  bool push(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    ::new (static_cast<void*>(buf_ + t)) T(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Push by rvalue reference.
   * @return false if queue is full (v is left untouched).
   */
  bool push(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & mask_;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    ::new (static_cast<void*>(buf_ + t)) T(std::move(v));
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pop one element into output.
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(buf_[h]);
    buf_[h].~T();
    head_.store((h + 1) & mask_, std::memory_order_release);
    return true;
  }

  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & mask_) == head_.load(std::memory_order_acquire);
  }

  /// @brief Capacity (power-of-two).
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + capacity_ - h) & mask_;
  }

private:
  void release() noexcept {
    if (!buf_) return;
    std::size_t h = head_.load(std::memory_order_relaxed);
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    while (h != t) {
      buf_[h].~T();
      h = (h + 1) & mask_;
    }
    ::operator delete[](static_cast<void*>(buf_), std::align_val_t(alignof(T)));
    buf_ = nullptr;
    capacity_ = 0;
    mask_ = 0;
    head_.store(0, std::memory_order_relaxed);
    tail_.store(0, std::memory_order_relaxed);
  }

  void move_from(SpscQueue&& other) noexcept {
    head_.store(other.head_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tail_.store(other.tail_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    buf_       = other.buf_;
    capacity_  = other.capacity_;
    mask_      = other.mask_;
    other.buf_ = nullptr;
    other.capacity_ = 0;
    other.mask_ = 0;
    other.head_.store(0, std::memory_order_relaxed);
    other.tail_.store(0, std::memory_order_relaxed);
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  alignas(kCacheLine) T* buf_      = nullptr; ///< Owning raw storage
  std::size_t            capacity_ = 0;       ///< Capacity (power-of-two)
  std::size_t            mask_     = 0;       ///< capacity_-1
};

} // namespace galley::mem
