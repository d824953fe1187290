#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

#include "platform.hpp"

namespace ch_logger
{

// 多生产者/单消费者有界队列。元素按值移动进出槽位，
// 同一生产者线程的入队顺序即出队顺序。
// Slots live on the heap so the owner stays small regardless of Capacity.
template <typename T, size_t Capacity>
class MPSCRingBuffer
{
  static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");
  static_assert(std::is_nothrow_move_assignable_v<T>, "T must be nothrow move assignable");
  static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

  static constexpr uint64_t kMask = Capacity - 1;

 public:
  MPSCRingBuffer() : slots_(std::make_unique<Slot[]>(Capacity))
  {
    for (uint64_t i = 0; i < Capacity; ++i)
    {
      slots_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  MPSCRingBuffer(const MPSCRingBuffer&) = delete;
  MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

  // On failure (queue full) item is left untouched.
  bool TryPush(T&& item)
  {
    Slot* slot = Claim();
    if (slot == nullptr)
    {
      return false;
    }
    slot->data = std::move(item);
    Publish(*slot);
    return true;
  }

  // ===== 以下仅限消费者线程 =====

  bool TryPop(T& item)
  {
    Slot& slot = slots_[head_ & kMask];
    if (slot.turn.load(std::memory_order_acquire) != head_ + 1)
    {
      return false;
    }
    item = std::move(slot.data);
    slot.data = T{};
    slot.turn.store(head_ + Capacity, std::memory_order_release);
    ++head_;
    return true;
  }

  // Pops up to max_items and hands each one to fn. Returns how many were consumed.
  template <typename Fn>
  size_t ConsumeBatch(Fn&& fn, size_t max_items)
  {
    size_t consumed = 0;
    T item;
    while (consumed < max_items && TryPop(item))
    {
      fn(item);
      ++consumed;
    }
    return consumed;
  }

  bool Empty() const
  {
    const Slot& slot = slots_[head_ & kMask];
    return slot.turn.load(std::memory_order_acquire) != head_ + 1;
  }

  static constexpr size_t GetCapacity() { return Capacity; }

 private:
  struct alignas(CH_LOG_CACHELINE_SIZE) Slot
  {
    std::atomic<uint64_t> turn{0};
    T data;
  };

  // 抢占一个空槽；队列满时返回 nullptr
  Slot* Claim()
  {
    uint64_t pos = tail_.load(std::memory_order_relaxed);
    for (;;)
    {
      Slot& slot = slots_[pos & kMask];
      uint64_t turn = slot.turn.load(std::memory_order_acquire);
      if (turn == pos)
      {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed,
                                        std::memory_order_relaxed))
        {
          return &slot;
        }
      }
      else if (turn < pos)
      {
        return nullptr;
      }
      else
      {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  void Publish(Slot& slot)
  {
    uint64_t pos = slot.turn.load(std::memory_order_relaxed);
    slot.turn.store(pos + 1, std::memory_order_release);
  }

  std::unique_ptr<Slot[]> slots_;
  alignas(CH_LOG_CACHELINE_SIZE) std::atomic<uint64_t> tail_{0};
  alignas(CH_LOG_CACHELINE_SIZE) uint64_t head_ = 0;
};

}  // namespace ch_logger
