#pragma once

#include <cstddef>
#include <cstdint>

#include "slabrc/api/status.hpp"
#include "slabrc/memory/slab_slot.hpp"

namespace slabrc {
namespace memory {

template <typename T>
class Slab;

// Shared, read-only ownership of one occupied slot of a Slab<T>.
//
// A handle carries 2^weight_exponent of its slot's weight. Split() halves
// that weight between two handles without touching shared memory; dropping a
// handle subtracts its weight from the slot counter, and whoever takes the
// counter to zero destroys the value. A never-split handle (exponent W-1) is
// the only reference to its slot and frees it without any atomic.
//
// Handles are move-only. A single handle must not be split from two threads
// at once; different handles to one slot may be used from any thread.
// Member definitions live in slab.hpp; include that header.
template <typename T>
class WeightedHandle {
 public:
  WeightedHandle() : slab_(NULL), slab_id_(0), slot_index_(0), weight_exponent_(0) {}
  ~WeightedHandle() { Reset(); }

  WeightedHandle(WeightedHandle&& other) noexcept
      : slab_(other.slab_),
        slab_id_(other.slab_id_),
        slot_index_(other.slot_index_),
        weight_exponent_(other.weight_exponent_) {
    other.Detach();
  }

  WeightedHandle& operator=(WeightedHandle&& other) noexcept {
    if (this != &other) {
      Reset();
      slab_ = other.slab_;
      slab_id_ = other.slab_id_;
      slot_index_ = other.slot_index_;
      weight_exponent_ = other.weight_exponent_;
      other.Detach();
    }
    return *this;
  }

  // Returns a second handle to the same slot.
  // - exponent > 1: local halving, no shared write.
  // - exponent == 1: the slab's ExhaustionPolicy decides (mint or
  //   SLAB_WEIGHT_EXHAUSTED).
  // - empty handle: SLAB_EMPTY_HANDLE.
  api::Result<WeightedHandle> Split();

  // Drops this handle's weight now. The handle becomes empty.
  void Reset();

  const T& Get() const;
  const T& operator*() const { return Get(); }
  const T* operator->() const { return &Get(); }

  bool empty() const { return slab_ == NULL; }
  std::uint8_t weight_exponent() const { return weight_exponent_; }
  std::size_t weight() const {
    return empty() ? 0 : detail::WeightFromExponent(weight_exponent_);
  }
  std::uint64_t slab_id() const { return slab_id_; }
  std::size_t slot_index() const { return slot_index_; }
  bool IsSoleOwner() const {
    return !empty() && weight_exponent_ == detail::kMaxWeightExponent;
  }

 private:
  friend class Slab<T>;

  WeightedHandle(Slab<T>* slab, std::uint64_t slab_id, std::size_t slot_index,
                 std::uint8_t weight_exponent)
      : slab_(slab),
        slab_id_(slab_id),
        slot_index_(slot_index),
        weight_exponent_(weight_exponent) {}

  WeightedHandle(const WeightedHandle&);
  WeightedHandle& operator=(const WeightedHandle&);

  void Detach() {
    slab_ = NULL;
    slab_id_ = 0;
    slot_index_ = 0;
    weight_exponent_ = 0;
  }

  Slab<T>* slab_;
  std::uint64_t slab_id_;
  std::size_t slot_index_;
  std::uint8_t weight_exponent_;
};

}  // namespace memory
}  // namespace slabrc
