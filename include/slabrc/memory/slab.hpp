#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <utility>

#include "slabrc/api/status.hpp"
#include "slabrc/memory/i_global_allocator.hpp"
#include "slabrc/memory/slab_errors.hpp"
#include "slabrc/memory/slab_options.hpp"
#include "slabrc/memory/slab_slot.hpp"
#include "slabrc/memory/weighted_handle.hpp"

namespace slabrc {
namespace memory {

// Fixed-capacity pool of T handing out WeightedHandle<T>.
//
// Slots go Empty -> Reserved -> Occupied -> Empty. Allocate claims a slot
// with one CAS on its state tag, so concurrent allocators never share a
// slot. A slot only returns to Empty when the weight of its handles has been
// fully released; there is no explicit deallocate.
//
// The slab must outlive every handle it issued. Destroying it while a slot
// is still occupied is a fatal invariant violation.
template <typename T>
class Slab {
 public:
  typedef WeightedHandle<T> Handle;

  static const std::size_t kDefaultCapacity = 16;

  static api::Result<std::unique_ptr<Slab> > Create(const SlabOptions& options);
  static api::Result<std::unique_ptr<Slab> > WithCapacity(std::size_t capacity);
  static api::Result<std::unique_ptr<Slab> > CreateFromFile(const std::string& config_path);

  ~Slab();

  // Moves value into the first empty slot. SLAB_POOL_EXHAUSTED when full.
  api::Result<Handle> Allocate(T&& value) { return Emplace(std::move(value)); }
  api::Result<Handle> Allocate(const T& value) { return Emplace(value); }

  // Constructs T in place. If the constructor throws, the slot is returned
  // and SLAB_VALUE_CONSTRUCTION_FAILED is reported.
  template <typename... Args>
  api::Result<Handle> Emplace(Args&&... args);

  std::size_t Capacity() const { return capacity_; }
  std::size_t InUse() const { return in_use_.load(std::memory_order_relaxed); }
  std::size_t Available() const { return capacity_ - InUse(); }
  std::uint64_t Id() const { return id_; }
  const SlabOptions& Options() const { return options_; }
  SlabStats Stats() const;

  bool Owns(const Handle& handle) const {
    return !handle.empty() && handle.slab_id_ == id_ && handle.slab_ == this;
  }
  bool IsOccupied(std::size_t slot_index) const;
  // Raw counter value. Only meaningful while no split/release is in flight.
  std::size_t WeightOf(std::size_t slot_index) const;

 private:
  friend class WeightedHandle<T>;
  typedef detail::Slot<T> SlotType;

  Slab(const SlabOptions& options, detail::Slot<T>* slots);
  Slab(const Slab&);
  Slab& operator=(const Slab&);

  api::Result<std::size_t> ClaimSlot();
  void Publish(std::size_t slot_index);
  void Unclaim(std::size_t slot_index);

  api::Result<Handle> SplitExhausted(std::size_t slot_index);
  api::Result<std::uint8_t> MintWeight(std::size_t slot_index);
  void ReleaseWeight(std::size_t slot_index, std::uint8_t weight_exponent);
  void DestroySlot(std::size_t slot_index);
  const T& ValueAt(std::size_t slot_index) const;

  static void Bump(std::atomic<std::uint64_t>* counter) {
    counter->fetch_add(1, std::memory_order_relaxed);
  }

  const std::uint64_t id_;
  const SlabOptions options_;
  const std::size_t capacity_;
  detail::Slot<T>* slots_;

  std::atomic<std::size_t> in_use_;
  std::atomic<std::uint64_t> allocations_;
  std::atomic<std::uint64_t> releases_;
  std::atomic<std::uint64_t> sole_owner_releases_;
  std::atomic<std::uint64_t> pool_exhausted_;
  std::atomic<std::uint64_t> construction_failures_;
  std::atomic<std::uint64_t> splits_;
  std::atomic<std::uint64_t> mints_;
  std::atomic<std::uint64_t> weight_exhausted_;
};

template <typename T>
const std::size_t Slab<T>::kDefaultCapacity;

// ---------------------------------------------------------------------------
// Slab

template <typename T>
api::Result<std::unique_ptr<Slab<T> > > Slab<T>::Create(const SlabOptions& options) {
  typedef api::Result<std::unique_ptr<Slab<T> > > CreateResult;
  if (options.capacity == 0) {
    return CreateResult(
        SlabStatus(api::StatusCode::kInvalidArgument, kSlabZeroCapacity, "capacity must be > 0"));
  }
  if (options.capacity > std::numeric_limits<std::size_t>::max() / sizeof(detail::Slot<T>)) {
    return CreateResult(SlabStatus(api::StatusCode::kInvalidArgument,
                                   kSlabStorageAllocationFailed, "capacity overflows size_t"));
  }

  const std::size_t alignment =
      alignof(detail::Slot<T>) < sizeof(void*) ? sizeof(void*) : alignof(detail::Slot<T>);
  api::Result<void*> mem =
      GlobalAllocator::Allocate(sizeof(detail::Slot<T>) * options.capacity, alignment);
  if (!mem.ok() || mem.value() == NULL) {
    return CreateResult(SlabStatus(api::StatusCode::kInternalError, kSlabStorageAllocationFailed,
                                   "slot storage allocation failed: " + mem.status().message()));
  }

  detail::Slot<T>* slots = static_cast<detail::Slot<T>*>(mem.value());
  for (std::size_t i = 0; i < options.capacity; ++i) {
    new (&slots[i]) detail::Slot<T>();
  }

  std::unique_ptr<Slab<T> > slab(new (std::nothrow) Slab<T>(options, slots));
  if (!slab) {
    api::Status freed = GlobalAllocator::Deallocate(mem.value());
    if (!freed.ok()) {
      detail::LogStorageReleaseFailed(0, freed);
    }
    return CreateResult(SlabStatus(api::StatusCode::kInternalError, kSlabStorageAllocationFailed,
                                   "slab object allocation failed"));
  }
  detail::LogSlabCreated(slab->Id(), slab->Capacity(), options.exhaustion_policy);
  return CreateResult(std::move(slab));
}

template <typename T>
api::Result<std::unique_ptr<Slab<T> > > Slab<T>::WithCapacity(std::size_t capacity) {
  SlabOptions options;
  options.capacity = capacity;
  return Create(options);
}

template <typename T>
api::Result<std::unique_ptr<Slab<T> > > Slab<T>::CreateFromFile(const std::string& config_path) {
  api::Result<SlabOptions> options = SlabConfig::LoadFile(config_path);
  if (!options.ok()) {
    return api::Result<std::unique_ptr<Slab<T> > >(options.status());
  }
  return Create(options.value());
}

template <typename T>
Slab<T>::Slab(const SlabOptions& options, detail::Slot<T>* slots)
    : id_(detail::NextSlabId()),
      options_(options),
      capacity_(options.capacity),
      slots_(slots),
      in_use_(0),
      allocations_(0),
      releases_(0),
      sole_owner_releases_(0),
      pool_exhausted_(0),
      construction_failures_(0),
      splits_(0),
      mints_(0),
      weight_exhausted_(0) {}

template <typename T>
Slab<T>::~Slab() {
  for (std::size_t i = 0; i < capacity_; ++i) {
    if (slots_[i].state.load(std::memory_order_acquire) != detail::SlotState::kEmpty) {
      detail::FatalInvariant("slab destroyed while a handle still references this slot", id_, i);
    }
    slots_[i].~SlotType();
  }
  api::Status freed = GlobalAllocator::Deallocate(static_cast<void*>(slots_));
  if (!freed.ok()) {
    detail::LogStorageReleaseFailed(id_, freed);
  }
}

template <typename T>
template <typename... Args>
api::Result<WeightedHandle<T> > Slab<T>::Emplace(Args&&... args) {
  api::Result<std::size_t> claimed = ClaimSlot();
  if (!claimed.ok()) {
    return api::Result<Handle>(claimed.status());
  }
  const std::size_t index = claimed.value();

  try {
    new (slots_[index].value()) T(std::forward<Args>(args)...);
  } catch (const std::exception& ex) {
    Unclaim(index);
    return api::Result<Handle>(SlabStatus(api::StatusCode::kInternalError,
                                          kSlabValueConstructionFailed,
                                          std::string("value constructor threw: ") + ex.what()));
  } catch (...) {
    Unclaim(index);
    return api::Result<Handle>(SlabStatus(api::StatusCode::kInternalError,
                                          kSlabValueConstructionFailed,
                                          "value constructor threw a non-std exception"));
  }

  Publish(index);
  return api::Result<Handle>(Handle(this, id_, index, detail::kMaxWeightExponent));
}

template <typename T>
SlabStats Slab<T>::Stats() const {
  SlabStats s;
  s.allocations = allocations_.load(std::memory_order_relaxed);
  s.releases = releases_.load(std::memory_order_relaxed);
  s.sole_owner_releases = sole_owner_releases_.load(std::memory_order_relaxed);
  s.pool_exhausted = pool_exhausted_.load(std::memory_order_relaxed);
  s.construction_failures = construction_failures_.load(std::memory_order_relaxed);
  s.splits = splits_.load(std::memory_order_relaxed);
  s.mints = mints_.load(std::memory_order_relaxed);
  s.weight_exhausted = weight_exhausted_.load(std::memory_order_relaxed);
  return s;
}

template <typename T>
bool Slab<T>::IsOccupied(std::size_t slot_index) const {
  if (slot_index >= capacity_) return false;
  return slots_[slot_index].state.load(std::memory_order_acquire) ==
         detail::SlotState::kOccupied;
}

template <typename T>
std::size_t Slab<T>::WeightOf(std::size_t slot_index) const {
  if (slot_index >= capacity_) return 0;
  return slots_[slot_index].weight.load(std::memory_order_acquire);
}

// First fit. The acquire on a successful CAS pairs with the release store
// of kEmpty in DestroySlot, so the previous value is fully gone.
template <typename T>
api::Result<std::size_t> Slab<T>::ClaimSlot() {
  for (std::size_t i = 0; i < capacity_; ++i) {
    detail::SlotState expected = detail::SlotState::kEmpty;
    if (slots_[i].state.compare_exchange_strong(expected, detail::SlotState::kReserved,
                                                std::memory_order_acquire,
                                                std::memory_order_relaxed)) {
      in_use_.fetch_add(1, std::memory_order_relaxed);
      return api::Result<std::size_t>(i);
    }
  }
  Bump(&pool_exhausted_);
  if (options_.log_exhaustion) {
    detail::LogPoolExhausted(id_, capacity_);
  }
  return api::Result<std::size_t>(PoolExhaustedStatus(capacity_));
}

template <typename T>
void Slab<T>::Publish(std::size_t slot_index) {
  slots_[slot_index].weight.store(detail::kMaxWeight, std::memory_order_relaxed);
  slots_[slot_index].state.store(detail::SlotState::kOccupied, std::memory_order_release);
  Bump(&allocations_);
}

template <typename T>
void Slab<T>::Unclaim(std::size_t slot_index) {
  Bump(&construction_failures_);
  in_use_.fetch_sub(1, std::memory_order_relaxed);
  slots_[slot_index].state.store(detail::SlotState::kEmpty, std::memory_order_release);
}

template <typename T>
api::Result<WeightedHandle<T> > Slab<T>::SplitExhausted(std::size_t slot_index) {
  if (options_.exhaustion_policy == ExhaustionPolicy::kReject) {
    Bump(&weight_exhausted_);
    return api::Result<Handle>(
        WeightExhaustedStatus("handle weight is 2^1 and the slab rejects minting"));
  }
  api::Result<std::uint8_t> minted = MintWeight(slot_index);
  if (!minted.ok()) {
    return api::Result<Handle>(minted.status());
  }
  return api::Result<Handle>(Handle(this, id_, slot_index, minted.value()));
}

// The caller still holds weight >= 2, so the counter cannot reach zero while
// we add to it; relaxed ordering is enough, as for shared_ptr increments.
template <typename T>
api::Result<std::uint8_t> Slab<T>::MintWeight(std::size_t slot_index) {
  std::atomic<std::size_t>& counter = slots_[slot_index].weight;
  std::size_t current = counter.load(std::memory_order_relaxed);
  for (;;) {
    const std::size_t headroom = std::numeric_limits<std::size_t>::max() - current;
    if (headroom < 2) {
      Bump(&weight_exhausted_);
      return api::Result<std::uint8_t>(
          WeightExhaustedStatus("slot weight counter has no headroom left to mint"));
    }
    std::uint8_t exponent = detail::FloorLog2(headroom);
    if (exponent > detail::kMaxMintExponent) {
      exponent = detail::kMaxMintExponent;
    }
    if (counter.compare_exchange_weak(current, current + detail::WeightFromExponent(exponent),
                                      std::memory_order_relaxed, std::memory_order_relaxed)) {
      Bump(&mints_);
      return api::Result<std::uint8_t>(exponent);
    }
  }
}

template <typename T>
void Slab<T>::ReleaseWeight(std::size_t slot_index, std::uint8_t weight_exponent) {
  if (weight_exponent == detail::kMaxWeightExponent) {
    Bump(&sole_owner_releases_);
    DestroySlot(slot_index);
    return;
  }

  const std::size_t weight = detail::WeightFromExponent(weight_exponent);
  const std::size_t prior =
      slots_[slot_index].weight.fetch_sub(weight, std::memory_order_release);
  if (prior < weight) {
    detail::FatalInvariant("weight counter underflow", id_, slot_index);
  }
  if (prior == weight) {
    std::atomic_thread_fence(std::memory_order_acquire);
    DestroySlot(slot_index);
  }
}

template <typename T>
void Slab<T>::DestroySlot(std::size_t slot_index) {
  detail::Slot<T>& slot = slots_[slot_index];
  slot.value()->~T();
  slot.weight.store(0, std::memory_order_relaxed);
  in_use_.fetch_sub(1, std::memory_order_relaxed);
  Bump(&releases_);
  slot.state.store(detail::SlotState::kEmpty, std::memory_order_release);
}

template <typename T>
const T& Slab<T>::ValueAt(std::size_t slot_index) const {
  // Debug builds only, like DCHECK: this sits on every dereference.
#if !defined(NDEBUG)
  if (slot_index >= capacity_ ||
      slots_[slot_index].state.load(std::memory_order_relaxed) != detail::SlotState::kOccupied) {
    detail::FatalInvariant("live handle references a slot that is not occupied", id_,
                           slot_index);
  }
#endif
  return *slots_[slot_index].value();
}

// ---------------------------------------------------------------------------
// WeightedHandle

template <typename T>
api::Result<WeightedHandle<T> > WeightedHandle<T>::Split() {
  if (empty()) {
    return api::Result<WeightedHandle>(
        SlabStatus(api::StatusCode::kInvalidArgument, kSlabEmptyHandle, "split of empty handle"));
  }
  if (weight_exponent_ > 1) {
    --weight_exponent_;
    Slab<T>::Bump(&slab_->splits_);
    return api::Result<WeightedHandle>(
        WeightedHandle(slab_, slab_id_, slot_index_, weight_exponent_));
  }
  return slab_->SplitExhausted(slot_index_);
}

template <typename T>
void WeightedHandle<T>::Reset() {
  if (slab_ == NULL) return;
  Slab<T>* slab = slab_;
  const std::size_t slot_index = slot_index_;
  const std::uint8_t weight_exponent = weight_exponent_;
  Detach();
  slab->ReleaseWeight(slot_index, weight_exponent);
}

template <typename T>
const T& WeightedHandle<T>::Get() const {
#if !defined(NDEBUG)
  if (slab_ == NULL) {
    detail::FatalInvariant("dereferenced an empty handle", slab_id_, slot_index_);
  }
#endif
  return slab_->ValueAt(slot_index_);
}

}  // namespace memory
}  // namespace slabrc
