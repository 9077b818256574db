#include "memory/allocation_tracker.hpp"

#include <string>

namespace slabrc {
namespace memory {

#define SLABRC_MEM_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, (detail))

AllocationTracker::AllocationTracker()
    : alloc_count_(0), free_count_(0), alloc_fail_count_(0), bytes_in_use_(0), bytes_peak_(0) {}

void AllocationTracker::RecordFailure() {
  alloc_fail_count_.fetch_add(1, std::memory_order_relaxed);
}

void AllocationTracker::RecordAllocation(void* ptr, std::size_t size) {
  alloc_count_.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lock(size_mu_);
    alloc_sizes_[ptr] = size;
  }
  const std::uint64_t in_use_now =
      bytes_in_use_.fetch_add(static_cast<std::uint64_t>(size), std::memory_order_relaxed) +
      static_cast<std::uint64_t>(size);

  std::uint64_t peak = bytes_peak_.load(std::memory_order_relaxed);
  while (in_use_now > peak &&
         !bytes_peak_.compare_exchange_weak(peak, in_use_now, std::memory_order_relaxed,
                                            std::memory_order_relaxed)) {
  }
}

void AllocationTracker::RecordDeallocation(void* ptr) {
  std::size_t released = 0;
  {
    std::lock_guard<std::mutex> lock(size_mu_);
    std::unordered_map<void*, std::size_t>::iterator it = alloc_sizes_.find(ptr);
    if (it != alloc_sizes_.end()) {
      released = it->second;
      alloc_sizes_.erase(it);
    }
  }

  free_count_.fetch_add(1, std::memory_order_relaxed);
  if (released == 0) return;
  bytes_in_use_.fetch_sub(static_cast<std::uint64_t>(released), std::memory_order_relaxed);
}

AllocatorStats AllocationTracker::Snapshot() const {
  AllocatorStats s;
  s.alloc_count = alloc_count_.load(std::memory_order_relaxed);
  s.free_count = free_count_.load(std::memory_order_relaxed);
  s.alloc_fail_count = alloc_fail_count_.load(std::memory_order_relaxed);
  s.bytes_in_use = bytes_in_use_.load(std::memory_order_relaxed);
  s.bytes_peak = bytes_peak_.load(std::memory_order_relaxed);
  return s;
}

AllocatorStats TrackedAllocator::Stats() const { return tracker_.Snapshot(); }

api::Result<void*> TrackedAllocator::Allocate(std::size_t size, std::size_t alignment) {
  api::Status valid = ValidateAllocationRequest(size, alignment);
  if (!valid.ok()) {
    tracker_.RecordFailure();
    return api::Result<void*>(valid);
  }
  void* ptr = AllocateBlock(size, alignment);
  if (ptr == NULL) {
    tracker_.RecordFailure();
    return api::Result<void*>(SLABRC_MEM_STATUS(
        api::StatusCode::kInternalError, std::string(AllocateCallName()) + " failed", 0));
  }
  tracker_.RecordAllocation(ptr, size);
  return api::Result<void*>(ptr);
}

api::Status TrackedAllocator::Deallocate(void* ptr) {
  if (ptr == NULL) return api::Status::Ok();
  tracker_.RecordDeallocation(ptr);
  FreeBlock(ptr);
  return api::Status::Ok();
}

api::Status ValidateAllocationRequest(std::size_t size, std::size_t alignment) {
  if (size == 0) {
    return SLABRC_MEM_STATUS(api::StatusCode::kInvalidArgument, "size must be > 0", 0);
  }
  if (alignment < sizeof(void*) || !IsPowerOfTwo(alignment)) {
    return SLABRC_MEM_STATUS(api::StatusCode::kInvalidArgument,
                             "alignment must be power-of-two and >= sizeof(void*)", 0x0001);
  }
  return api::Status::Ok();
}

#undef SLABRC_MEM_STATUS

}  // namespace memory
}  // namespace slabrc
