#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "slabrc/memory/iallocator.hpp"

namespace slabrc {
namespace memory {

// Counters plus a pointer -> size map so Deallocate can credit bytes back.
class AllocationTracker {
 public:
  AllocationTracker();

  void RecordFailure();
  void RecordAllocation(void* ptr, std::size_t size);
  void RecordDeallocation(void* ptr);

  AllocatorStats Snapshot() const;

 private:
  std::atomic<std::uint64_t> alloc_count_;
  std::atomic<std::uint64_t> free_count_;
  std::atomic<std::uint64_t> alloc_fail_count_;
  std::atomic<std::uint64_t> bytes_in_use_;
  std::atomic<std::uint64_t> bytes_peak_;

  mutable std::mutex size_mu_;
  std::unordered_map<void*, std::size_t> alloc_sizes_;
};

// IAllocator with validation and bookkeeping done once. A backend only
// supplies the raw aligned allocate/free pair.
class TrackedAllocator : public IAllocator {
 public:
  AllocatorStats Stats() const override;
  api::Result<void*> Allocate(std::size_t size, std::size_t alignment) override;
  api::Status Deallocate(void* ptr) override;

 protected:
  TrackedAllocator() {}

  // NULL when the backend is out of memory.
  virtual void* AllocateBlock(std::size_t size, std::size_t alignment) = 0;
  virtual void FreeBlock(void* ptr) = 0;

  // Names the failing call in the kInternalError message.
  virtual const char* AllocateCallName() const = 0;

 private:
  TrackedAllocator(const TrackedAllocator&);
  TrackedAllocator& operator=(const TrackedAllocator&);

  AllocationTracker tracker_;
};

inline bool IsPowerOfTwo(std::size_t x) { return x != 0 && (x & (x - 1)) == 0; }

api::Status ValidateAllocationRequest(std::size_t size, std::size_t alignment);

}  // namespace memory
}  // namespace slabrc
