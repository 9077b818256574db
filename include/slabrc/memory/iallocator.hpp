#pragma once

#include <cstddef>
#include <cstdint>

#include "slabrc/api/status.hpp"

namespace slabrc {
namespace memory {

enum class AllocBackend { kSystem = 0, kTbbScalable = 1, kMimalloc = 2 };

struct AllocatorStats {
  std::uint64_t alloc_count = 0;
  std::uint64_t free_count = 0;
  std::uint64_t alloc_fail_count = 0;
  std::uint64_t bytes_in_use = 0;
  std::uint64_t bytes_peak = 0;
};

// Backing store for slab slot arrays. One instance is active per process
// (see GlobalAllocator); slabs never talk to a backend directly.
class IAllocator {
 public:
  virtual ~IAllocator() {}

  // "system", "tbb" or "mimalloc", as spelled in config files.
  virtual const char* BackendName() const = 0;

  virtual AllocatorStats Stats() const = 0;

  // size > 0; alignment a power of two no smaller than sizeof(void*).
  // kInvalidArgument on bad input, kInternalError when the backend is out
  // of memory.
  virtual api::Result<void*> Allocate(std::size_t size, std::size_t alignment) = 0;

  // NULL is a no-op.
  virtual api::Status Deallocate(void* ptr) = 0;
};

}  // namespace memory
}  // namespace slabrc
