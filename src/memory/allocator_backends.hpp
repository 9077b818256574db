#pragma once

#include "memory/allocation_tracker.hpp"

namespace slabrc {
namespace memory {

// posix_memalign / _aligned_malloc. Always built.
class SystemAllocator : public TrackedAllocator {
 public:
  const char* BackendName() const override;

 protected:
  void* AllocateBlock(std::size_t size, std::size_t alignment) override;
  void FreeBlock(void* ptr) override;
  const char* AllocateCallName() const override;
};

#if defined(SLABRC_ENABLE_TBBMALLOC_BACKEND)
class TbbAllocator : public TrackedAllocator {
 public:
  const char* BackendName() const override;

 protected:
  void* AllocateBlock(std::size_t size, std::size_t alignment) override;
  void FreeBlock(void* ptr) override;
  const char* AllocateCallName() const override;
};
#endif

#if defined(SLABRC_ENABLE_MIMALLOC_BACKEND)
class MimallocAllocator : public TrackedAllocator {
 public:
  const char* BackendName() const override;

 protected:
  void* AllocateBlock(std::size_t size, std::size_t alignment) override;
  void FreeBlock(void* ptr) override;
  const char* AllocateCallName() const override;
};
#endif

}  // namespace memory
}  // namespace slabrc
