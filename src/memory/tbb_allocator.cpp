#include "memory/allocator_backends.hpp"

#include <tbb/scalable_allocator.h>

namespace slabrc {
namespace memory {

const char* TbbAllocator::BackendName() const { return "tbb"; }

void* TbbAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  return scalable_aligned_malloc(size, alignment);
}

void TbbAllocator::FreeBlock(void* ptr) { scalable_aligned_free(ptr); }

const char* TbbAllocator::AllocateCallName() const { return "scalable_aligned_malloc"; }

}  // namespace memory
}  // namespace slabrc
