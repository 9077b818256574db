#include "memory/allocator_backends.hpp"

#include <mimalloc.h>

namespace slabrc {
namespace memory {

const char* MimallocAllocator::BackendName() const { return "mimalloc"; }

void* MimallocAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  return mi_malloc_aligned(size, alignment);
}

void MimallocAllocator::FreeBlock(void* ptr) { mi_free(ptr); }

const char* MimallocAllocator::AllocateCallName() const { return "mi_malloc_aligned"; }

}  // namespace memory
}  // namespace slabrc
