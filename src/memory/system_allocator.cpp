#include "memory/allocator_backends.hpp"

#include <cstdlib>

#if defined(_WIN32)
#include <malloc.h>
#endif

namespace slabrc {
namespace memory {

const char* SystemAllocator::BackendName() const { return "system"; }

#if defined(_WIN32)
void* SystemAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  return _aligned_malloc(size, alignment);
}

void SystemAllocator::FreeBlock(void* ptr) { _aligned_free(ptr); }

const char* SystemAllocator::AllocateCallName() const { return "_aligned_malloc"; }
#else
void* SystemAllocator::AllocateBlock(std::size_t size, std::size_t alignment) {
  void* ptr = NULL;
  if (posix_memalign(&ptr, alignment, size) != 0) return NULL;
  return ptr;
}

void SystemAllocator::FreeBlock(void* ptr) { std::free(ptr); }

const char* SystemAllocator::AllocateCallName() const { return "posix_memalign"; }
#endif

}  // namespace memory
}  // namespace slabrc
