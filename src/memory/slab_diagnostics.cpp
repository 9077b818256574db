#include "slabrc/memory/slab_slot.hpp"

#include <glog/logging.h>

namespace slabrc {
namespace memory {
namespace detail {

std::uint64_t NextSlabId() {
  static std::atomic<std::uint64_t> next_id(1);
  return next_id.fetch_add(1, std::memory_order_relaxed);
}

void LogSlabCreated(std::uint64_t slab_id, std::size_t capacity, ExhaustionPolicy policy) {
  LOG(INFO) << "slab#" << slab_id << " created: capacity=" << capacity
            << " exhaustion_policy=" << SlabConfig::PolicyName(policy);
}

void LogPoolExhausted(std::uint64_t slab_id, std::size_t capacity) {
  LOG(WARNING) << "slab#" << slab_id << " exhausted: all " << capacity
               << " slots are occupied";
}

void LogStorageReleaseFailed(std::uint64_t slab_id, const api::Status& status) {
  LOG(ERROR) << "slab#" << slab_id << " failed to release slot storage: " << status.message()
             << " (" << status.hex_code_string() << ")";
}

void FatalInvariant(const char* what, std::uint64_t slab_id, std::size_t slot_index) {
  LOG(FATAL) << "slab#" << slab_id << " slot " << slot_index << ": " << what;
}

}  // namespace detail
}  // namespace memory
}  // namespace slabrc
