#pragma once

#include <cstddef>
#include <string>

#include "slabrc/api/export.hpp"
#include "slabrc/json/i_json.hpp"
#include "slabrc/memory/iallocator.hpp"

namespace slabrc {
namespace memory {

struct GlobalAllocatorOptions {
  AllocBackend backend = AllocBackend::kSystem;
  bool strict_backend = true;
};

// Process-wide backing allocator used for slab slot arrays.
class SLABRC_API GlobalAllocator {
 public:
  // Switch backend policy. Refused with kWouldBlock while the current
  // backend still has bytes in use. A backend missing from this build is
  // kUnsupported when strict_backend is set, otherwise falls back to system.
  static api::Status Configure(const GlobalAllocatorOptions& options);

  // {"memory": {"backend": "system|tbb|mimalloc", "strict_backend": bool}}.
  // The "memory" wrapper may be omitted. Unknown keys are ignored; keys left
  // out keep their current values.
  static api::Status ConfigureFromFile(const std::string& config_path);
  static api::Status ConfigureFromJson(const json::Json& root);

  static api::Result<void*> Allocate(std::size_t size, std::size_t alignment);
  static api::Status Deallocate(void* ptr);

  static AllocBackend CurrentBackend();
  static const char* BackendDisplayName(AllocBackend backend);
  static bool IsBackendEnabled(AllocBackend backend);

  static const char* CurrentBackendName();
  static AllocatorStats CurrentStats();
};

}  // namespace memory
}  // namespace slabrc
