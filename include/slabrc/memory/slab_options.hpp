#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "slabrc/api/export.hpp"
#include "slabrc/api/status.hpp"
#include "slabrc/json/i_json.hpp"

namespace slabrc {
namespace memory {

// What WeightedHandle::Split does once a handle is down to weight 2^1.
enum class ExhaustionPolicy {
  // Add fresh weight to the slot counter with one CAS and hand it to the
  // new handle. Fails only when the counter has no headroom left.
  kMint = 0,
  // Fail with SLAB_WEIGHT_EXHAUSTED; the caller shares some other way.
  kReject = 1,
};

struct SlabOptions {
  std::size_t capacity = 16;
  ExhaustionPolicy exhaustion_policy = ExhaustionPolicy::kMint;
  // Emit a WARNING each time Allocate finds no empty slot.
  bool log_exhaustion = false;
};

// Cumulative counters; each is read independently (relaxed).
struct SlabStats {
  std::uint64_t allocations = 0;
  std::uint64_t releases = 0;
  std::uint64_t sole_owner_releases = 0;
  std::uint64_t pool_exhausted = 0;
  std::uint64_t construction_failures = 0;
  std::uint64_t splits = 0;
  std::uint64_t mints = 0;
  std::uint64_t weight_exhausted = 0;
};

class SLABRC_API SlabConfig {
 public:
  // Reads the "slab" object, or the root object when there is none:
  // {
  //   "slab": {
  //     "capacity": 1024,
  //     "exhaustion_policy": "mint|reject",
  //     "log_exhaustion": false
  //   }
  // }
  // Missing fields keep their SlabOptions defaults.
  static api::Result<SlabOptions> FromJson(const json::Json& root);
  static api::Result<SlabOptions> Parse(const std::string& text);
  static api::Result<SlabOptions> LoadFile(const std::string& path);

  static api::Status ParsePolicy(const std::string& value, ExhaustionPolicy* out);
  static const char* PolicyName(ExhaustionPolicy policy);
};

}  // namespace memory
}  // namespace slabrc
