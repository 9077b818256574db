#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "slabrc/api/export.hpp"
#include "slabrc/api/status.hpp"

namespace slabrc {
namespace memory {

// Detail ids under api::ErrorModule::kSlab.
enum SlabErrorDetail : std::uint32_t {
  kSlabPoolExhausted = 0x0001,
  kSlabWeightExhausted = 0x0002,
  kSlabEmptyHandle = 0x0003,
  kSlabZeroCapacity = 0x0004,
  kSlabValueConstructionFailed = 0x0005,
  kSlabStorageAllocationFailed = 0x0006,
};

SLABRC_API api::Status PoolExhaustedStatus(std::size_t capacity);
SLABRC_API api::Status WeightExhaustedStatus(const std::string& reason);
SLABRC_API api::Status SlabStatus(api::StatusCode code, SlabErrorDetail detail,
                                  const std::string& message);

SLABRC_API bool IsPoolExhausted(const api::Status& status);
SLABRC_API bool IsWeightExhausted(const api::Status& status);

}  // namespace memory
}  // namespace slabrc
