#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "slabrc/api/export.hpp"
#include "slabrc/memory/slab_options.hpp"

namespace slabrc {
namespace memory {
namespace detail {

// W: width of the weight counter in bits.
const unsigned kWordBits = std::numeric_limits<std::size_t>::digits;
// Exponent held by a freshly allocated, never split handle (sole owner).
const std::uint8_t kMaxWeightExponent = static_cast<std::uint8_t>(kWordBits - 1);
// Highest exponent a minted handle may receive; keeps kMaxWeightExponent unique.
const std::uint8_t kMaxMintExponent = static_cast<std::uint8_t>(kWordBits - 2);
const std::size_t kMaxWeight = static_cast<std::size_t>(1) << kMaxWeightExponent;

inline std::size_t WeightFromExponent(std::uint8_t exponent) {
  return static_cast<std::size_t>(1) << exponent;
}

// Index of the highest set bit. x must be non-zero.
inline std::uint8_t FloorLog2(std::size_t x) {
  std::uint8_t exponent = 0;
  while (x >>= 1) ++exponent;
  return exponent;
}

enum class SlotState : std::uint8_t {
  kEmpty = 0,
  // Claimed by an allocator, value not yet constructed.
  kReserved = 1,
  kOccupied = 2,
};

template <typename T>
struct Slot {
  Slot() : state(SlotState::kEmpty), weight(0) {}

  T* value() { return reinterpret_cast<T*>(&storage); }
  const T* value() const { return reinterpret_cast<const T*>(&storage); }

  std::atomic<SlotState> state;
  // Sum of 2^exponent over live handles, except while the sole owner holds
  // the slot: then it stays at kMaxWeight untouched.
  std::atomic<std::size_t> weight;
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage;

 private:
  Slot(const Slot&);
  Slot& operator=(const Slot&);
};

// Non-template hooks so slab.hpp does not pull glog into user code.
SLABRC_API std::uint64_t NextSlabId();
SLABRC_API void LogSlabCreated(std::uint64_t slab_id, std::size_t capacity,
                               ExhaustionPolicy policy);
SLABRC_API void LogPoolExhausted(std::uint64_t slab_id, std::size_t capacity);
SLABRC_API void LogStorageReleaseFailed(std::uint64_t slab_id, const api::Status& status);
// Unrecoverable: a broken invariant means memory safety is already lost. Aborts.
SLABRC_API void FatalInvariant(const char* what, std::uint64_t slab_id, std::size_t slot_index);

}  // namespace detail
}  // namespace memory
}  // namespace slabrc
