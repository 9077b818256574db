#include "slabrc/slabrc.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#if !defined(_WIN32)
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace {

using slabrc::memory::Slab;
using slabrc::memory::SlabOptions;
using slabrc::memory::WeightedHandle;

// Counts constructions minus destructions and records per-id destroy counts.
struct Sentinel {
  Sentinel(int id_in, std::atomic<int>* live_in, std::vector<int>* destroyed_in)
      : id(id_in), live(live_in), destroyed(destroyed_in) {
    live->fetch_add(1);
  }
  ~Sentinel() {
    live->fetch_sub(1);
    if (destroyed != NULL) ++(*destroyed)[static_cast<std::size_t>(id)];
  }

  int id;
  std::atomic<int>* live;
  std::vector<int>* destroyed;

 private:
  Sentinel(const Sentinel&);
  Sentinel& operator=(const Sentinel&);
};

struct Throwing {
  explicit Throwing(bool fail) : value(7) {
    if (fail) throw std::runtime_error("constructor refused");
  }
  int value;
};

template <typename T>
std::unique_ptr<Slab<T> > MakeSlab(std::size_t capacity) {
  slabrc::api::Result<std::unique_ptr<Slab<T> > > created = Slab<T>::WithCapacity(capacity);
  if (!created.ok()) return std::unique_ptr<Slab<T> >();
  return std::move(created.value());
}

bool TestCapacityConservation() {
  const std::size_t capacity = 32;
  std::unique_ptr<Slab<int> > slab = MakeSlab<int>(capacity);
  if (!slab) return false;

  std::vector<WeightedHandle<int> > handles;
  for (std::size_t i = 0; i < capacity; ++i) {
    slabrc::api::Result<WeightedHandle<int> > r = slab->Allocate(static_cast<int>(i));
    if (!r.ok()) return false;
    handles.push_back(std::move(r.value()));
  }
  if (slab->Available() != 0 || slab->InUse() != capacity) return false;

  slabrc::api::Result<WeightedHandle<int> > overflow = slab->Allocate(-1);
  if (overflow.ok()) return false;
  if (!slabrc::memory::IsPoolExhausted(overflow.status())) return false;
  if (overflow.status().code() != slabrc::api::StatusCode::kResourceExhausted) return false;
  if (std::string(overflow.status().symbol()) != "SLAB_POOL_EXHAUSTED") return false;
  if (slab->Stats().pool_exhausted != 1) return false;

  for (std::size_t i = 0; i < handles.size(); ++i) {
    if (*handles[i] != static_cast<int>(i)) return false;
  }
  handles.clear();
  return slab->InUse() == 0;
}

bool TestZeroCapacityRejected() {
  slabrc::api::Result<std::unique_ptr<Slab<int> > > created = Slab<int>::WithCapacity(0);
  if (created.ok()) return false;
  return created.status().code() == slabrc::api::StatusCode::kInvalidArgument &&
         std::string(created.status().symbol()) == "SLAB_ZERO_CAPACITY";
}

bool TestDefaultOptions() {
  slabrc::api::Result<std::unique_ptr<Slab<int> > > created = Slab<int>::Create(SlabOptions());
  if (!created.ok()) return false;
  const Slab<int>& slab = *created.value();
  return slab.Capacity() == Slab<int>::kDefaultCapacity &&
         slab.Options().exhaustion_policy == slabrc::memory::ExhaustionPolicy::kMint &&
         slab.Available() == Slab<int>::kDefaultCapacity;
}

bool TestThousandSentinelsDestroyedOnce() {
  const int count = 1000;
  std::atomic<int> live(0);
  std::vector<int> destroyed(count, 0);
  std::unique_ptr<Slab<Sentinel> > slab = MakeSlab<Sentinel>(count);
  if (!slab) return false;

  {
    std::vector<WeightedHandle<Sentinel> > handles;
    for (int i = 0; i < count; ++i) {
      slabrc::api::Result<WeightedHandle<Sentinel> > r = slab->Emplace(i, &live, &destroyed);
      if (!r.ok()) return false;
      handles.push_back(std::move(r.value()));
    }
    if (live.load() != count) return false;
  }

  if (live.load() != 0) return false;
  for (int i = 0; i < count; ++i) {
    if (destroyed[static_cast<std::size_t>(i)] != 1) return false;
  }
  const slabrc::memory::SlabStats stats = slab->Stats();
  return slab->InUse() == 0 && stats.allocations == 1000 && stats.releases == 1000 &&
         stats.sole_owner_releases == 1000;
}

bool TestFreedSlotsAreReusable() {
  std::atomic<int> live(0);
  std::unique_ptr<Slab<Sentinel> > slab = MakeSlab<Sentinel>(2);
  if (!slab) return false;

  {
    slabrc::api::Result<WeightedHandle<Sentinel> > a = slab->Emplace(0, &live, nullptr);
    slabrc::api::Result<WeightedHandle<Sentinel> > b = slab->Emplace(0, &live, nullptr);
    if (!a.ok() || !b.ok()) return false;
    if (live.load() != 2) return false;
  }
  if (live.load() != 0) return false;

  slabrc::api::Result<WeightedHandle<Sentinel> > c = slab->Emplace(0, &live, nullptr);
  slabrc::api::Result<WeightedHandle<Sentinel> > d = slab->Emplace(0, &live, nullptr);
  if (!c.ok() || !d.ok()) return false;
  if (live.load() != 2) return false;

  slabrc::api::Result<WeightedHandle<Sentinel> > e = slab->Emplace(0, &live, nullptr);
  return !e.ok() && slabrc::memory::IsPoolExhausted(e.status());
}

bool TestReusedSlotHoldsIndependentValue() {
  std::unique_ptr<Slab<std::vector<int> > > slab = MakeSlab<std::vector<int> >(1);
  if (!slab) return false;

  std::size_t first_index = 0;
  {
    std::vector<int> first(3, 11);
    slabrc::api::Result<WeightedHandle<std::vector<int> > > r = slab->Allocate(std::move(first));
    if (!r.ok()) return false;
    first_index = r.value().slot_index();
    if (r.value()->size() != 3 || (*r.value())[2] != 11) return false;
  }
  if (slab->IsOccupied(first_index)) return false;

  slabrc::api::Result<WeightedHandle<std::vector<int> > > again =
      slab->Allocate(std::vector<int>(1, 42));
  if (!again.ok()) return false;
  const WeightedHandle<std::vector<int> >& h = again.value();
  return h.slot_index() == first_index && h->size() == 1 && (*h)[0] == 42 &&
         h.IsSoleOwner() && slab->WeightOf(first_index) == slabrc::memory::detail::kMaxWeight;
}

bool TestConstructorFailureReturnsSlot() {
  std::unique_ptr<Slab<Throwing> > slab = MakeSlab<Throwing>(1);
  if (!slab) return false;

  slabrc::api::Result<WeightedHandle<Throwing> > failed = slab->Emplace(true);
  if (failed.ok()) return false;
  if (failed.status().code() != slabrc::api::StatusCode::kInternalError) return false;
  if (std::string(failed.status().symbol()) != "SLAB_VALUE_CONSTRUCTION_FAILED") return false;
  if (failed.status().message().find("constructor refused") == std::string::npos) return false;
  if (slab->InUse() != 0 || slab->IsOccupied(0)) return false;

  slabrc::api::Result<WeightedHandle<Throwing> > ok = slab->Emplace(false);
  if (!ok.ok()) return false;
  return ok.value().slot_index() == 0 && ok.value()->value == 7 &&
         slab->Stats().construction_failures == 1;
}

bool TestHandlesIdentifyTheirSlab() {
  std::unique_ptr<Slab<int> > left = MakeSlab<int>(4);
  std::unique_ptr<Slab<int> > right = MakeSlab<int>(4);
  if (!left || !right) return false;
  if (left->Id() == right->Id()) return false;

  slabrc::api::Result<WeightedHandle<int> > a = left->Allocate(1);
  slabrc::api::Result<WeightedHandle<int> > b = right->Allocate(2);
  if (!a.ok() || !b.ok()) return false;

  // Same slot index in two slabs; identity is (slab_id, slot_index).
  if (a.value().slot_index() != b.value().slot_index()) return false;
  if (a.value().slab_id() != left->Id() || b.value().slab_id() != right->Id()) return false;
  return left->Owns(a.value()) && !left->Owns(b.value()) && right->Owns(b.value()) &&
         !right->Owns(WeightedHandle<int>());
}

bool TestSlotStorageComesFromGlobalAllocator() {
  const slabrc::memory::AllocatorStats before =
      slabrc::memory::GlobalAllocator::CurrentStats();
  {
    std::unique_ptr<Slab<long long> > slab = MakeSlab<long long>(64);
    if (!slab) return false;
    const slabrc::memory::AllocatorStats during =
        slabrc::memory::GlobalAllocator::CurrentStats();
    if (during.alloc_count != before.alloc_count + 1) return false;
    if (during.bytes_in_use < before.bytes_in_use + 64 * sizeof(long long)) return false;
  }
  const slabrc::memory::AllocatorStats after = slabrc::memory::GlobalAllocator::CurrentStats();
  return after.bytes_in_use == before.bytes_in_use &&
         after.free_count == before.free_count + 1;
}

#if !defined(_WIN32)
// Runs fn in a child process; true when the child is killed by a signal or
// exits non-zero. LOG(FATAL) aborts, so this is how fatal paths are checked.
bool DiesAbnormally(void (*fn)()) {
  std::fflush(stdout);
  std::fflush(stderr);
  const pid_t pid = fork();
  if (pid < 0) return false;
  if (pid == 0) {
    fn();
    _exit(0);
  }
  int status = 0;
  if (waitpid(pid, &status, 0) != pid) return false;
  return WIFSIGNALED(status) || (WIFEXITED(status) && WEXITSTATUS(status) != 0);
}

void DestroySlabWithLiveHandle() {
  std::unique_ptr<Slab<int> > slab = MakeSlab<int>(2);
  if (!slab) return;
  slabrc::api::Result<WeightedHandle<int> > h = slab->Allocate(9);
  if (!h.ok()) return;
  slab.reset();
}

void DereferenceEmptyHandle() {
  WeightedHandle<int> empty;
  volatile int value = *empty;
  (void)value;
}
#endif

bool TestDestroyingSlabWithLiveHandleIsFatal() {
#if defined(_WIN32)
  return true;
#else
  return DiesAbnormally(DestroySlabWithLiveHandle);
#endif
}

// Checked in debug builds only; release builds skip the state check.
bool TestDereferencingEmptyHandleIsFatal() {
#if defined(_WIN32) || defined(NDEBUG)
  return true;
#else
  return DiesAbnormally(DereferenceEmptyHandle);
#endif
}

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"capacity_conservation", TestCapacityConservation},
      {"zero_capacity_rejected", TestZeroCapacityRejected},
      {"default_options", TestDefaultOptions},
      {"thousand_sentinels_destroyed_once", TestThousandSentinelsDestroyedOnce},
      {"freed_slots_are_reusable", TestFreedSlotsAreReusable},
      {"reused_slot_holds_independent_value", TestReusedSlotHoldsIndependentValue},
      {"constructor_failure_returns_slot", TestConstructorFailureReturnsSlot},
      {"handles_identify_their_slab", TestHandlesIdentifyTheirSlab},
      {"slot_storage_comes_from_global_allocator", TestSlotStorageComesFromGlobalAllocator},
      {"destroying_slab_with_live_handle_is_fatal", TestDestroyingSlabWithLiveHandleIsFatal},
      {"dereferencing_empty_handle_is_fatal", TestDereferencingEmptyHandleIsFatal},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
