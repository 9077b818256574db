#include "slabrc/slabrc.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using slabrc::api::Result;
using slabrc::api::Status;
using slabrc::api::StatusCode;
using slabrc::memory::AllocBackend;
using slabrc::memory::ExhaustionPolicy;
using slabrc::memory::GlobalAllocator;
using slabrc::memory::GlobalAllocatorOptions;
using slabrc::memory::SlabConfig;
using slabrc::memory::SlabOptions;

std::string TempPath(const std::string& name) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return "/tmp/slabrc_" + name + "_" + std::to_string(now) + ".json";
}

bool HasSymbol(const Status& st, const char* symbol) { return std::string(st.symbol()) == symbol; }

bool RestoreSystemBackend() {
  GlobalAllocatorOptions options;
  options.backend = AllocBackend::kSystem;
  return GlobalAllocator::Configure(options).ok();
}

bool TestSlabConfigParsesAllFields() {
  Result<SlabOptions> parsed = SlabConfig::Parse(
      "{\"slab\": {\"capacity\": 1024, \"exhaustion_policy\": \"reject\", "
      "\"log_exhaustion\": true}}");
  if (!parsed.ok()) return false;
  const SlabOptions& o = parsed.value();
  return o.capacity == 1024 && o.exhaustion_policy == ExhaustionPolicy::kReject &&
         o.log_exhaustion;
}

bool TestSlabConfigDefaults() {
  Result<SlabOptions> empty = SlabConfig::Parse("{}");
  Result<SlabOptions> flat = SlabConfig::Parse("{\"capacity\": 4}");
  if (!empty.ok() || !flat.ok()) return false;
  const SlabOptions defaults;
  return empty.value().capacity == defaults.capacity &&
         empty.value().exhaustion_policy == ExhaustionPolicy::kMint &&
         !empty.value().log_exhaustion && flat.value().capacity == 4 &&
         flat.value().exhaustion_policy == ExhaustionPolicy::kMint;
}

bool TestSlabConfigRejectsBadFields() {
  const char* bad[] = {
      "{\"slab\": {\"capacity\": 0}}",
      "{\"slab\": {\"capacity\": -3}}",
      "{\"slab\": {\"capacity\": \"16\"}}",
      "{\"slab\": {\"capacity\": 2.5}}",
      "{\"slab\": {\"exhaustion_policy\": \"drop\"}}",
      "{\"slab\": {\"exhaustion_policy\": 1}}",
      "{\"slab\": {\"log_exhaustion\": \"yes\"}}",
      "{\"slab\": 16}",
      "[1, 2, 3]",
  };
  for (std::size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
    Result<SlabOptions> parsed = SlabConfig::Parse(bad[i]);
    if (parsed.ok()) return false;
    if (parsed.status().code() != StatusCode::kInvalidArgument) return false;
    if (!HasSymbol(parsed.status(), "CONFIG_INVALID_FIELD")) return false;
  }

  Result<SlabOptions> garbage = SlabConfig::Parse("{\"slab\": ");
  return !garbage.ok() && HasSymbol(garbage.status(), "CONFIG_PARSE_FAILED");
}

bool TestPolicyNamesRoundTrip() {
  ExhaustionPolicy policy = ExhaustionPolicy::kMint;
  if (!SlabConfig::ParsePolicy("reject", &policy).ok()) return false;
  if (policy != ExhaustionPolicy::kReject) return false;
  if (SlabConfig::ParsePolicy("Reject", &policy).ok()) return false;
  return std::string(SlabConfig::PolicyName(ExhaustionPolicy::kMint)) == "mint" &&
         std::string(SlabConfig::PolicyName(ExhaustionPolicy::kReject)) == "reject";
}

bool TestCreateSlabFromFile() {
  const std::string path = TempPath("slab_config");
  {
    std::ofstream out(path.c_str());
    if (!out.is_open()) return false;
    out << "{\"slab\": {\"capacity\": 3, \"exhaustion_policy\": \"reject\"}}\n";
  }

  Result<std::unique_ptr<slabrc::memory::Slab<int> > > created =
      slabrc::memory::Slab<int>::CreateFromFile(path);
  std::remove(path.c_str());
  if (!created.ok()) return false;
  const slabrc::memory::Slab<int>& slab = *created.value();
  if (slab.Capacity() != 3 || slab.Options().exhaustion_policy != ExhaustionPolicy::kReject) {
    return false;
  }

  Result<std::unique_ptr<slabrc::memory::Slab<int> > > missing =
      slabrc::memory::Slab<int>::CreateFromFile("/nonexistent/slabrc/slab.json");
  return !missing.ok() && missing.status().code() == StatusCode::kNotFound;
}

bool TestAllocatorRejectsUnknownBackend() {
  Result<slabrc::json::Json> root =
      slabrc::json::JsonCodec::Parse("{\"memory\": {\"backend\": \"jemalloc\"}}");
  if (!root.ok()) return false;
  Status st = GlobalAllocator::ConfigureFromJson(root.value());
  if (st.code() != StatusCode::kInvalidArgument || !HasSymbol(st, "MEM_INVALID_CONFIG")) {
    return false;
  }

  Result<slabrc::json::Json> wrong_type =
      slabrc::json::JsonCodec::Parse("{\"memory\": {\"strict_backend\": \"no\"}}");
  if (!wrong_type.ok()) return false;
  st = GlobalAllocator::ConfigureFromJson(wrong_type.value());
  return st.code() == StatusCode::kInvalidArgument &&
         GlobalAllocator::CurrentBackend() == AllocBackend::kSystem;
}

bool TestAllocatorNonStrictFallsBackToSystem() {
  Result<slabrc::json::Json> root = slabrc::json::JsonCodec::Parse(
      "{\"memory\": {\"backend\": \"tbb\", \"strict_backend\": false}}");
  if (!root.ok()) return false;
  if (!GlobalAllocator::ConfigureFromJson(root.value()).ok()) return false;

  const bool enabled = GlobalAllocator::IsBackendEnabled(AllocBackend::kTbbScalable);
  const AllocBackend expected = enabled ? AllocBackend::kTbbScalable : AllocBackend::kSystem;
  const bool matches =
      GlobalAllocator::CurrentBackend() == expected &&
      std::string(GlobalAllocator::CurrentBackendName()) ==
          GlobalAllocator::BackendDisplayName(expected);

  bool slab_ok = false;
  {
    Result<std::unique_ptr<slabrc::memory::Slab<int> > > created =
        slabrc::memory::Slab<int>::WithCapacity(8);
    if (created.ok()) {
      Result<slabrc::memory::WeightedHandle<int> > h = created.value()->Allocate(5);
      slab_ok = h.ok() && *h.value() == 5;
    }
  }
  return matches && slab_ok && RestoreSystemBackend();
}

bool TestAllocatorStrictMissingBackendUnsupported() {
  GlobalAllocatorOptions options;
  options.backend = AllocBackend::kMimalloc;
  options.strict_backend = true;
  Status st = GlobalAllocator::Configure(options);
  bool ok = false;
  if (GlobalAllocator::IsBackendEnabled(AllocBackend::kMimalloc)) {
    ok = st.ok() && GlobalAllocator::CurrentBackend() == AllocBackend::kMimalloc;
  } else {
    ok = st.code() == StatusCode::kUnsupported &&
         GlobalAllocator::CurrentBackend() == AllocBackend::kSystem;
  }
  return ok && RestoreSystemBackend();
}

bool TestAllocatorSwitchRefusedWhileSlabAlive() {
  Result<std::unique_ptr<slabrc::memory::Slab<int> > > created =
      slabrc::memory::Slab<int>::WithCapacity(8);
  if (!created.ok()) return false;

  GlobalAllocatorOptions options;
  options.backend = AllocBackend::kTbbScalable;
  options.strict_backend = false;
  Status st = GlobalAllocator::Configure(options);
  if (st.code() != StatusCode::kWouldBlock || !HasSymbol(st, "MEM_BACKEND_IN_USE")) {
    return false;
  }
  if (GlobalAllocator::CurrentBackend() != AllocBackend::kSystem) return false;

  created.value().reset();
  st = GlobalAllocator::Configure(options);
  return st.ok() && RestoreSystemBackend();
}

bool TestAllocatorValidatesAndCounts() {
  const slabrc::memory::AllocatorStats before = GlobalAllocator::CurrentStats();

  Result<void*> misaligned = GlobalAllocator::Allocate(64, 3);
  if (misaligned.ok() || !HasSymbol(misaligned.status(), "MEM_INVALID_ALIGNMENT")) return false;
  Result<void*> empty = GlobalAllocator::Allocate(0, 16);
  if (empty.ok() || empty.status().code() != StatusCode::kInvalidArgument) return false;

  Result<void*> block = GlobalAllocator::Allocate(256, 64);
  if (!block.ok() || block.value() == NULL) return false;
  if (reinterpret_cast<std::uintptr_t>(block.value()) % 64 != 0) return false;
  const slabrc::memory::AllocatorStats during = GlobalAllocator::CurrentStats();
  if (!GlobalAllocator::Deallocate(block.value()).ok()) return false;
  if (!GlobalAllocator::Deallocate(NULL).ok()) return false;
  const slabrc::memory::AllocatorStats after = GlobalAllocator::CurrentStats();

  return during.alloc_fail_count == before.alloc_fail_count + 2 &&
         during.alloc_count == before.alloc_count + 1 &&
         during.bytes_in_use == before.bytes_in_use + 256 &&
         during.bytes_peak >= during.bytes_in_use &&
         after.bytes_in_use == before.bytes_in_use &&
         after.free_count == before.free_count + 1;
}

bool TestConfigureAllocatorFromFile() {
  const std::string path = TempPath("memory_config");
  {
    std::ofstream out(path.c_str());
    if (!out.is_open()) return false;
    out << "{\"memory\": {\"backend\": \"system\"}}\n";
  }
  Status st = GlobalAllocator::ConfigureFromFile(path);
  std::remove(path.c_str());
  if (!st.ok() || GlobalAllocator::CurrentBackend() != AllocBackend::kSystem) return false;
  if (std::string(GlobalAllocator::CurrentBackendName()) != "system") return false;

  st = GlobalAllocator::ConfigureFromFile("/nonexistent/slabrc/memory.json");
  return st.code() == StatusCode::kNotFound &&
         GlobalAllocator::CurrentBackend() == AllocBackend::kSystem;
}

bool TestApiVersionPacking() {
  return slabrc::api::kApiVersion == ((1u << 16) | (2u << 8)) &&
         (slabrc::api::kApiVersion >> 16) == slabrc::api::kApiVersionMajor;
}

bool TestErrorCodeLayout() {
  const std::uint32_t code = slabrc::api::MakeErrorCode(
      slabrc::api::ErrorModule::kSlab, StatusCode::kResourceExhausted, 0x0001);
  if (slabrc::api::FormatErrorCodeHex(code) != "0x40500001") return false;
  const slabrc::api::ErrorCatalogEntry* entry = slabrc::api::FindErrorCatalogEntry(code);
  if (entry == NULL || std::string(entry->symbol) != "SLAB_POOL_EXHAUSTED") return false;

  const Status pool = slabrc::memory::PoolExhaustedStatus(16);
  return pool.hex_code() == code && pool.message().find("16") != std::string::npos &&
         slabrc::memory::IsPoolExhausted(pool) && !slabrc::memory::IsWeightExhausted(pool) &&
         std::string(slabrc::api::ErrorModuleName(slabrc::api::ErrorModule::kSlab)) == "slab" &&
         HasSymbol(Status(StatusCode::kIoError, "x"), "CORE_IO_ERROR");
}

}  // namespace

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"slab_config_parses_all_fields", TestSlabConfigParsesAllFields},
      {"slab_config_defaults", TestSlabConfigDefaults},
      {"slab_config_rejects_bad_fields", TestSlabConfigRejectsBadFields},
      {"policy_names_round_trip", TestPolicyNamesRoundTrip},
      {"create_slab_from_file", TestCreateSlabFromFile},
      {"allocator_rejects_unknown_backend", TestAllocatorRejectsUnknownBackend},
      {"allocator_non_strict_falls_back_to_system", TestAllocatorNonStrictFallsBackToSystem},
      {"allocator_strict_missing_backend_unsupported",
       TestAllocatorStrictMissingBackendUnsupported},
      {"allocator_switch_refused_while_slab_alive", TestAllocatorSwitchRefusedWhileSlabAlive},
      {"allocator_validates_and_counts", TestAllocatorValidatesAndCounts},
      {"configure_allocator_from_file", TestConfigureAllocatorFromFile},
      {"api_version_packing", TestApiVersionPacking},
      {"error_code_layout", TestErrorCodeLayout},
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
