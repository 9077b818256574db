#include "slabrc/memory/i_global_allocator.hpp"

#include <memory>
#include <mutex>
#include <string>

#include "memory/allocator_backends.hpp"

namespace slabrc {
namespace memory {

#define SLABRC_STATUS(code, message, detail) \
  api::Status::FromModule((code), (message), api::ErrorModule::kMemory, (detail))
namespace {

const std::uint32_t kDetailBackendInUse = 0x0001;
const std::uint32_t kDetailInvalidField = 0x0002;

std::mutex& ConfigureMu() {
  static std::mutex mu;
  return mu;
}

// Guarded by ConfigureMu().
std::shared_ptr<IAllocator>& AllocatorState() {
  static std::shared_ptr<IAllocator> state(new SystemAllocator());
  return state;
}

GlobalAllocatorOptions& GlobalOptions() {
  static GlobalAllocatorOptions opts;
  return opts;
}

api::Result<std::shared_ptr<IAllocator> > CreateAllocator(AllocBackend backend) {
  switch (backend) {
    case AllocBackend::kSystem:
      return api::Result<std::shared_ptr<IAllocator> >(
          std::shared_ptr<IAllocator>(new SystemAllocator()));
#if defined(SLABRC_ENABLE_MIMALLOC_BACKEND)
    case AllocBackend::kMimalloc:
      return api::Result<std::shared_ptr<IAllocator> >(
          std::shared_ptr<IAllocator>(new MimallocAllocator()));
#endif
#if defined(SLABRC_ENABLE_TBBMALLOC_BACKEND)
    case AllocBackend::kTbbScalable:
      return api::Result<std::shared_ptr<IAllocator> >(
          std::shared_ptr<IAllocator>(new TbbAllocator()));
#endif
    default:
      return api::Result<std::shared_ptr<IAllocator> >(SLABRC_STATUS(
          api::StatusCode::kUnsupported, "Requested backend is not enabled in this build", 0));
  }
}

api::Status ParseBackend(const std::string& value, AllocBackend* out) {
  if (value == "system") {
    *out = AllocBackend::kSystem;
    return api::Status::Ok();
  }
  if (value == "tbb" || value == "tbb_scalable" || value == "tbbscalable") {
    *out = AllocBackend::kTbbScalable;
    return api::Status::Ok();
  }
  if (value == "mimalloc" || value == "mi") {
    *out = AllocBackend::kMimalloc;
    return api::Status::Ok();
  }
  return SLABRC_STATUS(api::StatusCode::kInvalidArgument, "memory.backend is invalid: " + value,
                       kDetailInvalidField);
}

}  // namespace

api::Status GlobalAllocator::Configure(const GlobalAllocatorOptions& options) {
  std::lock_guard<std::mutex> lock(ConfigureMu());

  GlobalAllocatorOptions normalized = options;
  if (normalized.backend == GlobalOptions().backend) {
    GlobalOptions() = normalized;
    return api::Status::Ok();
  }

  // Blocks already handed out must be freed by the backend that made them.
  if (AllocatorState()->Stats().bytes_in_use != 0) {
    return SLABRC_STATUS(api::StatusCode::kWouldBlock,
                         "cannot switch allocator backend while memory is still in use",
                         kDetailBackendInUse);
  }

  api::Result<std::shared_ptr<IAllocator> > created = CreateAllocator(normalized.backend);
  if (!created.ok()) {
    if (normalized.strict_backend) {
      return created.status();
    }
    created = CreateAllocator(AllocBackend::kSystem);
    if (!created.ok()) {
      return created.status();
    }
    normalized.backend = AllocBackend::kSystem;
  }

  AllocatorState() = created.value();
  GlobalOptions() = normalized;
  return api::Status::Ok();
}

api::Status GlobalAllocator::ConfigureFromFile(const std::string& config_path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(config_path);
  if (!loaded.ok()) {
    return loaded.status();
  }
  return ConfigureFromJson(loaded.value());
}

api::Status GlobalAllocator::ConfigureFromJson(const json::Json& root) {
  if (!root.is_object()) {
    return SLABRC_STATUS(api::StatusCode::kInvalidArgument, "root JSON must be object",
                         kDetailInvalidField);
  }

  GlobalAllocatorOptions options;
  {
    std::lock_guard<std::mutex> lock(ConfigureMu());
    options = GlobalOptions();
  }

  const json::Json* memory = &root;
  if (root.contains("memory")) {
    memory = &root["memory"];
    if (!memory->is_object()) {
      return SLABRC_STATUS(api::StatusCode::kInvalidArgument, "memory must be JSON object",
                           kDetailInvalidField);
    }
  }

  if (memory->contains("backend")) {
    if (!(*memory)["backend"].is_string()) {
      return SLABRC_STATUS(api::StatusCode::kInvalidArgument, "memory.backend must be string",
                           kDetailInvalidField);
    }
    api::Status st = ParseBackend((*memory)["backend"].get<std::string>(), &options.backend);
    if (!st.ok()) {
      return st;
    }
  }

  if (memory->contains("strict_backend")) {
    if (!(*memory)["strict_backend"].is_boolean()) {
      return SLABRC_STATUS(api::StatusCode::kInvalidArgument,
                           "memory.strict_backend must be boolean", kDetailInvalidField);
    }
    options.strict_backend = (*memory)["strict_backend"].get<bool>();
  }

  return Configure(options);
}

api::Result<void*> GlobalAllocator::Allocate(std::size_t size, std::size_t alignment) {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return AllocatorState()->Allocate(size, alignment);
}

api::Status GlobalAllocator::Deallocate(void* ptr) {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return AllocatorState()->Deallocate(ptr);
}

AllocBackend GlobalAllocator::CurrentBackend() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return GlobalOptions().backend;
}

const char* GlobalAllocator::BackendDisplayName(AllocBackend backend) {
  switch (backend) {
    case AllocBackend::kSystem:
      return "system";
    case AllocBackend::kMimalloc:
      return "mimalloc";
    case AllocBackend::kTbbScalable:
      return "tbb";
    default:
      return "unknown";
  }
}

bool GlobalAllocator::IsBackendEnabled(AllocBackend backend) {
  switch (backend) {
    case AllocBackend::kSystem:
      return true;
#if defined(SLABRC_ENABLE_MIMALLOC_BACKEND)
    case AllocBackend::kMimalloc:
      return true;
#endif
#if defined(SLABRC_ENABLE_TBBMALLOC_BACKEND)
    case AllocBackend::kTbbScalable:
      return true;
#endif
    default:
      return false;
  }
}

const char* GlobalAllocator::CurrentBackendName() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return AllocatorState()->BackendName();
}

AllocatorStats GlobalAllocator::CurrentStats() {
  std::lock_guard<std::mutex> lock(ConfigureMu());
  return AllocatorState()->Stats();
}

#undef SLABRC_STATUS

}  // namespace memory
}  // namespace slabrc
