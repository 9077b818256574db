#include "slabrc/api/status.hpp"

#include <cstdio>

namespace slabrc {
namespace api {

namespace {

#define SLABRC_CATALOG(module, status, detail, symbol, text) \
  { (static_cast<std::uint32_t>(ErrorModule::module) << 24) | \
        (static_cast<std::uint32_t>(StatusCode::status) << 20) | (detail), \
    symbol, text }

const ErrorCatalogEntry kErrorCatalog[] = {
    SLABRC_CATALOG(kCore, kOk, 0, "CORE_OK", "Operation succeeded"),
    SLABRC_CATALOG(kCore, kInvalidArgument, 0, "CORE_INVALID_ARGUMENT", "Invalid argument"),
    SLABRC_CATALOG(kCore, kNotInitialized, 0, "CORE_NOT_INITIALIZED", "Not initialized"),
    SLABRC_CATALOG(kCore, kNotFound, 0, "CORE_NOT_FOUND", "Resource not found"),
    SLABRC_CATALOG(kCore, kWouldBlock, 0, "CORE_WOULD_BLOCK", "Operation would block"),
    SLABRC_CATALOG(kCore, kResourceExhausted, 0, "CORE_RESOURCE_EXHAUSTED",
                   "Resource exhausted"),
    SLABRC_CATALOG(kCore, kIoError, 0, "CORE_IO_ERROR", "I/O error"),
    SLABRC_CATALOG(kCore, kInternalError, 0, "CORE_INTERNAL_ERROR", "Internal error"),
    SLABRC_CATALOG(kCore, kUnsupported, 0, "CORE_UNSUPPORTED", "Not supported by this build"),

    // slab
    SLABRC_CATALOG(kSlab, kResourceExhausted, 0x0001, "SLAB_POOL_EXHAUSTED",
                   "No empty slot left in the slab"),
    SLABRC_CATALOG(kSlab, kResourceExhausted, 0x0002, "SLAB_WEIGHT_EXHAUSTED",
                   "Handle has no weight left to split"),
    SLABRC_CATALOG(kSlab, kInvalidArgument, 0x0003, "SLAB_EMPTY_HANDLE",
                   "Operation on an empty handle"),
    SLABRC_CATALOG(kSlab, kInvalidArgument, 0x0004, "SLAB_ZERO_CAPACITY",
                   "Slab capacity must be > 0"),
    SLABRC_CATALOG(kSlab, kInternalError, 0x0005, "SLAB_VALUE_CONSTRUCTION_FAILED",
                   "Value construction threw inside a slot"),
    SLABRC_CATALOG(kSlab, kInternalError, 0x0006, "SLAB_STORAGE_ALLOCATION_FAILED",
                   "Slot array allocation failed"),

    // memory
    SLABRC_CATALOG(kMemory, kInvalidArgument, 0x0001, "MEM_INVALID_ALIGNMENT",
                   "Invalid memory alignment"),
    SLABRC_CATALOG(kMemory, kInvalidArgument, 0x0002, "MEM_INVALID_CONFIG",
                   "Invalid allocator configuration"),
    SLABRC_CATALOG(kMemory, kWouldBlock, 0x0001, "MEM_BACKEND_IN_USE",
                   "Allocator backend still has live allocations"),

    // json config, logging
    SLABRC_CATALOG(kJson, kInvalidArgument, 0x0001, "CONFIG_PARSE_FAILED", "JSON parse failed"),
    SLABRC_CATALOG(kJson, kInvalidArgument, 0x0002, "CONFIG_INVALID_FIELD",
                   "Config field has a wrong type or value"),
    SLABRC_CATALOG(kLog, kInvalidArgument, 0x0001, "LOG_INVALID_CONFIG",
                   "Logging config could not be parsed"),
};

#undef SLABRC_CATALOG

}  // namespace

std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code, std::uint32_t detail_id) {
  return (static_cast<std::uint32_t>(module) << 24) |
         ((static_cast<std::uint32_t>(status_code) & 0x0Fu) << 20) | (detail_id & 0x000FFFFFu);
}

const char* ErrorModuleName(ErrorModule module) {
  switch (module) {
    case ErrorModule::kCore:
      return "core";
    case ErrorModule::kLog:
      return "log";
    case ErrorModule::kMemory:
      return "memory";
    case ErrorModule::kSlab:
      return "slab";
    case ErrorModule::kJson:
      return "json";
  }
  return "unknown";
}

const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code) {
  const std::size_t count = sizeof(kErrorCatalog) / sizeof(kErrorCatalog[0]);
  for (std::size_t i = 0; i < count; ++i) {
    if (kErrorCatalog[i].hex_code == hex_code) return &kErrorCatalog[i];
  }
  return NULL;
}

std::string FormatErrorCodeHex(std::uint32_t hex_code) {
  char buf[11];
  std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned int>(hex_code));
  return std::string(buf);
}

const char* Status::symbol() const {
  const ErrorCatalogEntry* entry = FindErrorCatalogEntry(hex_code_);
  return entry == NULL ? "UNKNOWN" : entry->symbol;
}

}  // namespace api
}  // namespace slabrc
