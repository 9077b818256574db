#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "slabrc/api/export.hpp"

namespace slabrc {
namespace api {

// Status family; packed into the S nibble of a hex code.
enum class StatusCode {
  kOk = 0,
  kInvalidArgument = 1,
  kNotInitialized = 2,
  kNotFound = 3,
  kWouldBlock = 4,
  kResourceExhausted = 5,
  kIoError = 6,
  kInternalError = 7,
  kUnsupported = 8,
};

enum class ErrorModule : std::uint8_t {
  kCore = 0x00,
  kLog = 0x10,
  kMemory = 0x30,
  kSlab = 0x40,
  kJson = 0x60,
};

struct ErrorCatalogEntry {
  std::uint32_t hex_code;
  const char* symbol;
  const char* description;
};

// 0xMMSDDDDD: module (8 bits), status family (4 bits), detail id (20 bits).
SLABRC_API std::uint32_t MakeErrorCode(ErrorModule module, StatusCode status_code,
                                       std::uint32_t detail_id = 0);
SLABRC_API const char* ErrorModuleName(ErrorModule module);
SLABRC_API const ErrorCatalogEntry* FindErrorCatalogEntry(std::uint32_t hex_code);
SLABRC_API std::string FormatErrorCodeHex(std::uint32_t hex_code);

class Status {
 public:
  Status() : code_(StatusCode::kOk), hex_code_(0) {}
  Status(StatusCode code, std::string message, ErrorModule module = ErrorModule::kCore,
         std::uint32_t detail_id = 0)
      : code_(code),
        message_(std::move(message)),
        hex_code_(MakeErrorCode(module, code, detail_id)) {}

  static Status Ok() { return Status(); }
  static Status FromModule(StatusCode code, std::string message, ErrorModule module,
                           std::uint32_t detail_id = 0) {
    return Status(code, std::move(message), module, detail_id);
  }

  bool ok() const { return code_ == StatusCode::kOk; }
  StatusCode code() const { return code_; }
  const std::string& message() const { return message_; }
  std::uint32_t hex_code() const { return hex_code_; }
  std::string hex_code_string() const { return FormatErrorCodeHex(hex_code_); }

  // "SLAB_POOL_EXHAUSTED", ...; "UNKNOWN" when the code is not catalogued.
  SLABRC_API const char* symbol() const;

 private:
  StatusCode code_;
  std::string message_;
  std::uint32_t hex_code_;
};

// Either a value or the Status explaining its absence. T may be move-only
// (handles, unique_ptr); take it with std::move(result.value()).
template <typename T>
class Result {
 public:
  Result(const Status& status) : status_(status), value_() {}
  Result(const T& value) : value_(value) {}
  Result(T&& value) : value_(std::move(value)) {}

  bool ok() const { return status_.ok(); }
  const Status& status() const { return status_; }
  const T& value() const { return value_; }
  T& value() { return value_; }

 private:
  Status status_;
  T value_;
};

}  // namespace api
}  // namespace slabrc
