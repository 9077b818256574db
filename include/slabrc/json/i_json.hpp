#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "slabrc/api/export.hpp"
#include "slabrc/api/status.hpp"

namespace slabrc {
namespace json {

using Json = nlohmann::json;

// Config documents (slab options, allocator policy) are read through here so
// that nlohmann exceptions never leave the library.
class SLABRC_API JsonCodec {
 public:
  // CONFIG_PARSE_FAILED on malformed text.
  static api::Result<Json> Parse(const std::string& text);

  // kNotFound when the file cannot be opened, otherwise as Parse.
  static api::Result<Json> LoadFile(const std::string& path);
};

}  // namespace json
}  // namespace slabrc
