#include "slabrc/memory/slab_options.hpp"

#include <limits>

namespace slabrc {
namespace memory {

#define SLABRC_CONFIG_STATUS(message) \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message), \
                          api::ErrorModule::kJson, 0x0002)

api::Status SlabConfig::ParsePolicy(const std::string& value, ExhaustionPolicy* out) {
  if (value == "mint") {
    *out = ExhaustionPolicy::kMint;
    return api::Status::Ok();
  }
  if (value == "reject") {
    *out = ExhaustionPolicy::kReject;
    return api::Status::Ok();
  }
  return SLABRC_CONFIG_STATUS("slab.exhaustion_policy must be \"mint\" or \"reject\": " + value);
}

const char* SlabConfig::PolicyName(ExhaustionPolicy policy) {
  switch (policy) {
    case ExhaustionPolicy::kMint:
      return "mint";
    case ExhaustionPolicy::kReject:
      return "reject";
    default:
      return "unknown";
  }
}

api::Result<SlabOptions> SlabConfig::FromJson(const json::Json& root) {
  if (!root.is_object()) {
    return api::Result<SlabOptions>(SLABRC_CONFIG_STATUS("root JSON must be object"));
  }

  const json::Json* slab = &root;
  if (root.contains("slab")) {
    slab = &root["slab"];
    if (!slab->is_object()) {
      return api::Result<SlabOptions>(SLABRC_CONFIG_STATUS("slab must be JSON object"));
    }
  }

  SlabOptions options;
  if (slab->contains("capacity")) {
    const json::Json& capacity = (*slab)["capacity"];
    if (!capacity.is_number_unsigned() || capacity.get<std::uint64_t>() == 0) {
      return api::Result<SlabOptions>(
          SLABRC_CONFIG_STATUS("slab.capacity must be a positive integer"));
    }
    if (capacity.get<std::uint64_t>() > std::numeric_limits<std::size_t>::max()) {
      return api::Result<SlabOptions>(SLABRC_CONFIG_STATUS("slab.capacity is too large"));
    }
    options.capacity = static_cast<std::size_t>(capacity.get<std::uint64_t>());
  }

  if (slab->contains("exhaustion_policy")) {
    if (!(*slab)["exhaustion_policy"].is_string()) {
      return api::Result<SlabOptions>(
          SLABRC_CONFIG_STATUS("slab.exhaustion_policy must be string"));
    }
    api::Status st = ParsePolicy((*slab)["exhaustion_policy"].get<std::string>(),
                                 &options.exhaustion_policy);
    if (!st.ok()) {
      return api::Result<SlabOptions>(st);
    }
  }

  if (slab->contains("log_exhaustion")) {
    if (!(*slab)["log_exhaustion"].is_boolean()) {
      return api::Result<SlabOptions>(
          SLABRC_CONFIG_STATUS("slab.log_exhaustion must be boolean"));
    }
    options.log_exhaustion = (*slab)["log_exhaustion"].get<bool>();
  }

  return api::Result<SlabOptions>(options);
}

api::Result<SlabOptions> SlabConfig::Parse(const std::string& text) {
  api::Result<json::Json> parsed = json::JsonCodec::Parse(text);
  if (!parsed.ok()) {
    return api::Result<SlabOptions>(parsed.status());
  }
  return FromJson(parsed.value());
}

api::Result<SlabOptions> SlabConfig::LoadFile(const std::string& path) {
  api::Result<json::Json> loaded = json::JsonCodec::LoadFile(path);
  if (!loaded.ok()) {
    return api::Result<SlabOptions>(loaded.status());
  }
  return FromJson(loaded.value());
}

#undef SLABRC_CONFIG_STATUS

}  // namespace memory
}  // namespace slabrc
