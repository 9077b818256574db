#include "slabrc/memory/slab_errors.hpp"

#include <sstream>

namespace slabrc {
namespace memory {

api::Status SlabStatus(api::StatusCode code, SlabErrorDetail detail,
                       const std::string& message) {
  return api::Status::FromModule(code, message, api::ErrorModule::kSlab, detail);
}

api::Status PoolExhaustedStatus(std::size_t capacity) {
  std::ostringstream msg;
  msg << "all " << capacity << " slots are occupied";
  return SlabStatus(api::StatusCode::kResourceExhausted, kSlabPoolExhausted, msg.str());
}

api::Status WeightExhaustedStatus(const std::string& reason) {
  return SlabStatus(api::StatusCode::kResourceExhausted, kSlabWeightExhausted, reason);
}

bool IsPoolExhausted(const api::Status& status) {
  return status.hex_code() == api::MakeErrorCode(api::ErrorModule::kSlab,
                                                 api::StatusCode::kResourceExhausted,
                                                 kSlabPoolExhausted);
}

bool IsWeightExhausted(const api::Status& status) {
  return status.hex_code() == api::MakeErrorCode(api::ErrorModule::kSlab,
                                                 api::StatusCode::kResourceExhausted,
                                                 kSlabWeightExhausted);
}

}  // namespace memory
}  // namespace slabrc
