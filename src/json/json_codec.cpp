#include "slabrc/json/i_json.hpp"

#include <fstream>
#include <sstream>

namespace slabrc {
namespace json {

api::Result<Json> JsonCodec::Parse(const std::string& text) {
  try {
    return api::Result<Json>(Json::parse(text));
  } catch (const Json::parse_error& ex) {
    return api::Result<Json>(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, std::string("json parse failed: ") + ex.what(),
        api::ErrorModule::kJson, 0x0001));
  }
}

api::Result<Json> JsonCodec::LoadFile(const std::string& path) {
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return api::Result<Json>(api::Status(api::StatusCode::kNotFound,
                                         "json file not found: " + path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

}  // namespace json
}  // namespace slabrc
