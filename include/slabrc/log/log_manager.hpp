#pragma once

#include <string>

#include "slabrc/api/export.hpp"
#include "slabrc/api/status.hpp"
#include "slabrc/log/log_types.hpp"

namespace slabrc {
namespace log {

// Process-wide glog front end. Callers never see glog headers.
class SLABRC_API LogManager {
 public:
  // Initialize glog with an application name and optional config file.
  // Calling again after a successful Init is a no-op returning kOk.
  static api::Status Init(const std::string& app_name, const std::string& config_path = {});

  // Reload configuration at runtime. On failure the active options stay in effect.
  static api::Status Reload(const std::string& config_path);

  static LoggingOptions CurrentOptions();
  static bool IsInitialized();

  // Shutdown glog. Repeated calls are harmless.
  static void Shutdown();

  static void Log(LogSeverity severity, const std::string& message);

  // Parse "key = value" config text. Unknown keys are ignored.
  static api::Result<LoggingOptions> ParseConfig(const std::string& text);

 private:
  static api::Status ApplyOptions(const LoggingOptions& options);
  static api::Result<LoggingOptions> LoadFromFile(const std::string& path);
};

}  // namespace log
}  // namespace slabrc
