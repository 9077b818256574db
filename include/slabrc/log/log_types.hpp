#pragma once

#include <string>

namespace slabrc {
namespace log {

enum class LogSeverity { kInfo = 0, kWarning = 1, kError = 2, kFatal = 3 };

// Normalized logging options parsed from a config file and applied to glog flags.
struct LoggingOptions {
  std::string log_dir;
  bool session_subdir = true;  // create <log_dir>/<timestamp>/ for this run
  bool simple_format = false;  // custom sink: "<ts> [I] message" into app.log
  bool json_format = false;    // custom sink: JSON lines into app.jsonl
  // Bootstrap to stderr before full options are applied.
  bool bootstrap_stderr = true;
  // Installs glog failure signal handler once per process.
  bool install_failure_signal_handler = true;
  // When false, glog per-severity files are disabled; only custom sink files are written.
  bool glog_file_output = false;
  bool logtostderr = false;
  bool alsologtostderr = false;
  bool colorlogtostderr = true;
  bool log_prefix = true;
  int min_log_level = 0;     // INFO=0, WARNING=1, ERROR=2, FATAL=3
  int stderr_threshold = 2;  // glog treats this as ERROR by default
  int verbosity = 0;         // VLOG level
};

}  // namespace log
}  // namespace slabrc
