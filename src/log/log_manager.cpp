#include "slabrc/log/log_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#if defined(_WIN32)
#include <direct.h>
#include <sys/stat.h>
#else
#include <sys/stat.h>
#include <sys/types.h>
#endif

#include <glog/logging.h>

namespace slabrc {
namespace log {
namespace {

const std::uint32_t kDetailInvalidConfig = 0x0001;

std::mutex& GlobalMutex() {
  static std::mutex m;
  return m;
}

LoggingOptions& GlobalOptions() {
  static LoggingOptions opts;
  return opts;
}

// Session directory chosen for the current log_dir; reused across reloads.
std::string& GlobalSessionDir() {
  static std::string dir;
  return dir;
}

std::string& GlobalBaseDir() {
  static std::string dir;
  return dir;
}

std::string& GlobalOutputDir() {
  static std::string dir;
  return dir;
}

std::unique_ptr<google::LogSink>& GlobalSink() {
  static std::unique_ptr<google::LogSink> sink;
  return sink;
}

bool& GlobalInitialized() {
  static bool initialized = false;
  return initialized;
}

bool& GlobalFailureHandlerInstalled() {
  static bool installed = false;
  return installed;
}

api::Status LogStatus(api::StatusCode code, const std::string& message,
                      std::uint32_t detail = 0) {
  return api::Status::FromModule(code, message, api::ErrorModule::kLog, detail);
}

bool IsPathSeparator(char c) { return c == '/' || c == '\\'; }

std::string BaseName(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && IsPathSeparator(path[end - 1])) --end;
  if (end == 0) return std::string();
  const std::size_t pos = path.find_last_of("/\\", end - 1);
  if (pos == std::string::npos) return path.substr(0, end);
  return path.substr(pos + 1, end - pos - 1);
}

std::string JoinPath(const std::string& left, const std::string& right) {
  if (left.empty()) return right;
  if (right.empty()) return left;
  if (IsPathSeparator(left[left.size() - 1])) return left + right;
#if defined(_WIN32)
  return left + "\\" + right;
#else
  return left + "/" + right;
#endif
}

bool DirectoryExists(const std::string& path) {
  if (path.empty()) return false;
#if defined(_WIN32)
  struct _stat info;
  if (_stat(path.c_str(), &info) != 0) return false;
#else
  struct stat info;
  if (stat(path.c_str(), &info) != 0) return false;
#endif
  return (info.st_mode & S_IFDIR) != 0;
}

int MakeDir(const std::string& path) {
#if defined(_WIN32)
  return _mkdir(path.c_str());
#else
  return mkdir(path.c_str(), 0755);
#endif
}

// mkdir -p. Returns false when any component cannot be created.
bool CreateDirectories(const std::string& path) {
  if (path.empty()) return false;
  if (DirectoryExists(path)) return true;

  std::string current = IsPathSeparator(path[0]) ? path.substr(0, 1) : std::string();
  std::size_t pos = current.size();
  while (pos <= path.size()) {
    const std::size_t next = path.find_first_of("/\\", pos);
    const std::string part =
        next == std::string::npos ? path.substr(pos) : path.substr(pos, next - pos);
    if (!part.empty()) {
      current = current.empty() ? part : JoinPath(current, part);
      if (!DirectoryExists(current)) {
        errno = 0;
        if (MakeDir(current) != 0 && errno != EEXIST) return false;
      }
    }
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return DirectoryExists(path);
}

std::string Trim(const std::string& s) {
  const std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  const std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string StripComment(const std::string& value) {
  std::size_t pos = value.find('#');
  const std::size_t slash = value.find("//");
  if (slash != std::string::npos) pos = std::min(pos, slash);
  return pos == std::string::npos ? value : Trim(value.substr(0, pos));
}

bool ParseBool(const std::string& value, bool* out) {
  const std::string v = ToLower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& value, int* out) {
  if (value.empty()) return false;
  char* end = NULL;
  errno = 0;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (errno != 0 || end == NULL || *end != '\0') return false;
  *out = static_cast<int>(parsed);
  return true;
}

bool ParseLevel(const std::string& value, int* out) {
  const std::string v = ToLower(value);
  if (v == "info") {
    *out = google::GLOG_INFO;
  } else if (v == "warning" || v == "warn") {
    *out = google::GLOG_WARNING;
  } else if (v == "error") {
    *out = google::GLOG_ERROR;
  } else if (v == "fatal") {
    *out = google::GLOG_FATAL;
  } else if (!ParseInt(v, out)) {
    return false;
  }
  return *out >= google::GLOG_INFO && *out <= google::GLOG_FATAL;
}

struct BoolKey {
  const char* key;
  bool LoggingOptions::*field;
};

const BoolKey kBoolKeys[] = {
    {"session_subdir", &LoggingOptions::session_subdir},
    {"simple_format", &LoggingOptions::simple_format},
    {"json_format", &LoggingOptions::json_format},
    {"bootstrap_stderr", &LoggingOptions::bootstrap_stderr},
    {"install_failure_signal_handler", &LoggingOptions::install_failure_signal_handler},
    {"crash_stacktrace", &LoggingOptions::install_failure_signal_handler},
    {"glog_file_output", &LoggingOptions::glog_file_output},
    {"logtostderr", &LoggingOptions::logtostderr},
    {"alsologtostderr", &LoggingOptions::alsologtostderr},
    {"colorlogtostderr", &LoggingOptions::colorlogtostderr},
    {"log_prefix", &LoggingOptions::log_prefix},
};

// Returns false when the value for a known key is malformed.
bool ApplyKey(const std::string& key, const std::string& value, LoggingOptions* options) {
  for (std::size_t i = 0; i < sizeof(kBoolKeys) / sizeof(kBoolKeys[0]); ++i) {
    if (key == kBoolKeys[i].key) {
      return ParseBool(value, &(options->*(kBoolKeys[i].field)));
    }
  }
  if (key == "log_dir") {
    options->log_dir = value;
    return true;
  }
  if (key == "minloglevel") return ParseLevel(value, &options->min_log_level);
  if (key == "stderrthreshold") return ParseLevel(value, &options->stderr_threshold);
  if (key == "v" || key == "verbosity") return ParseInt(value, &options->verbosity);
  return true;
}

std::tm LocalTime(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm;
}

std::string FormatNow(bool for_directory) {
  const std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
  const std::tm tm = LocalTime(std::chrono::system_clock::to_time_t(now));
  char buf[64];
  if (for_directory) {
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  } else {
    const long long micros = std::chrono::duration_cast<std::chrono::microseconds>(
                                 now.time_since_epoch()).count() % 1000000LL;
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d %02d:%02d:%02d.%06lld", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
  }
  return std::string(buf);
}

std::string JsonEscape(const std::string& input) {
  std::ostringstream out;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(input[i]);
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(c) << std::dec;
        } else {
          out << static_cast<char>(c);
        }
        break;
    }
  }
  return out.str();
}

// Mirrors glog output into app.log / app.jsonl.
class FormattedSink : public google::LogSink {
 public:
  enum class Mode { kSimple, kJson };

  FormattedSink(const std::string& file_path, Mode mode)
      : stream_(file_path.c_str(), std::ios::app), mode_(mode) {}

  void send(google::LogSeverity severity, const char*, const char*, int, const std::tm*,
            const char* message, size_t message_len) override {
    std::string msg = message == NULL ? std::string() : std::string(message, message_len);
    while (!msg.empty() && (msg[msg.size() - 1] == '\n' || msg[msg.size() - 1] == '\r')) {
      msg.erase(msg.size() - 1);
    }
    const char levels[] = {'I', 'W', 'E', 'F'};
    const char level = levels[std::max(0, std::min(3, static_cast<int>(severity)))];

    std::lock_guard<std::mutex> lock(stream_mu_);
    if (!stream_.is_open()) return;
    if (mode_ == Mode::kSimple) {
      stream_ << FormatNow(false) << " [" << level << "] " << msg << '\n';
    } else {
      stream_ << "{\"ts\":\"" << FormatNow(false) << "\",\"level\":\"" << level
              << "\",\"message\":\"" << JsonEscape(msg) << "\"}\n";
    }
    stream_.flush();
  }

  bool is_open() const { return stream_.is_open(); }

 private:
  std::mutex stream_mu_;
  std::ofstream stream_;
  Mode mode_;
};

void RemoveSink() {
  if (GlobalSink()) {
    google::RemoveLogSink(GlobalSink().get());
    GlobalSink().reset();
  }
}

void ClearDirs() {
  GlobalSessionDir().clear();
  GlobalBaseDir().clear();
  GlobalOutputDir().clear();
}

}  // namespace

api::Result<LoggingOptions> LogManager::ParseConfig(const std::string& text) {
  LoggingOptions options;
  std::istringstream input(text);
  std::string line;
  int lineno = 0;

  while (std::getline(input, line)) {
    ++lineno;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 2, "//") == 0) continue;

    const std::size_t sep = trimmed.find_first_of("=:");
    if (sep == std::string::npos) continue;

    const std::string key = ToLower(Trim(trimmed.substr(0, sep)));
    const std::string value = StripComment(Trim(trimmed.substr(sep + 1)));
    if (!ApplyKey(key, value, &options)) {
      std::ostringstream msg;
      msg << "invalid value for '" << key << "' at line " << lineno;
      return api::Result<LoggingOptions>(
          LogStatus(api::StatusCode::kInvalidArgument, msg.str(), kDetailInvalidConfig));
    }
  }
  return api::Result<LoggingOptions>(options);
}

api::Result<LoggingOptions> LogManager::LoadFromFile(const std::string& path) {
  if (path.empty()) {
    return api::Result<LoggingOptions>(LoggingOptions());
  }
  std::ifstream input(path.c_str());
  if (!input.is_open()) {
    return api::Result<LoggingOptions>(
        LogStatus(api::StatusCode::kNotFound, "logging config not found: " + path));
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return ParseConfig(buffer.str());
}

api::Status LogManager::Init(const std::string& app_name, const std::string& config_path) {
  if (app_name.empty()) {
    return LogStatus(api::StatusCode::kInvalidArgument, "app_name is empty");
  }

  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (GlobalInitialized()) return api::Status::Ok();

  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);
  if (!loaded.ok()) return loaded.status();

  if (loaded.value().bootstrap_stderr) {
    FLAGS_logtostderr = true;
    FLAGS_alsologtostderr = false;
  }
  const std::string program = BaseName(app_name).empty() ? "slabrc" : BaseName(app_name);
  google::InitGoogleLogging(program.c_str());

  api::Status applied = ApplyOptions(loaded.value());
  if (!applied.ok()) {
    RemoveSink();
    ClearDirs();
    google::ShutdownGoogleLogging();
    return applied;
  }

  GlobalInitialized() = true;
  return api::Status::Ok();
}

api::Status LogManager::Reload(const std::string& config_path) {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) {
    return LogStatus(api::StatusCode::kNotInitialized, "LogManager::Init has not been called");
  }
  api::Result<LoggingOptions> loaded = LoadFromFile(config_path);
  if (!loaded.ok()) return loaded.status();
  return ApplyOptions(loaded.value());
}

LoggingOptions LogManager::CurrentOptions() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalOptions();
}

bool LogManager::IsInitialized() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalInitialized();
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalInitialized()) return;
  RemoveSink();
  google::ShutdownGoogleLogging();
  ClearDirs();
  GlobalOptions() = LoggingOptions();
  GlobalInitialized() = false;
}

void LogManager::Log(LogSeverity severity, const std::string& message) {
  const int level = std::max(0, std::min(3, static_cast<int>(severity)));
  google::LogMessage(__FILE__, __LINE__, static_cast<google::LogSeverity>(level)).stream()
      << message;
}

api::Status LogManager::ApplyOptions(const LoggingOptions& options) {
  std::string output_dir;
  if (!options.log_dir.empty()) {
    output_dir = options.log_dir;
    if (options.session_subdir) {
      if (GlobalSessionDir().empty() || GlobalBaseDir() != options.log_dir) {
        output_dir = JoinPath(options.log_dir, FormatNow(true));
      } else {
        output_dir = GlobalSessionDir();
      }
    }
    if (!CreateDirectories(output_dir)) {
      return LogStatus(api::StatusCode::kIoError, "cannot create log directory: " + output_dir);
    }
  }

  // Options are validated; commit them.
  GlobalBaseDir() = options.log_dir;
  GlobalSessionDir() = options.session_subdir ? output_dir : std::string();
  GlobalOutputDir() = output_dir;

  if (options.glog_file_output && !output_dir.empty()) {
    FLAGS_log_dir = output_dir;
    FLAGS_logtostderr = options.logtostderr;
    FLAGS_alsologtostderr = options.alsologtostderr;
  } else {
    // No glog file output: force stderr so glog never falls back to /tmp files.
    FLAGS_log_dir.clear();
    FLAGS_logtostderr = true;
    FLAGS_alsologtostderr = false;
  }
  FLAGS_colorlogtostderr = options.colorlogtostderr;
  FLAGS_log_prefix = options.log_prefix;
  FLAGS_minloglevel = options.min_log_level;
  FLAGS_stderrthreshold = options.stderr_threshold;
  FLAGS_v = options.verbosity;
  if (options.install_failure_signal_handler && !GlobalFailureHandlerInstalled()) {
    google::InstallFailureSignalHandler();
    GlobalFailureHandlerInstalled() = true;
  }

  RemoveSink();
  if (options.simple_format || options.json_format) {
    const std::string base = output_dir.empty() ? "." : output_dir;
    const bool use_json = options.json_format;
    FormattedSink* sink =
        new FormattedSink(JoinPath(base, use_json ? "app.jsonl" : "app.log"),
                          use_json ? FormattedSink::Mode::kJson : FormattedSink::Mode::kSimple);
    GlobalSink().reset(sink);
    if (!sink->is_open()) {
      GlobalSink().reset();
      return LogStatus(api::StatusCode::kIoError, "cannot open log sink file in " + base);
    }
    google::AddLogSink(sink);
    FLAGS_log_prefix = false;
  }

  GlobalOptions() = options;
  return api::Status::Ok();
}

}  // namespace log
}  // namespace slabrc
