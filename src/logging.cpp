#include <treetags/logging.h>

#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace treetags {
namespace {

constexpr std::array<std::string_view, 4> kLevelNames = {"error", "warn",
                                                         "info", "debug"};

// UTC with milliseconds; lines from several workers land within the same
// second.
std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  std::tm tm;
  gmtime_r(&time, &tm);
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
         << std::setw(3) << std::setfill('0') << millis << 'Z';
  return stream.str();
}

void WriteQuoted(std::ostream &stream, std::string_view value) {
  stream << '"';
  for (const auto character : value) {
    if (character == '"' || character == '\\') {
      stream << '\\';
    }
    stream << character;
  }
  stream << '"';
}

void WriteFields(std::ostream &stream, const LogFields &fields) {
  stream << '{';
  const char *separator = "";
  for (const auto &[key, value] : fields) {
    stream << separator;
    WriteQuoted(stream, key);
    stream << ": ";
    WriteQuoted(stream, value);
    separator = ", ";
  }
  stream << '}';
}

} // namespace

std::string LevelName(LogLevel level) {
  const auto index = static_cast<std::size_t>(level);
  if (index >= kLevelNames.size()) {
    return "unknown";
  }
  return std::string(kLevelNames[index]);
}

LogLevel ParseLogLevel(const std::string &value) {
  std::string normalized;
  for (const auto character : value) {
    if (std::isspace(static_cast<unsigned char>(character)) == 0) {
      normalized.push_back(static_cast<char>(
          std::tolower(static_cast<unsigned char>(character))));
    }
  }
  if (normalized == "warning") {
    return LogLevel::kWarn;
  }
  for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
    if (kLevelNames[i] == normalized) {
      return static_cast<LogLevel>(i);
    }
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

StructuredLogger::StructuredLogger(std::ostream &stream, LoggingConfig config)
    : stream_(&stream), config_(config) {}

void StructuredLogger::Log(LogLevel level, std::string_view message,
                           LogFields fields) {
  if (!IsEnabled(level) || stream_ == nullptr) {
    return;
  }

  std::ostringstream line;
  line << '[' << Timestamp() << "] level=" << LevelName(level) << " message=";
  WriteQuoted(line, message);
  line << " fields=";
  WriteFields(line, fields);
  line << '\n';

  std::lock_guard<std::mutex> lock(mutex_);
  (*stream_) << line.str();
  stream_->flush();
}

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger) {
  return logger ? std::move(logger)
                : std::shared_ptr<Logger>(std::make_shared<NullLogger>());
}

std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream) {
  return std::make_shared<StructuredLogger>(stream, config);
}

} // namespace treetags
