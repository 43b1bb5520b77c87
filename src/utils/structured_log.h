/**
 * @file structured_log.h
 * @brief Structured logging on top of spdlog
 *
 * Every operational event errdedup emits goes through StructuredLog so that
 * log lines are machine-parseable (JSON) or grep-friendly (key=value text).
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace errdedup::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("cache_eviction")
 *   .Field("key", key)
 *   .Field("count", entry.count)
 *   .Debug();
 * @endcode
 *
 * The output format is process-wide:
 * @code
 * StructuredLog::SetFormat(LogFormat::TEXT);
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Parse "json" / "text" (anything else maps to JSON)
   */
  static LogFormat ParseFormat(const std::string& format_str) {
    if (format_str == "text") {
      return LogFormat::TEXT;
    }
    return LogFormat::JSON;
  }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, int value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    return AddRaw(key, oss.str());
  }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }

  /**
   * @brief Render without logging (used by tests)
   */
  [[nodiscard]] std::string Build() const {
    if (format_.load(std::memory_order_relaxed) == LogFormat::TEXT) {
      return BuildText();
    }
    return BuildJSON();
  }

 private:
  struct LogField {
    std::string key;
    std::string value;
    bool is_string;  ///< Quote in JSON output
  };

  std::string event_;
  std::string message_;
  std::vector<LogField> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.push_back(LogField{key, std::move(value), true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, std::string value) {
    fields_.push_back(LogField{key, std::move(value), false});
    return *this;
  }

  std::string BuildJSON() const {
    std::ostringstream json;
    json << "{";
    const char* sep = "";
    if (!event_.empty()) {
      json << R"("event":")" << EscapeJSON(event_) << '"';
      sep = ",";
    }
    if (!message_.empty()) {
      json << sep << R"("message":")" << EscapeJSON(message_) << '"';
      sep = ",";
    }
    for (const auto& field : fields_) {
      json << sep << '"' << EscapeJSON(field.key) << "\":";
      if (field.is_string) {
        json << '"' << EscapeJSON(field.value) << '"';
      } else {
        json << field.value;
      }
      sep = ",";
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    const char* sep = "";
    if (!event_.empty()) {
      text << "event=" << EscapeText(event_);
      sep = " ";
    }
    if (!message_.empty()) {
      text << sep << "message=\"" << EscapeText(message_) << "\"";
      sep = " ";
    }
    for (const auto& field : fields_) {
      text << sep << field.key << "=";
      if (field.is_string && NeedsQuoting(field.value)) {
        text << '"' << EscapeText(field.value) << '"';
      } else {
        text << field.value;
      }
      sep = " ";
    }
    return text.str();
  }

  static bool NeedsQuoting(const std::string& value) {
    return value.empty() || value.find_first_of(" \"\n=") != std::string::npos;
  }

  static std::string EscapeText(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped += '\\';
          escaped += chr;
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          escaped += chr;
      }
    }
    return escaped;
  }

  static std::string EscapeJSON(const std::string& str) {
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr) << std::dec;
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log a failure raised by a user-supplied observer callback
 */
inline void LogCallbackError(const std::string& callback, const std::string& key, const std::string& error_msg) {
  StructuredLog()
      .Event("dedup_callback_error")
      .Message("observer callback threw; decision unchanged")
      .Field("callback", callback)
      .Field("key", key)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a rejected input line or document
 */
inline void LogSignalParseError(const std::string& source, uint64_t line, const std::string& error_msg) {
  // Keep log lines bounded when upstream sends huge payloads
  constexpr size_t kMaxErrorLogLength = 200;

  StructuredLog()
      .Event("signal_parse_error")
      .Message("signal rejected")
      .Field("source", source)
      .Field("line", line)
      .Field("error", error_msg.substr(0, kMaxErrorLogLength))
      .Warn();
}

}  // namespace errdedup::utils
