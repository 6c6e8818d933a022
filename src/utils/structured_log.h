/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON or key=value logs
 *
 * Helpers for logging storage and transfer events in a machine-parseable
 * form. Every chunk event carries the offset and the region size.
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

namespace stashd::utils {

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
 *   .Event("transfer_chunk_failed")
 *   .Field("direction", "restore")
 *   .Field("offset", offset)
 *   .Field("total", total)
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global log format (JSON or TEXT)
   */
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Parse "json" / "text" (anything else means JSON)
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

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    return AddRaw(key, oss.str());
  }

  StructuredLog& Field(const std::string& key, bool value) {
    std::string val_str = value ? "true" : "false";
    fields_.push_back(MakeJSONField(key, val_str, false));
    fields_text_.push_back(key + "=" + val_str);
    return *this;
  }

  /**
   * @brief Add message field (human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

 private:
  std::string event_;
  std::string message_;
  std::vector<std::string> fields_;       // JSON format fields
  std::vector<std::string> fields_text_;  // Text format fields
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};

  StructuredLog& AddString(const std::string& key, const std::string& value) {
    fields_.push_back(MakeJSONField(key, Escape(value)));
    fields_text_.push_back(MakeTextField(key, value));
    return *this;
  }

  // Numbers are quoted in JSON so log shippers never lose u64 precision
  StructuredLog& AddRaw(const std::string& key, const std::string& value) {
    fields_.push_back(MakeJSONField(key, value, true));
    fields_text_.push_back(key + "=" + value);
    return *this;
  }

  std::string Build() const {
    if (format_.load(std::memory_order_relaxed) == LogFormat::TEXT) {
      return BuildText();
    }
    return BuildJSON();
  }

  std::string BuildJSON() const {
    std::ostringstream json;
    json << "{";
    bool first = true;
    if (!event_.empty()) {
      json << R"("event":")" << Escape(event_) << R"(")";
      first = false;
    }
    if (!message_.empty()) {
      if (!first) {
        json << ",";
      }
      json << R"("message":")" << Escape(message_) << R"(")";
      first = false;
    }
    for (const auto& field : fields_) {
      if (!first) {
        json << ",";
      }
      json << field;
      first = false;
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    bool first = true;
    if (!event_.empty()) {
      text << "event=" << EscapeText(event_);
      first = false;
    }
    if (!message_.empty()) {
      if (!first) {
        text << " ";
      }
      text << "message=\"" << EscapeText(message_) << "\"";
      first = false;
    }
    for (const auto& field : fields_text_) {
      if (!first) {
        text << " ";
      }
      text << field;
      first = false;
    }
    return text.str();
  }

  static std::string MakeJSONField(const std::string& key, const std::string& value, bool quoted = true) {
    std::ostringstream oss;
    oss << "\"" << key << "\":";
    if (quoted) {
      oss << "\"" << value << "\"";
    } else {
      oss << value;
    }
    return oss.str();
  }

  static std::string MakeTextField(const std::string& key, const std::string& value) {
    if (value.find_first_of(" \"\n") != std::string::npos) {
      return key + "=\"" + EscapeText(value) + "\"";
    }
    return key + "=" + value;
  }

  static std::string EscapeText(const std::string& str) {
    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped << '\\' << chr;
          break;
        case '\n':
          escaped << "\\n";
          break;
        case '\r':
          escaped << "\\r";
          break;
        case '\t':
          escaped << "\\t";
          break;
        default:
          escaped << chr;
      }
    }
    return escaped.str();
  }

  static std::string Escape(const std::string& str) {
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
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
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
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& target, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("target", target)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage info in structured format
 */
inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a chunk that failed for good (retries exhausted or fatal error)
 */
inline void LogTransferChunkFailure(const std::string& direction, uint64_t offset, uint64_t total,
                                    const std::string& error_msg) {
  StructuredLog()
      .Event("transfer_chunk_failed")
      .Field("direction", direction)
      .Field("offset", offset)
      .Field("total", total)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a finished transfer
 */
inline void LogTransferComplete(const std::string& direction, uint64_t total_bytes, uint64_t chunks,
                                double elapsed_ms) {
  StructuredLog()
      .Event("transfer_complete")
      .Field("direction", direction)
      .Field("bytes", total_bytes)
      .Field("chunks", chunks)
      .Field("elapsed_ms", elapsed_ms)
      .Info();
}

}  // namespace stashd::utils
