// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 로거 구현.
//
// 각 이벤트는 Record (키 순서 보존) 로 만든 뒤 포맷에 따라
// JSON 한 줄 또는 "event key=value ..." 한 줄로 출력한다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "construct/text_scan.hpp"

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return "debug";
        case LogLevel::kInfo:  return "info";
        case LogLevel::kWarn:  return "warn";
        case LogLevel::kError: return "error";
    }
    return "info";
}

std::string json_quoted(std::string_view s) {
    return "\"" + escape_json_string(s) + "\"";
}

std::string string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += json_quoted(items[i]);
    }
    out += ']';
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger::Record
//   (key, JSON 값, 텍스트 값) 목록. 삽입 순서대로 출력한다.
// ---------------------------------------------------------------------------
class StructuredLogger::Record {
public:
    explicit Record(std::string_view event) {
        add("event", event);
    }

    Record& add(std::string_view key, std::string_view value) {
        fields_.push_back({std::string(key), json_quoted(value), std::string(value)});
        return *this;
    }

    Record& add(std::string_view key, const std::string& value) {
        return add(key, std::string_view{value});
    }

    Record& add(std::string_view key, const char* value) {
        return add(key, std::string_view{value});
    }

    Record& add(std::string_view key, bool value) {
        const char* s = value ? "true" : "false";
        fields_.push_back({std::string(key), s, s});
        return *this;
    }

    Record& add(std::string_view key, double value) {
        auto s = fmt::format("{}", value);
        fields_.push_back({std::string(key), s, s});
        return *this;
    }

    Record& add(std::string_view key, std::uint64_t value) {
        auto s = fmt::format("{}", value);
        fields_.push_back({std::string(key), s, s});
        return *this;
    }

    Record& add(std::string_view key, const std::optional<std::string>& value) {
        if (!value) {
            fields_.push_back({std::string(key), "null", "-"});
            return *this;
        }
        return add(key, std::string_view{*value});
    }

    Record& add(std::string_view key, const std::vector<std::string>& values) {
        std::string text;
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                text += ',';
            }
            text += values[i];
        }
        fields_.push_back({std::string(key), string_array(values), std::move(text)});
        return *this;
    }

    // 이미 직렬화된 JSON 값
    Record& add_raw(std::string_view key, std::string json, std::string text) {
        fields_.push_back({std::string(key), std::move(json), std::move(text)});
        return *this;
    }

    [[nodiscard]] std::string render(LogFormat format) const {
        std::ostringstream out;
        if (format == LogFormat::kJson) {
            out << '{';
            for (std::size_t i = 0; i < fields_.size(); ++i) {
                if (i > 0) {
                    out << ',';
                }
                out << '"' << fields_[i].key << "\":" << fields_[i].json;
            }
            out << '}';
            return out.str();
        }
        // kText: 첫 필드(event)는 값만
        for (std::size_t i = 0; i < fields_.size(); ++i) {
            if (i == 0) {
                out << fields_[i].text;
                continue;
            }
            out << ' ' << fields_[i].key << '=' << fields_[i].text;
        }
        return out.str();
    }

private:
    struct Field {
        std::string key;
        std::string json;
        std::string text;
    };

    std::vector<Field> fields_;
};

// ---------------------------------------------------------------------------
// 자유 함수
// ---------------------------------------------------------------------------
std::optional<LogLevel> parse_log_level(std::string_view name) {
    const std::string lowered = text_scan::to_lower(name);
    if (lowered == "trace" || lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error" || lowered == "critical") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

std::optional<LogFormat> parse_log_format(std::string_view name) {
    const std::string lowered = text_scan::to_lower(name);
    if (lowered == "json") {
        return LogFormat::kJson;
    }
    if (lowered == "text") {
        return LogFormat::kText;
    }
    return std::nullopt;
}

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const char c : str) {
        const auto ch = static_cast<unsigned char>(c);
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   LogFormat                    format)
    : min_level_(min_level)
    , format_(format)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>("schemarev", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // JSON 은 레코드 자체에 timestamp 가 있으므로 메시지만 출력
        if (format_ == LogFormat::kJson) {
            logger_->set_pattern("%v");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }
        logger_->flush_on(spdlog::level::trace);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("structured_logger: initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("structured_logger: cannot create log directory: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::write(LogLevel level, const Record& record) {
    if (!logger_ || static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    logger_->log(to_spdlog_level(level), record.render(format_));
}

// ---------------------------------------------------------------------------
// 이벤트 기록
// ---------------------------------------------------------------------------
void StructuredLogger::log_entity(const EntityLog& entry) {
    Record r("entity_reversed");
    r.add("schema", entry.schema)
     .add("table_name", entry.table_name)
     .add("column_count", static_cast<std::uint64_t>(entry.column_count))
     .add("baseline", entry.baseline)
     .add("final_confidence", entry.final_confidence)
     .add("accepted", entry.accepted)
     .add("classification", entry.classification)
     .add("timestamp", format_iso8601(entry.timestamp));
    write(LogLevel::kInfo, r);
}

void StructuredLogger::log_action(const ActionLog& entry) {
    Record r("action_reversed");
    r.add("schema", entry.schema)
     .add("function_name", entry.function_name)
     .add("kind", entry.kind)
     .add("parsers", entry.parsers)
     .add("baseline", entry.baseline)
     .add("delta", entry.delta)
     .add("final_confidence", entry.final_confidence)
     .add("accepted", entry.accepted)
     .add("used_fallback", entry.used_fallback)
     .add("timestamp", format_iso8601(entry.timestamp));
    write(LogLevel::kInfo, r);
}

void StructuredLogger::log_pair(const PairLog& entry) {
    Record r("pair_detected");
    r.add("vocabulary_table", entry.vocabulary_table)
     .add("instance_table", entry.instance_table)
     .add("base_entity_name", entry.base_entity_name)
     .add("translation_table", entry.translation_table)
     .add("timestamp", format_iso8601(entry.timestamp));
    write(LogLevel::kInfo, r);
}

void StructuredLogger::log_reject(const RejectLog& entry) {
    Record r("statement_rejected");
    r.add("source", entry.source)
     .add("statement_index", static_cast<std::uint64_t>(entry.statement_index))
     .add("code", entry.code)
     .add("message", entry.message)
     .add("context", entry.context)
     .add("timestamp", format_iso8601(entry.timestamp));
    write(LogLevel::kWarn, r);
}

void StructuredLogger::log_metrics(const MetricsLog& entry) {
    std::string json = "[";
    std::string text;
    for (std::size_t i = 0; i < entry.parsers.size(); ++i) {
        const auto& p = entry.parsers[i];
        if (i > 0) {
            json += ',';
            text += ',';
        }
        json += fmt::format(R"({{"parser_id":{},"attempts":{},"successes":{},"failures":{}}})",
                            json_quoted(p.parser_id), p.attempts, p.successes, p.failures);
        text += fmt::format("{}:{}/{}", p.parser_id, p.successes, p.attempts);
    }
    json += ']';

    Record r("parser_metrics");
    r.add_raw("parsers", std::move(json), std::move(text))
     .add("timestamp", format_iso8601(entry.timestamp));
    write(LogLevel::kInfo, r);
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    Record r("diagnostic");
    r.add("level", level_name(LogLevel::kDebug))
     .add("message", msg)
     .add("timestamp", format_iso8601(std::chrono::system_clock::now()));
    write(LogLevel::kDebug, r);
}

void StructuredLogger::info(std::string_view msg) {
    Record r("diagnostic");
    r.add("level", level_name(LogLevel::kInfo))
     .add("message", msg)
     .add("timestamp", format_iso8601(std::chrono::system_clock::now()));
    write(LogLevel::kInfo, r);
}

void StructuredLogger::warn(std::string_view msg) {
    Record r("diagnostic");
    r.add("level", level_name(LogLevel::kWarn))
     .add("message", msg)
     .add("timestamp", format_iso8601(std::chrono::system_clock::now()));
    write(LogLevel::kWarn, r);
}

void StructuredLogger::error(std::string_view msg) {
    Record r("diagnostic");
    r.add("level", level_name(LogLevel::kError))
     .add("message", msg)
     .add("timestamp", format_iso8601(std::chrono::system_clock::now()));
    write(LogLevel::kError, r);
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
