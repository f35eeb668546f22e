#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - spdlog 기본 로거(라이브러리 진단용)와 별개의 인스턴스를 소유한다.
//   전역 레지스트리에 등록하지 않으므로 여러 인스턴스가 공존할 수 있다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

// "debug" | "info" | "warn" | "error" (대소문자 무시). "trace" 는 kDebug,
// "critical" 은 kError 로 취급한다. 그 외는 nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// "json" | "text". 그 외는 nullopt.
[[nodiscard]] std::optional<LogFormat> parse_log_format(std::string_view name);

// JSON 문자열 리터럴 내용으로 이스케이프 (따옴표 미포함)
[[nodiscard]] std::string escape_json_string(std::string_view str);

// ---------------------------------------------------------------------------
// StructuredLogger
//   역공학 이벤트를 한 줄 단위로 기록한다 (stdout + rotating file).
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     LogFormat                    format = LogFormat::kJson);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_entity(const EntityLog& entry);
    void log_action(const ActionLog& entry);
    void log_pair(const PairLog& entry);

    // warn 레벨로 기록
    void log_reject(const RejectLog& entry);

    void log_metrics(const MetricsLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

private:
    class Record;

    void write(LogLevel level, const Record& record);

    LogLevel                        min_level_;
    LogFormat                       format_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
