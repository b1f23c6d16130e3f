#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   PolicyEngine 은 std::shared_ptr<StructuredLogger> 를 받는다 (nullptr 허용).
// - 고빈도 로그 경로(log_access)에서 불필요한 문자열 복사를 줄이기 위해
//   const-ref 파라미터를 사용한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// 한 줄에 이벤트 하나 (JSON Lines).
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   AccessLog / DenyLog / SecurityLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   to_stdout : true 이면 stdout 에도 기록한다
    //
    //   sink 생성 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path,
                              bool                         to_stdout = true);

    ~StructuredLogger();

    // 복사/이동 금지 (spdlog registry 에 등록된 이름 소유)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_access
    //   접근 판정 결과를 JSON 으로 기록한다.
    //   [고빈도 호출 경로] 불필요한 문자열 복사를 최소화할 것.
    void log_access(const AccessLog& entry);

    // log_deny
    //   차단 이벤트를 JSON 으로 기록한다.
    void log_deny(const DenyLog& entry);

    // log_security
    //   sandbox 보안 위반 / 예산 초과를 JSON 으로 기록한다 (error 레벨).
    void log_security(const SecurityLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   클라이언트 데이터(레코드 본문 등)를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // flush
    //   버퍼링된 로그를 즉시 기록한다 (CLI 종료 직전 등).
    void flush();

    [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::string                     name_;
    std::shared_ptr<spdlog::logger> logger_;
};
