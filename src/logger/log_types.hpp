#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 레코드 정의.
//
// [순환 의존성 방지 설계]
// - policy/ 헤더를 include 하지 않는다. 판정 결과는 호출자가 문자열/bool
//   로 풀어서 채운다 (logger → policy 역방향 의존 금지).
//
// [민감정보 취급 주의]
// - 레코드 본문(data) 은 기록하지 않는다. row_filter 에는 user.id 등이
//   값으로 들어갈 수 있으므로 운영 환경의 로그 접근 권한을 별도로 관리할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   감사 로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error". 그 외 문자열은 kInfo.
[[nodiscard]] LogLevel log_level_from_string(const std::string& name) noexcept;

// ---------------------------------------------------------------------------
// AccessLog
//   접근 판정 1건 (허용/차단 모두).
//   row_filter_json: 허용 시 적용된 행 필터 JSON, 차단 시 빈 문자열.
// ---------------------------------------------------------------------------
struct AccessLog {
    std::string                           user_id{};
    std::vector<std::string>              roles{};
    std::string                           resource{};
    std::string                           action{};
    bool                                  allowed{false};
    std::string                           matched_rule{};
    std::string                           row_filter_json{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};  // 판정 소요 시간
};

// ---------------------------------------------------------------------------
// DenyLog
//   차단 이벤트.
//   matched_rule: 규칙 식별자 ("Track:read") 또는 "default-deny"
//   reason: 사람이 읽을 수 있는 차단 사유 (클라이언트에 직접 노출 금지)
//   error_code: 평가 오류로 차단된 경우 오류 코드 문자열, 아니면 빈 문자열
// ---------------------------------------------------------------------------
struct DenyLog {
    std::string                           user_id{};
    std::string                           resource{};
    std::string                           action{};
    std::string                           matched_rule{};
    std::string                           reason{};
    std::string                           error_code{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// SecurityLog
//   sandbox 가 보고한 보안 위반 / 예산 초과.
//   정책 작성 오류가 아니라 공격 또는 폭주 징후일 수 있으므로 별도 기록한다.
// ---------------------------------------------------------------------------
struct SecurityLog {
    std::string                           user_id{};
    std::string                           resource{};
    std::string                           action{};
    std::string                           error_code{};  // "security_violation" | "budget_exceeded"
    std::string                           message{};
    std::string                           location{};    // 오류가 발생한 경로/연산
    std::chrono::system_clock::time_point timestamp{};
};
