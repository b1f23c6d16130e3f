#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/value.hpp"

// ---------------------------------------------------------------------------
// Action
//   정책이 바인딩되는 리소스 액션.
// ---------------------------------------------------------------------------
enum class Action : std::uint8_t {
    kCreate = 0,
    kRead   = 1,
    kUpdate = 2,
    kDelete = 3,
};

[[nodiscard]] std::string_view action_to_string(Action action) noexcept;

// 대소문자 구분. "create" | "read" | "update" | "delete" 외에는 std::nullopt.
[[nodiscard]] std::optional<Action> action_from_string(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// UserInfo
//   인증 레이어(외부)가 채워주는 행위자 정보. 이 코어는 인증을 수행하지 않는다.
//   id 가 빈 문자열이면 익명 사용자로 취급한다 (isAnonymous).
//   permissions 가 없으면 hasPermission 은 항상 false.
// ---------------------------------------------------------------------------
struct UserInfo {
    std::string                             id{};
    std::vector<std::string>                roles{};
    std::optional<std::vector<std::string>> permissions{};

    // to_value
    //   {id, roles, permissions} object 로 변환한다.
    //   "user." 로 시작하는 필드 경로는 이 값을 기준으로 해석된다.
    [[nodiscard]] Value to_value() const;
};

// ---------------------------------------------------------------------------
// EvaluationContext
//   한 번의 평가에 사용되는 읽기 전용 컨텍스트.
//   data: 후보 레코드, params/globals: 호출자 제공 부가 값.
//   연산 함수는 항상 const-ref 로만 전달받는다.
// ---------------------------------------------------------------------------
struct EvaluationContext {
    Value    data{Value::Object{}};
    UserInfo user{};
    Value    params{Value::Object{}};
    Value    globals{Value::Object{}};
};

// ---------------------------------------------------------------------------
// EvalErrorCode
//   평가 단계 오류 분류.
//
//   [terminal]
//   kSecurityViolation / kBudgetExceeded 는 공격 또는 폭주 징후이므로
//   어떤 호출자도 기본값으로 대체해서는 안 된다 (반드시 전파).
//
//   [plain]
//   나머지는 잘못 작성된 정책을 의미한다. 접근 검사 경로에서는 차단,
//   계산 필드 용도에서는 로깅 후 null 대체 가능.
// ---------------------------------------------------------------------------
enum class EvalErrorCode : std::uint8_t {
    kSecurityViolation    = 0,  // 금지 속성 접근, allow-list 밖 연산
    kBudgetExceeded       = 1,  // depth / 연산 수 / 시간 예산 초과
    kRecursionExceeded    = 2,  // Evaluator 재귀 깊이 초과 (sandbox 밖)
    kUnknownOperation     = 3,
    kUnknownComparator    = 4,
    kUnknownPermission    = 5,
    kMalformedExpression  = 6,  // null 자식 노드, 빈 경로 등
    kWildcardOnNonArray   = 7,
    kTypeError            = 8,
    kDivisionByZero       = 9,
    kDuplicateOperation   = 10, // custom 연산이 built-in 이름과 충돌
};

[[nodiscard]] std::string_view error_code_to_string(EvalErrorCode code) noexcept;

// is_terminal
//   kSecurityViolation / kBudgetExceeded 이면 true.
[[nodiscard]] bool is_terminal(EvalErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// EvalError
//   평가 실패 시 반환되는 오류 정보.
//   std::expected<T, EvalError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct EvalError {
    EvalErrorCode code{EvalErrorCode::kMalformedExpression};
    std::string   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string   context{};  // 오류가 발생한 연산 이름/경로 (로깅용)
};

using EvalResult = std::expected<Value, EvalError>;

// make_error
//   std::unexpected(EvalError{...}) 생성 헬퍼.
[[nodiscard]] std::unexpected<EvalError> make_error(EvalErrorCode code,
                                                    std::string   message,
                                                    std::string   context = {});
