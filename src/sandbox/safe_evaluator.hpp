#pragma once

// ---------------------------------------------------------------------------
// safe_evaluator.hpp
//
// 신뢰할 수 없는 정책 표현식을 위한 평가 래퍼.
//
// [평가 단계]
// 1. 정적 검증 (실행 전)
//    - FieldAccess 경로의 모든 세그먼트를 denylist 와 대조 → kSecurityViolation
//    - allow-list 설정 시 그 밖의 연산/비교자/권한 이름  → kSecurityViolation
//    - 트리 높이 > max_depth                            → kBudgetExceeded
//      (max_depth + 1 단계에서 탐색을 멈추므로 매우 깊은 트리도 스택을 넘지 않는다)
// 2. 컨텍스트 스냅샷
//    - 호출자 컨텍스트를 sandbox 소유 사본으로 복제한다. Value 는 불변
//      구조이므로 사본도 변경될 수 없다.
// 3. 예산 감시
//    - Evaluator 방문 hook 으로 노드마다 연산 카운터 증가 및
//      steady_clock 경과 시간 검사 → kBudgetExceeded
//    - 내부 evaluator 의 kRecursionExceeded 도 kBudgetExceeded 로 보고한다.
//
// [결과 계약]
// 결과는 (a) 보호 없는 평가와 같은 값, (b) kSecurityViolation /
// kBudgetExceeded 중 하나, (c) 보호 없는 평가도 냈을 일반 오류 중
// 하나다. 부분 결과는 없다.
//
// [스레드 안전성]
// 카운터를 가지므로 스레드 안전하지 않다. 평가 호출마다 생성한다.
// hook 이 this 를 캡처하므로 복사/이동 금지.
// ---------------------------------------------------------------------------

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

#include "common/types.hpp"
#include "expr/evaluator.hpp"
#include "expr/expression.hpp"
#include "expr/operation_registry.hpp"
#include "sandbox/evaluation_budget.hpp"

// 필드 경로에 나타나면 안 되는 세그먼트.
inline constexpr std::array<std::string_view, 13> kDeniedPathSegments = {
    "__proto__", "constructor", "prototype",
    "process",   "global",      "globalThis",
    "require",   "module",      "exports",
    "eval",      "Function",    "__dirname",
    "__filename",
};

[[nodiscard]] bool is_denied_segment(std::string_view segment) noexcept;

class SafeEvaluator {
public:
    explicit SafeEvaluator(EvaluationBudget         budget   = {},
                           const OperationRegistry& registry = OperationRegistry::defaults());

    ~SafeEvaluator() = default;

    SafeEvaluator(const SafeEvaluator&)            = delete;
    SafeEvaluator& operator=(const SafeEvaluator&) = delete;
    SafeEvaluator(SafeEvaluator&&)                 = delete;
    SafeEvaluator& operator=(SafeEvaluator&&)      = delete;

    // evaluate
    //   정적 검증 → 스냅샷 → 예산 감시 평가. 호출마다 카운터를 초기화한다.
    [[nodiscard]] EvalResult evaluate(const Expression& expr, const EvaluationContext& context);
    [[nodiscard]] EvalResult evaluate(const ExprPtr& expr, const EvaluationContext& context);

    // validate
    //   정적 검증만 수행한다. 문제없으면 std::nullopt.
    //   정책 로드 시점 사전 검증에도 사용한다.
    [[nodiscard]] std::optional<EvalError> validate(const Expression& expr) const;

    [[nodiscard]] std::size_t             operations_used() const noexcept { return operation_count_; }
    [[nodiscard]] const EvaluationBudget& budget() const noexcept { return budget_; }

private:
    [[nodiscard]] std::optional<EvalError> validate_node(const Expression&         expr,
                                                         std::size_t               depth,
                                                         std::optional<EvalError>& depth_error) const;
    [[nodiscard]] std::optional<EvalError> check_allowed(std::string_view name) const;
    [[nodiscard]] std::optional<EvalError> on_visit(const Expression& expr);

    EvaluationBudget                      budget_;
    Evaluator                             evaluator_;
    std::size_t                           operation_count_{0};
    std::chrono::steady_clock::time_point started_{};
};
