#pragma once

// ---------------------------------------------------------------------------
// evaluator.hpp
//
// 표현식 트리 → Value 평가기.
//
// [평가 규칙]
// - Literal    : 값 그대로
// - FieldAccess: context.data 를 경로로 탐색. 첫 세그먼트가 "user" 이면
//                context.user 를 기준으로 한다. 중간 null/누락 → null.
//                "*" 세그먼트는 현재 값이 배열이어야 하며 배열 자체를 반환.
// - Operation  : 인자를 왼쪽→오른쪽으로 모두 평가한 뒤 registry 연산 호출.
// - Condition  : 양쪽을 평가한 뒤 같은 이름의 비교 연산 호출.
//                kComparators 밖의 이름은 kUnknownComparator.
// - Permission : 컨텍스트 연산만 허용. 그 외는 kUnknownPermission.
//
// [재귀 깊이]
// 노드 진입 시 depth 증가, 정상 종료 시 감소. max_depth 초과 시
// kRecursionExceeded. 어떤 오류든 발생하면 depth 를 0 으로 강제 초기화하여
// 같은 인스턴스의 다음 평가가 오염되지 않게 한다.
//
// [스레드 안전성]
// depth 카운터를 가지므로 스레드 안전하지 않다. 호출마다 인스턴스를 만든다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <optional>

#include "common/types.hpp"
#include "expr/expression.hpp"
#include "expr/operation_registry.hpp"

class Evaluator {
public:
    // VisitHook
    //   노드 방문마다 호출된다. 오류를 반환하면 평가가 즉시 중단되고
    //   그 오류가 결과가 된다 (sandbox 예산 검사용).
    using VisitHook = std::function<std::optional<EvalError>(const Expression& node)>;

    static constexpr std::size_t kDefaultMaxDepth = 50;

    explicit Evaluator(const OperationRegistry& registry  = OperationRegistry::defaults(),
                       std::size_t              max_depth = kDefaultMaxDepth);

    ~Evaluator() = default;

    Evaluator(const Evaluator&)            = delete;
    Evaluator& operator=(const Evaluator&) = delete;
    Evaluator(Evaluator&&)                 = default;
    Evaluator& operator=(Evaluator&&)      = default;

    [[nodiscard]] EvalResult evaluate(const Expression& expr, const EvaluationContext& context);

    // null 포인터 → kMalformedExpression
    [[nodiscard]] EvalResult evaluate(const ExprPtr& expr, const EvaluationContext& context);

    void set_visit_hook(VisitHook hook) { hook_ = std::move(hook); }

    [[nodiscard]] std::size_t current_depth() const noexcept { return depth_; }
    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    [[nodiscard]] EvalResult dispatch(const Expression& expr, const EvaluationContext& context);
    [[nodiscard]] EvalResult eval_field(const FieldAccessExpr& node, const EvaluationContext& context);
    [[nodiscard]] EvalResult eval_operation(const OperationExpr& node, const EvaluationContext& context);
    [[nodiscard]] EvalResult eval_condition(const ConditionExpr& node, const EvaluationContext& context);
    [[nodiscard]] EvalResult eval_permission(const PermissionExpr& node, const EvaluationContext& context);

    OperationRegistry registry_;
    std::size_t       max_depth_;
    std::size_t       depth_{0};
    VisitHook         hook_{};
};

// ---------------------------------------------------------------------------
// evaluate_or_null
//   계산 필드처럼 보안 판단이 아닌 용도의 평가 헬퍼.
//   일반 오류는 warn 로그 후 null 로 대체한다.
//   terminal 오류 (kSecurityViolation / kBudgetExceeded) 는 그대로 반환한다.
//   접근 검사 경로에서는 사용하지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] EvalResult evaluate_or_null(Evaluator&               evaluator,
                                          const Expression&        expr,
                                          const EvaluationContext& context);
