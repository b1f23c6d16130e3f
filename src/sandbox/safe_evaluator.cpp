#include "sandbox/safe_evaluator.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

bool is_denied_segment(std::string_view segment) noexcept {
    return std::find(kDeniedPathSegments.begin(), kDeniedPathSegments.end(), segment)
           != kDeniedPathSegments.end();
}

SafeEvaluator::SafeEvaluator(EvaluationBudget budget, const OperationRegistry& registry)
    : budget_(std::move(budget))
    , evaluator_(registry, budget_.max_depth) {
    evaluator_.set_visit_hook([this](const Expression& node) { return on_visit(node); });
}

EvalResult SafeEvaluator::evaluate(const ExprPtr& expr, const EvaluationContext& context) {
    if (!expr) {
        return make_error(EvalErrorCode::kMalformedExpression, "null expression node");
    }
    return evaluate(*expr, context);
}

EvalResult SafeEvaluator::evaluate(const Expression& expr, const EvaluationContext& context) {
    operation_count_ = 0;

    if (auto err = validate(expr)) {
        spdlog::debug("safe_evaluator: rejected before evaluation code={} msg={}",
                      error_code_to_string(err->code), err->message);
        return std::unexpected(std::move(*err));
    }

    // 스냅샷: 이후 평가는 이 사본만 본다.
    const EvaluationContext snapshot = context;

    started_ = std::chrono::steady_clock::now();
    auto result = evaluator_.evaluate(expr, snapshot);
    if (!result && result.error().code == EvalErrorCode::kRecursionExceeded) {
        return make_error(EvalErrorCode::kBudgetExceeded,
                          fmt::format("Maximum depth ({}) exceeded", budget_.max_depth),
                          result.error().context);
    }
    return result;
}

std::optional<EvalError> SafeEvaluator::validate(const Expression& expr) const {
    std::optional<EvalError> depth_error;
    if (auto err = validate_node(expr, 1, depth_error)) {
        return err;
    }
    return depth_error;
}

// validate_node
//   max_depth 를 넘는 노드 아래로는 내려가지 않는다 (재귀 깊이 상한 max_depth + 1).
//   깊이 초과는 depth_error 에 한 번만 기록하고 형제 노드 검사는 계속한다.
//   보안 위반은 즉시 반환되므로 깊이 초과보다 우선한다.
std::optional<EvalError> SafeEvaluator::validate_node(const Expression&         expr,
                                                      std::size_t               depth,
                                                      std::optional<EvalError>& depth_error) const {
    if (depth > budget_.max_depth) {
        if (!depth_error) {
            depth_error = EvalError{EvalErrorCode::kBudgetExceeded,
                                    fmt::format("Expression depth exceeds maximum ({})", budget_.max_depth),
                                    describe(expr)};
        }
        return std::nullopt;
    }
    return std::visit(
        [&](const auto& node) -> std::optional<EvalError> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, FieldAccessExpr>) {
                for (const auto& part : split_path(node.path)) {
                    if (is_denied_segment(part)) {
                        return EvalError{
                            EvalErrorCode::kSecurityViolation,
                            fmt::format("Field access '{}' is not allowed (contains dangerous property '{}')",
                                        node.path, part),
                            node.path};
                    }
                }
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, OperationExpr>) {
                if (auto err = check_allowed(node.op)) {
                    return err;
                }
                for (const auto& child : node.args) {
                    if (!child) {
                        return EvalError{EvalErrorCode::kMalformedExpression,
                                         "null operation argument", node.op};
                    }
                    if (auto err = validate_node(*child, depth + 1, depth_error)) {
                        return err;
                    }
                }
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, ConditionExpr>) {
                if (auto err = check_allowed(node.op)) {
                    return err;
                }
                for (const auto* side : {&node.left, &node.right}) {
                    if (*side) {
                        if (auto err = validate_node(**side, depth + 1, depth_error)) {
                            return err;
                        }
                    }
                }
                return std::nullopt;
            } else {
                static_assert(std::is_same_v<T, PermissionExpr>, "unhandled expression node");
                return check_allowed(node.check);
            }
        },
        expr.node());
}

std::optional<EvalError> SafeEvaluator::check_allowed(std::string_view name) const {
    if (!budget_.allowed_operations || budget_.allowed_operations->contains(name)) {
        return std::nullopt;
    }
    return EvalError{EvalErrorCode::kSecurityViolation,
                     fmt::format("Operation '{}' is not allowed", name),
                     std::string{name}};
}

std::optional<EvalError> SafeEvaluator::on_visit(const Expression& expr) {
    const auto elapsed = std::chrono::steady_clock::now() - started_;
    if (elapsed > budget_.timeout) {
        return EvalError{EvalErrorCode::kBudgetExceeded,
                         fmt::format("Expression evaluation timeout ({}ms exceeded)", budget_.timeout.count()),
                         describe(expr)};
    }

    ++operation_count_;
    if (operation_count_ > budget_.max_operations) {
        return EvalError{EvalErrorCode::kBudgetExceeded,
                         fmt::format("Maximum operations ({}) exceeded", budget_.max_operations),
                         describe(expr)};
    }
    return std::nullopt;
}
