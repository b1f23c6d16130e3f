#include "expr/evaluator.hpp"

#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

Evaluator::Evaluator(const OperationRegistry& registry, std::size_t max_depth)
    : registry_(registry)
    , max_depth_(max_depth) {}

EvalResult Evaluator::evaluate(const ExprPtr& expr, const EvaluationContext& context) {
    if (!expr) {
        depth_ = 0;
        return make_error(EvalErrorCode::kMalformedExpression, "null expression node");
    }
    return evaluate(*expr, context);
}

EvalResult Evaluator::evaluate(const Expression& expr, const EvaluationContext& context) {
    ++depth_;
    if (depth_ > max_depth_) {
        depth_ = 0;
        return make_error(EvalErrorCode::kRecursionExceeded,
                          fmt::format("Maximum recursion depth ({}) exceeded", max_depth_),
                          std::string{kind_name(expr.kind())});
    }

    if (hook_) {
        if (auto err = hook_(expr)) {
            depth_ = 0;
            return std::unexpected(std::move(*err));
        }
    }

    auto result = dispatch(expr, context);
    if (!result) {
        depth_ = 0;
        return result;
    }
    --depth_;
    return result;
}

EvalResult Evaluator::dispatch(const Expression& expr, const EvaluationContext& context) {
    return std::visit(
        [&](const auto& node) -> EvalResult {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return node.value;
            } else if constexpr (std::is_same_v<T, FieldAccessExpr>) {
                return eval_field(node, context);
            } else if constexpr (std::is_same_v<T, OperationExpr>) {
                return eval_operation(node, context);
            } else if constexpr (std::is_same_v<T, ConditionExpr>) {
                return eval_condition(node, context);
            } else {
                static_assert(std::is_same_v<T, PermissionExpr>, "unhandled expression node");
                return eval_permission(node, context);
            }
        },
        expr.node());
}

EvalResult Evaluator::eval_field(const FieldAccessExpr& node, const EvaluationContext& context) {
    if (node.path.empty()) {
        return make_error(EvalErrorCode::kMalformedExpression, "empty field path");
    }

    auto parts = split_path(node.path);
    Value current;
    std::size_t first = 0;
    if (is_user_path(node.path)) {
        current = context.user.to_value();
        first   = 1;  // "user" 세그먼트 자체는 소비
    } else {
        current = context.data;
    }

    for (std::size_t i = first; i < parts.size(); ++i) {
        if (current.is_null()) {
            return Value{};
        }
        if (parts[i] == kWildcardSegment) {
            if (!current.is_array()) {
                return make_error(EvalErrorCode::kWildcardOnNonArray,
                                  "Cannot use wildcard '*' on non-array value",
                                  node.path);
            }
            return current;
        }
        const Value* next = current.get(parts[i]);
        current = next != nullptr ? *next : Value{};
    }
    return current;
}

EvalResult Evaluator::eval_operation(const OperationExpr& node, const EvaluationContext& context) {
    const OperationDef* def = registry_.find(node.op);
    if (def == nullptr) {
        return make_error(EvalErrorCode::kUnknownOperation, "Unknown operation: " + node.op, node.op);
    }

    std::vector<Value> args;
    args.reserve(node.args.size());
    for (const auto& child : node.args) {
        auto value = evaluate(child, context);
        if (!value) {
            return value;
        }
        args.push_back(std::move(*value));
    }
    return def->invoke(args, context);
}

EvalResult Evaluator::eval_condition(const ConditionExpr& node, const EvaluationContext& context) {
    const OperationDef* comparator = is_comparator(node.op) ? registry_.find(node.op) : nullptr;
    if (comparator == nullptr) {
        return make_error(EvalErrorCode::kUnknownComparator,
                          "Unknown condition operator: " + node.op, node.op);
    }

    auto left = evaluate(node.left, context);
    if (!left) {
        return left;
    }

    // exists 는 오른쪽 피연산자를 생략할 수 있다.
    Value right;
    if (node.right || node.op != "exists") {
        auto r = evaluate(node.right, context);
        if (!r) {
            return r;
        }
        right = std::move(*r);
    }

    const std::vector<Value> args{std::move(*left), std::move(right)};
    auto result = comparator->invoke(args, context);
    if (!result) {
        return result;
    }
    return Value{result->truthy()};
}

EvalResult Evaluator::eval_permission(const PermissionExpr& node, const EvaluationContext& context) {
    const OperationDef* checker = registry_.find(node.check);
    if (checker == nullptr || !checker->needs_context()) {
        return make_error(EvalErrorCode::kUnknownPermission,
                          "Unknown permission check: " + node.check, node.check);
    }

    std::vector<Value> args;
    args.reserve(node.args.size());
    for (const auto& a : node.args) {
        args.emplace_back(a);
    }
    auto result = checker->invoke(args, context);
    if (!result) {
        return result;
    }
    return Value{result->truthy()};
}

EvalResult evaluate_or_null(Evaluator&               evaluator,
                            const Expression&        expr,
                            const EvaluationContext& context) {
    auto result = evaluator.evaluate(expr, context);
    if (result || is_terminal(result.error().code)) {
        return result;
    }
    spdlog::warn("evaluator: expression failed, substituting null code={} msg={} expr={}",
                 error_code_to_string(result.error().code),
                 result.error().message,
                 describe(expr));
    return Value{};
}
