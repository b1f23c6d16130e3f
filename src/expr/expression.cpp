// ---------------------------------------------------------------------------
// expression.cpp
//
// 표현식 트리 생성 헬퍼 및 경로 유틸리티.
// ---------------------------------------------------------------------------

#include "expr/expression.hpp"

#include <type_traits>

#include <spdlog/fmt/fmt.h>

std::string_view kind_name(ExprKind kind) noexcept {
    switch (kind) {
        case ExprKind::kLiteral:     return "literal";
        case ExprKind::kFieldAccess: return "field";
        case ExprKind::kOperation:   return "operation";
        case ExprKind::kCondition:   return "condition";
        case ExprKind::kPermission:  return "permission";
    }
    return "unknown";
}

namespace expr {

ExprPtr literal(Value value) {
    return std::make_shared<const Expression>(LiteralExpr{std::move(value)});
}

ExprPtr field(std::string path) {
    return std::make_shared<const Expression>(FieldAccessExpr{std::move(path)});
}

ExprPtr op(std::string name, std::vector<ExprPtr> args) {
    return std::make_shared<const Expression>(OperationExpr{std::move(name), std::move(args)});
}

ExprPtr cond(std::string op, ExprPtr left, ExprPtr right) {
    return std::make_shared<const Expression>(
        ConditionExpr{std::move(op), std::move(left), std::move(right)});
}

ExprPtr permission(std::string check, std::vector<std::string> args) {
    return std::make_shared<const Expression>(PermissionExpr{std::move(check), std::move(args)});
}

}  // namespace expr

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            parts.emplace_back(path.substr(start));
            break;
        }
        parts.emplace_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool is_user_path(std::string_view path) noexcept {
    constexpr std::string_view kUser = "user";
    if (!path.starts_with(kUser)) {
        return false;
    }
    return path.size() == kUser.size() || path[kUser.size()] == '.';
}

std::string describe(const Expression& root) {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return fmt::format("literal({})", node.value.to_json());
            } else if constexpr (std::is_same_v<T, FieldAccessExpr>) {
                return fmt::format("field({})", node.path);
            } else if constexpr (std::is_same_v<T, OperationExpr>) {
                return fmt::format("operation({}, {} args)", node.op, node.args.size());
            } else if constexpr (std::is_same_v<T, ConditionExpr>) {
                return fmt::format("condition({})", node.op);
            } else {
                return fmt::format("permission({}, {} args)", node.check, node.args.size());
            }
        },
        root.node());
}
