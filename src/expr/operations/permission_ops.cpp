// ---------------------------------------------------------------------------
// permission_ops.cpp
//
// 권한 연산: hasRole hasAnyRole hasAllRoles hasPermission isOwner
//            isAuthenticated isAnonymous
//
// 컨텍스트를 받는 유일한 연산 그룹이다 (ContextOperation).
// Operation 노드와 Permission 노드 양쪽에서 호출될 수 있으며, Permission
// 노드의 문자열 인자는 string Value 로 전달된다.
//
// [fail-close]
// 인자 타입이 맞지 않으면 오류 대신 false 를 돌려준다. 결과는 항상 bool
// 이며 권한을 부여하는 방향의 기본값은 없다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <string>
#include <vector>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

bool has_role(const UserInfo& user, const std::string& role) {
    return std::find(user.roles.begin(), user.roles.end(), role) != user.roles.end();
}

// 역할 목록 인자. 배열 하나 (Operation 형태) 또는 문자열 나열 (Permission 형태).
std::vector<std::string> role_list(std::span<const Value> args) {
    std::span<const Value> items = args;
    if (args.size() == 1 && args[0].is_array()) {
        items = std::span<const Value>(args[0].as_array());
    }
    std::vector<std::string> roles;
    for (const auto& v : items) {
        if (v.is_string()) {
            roles.push_back(v.as_string());
        }
    }
    return roles;
}

}  // namespace

void register_permission_operations(OperationMap& ops) {
    define_contextual(ops, "hasRole",
        [](std::span<const Value> args, const EvaluationContext& ctx) -> EvalResult {
            const Value& role = arg(args, 0);
            return Value{role.is_string() && has_role(ctx.user, role.as_string())};
        });

    // hasAnyRole: 빈 목록 → false
    define_contextual(ops, "hasAnyRole",
        [](std::span<const Value> args, const EvaluationContext& ctx) -> EvalResult {
            const auto roles = role_list(args);
            return Value{std::any_of(roles.begin(), roles.end(),
                                     [&](const std::string& r) { return has_role(ctx.user, r); })};
        });

    // hasAllRoles: 빈 목록 → false (조건 없는 허용 방지)
    define_contextual(ops, "hasAllRoles",
        [](std::span<const Value> args, const EvaluationContext& ctx) -> EvalResult {
            const auto roles = role_list(args);
            return Value{!roles.empty() &&
                         std::all_of(roles.begin(), roles.end(),
                                     [&](const std::string& r) { return has_role(ctx.user, r); })};
        });

    define_contextual(ops, "hasPermission",
        [](std::span<const Value> args, const EvaluationContext& ctx) -> EvalResult {
            const Value& perm = arg(args, 0);
            if (!perm.is_string() || !ctx.user.permissions) {
                return Value{false};
            }
            const auto& granted = *ctx.user.permissions;
            return Value{std::find(granted.begin(), granted.end(), perm.as_string()) != granted.end()};
        });

    // isOwner(path): data.<path> == user.id. 익명 사용자는 항상 false.
    define_contextual(ops, "isOwner",
        [](std::span<const Value> args, const EvaluationContext& ctx) -> EvalResult {
            const Value& path = arg(args, 0);
            if (!path.is_string() || path.as_string().empty() || ctx.user.id.empty()) {
                return Value{false};
            }
            const Value owner = resolve_path(ctx.data, path.as_string());
            return Value{owner.is_string() && owner.as_string() == ctx.user.id};
        });

    define_contextual(ops, "isAuthenticated",
        [](std::span<const Value>, const EvaluationContext& ctx) -> EvalResult {
            return Value{!ctx.user.id.empty()};
        });

    define_contextual(ops, "isAnonymous",
        [](std::span<const Value>, const EvaluationContext& ctx) -> EvalResult {
            return Value{ctx.user.id.empty()};
        });
}
