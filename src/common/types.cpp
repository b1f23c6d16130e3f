#include "common/types.hpp"

#include <utility>

std::string_view action_to_string(Action action) noexcept {
    switch (action) {
        case Action::kCreate: return "create";
        case Action::kRead:   return "read";
        case Action::kUpdate: return "update";
        case Action::kDelete: return "delete";
    }
    return "unknown";
}

std::optional<Action> action_from_string(std::string_view name) noexcept {
    if (name == "create") { return Action::kCreate; }
    if (name == "read")   { return Action::kRead; }
    if (name == "update") { return Action::kUpdate; }
    if (name == "delete") { return Action::kDelete; }
    return std::nullopt;
}

Value UserInfo::to_value() const {
    Value::Array role_values(roles.begin(), roles.end());

    Value::Object obj;
    obj.emplace("id", Value{id});
    obj.emplace("roles", Value{std::move(role_values)});
    if (permissions.has_value()) {
        obj.emplace("permissions",
                    Value{Value::Array(permissions->begin(), permissions->end())});
    }
    return Value{std::move(obj)};
}

std::string_view error_code_to_string(EvalErrorCode code) noexcept {
    switch (code) {
        case EvalErrorCode::kSecurityViolation:   return "security_violation";
        case EvalErrorCode::kBudgetExceeded:      return "budget_exceeded";
        case EvalErrorCode::kRecursionExceeded:   return "recursion_exceeded";
        case EvalErrorCode::kUnknownOperation:    return "unknown_operation";
        case EvalErrorCode::kUnknownComparator:   return "unknown_comparator";
        case EvalErrorCode::kUnknownPermission:   return "unknown_permission";
        case EvalErrorCode::kMalformedExpression: return "malformed_expression";
        case EvalErrorCode::kWildcardOnNonArray:  return "wildcard_on_non_array";
        case EvalErrorCode::kTypeError:           return "type_error";
        case EvalErrorCode::kDivisionByZero:      return "division_by_zero";
        case EvalErrorCode::kDuplicateOperation:  return "duplicate_operation";
    }
    return "unknown";
}

bool is_terminal(EvalErrorCode code) noexcept {
    return code == EvalErrorCode::kSecurityViolation ||
           code == EvalErrorCode::kBudgetExceeded;
}

std::unexpected<EvalError> make_error(EvalErrorCode code,
                                      std::string   message,
                                      std::string   context) {
    return std::unexpected(EvalError{code, std::move(message), std::move(context)});
}
