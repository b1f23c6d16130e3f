#include "expr/operations/operations.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

#include "expr/expression.hpp"

namespace ops_detail {

void define_pure(OperationMap& ops, std::string name, OperationCategory category, PureOperation fn) {
    ops.try_emplace(std::move(name), OperationDef{std::move(fn), category});
}

void define_contextual(OperationMap& ops, std::string name, ContextOperation fn) {
    ops.try_emplace(std::move(name), OperationDef{std::move(fn), OperationCategory::kPermission});
}

const Value& arg(std::span<const Value> args, std::size_t index) {
    static const Value kNull{};
    return index < args.size() ? args[index] : kNull;
}

std::optional<EvalError> require_arity(std::string_view       op,
                                       std::span<const Value> args,
                                       std::size_t            min,
                                       std::size_t            max) {
    if (args.size() < min || args.size() > max) {
        return EvalError{
            EvalErrorCode::kTypeError,
            fmt::format("{}: expected {}..{} arguments, got {}", op, min, max, args.size()),
            std::string{op}};
    }
    return std::nullopt;
}

std::expected<double, EvalError>
number_arg(std::string_view op, std::span<const Value> args, std::size_t index) {
    const Value& v = arg(args, index);
    if (!v.is_number()) {
        return make_error(EvalErrorCode::kTypeError,
                          fmt::format("{}: argument {} must be a number, got {}",
                                      op, index, type_name(v.type())),
                          std::string{op});
    }
    return v.as_number();
}

std::expected<std::string, EvalError>
string_arg(std::string_view op, std::span<const Value> args, std::size_t index) {
    const Value& v = arg(args, index);
    if (!v.is_string()) {
        return make_error(EvalErrorCode::kTypeError,
                          fmt::format("{}: argument {} must be a string, got {}",
                                      op, index, type_name(v.type())),
                          std::string{op});
    }
    return v.as_string();
}

Value element_field(const Value& item, const std::string& field) {
    if (field.empty() || !item.is_object()) {
        return item;
    }
    const Value* member = item.get(field);
    return member != nullptr ? *member : Value{};
}

Value resolve_path(const Value& root, std::string_view path) {
    const Value* current = &root;
    for (const auto& part : split_path(path)) {
        const Value* next = current->get(part);
        if (next == nullptr || next->is_null()) {
            return Value{};
        }
        current = next;
    }
    return *current;
}

}  // namespace ops_detail
