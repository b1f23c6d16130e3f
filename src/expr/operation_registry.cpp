// ---------------------------------------------------------------------------
// operation_registry.cpp
//
// built-in registry 생성 및 custom 병합.
// ---------------------------------------------------------------------------

#include "expr/operation_registry.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "expr/operations/operations.hpp"

EvalResult OperationDef::invoke(std::span<const Value>   args,
                                const EvaluationContext& context) const {
    if (const auto* ctx_fn = std::get_if<ContextOperation>(&fn)) {
        if (!*ctx_fn) {
            return make_error(EvalErrorCode::kMalformedExpression, "empty operation function");
        }
        return (*ctx_fn)(args, context);
    }
    const auto& pure_fn = std::get<PureOperation>(fn);
    if (!pure_fn) {
        return make_error(EvalErrorCode::kMalformedExpression, "empty operation function");
    }
    return pure_fn(args);
}

bool is_comparator(std::string_view name) noexcept {
    return std::find(kComparators.begin(), kComparators.end(), name) != kComparators.end();
}

const OperationRegistry& OperationRegistry::defaults() {
    // 함수 지역 static: 스레드 안전한 1회 초기화 (C++11 magic static).
    static const OperationRegistry registry = [] {
        OperationMap ops;
        register_math_operations(ops);
        register_string_operations(ops);
        register_date_operations(ops);
        register_logic_operations(ops);
        register_comparison_operations(ops);
        register_array_operations(ops);
        register_permission_operations(ops);
        spdlog::debug("operation_registry: {} built-in operations registered", ops.size());
        return OperationRegistry{std::make_shared<const OperationMap>(std::move(ops))};
    }();
    return registry;
}

std::expected<OperationRegistry, EvalError>
OperationRegistry::with_custom(const OperationMap& custom) const {
    OperationMap merged = ops_ ? *ops_ : OperationMap{};
    for (const auto& [name, def] : custom) {
        if (merged.contains(name)) {
            spdlog::warn("operation_registry: custom operation '{}' collides with an existing operation", name);
            return make_error(EvalErrorCode::kDuplicateOperation,
                              "custom operation collides with existing operation: " + name,
                              name);
        }
        OperationDef copy = def;
        copy.category = OperationCategory::kCustom;
        merged.emplace(name, std::move(copy));
    }
    return OperationRegistry{std::make_shared<const OperationMap>(std::move(merged))};
}

const OperationDef* OperationRegistry::find(std::string_view name) const {
    if (!ops_) {
        return nullptr;
    }
    const auto it = ops_->find(name);
    return it == ops_->end() ? nullptr : &it->second;
}

std::vector<std::string> OperationRegistry::names() const {
    std::vector<std::string> result;
    if (!ops_) {
        return result;
    }
    result.reserve(ops_->size());
    for (const auto& [name, def] : *ops_) {
        result.push_back(name);
    }
    return result;
}
