// ---------------------------------------------------------------------------
// logic_ops.cpp
//
// 논리 연산: and or not if coalesce exists isNull isEmpty
//
// [평가 순서]
// 인자는 evaluator 가 모두 미리 평가한다 (단락 평가 없음). and/or 는
// truthy() 규칙으로 결과를 bool 로 접는다. if 는 선택된 분기 값을 그대로
// 돌려준다.
//
// exists 는 Condition 비교자로도 쓰이므로 두 번째 인자를 허용하고 무시한다.
// ---------------------------------------------------------------------------

#include <algorithm>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

void register_logic_operations(OperationMap& ops) {
    constexpr auto kLogic = OperationCategory::kLogic;

    // and(): 인자 없음 → true
    define_pure(ops, "and", kLogic, [](std::span<const Value> args) -> EvalResult {
        return Value{std::all_of(args.begin(), args.end(),
                                 [](const Value& v) { return v.truthy(); })};
    });

    // or(): 인자 없음 → false
    define_pure(ops, "or", kLogic, [](std::span<const Value> args) -> EvalResult {
        return Value{std::any_of(args.begin(), args.end(),
                                 [](const Value& v) { return v.truthy(); })};
    });

    define_pure(ops, "not", kLogic, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("not", args, 1, 1)) {
            return std::unexpected(*err);
        }
        return Value{!args[0].truthy()};
    });

    // if(cond, then, else?): else 생략 시 null
    define_pure(ops, "if", kLogic, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("if", args, 2, 3)) {
            return std::unexpected(*err);
        }
        return args[0].truthy() ? args[1] : arg(args, 2);
    });

    define_pure(ops, "coalesce", kLogic, [](std::span<const Value> args) -> EvalResult {
        for (const auto& v : args) {
            if (!v.is_null()) {
                return v;
            }
        }
        return Value{};
    });

    define_pure(ops, "exists", kLogic, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("exists", args, 1, 2)) {
            return std::unexpected(*err);
        }
        return Value{!args[0].is_null()};
    });

    define_pure(ops, "isNull", kLogic, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("isNull", args, 1, 1)) {
            return std::unexpected(*err);
        }
        return Value{args[0].is_null()};
    });

    // isEmpty: null, "", [], {} → true
    define_pure(ops, "isEmpty", kLogic, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("isEmpty", args, 1, 1)) {
            return std::unexpected(*err);
        }
        const Value& v = args[0];
        switch (v.type()) {
            case ValueType::kNull:   return Value{true};
            case ValueType::kString: return Value{v.as_string().empty()};
            case ValueType::kArray:  return Value{v.as_array().empty()};
            case ValueType::kObject: return Value{v.as_object().empty()};
            default:                 return Value{false};
        }
    });
}
