// ---------------------------------------------------------------------------
// comparison_ops.cpp
//
// 비교 연산: eq ne gt lt gte lte in
// (exists 는 logic_ops.cpp 에 등록되어 있으며 Condition 에서도 그대로 쓰인다)
//
// [비교 규칙]
// - eq/ne: 구조적 동등성 (Value::operator==). 타입이 다르면 다르다.
// - gt/lt/gte/lte: number 끼리는 수치 비교, string 끼리는 사전순 비교.
//   그 외 조합 (null 포함, 타입 혼합) 은 항상 false. 예외를 던지지 않는다.
//   누락 필드에 대한 순서 비교가 우연히 허용되는 경로를 막는다.
// - in(needle, haystack): haystack 이 배열이면 원소 포함, 문자열이면
//   부분 문자열 포함. 그 외는 false.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <optional>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

enum class Ordering { kLess, kEqual, kGreater };

// 비교 불가능한 조합이면 std::nullopt.
std::optional<Ordering> compare_ordered(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        const double x = a.as_number();
        const double y = b.as_number();
        if (x < y) return Ordering::kLess;
        if (x > y) return Ordering::kGreater;
        if (x == y) return Ordering::kEqual;
        return std::nullopt;  // NaN
    }
    if (a.is_string() && b.is_string()) {
        const int c = a.as_string().compare(b.as_string());
        if (c < 0) return Ordering::kLess;
        if (c > 0) return Ordering::kGreater;
        return Ordering::kEqual;
    }
    return std::nullopt;
}

template <typename Pred>
PureOperation ordered(std::string name, Pred pred) {
    return [name = std::move(name), pred](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 2, 2)) {
            return std::unexpected(*err);
        }
        const auto ord = compare_ordered(args[0], args[1]);
        return Value{ord.has_value() && pred(*ord)};
    };
}

}  // namespace

void register_comparison_operations(OperationMap& ops) {
    constexpr auto kComparison = OperationCategory::kComparison;

    define_pure(ops, "eq", kComparison, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("eq", args, 2, 2)) {
            return std::unexpected(*err);
        }
        return Value{args[0] == args[1]};
    });

    define_pure(ops, "ne", kComparison, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("ne", args, 2, 2)) {
            return std::unexpected(*err);
        }
        return Value{!(args[0] == args[1])};
    });

    define_pure(ops, "gt", kComparison, ordered("gt", [](Ordering o) {
        return o == Ordering::kGreater;
    }));
    define_pure(ops, "lt", kComparison, ordered("lt", [](Ordering o) {
        return o == Ordering::kLess;
    }));
    define_pure(ops, "gte", kComparison, ordered("gte", [](Ordering o) {
        return o != Ordering::kLess;
    }));
    define_pure(ops, "lte", kComparison, ordered("lte", [](Ordering o) {
        return o != Ordering::kGreater;
    }));

    define_pure(ops, "in", kComparison, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("in", args, 2, 2)) {
            return std::unexpected(*err);
        }
        const Value& needle   = args[0];
        const Value& haystack = args[1];
        if (haystack.is_array()) {
            const auto& items = haystack.as_array();
            return Value{std::find(items.begin(), items.end(), needle) != items.end()};
        }
        if (haystack.is_string() && needle.is_string()) {
            return Value{haystack.as_string().find(needle.as_string()) != std::string::npos};
        }
        return Value{false};
    });
}
