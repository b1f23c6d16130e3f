// ---------------------------------------------------------------------------
// array_ops.cpp
//
// 배열 연산: count sum avg first last map filter find some every
//            slice unique flatten
//
// [관대한 입력]
// 첫 인자가 배열이 아니면 오류 대신 중립값을 돌려준다.
//   count/sum/avg → 0, map/filter/slice/unique/flatten → [],
//   first/last/find → null, some/every → false
// 누락 필드(null)에 대한 집계가 정책 작성 실수로 평가 전체를 실패시키지
// 않게 하기 위함이다.
//
// [field 인자]
// sum/avg/map/filter/find/some/every 는 선택적 field 이름을 받는다.
// 원소가 object 이면 해당 멤버를, 아니면 원소 자체를 사용한다.
// filter/find/some/every 는 value 인자가 있으면 동등 비교, 없으면
// truthy 여부로 판정한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

const Value::Array kEmptyArray{};

const Value::Array& items_of(const Value& v) {
    return v.is_array() ? v.as_array() : kEmptyArray;
}

// 선택적 field 인자. null/누락 → "" (원소 자체 사용).
std::expected<std::string, EvalError>
field_arg(std::string_view op, std::span<const Value> args, std::size_t index) {
    const Value& v = arg(args, index);
    if (v.is_null()) {
        return std::string{};
    }
    if (!v.is_string()) {
        return make_error(EvalErrorCode::kTypeError,
                          fmt::format("{}: field argument must be a string, got {}", op, type_name(v.type())),
                          std::string{op});
    }
    return v.as_string();
}

// sum 용 수치 변환: number 는 그대로, bool 은 0/1, 그 외는 0.
double numeric_or_zero(const Value& v) {
    if (v.is_number()) {
        return v.as_number();
    }
    if (v.is_bool()) {
        return v.as_bool() ? 1.0 : 0.0;
    }
    return 0.0;
}

double sum_items(const Value::Array& items, const std::string& field) {
    double total = 0.0;
    for (const auto& item : items) {
        total += numeric_or_zero(element_field(item, field));
    }
    return total;
}

// JS Array.prototype.slice 와 같은 인덱스 정규화 (음수는 끝에서부터).
std::size_t normalize_index(double idx, std::size_t size) {
    if (std::isnan(idx)) {
        return 0;
    }
    const auto n = static_cast<double>(size);
    if (idx < 0.0) {
        idx = std::max(0.0, n + std::trunc(idx));
    }
    return static_cast<std::size_t>(std::min(std::trunc(idx), n));
}

// filter/find/some/every 공통 판정기 생성.
struct ElementMatcher {
    std::string field;
    bool        by_value{false};
    Value       expected{};

    [[nodiscard]] bool operator()(const Value& item) const {
        const Value v = element_field(item, field);
        return by_value ? v == expected : v.truthy();
    }
};

std::expected<ElementMatcher, EvalError>
make_matcher(std::string_view op, std::span<const Value> args) {
    if (auto err = require_arity(op, args, 1, 3)) {
        return std::unexpected(*err);
    }
    auto field = field_arg(op, args, 1);
    if (!field) {
        return std::unexpected(field.error());
    }
    return ElementMatcher{std::move(*field), args.size() == 3, arg(args, 2)};
}

}  // namespace

void register_array_operations(OperationMap& ops) {
    constexpr auto kArray = OperationCategory::kArray;

    define_pure(ops, "count", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("count", args, 1, 1)) {
            return std::unexpected(*err);
        }
        return Value{items_of(args[0]).size()};
    });

    define_pure(ops, "sum", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("sum", args, 1, 2)) {
            return std::unexpected(*err);
        }
        auto field = field_arg("sum", args, 1);
        if (!field) {
            return std::unexpected(field.error());
        }
        return Value{sum_items(items_of(args[0]), *field)};
    });

    // avg: 빈 배열 → 0
    define_pure(ops, "avg", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("avg", args, 1, 2)) {
            return std::unexpected(*err);
        }
        auto field = field_arg("avg", args, 1);
        if (!field) {
            return std::unexpected(field.error());
        }
        const auto& items = items_of(args[0]);
        if (items.empty()) {
            return Value{0};
        }
        return Value{sum_items(items, *field) / static_cast<double>(items.size())};
    });

    define_pure(ops, "first", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("first", args, 1, 1)) {
            return std::unexpected(*err);
        }
        const auto& items = items_of(args[0]);
        return items.empty() ? Value{} : items.front();
    });

    define_pure(ops, "last", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("last", args, 1, 1)) {
            return std::unexpected(*err);
        }
        const auto& items = items_of(args[0]);
        return items.empty() ? Value{} : items.back();
    });

    // map(arr, field): 각 원소의 field 추출
    define_pure(ops, "map", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("map", args, 1, 2)) {
            return std::unexpected(*err);
        }
        auto field = field_arg("map", args, 1);
        if (!field) {
            return std::unexpected(field.error());
        }
        Value::Array out;
        for (const auto& item : items_of(args[0])) {
            out.push_back(element_field(item, *field));
        }
        return Value{std::move(out)};
    });

    define_pure(ops, "filter", kArray, [](std::span<const Value> args) -> EvalResult {
        auto matcher = make_matcher("filter", args);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        Value::Array out;
        for (const auto& item : items_of(args[0])) {
            if ((*matcher)(item)) {
                out.push_back(item);
            }
        }
        return Value{std::move(out)};
    });

    define_pure(ops, "find", kArray, [](std::span<const Value> args) -> EvalResult {
        auto matcher = make_matcher("find", args);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        const auto& items = items_of(args[0]);
        const auto it = std::find_if(items.begin(), items.end(), *matcher);
        return it == items.end() ? Value{} : *it;
    });

    define_pure(ops, "some", kArray, [](std::span<const Value> args) -> EvalResult {
        auto matcher = make_matcher("some", args);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        const auto& items = items_of(args[0]);
        return Value{std::any_of(items.begin(), items.end(), *matcher)};
    });

    // every: 배열이 아니면 false, 빈 배열이면 true
    define_pure(ops, "every", kArray, [](std::span<const Value> args) -> EvalResult {
        auto matcher = make_matcher("every", args);
        if (!matcher) {
            return std::unexpected(matcher.error());
        }
        if (!args[0].is_array()) {
            return Value{false};
        }
        const auto& items = args[0].as_array();
        return Value{std::all_of(items.begin(), items.end(), *matcher)};
    });

    // slice(arr, start, end?): [start, end), 음수 인덱스는 끝에서부터
    define_pure(ops, "slice", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("slice", args, 2, 3)) {
            return std::unexpected(*err);
        }
        auto start = number_arg("slice", args, 1);
        if (!start) {
            return std::unexpected(start.error());
        }
        const auto& items = items_of(args[0]);
        const std::size_t begin = normalize_index(*start, items.size());
        std::size_t end = items.size();
        if (!arg(args, 2).is_null()) {
            auto e = number_arg("slice", args, 2);
            if (!e) {
                return std::unexpected(e.error());
            }
            end = normalize_index(*e, items.size());
        }
        if (end <= begin) {
            return Value{Value::Array{}};
        }
        return Value{Value::Array(items.begin() + static_cast<std::ptrdiff_t>(begin),
                                  items.begin() + static_cast<std::ptrdiff_t>(end))};
    });

    // unique: 구조적 동등성 기준, 최초 출현 순서 유지
    define_pure(ops, "unique", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("unique", args, 1, 1)) {
            return std::unexpected(*err);
        }
        Value::Array out;
        for (const auto& item : items_of(args[0])) {
            if (std::find(out.begin(), out.end(), item) == out.end()) {
                out.push_back(item);
            }
        }
        return Value{std::move(out)};
    });

    // flatten: 한 단계만 펼친다
    define_pure(ops, "flatten", kArray, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("flatten", args, 1, 1)) {
            return std::unexpected(*err);
        }
        Value::Array out;
        for (const auto& item : items_of(args[0])) {
            if (item.is_array()) {
                const auto& inner = item.as_array();
                out.insert(out.end(), inner.begin(), inner.end());
            } else {
                out.push_back(item);
            }
        }
        return Value{std::move(out)};
    });
}
