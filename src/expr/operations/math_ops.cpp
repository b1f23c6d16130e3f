// ---------------------------------------------------------------------------
// math_ops.cpp
//
// 산술 연산: add subtract multiply divide mod pow abs round floor ceil min max
//
// [타입 규칙]
// - 모든 인자는 number 여야 한다. 그 외는 kTypeError.
//   (누락 필드 = null 이므로 접근 검사 경로에서는 차단으로 귀결된다)
// - min/max 는 number 배열 하나를 받을 수도 있다 (min(field("scores.*"))).
// - 0 으로 나누기/나머지는 kDivisionByZero.
// ---------------------------------------------------------------------------

#include <cmath>
#include <limits>
#include <vector>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

// 가변 인자 number 목록 수집. 인자가 배열 하나뿐이면 그 원소를 사용한다.
std::expected<std::vector<double>, EvalError>
collect_numbers(std::string_view op, std::span<const Value> args) {
    std::span<const Value> items = args;
    if (args.size() == 1 && args[0].is_array()) {
        items = std::span<const Value>(args[0].as_array());
    }

    std::vector<double> numbers;
    numbers.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto n = number_arg(op, items, i);
        if (!n) {
            return std::unexpected(n.error());
        }
        numbers.push_back(*n);
    }
    return numbers;
}

// 이항 연산 공통 처리
template <typename Fn>
PureOperation binary(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 2, 2)) {
            return std::unexpected(*err);
        }
        auto a = number_arg(name, args, 0);
        if (!a) {
            return std::unexpected(a.error());
        }
        auto b = number_arg(name, args, 1);
        if (!b) {
            return std::unexpected(b.error());
        }
        return fn(*a, *b);
    };
}

// 단항 연산 공통 처리
template <typename Fn>
PureOperation unary(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 1, 1)) {
            return std::unexpected(*err);
        }
        auto a = number_arg(name, args, 0);
        if (!a) {
            return std::unexpected(a.error());
        }
        return Value{fn(*a)};
    };
}

}  // namespace

void register_math_operations(OperationMap& ops) {
    constexpr auto kMath = OperationCategory::kMath;

    define_pure(ops, "add", kMath, [](std::span<const Value> args) -> EvalResult {
        auto numbers = collect_numbers("add", args);
        if (!numbers) {
            return std::unexpected(numbers.error());
        }
        double total = 0.0;
        for (double n : *numbers) {
            total += n;
        }
        return Value{total};
    });

    define_pure(ops, "multiply", kMath, [](std::span<const Value> args) -> EvalResult {
        auto numbers = collect_numbers("multiply", args);
        if (!numbers) {
            return std::unexpected(numbers.error());
        }
        if (numbers->empty()) {
            return make_error(EvalErrorCode::kTypeError, "multiply: expected at least 1 argument", "multiply");
        }
        double product = 1.0;
        for (double n : *numbers) {
            product *= n;
        }
        return Value{product};
    });

    define_pure(ops, "subtract", kMath, binary("subtract", [](double a, double b) -> EvalResult {
        return Value{a - b};
    }));

    define_pure(ops, "divide", kMath, binary("divide", [](double a, double b) -> EvalResult {
        if (b == 0.0) {
            return make_error(EvalErrorCode::kDivisionByZero, "Division by zero", "divide");
        }
        return Value{a / b};
    }));

    define_pure(ops, "mod", kMath, binary("mod", [](double a, double b) -> EvalResult {
        if (b == 0.0) {
            return make_error(EvalErrorCode::kDivisionByZero, "Division by zero", "mod");
        }
        return Value{std::fmod(a, b)};
    }));

    define_pure(ops, "pow", kMath, binary("pow", [](double a, double b) -> EvalResult {
        return Value{std::pow(a, b)};
    }));

    define_pure(ops, "abs",   kMath, unary("abs",   [](double a) { return std::fabs(a); }));
    define_pure(ops, "floor", kMath, unary("floor", [](double a) { return std::floor(a); }));
    define_pure(ops, "ceil",  kMath, unary("ceil",  [](double a) { return std::ceil(a); }));
    // 0.5 경계는 +무한대 방향으로 반올림 (-2.5 → -2)
    define_pure(ops, "round", kMath, unary("round", [](double a) { return std::floor(a + 0.5); }));

    define_pure(ops, "min", kMath, [](std::span<const Value> args) -> EvalResult {
        auto numbers = collect_numbers("min", args);
        if (!numbers) {
            return std::unexpected(numbers.error());
        }
        if (numbers->empty()) {
            return Value{};
        }
        double result = std::numeric_limits<double>::infinity();
        for (double n : *numbers) {
            result = std::fmin(result, n);
        }
        return Value{result};
    });

    define_pure(ops, "max", kMath, [](std::span<const Value> args) -> EvalResult {
        auto numbers = collect_numbers("max", args);
        if (!numbers) {
            return std::unexpected(numbers.error());
        }
        if (numbers->empty()) {
            return Value{};
        }
        double result = -std::numeric_limits<double>::infinity();
        for (double n : *numbers) {
            result = std::fmax(result, n);
        }
        return Value{result};
    });
}
