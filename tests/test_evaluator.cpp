// ---------------------------------------------------------------------------
// test_evaluator.cpp
//
// Evaluator 단위 테스트.
//
// [테스트 범위]
// - 리터럴 / 필드 접근 (중첩 경로, user.* 경로, 누락 경로 → null)
// - 와일드카드 세그먼트 (배열 반환, 비배열 → 오류)
// - operation / condition / permission 디스패치
// - 알 수 없는 연산/비교자/권한 검사 오류
// - 재귀 깊이 제한과 오류 후 깊이 초기화
// - custom 연산 등록 (built-in 이름 충돌 거부)
// - evaluate_or_null: 일반 오류 → null, 종료 오류는 그대로 전달
// ---------------------------------------------------------------------------

#include "expr/evaluator.hpp"
#include "expr/expression.hpp"
#include "expr/operation_registry.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

namespace {

EvaluationContext make_context() {
    EvaluationContext ctx;
    ctx.data = Value::object({
        {"title", "Night Drive"},
        {"ownerId", "user-123"},
        {"isPublic", false},
        {"stats", Value::object({{"plays", 42}})},
        {"tags", Value::array({"synth", "night"})},
    });
    ctx.user = UserInfo{"user-123", {"user", "artist"}, std::vector<std::string>{"tracks.read"}};
    return ctx;
}

ExprPtr nested_not(int levels) {
    ExprPtr e = expr::literal(true);
    for (int i = 0; i < levels; ++i) {
        e = expr::op("not", {e});
    }
    return e;
}

}  // namespace

// ===========================================================================
// Step 1: 리터럴 / 필드 접근
// ===========================================================================

TEST(Evaluator, Literal_ReturnsValue) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::literal(Value{"x"}), make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value{"x"});
}

TEST(Evaluator, FieldAccess_NestedPath) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::field("stats.plays"), make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value{42});
}

TEST(Evaluator, FieldAccess_MissingPathIsNull) {
    Evaluator evaluator;
    const auto ctx = make_context();
    EXPECT_EQ(*evaluator.evaluate(expr::field("missing"), ctx), Value{});
    EXPECT_EQ(*evaluator.evaluate(expr::field("missing.deeper.still"), ctx), Value{});
    EXPECT_EQ(*evaluator.evaluate(expr::field("title.length"), ctx), Value{});
}

TEST(Evaluator, FieldAccess_UserPathResolvesAgainstUser) {
    Evaluator evaluator;
    const auto ctx = make_context();
    EXPECT_EQ(*evaluator.evaluate(expr::field("user.id"), ctx), Value{"user-123"});
    EXPECT_EQ(*evaluator.evaluate(expr::field("user.roles"), ctx), Value::array({"user", "artist"}));

    // "username" 은 user 경로가 아니다 (data 에서 조회)
    EXPECT_EQ(*evaluator.evaluate(expr::field("username"), ctx), Value{});
}

TEST(Evaluator, FieldAccess_EmptyPathIsMalformed) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::field(""), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kMalformedExpression);
}

TEST(Evaluator, FieldAccess_WildcardReturnsArray) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::field("tags.*"), make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value::array({"synth", "night"}));
}

TEST(Evaluator, FieldAccess_WildcardOnNonArrayFails) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::field("title.*"), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kWildcardOnNonArray);
    EXPECT_EQ(result.error().context, "title.*");
}

// ===========================================================================
// Step 2: operation / condition / permission
// ===========================================================================

TEST(Evaluator, Operation_EvaluatesArgumentsThenApplies) {
    Evaluator evaluator;
    const auto e = expr::op("add", {expr::field("stats.plays"), expr::literal(8)});
    const auto result = evaluator.evaluate(e, make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value{50});
}

TEST(Evaluator, Operation_UnknownNameFails) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::op("launchMissiles", {}), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kUnknownOperation);
    EXPECT_EQ(result.error().context, "launchMissiles");
}

TEST(Evaluator, Operation_ArgumentErrorPropagates) {
    Evaluator evaluator;
    const auto e = expr::op("and", {expr::literal(true), expr::op("nope", {})});
    const auto result = evaluator.evaluate(e, make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kUnknownOperation);
}

TEST(Evaluator, Condition_ComparesOperands) {
    Evaluator evaluator;
    const auto ctx = make_context();
    const auto owner = expr::cond("eq", expr::field("ownerId"), expr::field("user.id"));
    const auto plays = expr::cond("gt", expr::field("stats.plays"), expr::literal(100));
    EXPECT_EQ(*evaluator.evaluate(owner, ctx), Value{true});
    EXPECT_EQ(*evaluator.evaluate(plays, ctx), Value{false});
}

TEST(Evaluator, Condition_ExistsWithoutRightOperand) {
    Evaluator evaluator;
    const auto ctx = make_context();
    EXPECT_EQ(*evaluator.evaluate(expr::cond("exists", expr::field("title"), nullptr), ctx), Value{true});
    EXPECT_EQ(*evaluator.evaluate(expr::cond("exists", expr::field("nope"), nullptr), ctx), Value{false});
}

TEST(Evaluator, Condition_MissingRightOperandIsMalformed) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(expr::cond("eq", expr::field("title"), nullptr), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kMalformedExpression);
}

TEST(Evaluator, Condition_NonComparatorRejected) {
    Evaluator evaluator;
    // add 는 등록된 연산이지만 비교자가 아니다
    const auto result = evaluator.evaluate(
        expr::cond("add", expr::literal(1), expr::literal(2)), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kUnknownComparator);
}

TEST(Evaluator, Permission_ChecksUser) {
    Evaluator evaluator;
    const auto ctx = make_context();
    EXPECT_EQ(*evaluator.evaluate(expr::permission("hasRole", {"artist"}), ctx), Value{true});
    EXPECT_EQ(*evaluator.evaluate(expr::permission("hasRole", {"admin"}), ctx), Value{false});
    EXPECT_EQ(*evaluator.evaluate(expr::permission("hasPermission", {"tracks.read"}), ctx), Value{true});
    EXPECT_EQ(*evaluator.evaluate(expr::permission("isOwner", {"ownerId"}), ctx), Value{true});
}

TEST(Evaluator, Permission_UnknownOrPureCheckRejected) {
    Evaluator evaluator;
    const auto ctx = make_context();

    const auto unknown = evaluator.evaluate(expr::permission("isWizard", {}), ctx);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, EvalErrorCode::kUnknownPermission);

    // upper 는 문맥이 필요 없는 연산이므로 권한 검사로 쓸 수 없다
    const auto pure = evaluator.evaluate(expr::permission("upper", {"x"}), ctx);
    ASSERT_FALSE(pure.has_value());
    EXPECT_EQ(pure.error().code, EvalErrorCode::kUnknownPermission);
}

TEST(Evaluator, NullExpression_IsMalformed) {
    Evaluator evaluator;
    const auto result = evaluator.evaluate(ExprPtr{}, make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kMalformedExpression);
}

// ===========================================================================
// Step 3: 재귀 깊이
// ===========================================================================

TEST(Evaluator, Depth_WithinLimitSucceeds) {
    Evaluator evaluator{OperationRegistry::defaults(), 5};
    // not 4 단 + literal = 깊이 5
    const auto result = evaluator.evaluate(nested_not(4), make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value{true});
    EXPECT_EQ(evaluator.current_depth(), 0u);
}

TEST(Evaluator, Depth_ExceededFailsAndResets) {
    Evaluator evaluator{OperationRegistry::defaults(), 5};
    const auto result = evaluator.evaluate(nested_not(5), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kRecursionExceeded);
    EXPECT_EQ(result.error().message, "Maximum recursion depth (5) exceeded");
    EXPECT_EQ(evaluator.current_depth(), 0u);

    // 같은 인스턴스로 다시 평가 가능
    EXPECT_TRUE(evaluator.evaluate(nested_not(2), make_context()).has_value());
}

TEST(Evaluator, VisitHook_ErrorAbortsEvaluation) {
    Evaluator evaluator;
    int visits = 0;
    evaluator.set_visit_hook([&](const Expression&) -> std::optional<EvalError> {
        if (++visits > 2) {
            return EvalError{EvalErrorCode::kBudgetExceeded, "stop", ""};
        }
        return std::nullopt;
    });
    const auto result = evaluator.evaluate(
        expr::op("and", {expr::literal(true), expr::literal(true)}), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kBudgetExceeded);
    EXPECT_EQ(visits, 3);
}

// ===========================================================================
// Step 4: custom 연산
// ===========================================================================

TEST(OperationRegistry, WithCustom_AddsOperation) {
    OperationMap custom;
    custom.emplace("double", OperationDef{PureOperation{[](std::span<const Value> args) -> EvalResult {
        return Value{args[0].as_number() * 2};
    }}, OperationCategory::kCustom});

    const auto registry = OperationRegistry::defaults().with_custom(custom);
    ASSERT_TRUE(registry.has_value());
    EXPECT_TRUE(registry->contains("double"));
    EXPECT_FALSE(OperationRegistry::defaults().contains("double"));

    Evaluator evaluator{*registry};
    const auto result = evaluator.evaluate(expr::op("double", {expr::literal(21)}), make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Value{42});
}

TEST(OperationRegistry, WithCustom_RejectsBuiltinName) {
    OperationMap custom;
    custom.emplace("eq", OperationDef{PureOperation{[](std::span<const Value>) -> EvalResult {
        return Value{true};
    }}, OperationCategory::kCustom});

    const auto registry = OperationRegistry::defaults().with_custom(custom);
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error().code, EvalErrorCode::kDuplicateOperation);
}

TEST(OperationRegistry, Defaults_ContainsEveryComparator) {
    const auto& registry = OperationRegistry::defaults();
    for (const auto name : kComparators) {
        EXPECT_TRUE(registry.contains(name)) << name;
    }
    EXPECT_TRUE(registry.contains("hasRole"));
    EXPECT_TRUE(registry.find("hasRole")->needs_context());
    EXPECT_FALSE(registry.find("upper")->needs_context());
}

TEST(OperationRegistry, Names_ListsEveryRegisteredOperation) {
    const auto& defaults = OperationRegistry::defaults();
    const auto  names    = defaults.names();
    EXPECT_EQ(names.size(), defaults.size());
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    for (const auto& name : names) {
        EXPECT_TRUE(defaults.contains(name)) << name;
    }
    EXPECT_NE(std::find(names.begin(), names.end(), "isAnonymous"), names.end());

    OperationMap custom;
    custom.emplace("noop", OperationDef{PureOperation{[](std::span<const Value>) -> EvalResult {
        return Value{};
    }}, OperationCategory::kCustom});
    const auto extended = defaults.with_custom(custom);
    ASSERT_TRUE(extended.has_value());
    const auto extended_names = extended->names();
    EXPECT_EQ(extended_names.size(), names.size() + 1);
    EXPECT_NE(std::find(extended_names.begin(), extended_names.end(), "noop"), extended_names.end());
}

// ===========================================================================
// Step 5: evaluate_or_null
// ===========================================================================

TEST(Evaluator, EvaluateOrNull_SubstitutesNullForPlainErrors) {
    Evaluator evaluator;
    const auto result = evaluate_or_null(evaluator, *expr::op("divide", {expr::literal(1), expr::literal(0)}),
                                         make_context());
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_null());
}

TEST(Evaluator, EvaluateOrNull_KeepsTerminalErrors) {
    Evaluator evaluator;
    evaluator.set_visit_hook([](const Expression&) -> std::optional<EvalError> {
        return EvalError{EvalErrorCode::kSecurityViolation, "blocked", ""};
    });
    const auto result = evaluate_or_null(evaluator, *expr::literal(1), make_context());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EvalErrorCode::kSecurityViolation);
}
