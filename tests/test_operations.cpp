// ---------------------------------------------------------------------------
// test_operations.cpp
//
// built-in 연산 단위 테스트 (math / string / date / logic / comparison /
// array / permission).
//
// 연산은 레지스트리에서 직접 꺼내 호출한다. 평가기 경로는
// test_evaluator.cpp 에서 다룬다.
// ---------------------------------------------------------------------------

#include "expr/operation_registry.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

EvalResult call(const std::string& name, std::initializer_list<Value> args,
                const EvaluationContext& ctx = EvaluationContext{}) {
    const OperationDef* def = OperationRegistry::defaults().find(name);
    if (def == nullptr) {
        return make_error(EvalErrorCode::kUnknownOperation, "missing " + name);
    }
    const std::vector<Value> values(args);
    return def->invoke(values, ctx);
}

Value ok(const std::string& name, std::initializer_list<Value> args,
         const EvaluationContext& ctx = EvaluationContext{}) {
    auto result = call(name, args, ctx);
    EXPECT_TRUE(result.has_value()) << name << ": " << (result ? "" : result.error().message);
    return result ? *result : Value{};
}

EvalErrorCode fails(const std::string& name, std::initializer_list<Value> args) {
    auto result = call(name, args);
    EXPECT_FALSE(result.has_value()) << name << " unexpectedly succeeded";
    return result ? EvalErrorCode::kMalformedExpression : result.error().code;
}

EvaluationContext user_context(std::string id, std::vector<std::string> roles) {
    EvaluationContext ctx;
    ctx.user.id    = std::move(id);
    ctx.user.roles = std::move(roles);
    ctx.data       = Value::object({{"ownerId", "user-123"},
                                    {"meta", Value::object({{"author", "user-123"}})}});
    return ctx;
}

const Value kTracks = Value::array({
    Value::object({{"id", "t1"}, {"plays", 10}, {"public", true}}),
    Value::object({{"id", "t2"}, {"plays", 30}, {"public", false}}),
    Value::object({{"id", "t3"}, {"plays", 20}, {"public", true}}),
});

}  // namespace

// ===========================================================================
// math
// ===========================================================================

TEST(MathOps, Arithmetic) {
    EXPECT_EQ(ok("add", {1, 2, 3}), Value{6});
    EXPECT_EQ(ok("add", {Value::array({1, 2})}), Value{3});
    EXPECT_EQ(ok("add", {}), Value{0});
    EXPECT_EQ(ok("subtract", {10, 4}), Value{6});
    EXPECT_EQ(ok("multiply", {2, 3, 4}), Value{24});
    EXPECT_EQ(ok("divide", {9, 2}), Value{4.5});
    EXPECT_EQ(ok("mod", {7, 3}), Value{1});
    EXPECT_EQ(ok("pow", {2, 10}), Value{1024});
}

TEST(MathOps, DivisionByZeroFails) {
    EXPECT_EQ(fails("divide", {1, 0}), EvalErrorCode::kDivisionByZero);
    EXPECT_EQ(fails("mod", {1, 0}), EvalErrorCode::kDivisionByZero);
}

TEST(MathOps, NonNumberIsTypeError) {
    EXPECT_EQ(fails("add", {1, "2"}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("subtract", {1}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("abs", {Value{}}), EvalErrorCode::kTypeError);
}

TEST(MathOps, Rounding) {
    EXPECT_EQ(ok("abs", {-3}), Value{3});
    EXPECT_EQ(ok("floor", {2.7}), Value{2});
    EXPECT_EQ(ok("ceil", {2.1}), Value{3});
    EXPECT_EQ(ok("round", {2.5}), Value{3});
    EXPECT_EQ(ok("round", {-2.5}), Value{-2});
}

TEST(MathOps, MinMax) {
    EXPECT_EQ(ok("min", {3, 1, 2}), Value{1});
    EXPECT_EQ(ok("max", {Value::array({3, 9, 2})}), Value{9});
    EXPECT_TRUE(ok("min", {}).is_null());
}

// ===========================================================================
// string
// ===========================================================================

TEST(StringOps, CaseAndTrim) {
    EXPECT_EQ(ok("upper", {"abc"}), Value{"ABC"});
    EXPECT_EQ(ok("lower", {"AbC"}), Value{"abc"});
    EXPECT_EQ(ok("trim", {"  x y \t"}), Value{"x y"});
}

TEST(StringOps, ConcatStringifiesNonStrings) {
    EXPECT_EQ(ok("concat", {"track-", 7, Value{}, true}), Value{"track-7true"});
}

TEST(StringOps, LengthOfStringAndArray) {
    EXPECT_EQ(ok("length", {"hello"}), Value{5});
    EXPECT_EQ(ok("length", {Value::array({1, 2})}), Value{2});
    EXPECT_EQ(ok("length", {Value{}}), Value{0});
}

TEST(StringOps, Substring) {
    EXPECT_EQ(ok("substring", {"playlist", 0, 4}), Value{"play"});
    EXPECT_EQ(ok("substring", {"playlist", 4}), Value{"list"});
    EXPECT_EQ(ok("substring", {"abc", 5}), Value{""});
}

TEST(StringOps, Substring_HugeIndexClamped) {
    EXPECT_EQ(ok("substring", {"abc", 1e20}), Value{""});
    EXPECT_EQ(ok("substring", {"abc", 0, 1e20}), Value{"abc"});
    EXPECT_EQ(ok("substring", {"abc", -1e20, 2}), Value{"ab"});
    EXPECT_EQ(ok("substring", {"abc", 1, 3}), Value{"bc"});
}

TEST(StringOps, ContainsStartsEnds) {
    EXPECT_EQ(ok("contains", {"synthwave", "wave"}), Value{true});
    EXPECT_EQ(ok("contains", {Value::array({"a", "b"}), "b"}), Value{true});
    EXPECT_EQ(ok("contains", {42, "4"}), Value{false});
    EXPECT_EQ(ok("startsWith", {"user-123", "user-"}), Value{true});
    EXPECT_EQ(ok("endsWith", {"user-123", "124"}), Value{false});
}

TEST(StringOps, ReplaceSplitJoin) {
    EXPECT_EQ(ok("replace", {"a-b-c", "-", "+"}), Value{"a+b+c"});
    EXPECT_EQ(ok("replace", {"abc", "", "x"}), Value{"abc"});
    EXPECT_EQ(ok("split", {"a,b,,c", ","}), Value::array({"a", "b", "", "c"}));
    EXPECT_EQ(ok("join", {Value::array({"a", 1, true})}), Value{"a,1,true"});
    EXPECT_EQ(ok("join", {Value::array({"a", "b"}), " | "}), Value{"a | b"});
}

TEST(StringOps, NonStringIsTypeError) {
    EXPECT_EQ(fails("upper", {1}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("split", {"a", 1}), EvalErrorCode::kTypeError);
}

// ===========================================================================
// date
// ===========================================================================

TEST(DateOps, ParseIsoToEpochMillis) {
    EXPECT_EQ(ok("parseDate", {"1970-01-02"}), Value{86'400'000.0});
    EXPECT_EQ(ok("parseDate", {"2024-03-01T12:30:15.250Z"}), Value{1709296215250.0});
    EXPECT_EQ(ok("parseDate", {1000}), Value{1000});
}

TEST(DateOps, InvalidDateIsTypeError) {
    EXPECT_EQ(fails("parseDate", {"2024-02-30"}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("parseDate", {"yesterday"}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("parseDate", {"2024-01-01T25:00"}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("parseDate", {true}), EvalErrorCode::kTypeError);
}

TEST(DateOps, OutOfRangeEpochIsTypeError) {
    EXPECT_EQ(ok("parseDate", {8.64e15}), Value{8.64e15});
    EXPECT_EQ(fails("parseDate", {8.65e15}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("year", {1e300}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("month", {-1e300}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("isBefore", {1e20, 0}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("formatDate", {1e16}), EvalErrorCode::kTypeError);
    // epoch 범위 안이지만 달력 연도 범위 밖
    EXPECT_EQ(fails("year", {8.64e15}), EvalErrorCode::kTypeError);
}

TEST(DateOps, ComponentsAtFourDigitYearBoundary) {
    EXPECT_EQ(ok("year", {253402300799999.0}), Value{9999});
    EXPECT_EQ(ok("formatDate", {253402300799999.0}), Value{"9999-12-31T23:59:59.999Z"});
}

TEST(DateOps, Format) {
    EXPECT_EQ(ok("formatDate", {"2024-03-01T12:30:15.250Z"}), Value{"2024-03-01T12:30:15.250Z"});
    EXPECT_EQ(ok("formatDate", {"2024-03-01T12:30", "date"}), Value{"2024-03-01"});
    EXPECT_EQ(ok("formatDate", {0}), Value{"1970-01-01T00:00:00.000Z"});
}

TEST(DateOps, Arithmetic) {
    EXPECT_EQ(ok("formatDate", {ok("addDays", {"2024-02-28", 2}), "date"}), Value{"2024-03-01"});
    EXPECT_EQ(ok("diffDays", {"2024-01-01", "2024-03-01"}), Value{60});
    EXPECT_EQ(ok("diffDays", {"2024-01-02", "2024-01-01T12:00"}), Value{0});
    EXPECT_EQ(ok("isBefore", {"2024-01-01", "2024-01-02"}), Value{true});
    EXPECT_EQ(ok("isAfter", {"2024-01-01", "2024-01-02"}), Value{false});
}

TEST(DateOps, Components) {
    EXPECT_EQ(ok("year", {"2023-12-31T23:59:59Z"}), Value{2023});
    EXPECT_EQ(ok("month", {"2023-12-31"}), Value{12});
    EXPECT_EQ(ok("day", {"2023-12-31"}), Value{31});
}

// ===========================================================================
// logic
// ===========================================================================

TEST(LogicOps, AndOrNot) {
    EXPECT_EQ(ok("and", {true, 1, "x"}), Value{true});
    EXPECT_EQ(ok("and", {true, 0}), Value{false});
    EXPECT_EQ(ok("and", {}), Value{true});
    EXPECT_EQ(ok("or", {false, Value{}, "x"}), Value{true});
    EXPECT_EQ(ok("or", {}), Value{false});
    EXPECT_EQ(ok("not", {Value::array({})}), Value{true});
}

TEST(LogicOps, IfAndCoalesce) {
    EXPECT_EQ(ok("if", {true, "a", "b"}), Value{"a"});
    EXPECT_EQ(ok("if", {0, "a", "b"}), Value{"b"});
    EXPECT_TRUE(ok("if", {false, "a"}).is_null());
    EXPECT_EQ(ok("coalesce", {Value{}, Value{}, 0, 1}), Value{0});
    EXPECT_TRUE(ok("coalesce", {}).is_null());
}

TEST(LogicOps, NullAndEmptyChecks) {
    EXPECT_EQ(ok("exists", {0}), Value{true});
    EXPECT_EQ(ok("exists", {Value{}}), Value{false});
    EXPECT_EQ(ok("isNull", {Value{}}), Value{true});
    EXPECT_EQ(ok("isEmpty", {""}), Value{true});
    EXPECT_EQ(ok("isEmpty", {Value{Value::Object{}}}), Value{true});
    EXPECT_EQ(ok("isEmpty", {0}), Value{false});
}

// ===========================================================================
// comparison
// ===========================================================================

TEST(ComparisonOps, EqualityIsStructural) {
    EXPECT_EQ(ok("eq", {Value::array({1, 2}), Value::array({1, 2})}), Value{true});
    EXPECT_EQ(ok("eq", {1, "1"}), Value{false});
    EXPECT_EQ(ok("ne", {Value{}, false}), Value{true});
}

TEST(ComparisonOps, OrderingNumbersAndStrings) {
    EXPECT_EQ(ok("gt", {2, 1}), Value{true});
    EXPECT_EQ(ok("lte", {2, 2}), Value{true});
    EXPECT_EQ(ok("lt", {"apple", "banana"}), Value{true});
    EXPECT_EQ(ok("gte", {"b", "a"}), Value{true});
}

TEST(ComparisonOps, MixedOrNullIsFalse) {
    EXPECT_EQ(ok("gt", {2, "1"}), Value{false});
    EXPECT_EQ(ok("lt", {Value{}, 1}), Value{false});
    EXPECT_EQ(ok("gte", {Value{}, Value{}}), Value{false});
    EXPECT_EQ(ok("lte", {std::nan(""), 1}), Value{false});
}

TEST(ComparisonOps, InArrayOrSubstring) {
    EXPECT_EQ(ok("in", {"admin", Value::array({"user", "admin"})}), Value{true});
    EXPECT_EQ(ok("in", {"owner", Value::array({"user", "admin"})}), Value{false});
    EXPECT_EQ(ok("in", {"wave", "synthwave"}), Value{true});
    EXPECT_EQ(ok("in", {1, Value{}}), Value{false});
}

// ===========================================================================
// array
// ===========================================================================

TEST(ArrayOps, CountSumAvg) {
    EXPECT_EQ(ok("count", {kTracks}), Value{3});
    EXPECT_EQ(ok("count", {"not an array"}), Value{0});
    EXPECT_EQ(ok("sum", {kTracks, "plays"}), Value{60});
    EXPECT_EQ(ok("sum", {Value::array({1, true, "x", Value{}})}), Value{2});
    EXPECT_EQ(ok("avg", {kTracks, "plays"}), Value{20});
    EXPECT_EQ(ok("avg", {Value::array({})}), Value{0});
}

TEST(ArrayOps, FirstLastMap) {
    EXPECT_EQ(ok("first", {Value::array({1, 2})}), Value{1});
    EXPECT_EQ(ok("last", {Value::array({1, 2})}), Value{2});
    EXPECT_TRUE(ok("first", {Value::array({})}).is_null());
    EXPECT_EQ(ok("map", {kTracks, "id"}), Value::array({"t1", "t2", "t3"}));
    EXPECT_EQ(ok("map", {Value{}, "id"}), Value{Value::Array{}});
}

TEST(ArrayOps, FilterFindSomeEvery) {
    EXPECT_EQ(ok("map", {ok("filter", {kTracks, "public"}), "id"}), Value::array({"t1", "t3"}));
    EXPECT_EQ(ok("map", {ok("filter", {kTracks, "plays", 30}), "id"}), Value::array({"t2"}));
    EXPECT_EQ(ok("find", {kTracks, "id", "t3"}), kTracks.as_array()[2]);
    EXPECT_TRUE(ok("find", {kTracks, "id", "t9"}).is_null());
    EXPECT_EQ(ok("some", {kTracks, "public", false}), Value{true});
    EXPECT_EQ(ok("every", {kTracks, "public"}), Value{false});
    EXPECT_EQ(ok("every", {Value::array({})}), Value{true});
    EXPECT_EQ(ok("every", {"text"}), Value{false});
}

TEST(ArrayOps, NonStringFieldIsTypeError) {
    EXPECT_EQ(fails("sum", {kTracks, 1}), EvalErrorCode::kTypeError);
    EXPECT_EQ(fails("filter", {kTracks, true, 1}), EvalErrorCode::kTypeError);
}

TEST(ArrayOps, SliceUniqueFlatten) {
    const Value nums = Value::array({1, 2, 3, 4, 5});
    EXPECT_EQ(ok("slice", {nums, 1, 3}), Value::array({2, 3}));
    EXPECT_EQ(ok("slice", {nums, -2}), Value::array({4, 5}));
    EXPECT_EQ(ok("slice", {nums, 3, 1}), Value{Value::Array{}});
    EXPECT_EQ(ok("unique", {Value::array({1, "1", 1, Value::array({1}), Value::array({1})})}),
              Value::array({1, "1", Value::array({1})}));
    EXPECT_EQ(ok("flatten", {Value::array({1, Value::array({2, Value::array({3})})})}),
              Value::array({1, 2, Value::array({3})}));
}

// ===========================================================================
// permission
// ===========================================================================

TEST(PermissionOps, RoleChecks) {
    const auto ctx = user_context("user-123", {"user", "artist"});
    EXPECT_EQ(ok("hasRole", {"artist"}, ctx), Value{true});
    EXPECT_EQ(ok("hasAnyRole", {"admin", "artist"}, ctx), Value{true});
    EXPECT_EQ(ok("hasAnyRole", {Value::array({"admin"})}, ctx), Value{false});
    EXPECT_EQ(ok("hasAllRoles", {"user", "artist"}, ctx), Value{true});
    EXPECT_EQ(ok("hasAllRoles", {"user", "admin"}, ctx), Value{false});
    // 빈 목록은 허용 근거가 될 수 없다
    EXPECT_EQ(ok("hasAllRoles", {}, ctx), Value{false});
    EXPECT_EQ(ok("hasAnyRole", {}, ctx), Value{false});
}

TEST(PermissionOps, PermissionListMayBeAbsent) {
    auto ctx = user_context("user-123", {});
    EXPECT_EQ(ok("hasPermission", {"tracks.read"}, ctx), Value{false});
    ctx.user.permissions = std::vector<std::string>{"tracks.read"};
    EXPECT_EQ(ok("hasPermission", {"tracks.read"}, ctx), Value{true});
    EXPECT_EQ(ok("hasPermission", {"tracks.write"}, ctx), Value{false});
}

TEST(PermissionOps, IsOwnerResolvesDataPath) {
    const auto ctx = user_context("user-123", {});
    EXPECT_EQ(ok("isOwner", {"ownerId"}, ctx), Value{true});
    EXPECT_EQ(ok("isOwner", {"meta.author"}, ctx), Value{true});
    EXPECT_EQ(ok("isOwner", {"missing"}, ctx), Value{false});

    const auto other = user_context("user-999", {});
    EXPECT_EQ(ok("isOwner", {"ownerId"}, other), Value{false});
}

TEST(PermissionOps, AnonymousUser) {
    const auto anon = user_context("", {});
    EXPECT_EQ(ok("isAnonymous", {}, anon), Value{true});
    EXPECT_EQ(ok("isAuthenticated", {}, anon), Value{false});
    // 익명 사용자는 빈 ownerId 와 일치하더라도 소유자가 아니다
    EvaluationContext ctx = anon;
    ctx.data = Value::object({{"ownerId", ""}});
    EXPECT_EQ(ok("isOwner", {"ownerId"}, ctx), Value{false});
}
