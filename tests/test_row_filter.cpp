// ---------------------------------------------------------------------------
// test_row_filter.cpp
//
// 행 필터 추출 / where 병합 단위 테스트.
//
// [테스트 범위]
// - eq 조건: 레코드 필드 vs user.* 필드 / 리터럴 (양방향)
// - and: 제약 없는 갈래 제거, 단일 갈래 평탄화
// - or: 제약 없는 갈래가 하나라도 있으면 전체가 제약 없음
// - or(): 빈 or 는 아무 행도 일치하지 않음
// - 추출 불가 노드 (permission, ne, 기타 연산) → 제약 없음
// - 조합자 이름 필드 (AND/OR/NOT), 배열/객체 값 → 제약 없음
// - merge_where: 빈 where, 제약 없는 필터, AND 결합
// - RowFilter::matches: 메모리 내 레코드 검사
//
// [보안 고려사항]
// 행 필터는 allow 의 근사치이며 접근 검사를 대체하지 않는다.
// 여기서는 "필터가 허용 범위보다 좁아지지 않는다" 는 성질만 확인한다.
// ---------------------------------------------------------------------------

#include "policy/row_filter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

UserInfo make_user() {
    return UserInfo{"user-123", {"user"}, std::nullopt};
}

ExprPtr owner_eq() {
    return expr::cond("eq", expr::field("ownerId"), expr::field("user.id"));
}

ExprPtr public_eq() {
    return expr::cond("eq", expr::field("isPublic"), expr::literal(true));
}

std::string extract_json(const ExprPtr& e) {
    return extract_row_filter(*e, make_user()).to_json();
}

}  // namespace

// ===========================================================================
// Step 1: eq 조건
// ===========================================================================

TEST(RowFilter, Equality_UserFieldResolved) {
    EXPECT_EQ(extract_json(owner_eq()), R"({"ownerId":"user-123"})");
}

TEST(RowFilter, Equality_OperandOrderIrrelevant) {
    const auto reversed = expr::cond("eq", expr::field("user.id"), expr::field("ownerId"));
    EXPECT_EQ(extract_json(reversed), R"({"ownerId":"user-123"})");

    const auto literal_left = expr::cond("eq", expr::literal("published"), expr::field("status"));
    EXPECT_EQ(extract_json(literal_left), R"({"status":"published"})");
}

TEST(RowFilter, Equality_LiteralValue) {
    EXPECT_EQ(extract_json(public_eq()), R"({"isPublic":true})");
}

TEST(RowFilter, Equality_MissingUserFieldBecomesNull) {
    const auto e = expr::cond("eq", expr::field("teamId"), expr::field("user.teamId"));
    EXPECT_EQ(extract_json(e), R"({"teamId":null})");
}

TEST(RowFilter, Equality_NestedRecordPathKept) {
    const auto e = expr::cond("eq", expr::field("owner.id"), expr::field("user.id"));
    const RowFilter f = extract_row_filter(*e, make_user());
    ASSERT_EQ(f.kind(), RowFilter::Kind::kLeaf);
    EXPECT_EQ(f.field(), "owner.id");
}

TEST(RowFilter, Equality_NotReducible) {
    // 필드 대 필드 (둘 다 레코드 필드)
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("a"), expr::field("b"))), "{}");
    // 와일드카드
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("tags.*"), expr::literal("x"))), "{}");
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("ownerId"), expr::field("user.roles.*"))), "{}");
    // 계산된 값
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("ownerId"),
                                      expr::op("lower", {expr::field("user.id")}))), "{}");
    // eq 외 비교자
    EXPECT_EQ(extract_json(expr::cond("ne", expr::field("ownerId"), expr::field("user.id"))), "{}");
    EXPECT_EQ(extract_json(expr::cond("gt", expr::field("plays"), expr::literal(10))), "{}");
}

TEST(RowFilter, Equality_ReservedFieldNameUnconstrained) {
    // {"OR":[]} leaf 는 deny-all 과 구분되지 않는다
    const auto or_field = expr::cond("eq", expr::field("OR"), expr::literal(Value::array({})));
    EXPECT_EQ(extract_json(or_field), "{}");
    EXPECT_NE(extract_row_filter(*or_field, make_user()).to_json(), RowFilter::match_none().to_json());

    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("AND"), expr::literal(1))), "{}");
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("NOT.x"), expr::field("user.id"))), "{}");
    // 접두어만 같은 필드는 그대로 추출
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("ORder"), expr::literal(1))), R"({"ORder":1})");
}

TEST(RowFilter, Equality_ContainerValueUnconstrained) {
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("status"),
                                      expr::literal(Value::object({{"not", "x"}})))), "{}");
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("tags"),
                                      expr::literal(Value::array({"a"})))), "{}");
    // user.roles 는 배열로 해석된다
    EXPECT_EQ(extract_json(expr::cond("eq", expr::field("roles"), expr::field("user.roles"))), "{}");
}

TEST(RowFilter, Equality_ContainerArmWidensOr) {
    // 추출되지 않는 갈래가 있으면 or 전체가 제약 없음
    const auto e = expr::op("or", {owner_eq(),
                                   expr::cond("eq", expr::field("OR"), expr::literal(Value::array({})))});
    EXPECT_TRUE(extract_row_filter(*e, make_user()).is_unconstrained());
}

TEST(RowFilter, NonConditionNodesUnconstrained) {
    EXPECT_EQ(extract_json(expr::permission("hasRole", {"admin"})), "{}");
    EXPECT_EQ(extract_json(expr::literal(true)), "{}");
    EXPECT_EQ(extract_json(expr::op("not", {owner_eq()})), "{}");
}

// ===========================================================================
// Step 2: and / or
// ===========================================================================

TEST(RowFilter, And_DropsUnconstrainedArms) {
    const auto e = expr::op("and", {expr::permission("isAuthenticated"), owner_eq()});
    EXPECT_EQ(extract_json(e), R"({"ownerId":"user-123"})");
}

TEST(RowFilter, And_CombinesConstrainedArms) {
    const auto e = expr::op("and", {owner_eq(), public_eq()});
    EXPECT_EQ(extract_json(e), R"({"AND":[{"ownerId":"user-123"},{"isPublic":true}]})");
}

TEST(RowFilter, And_EmptyIsUnconstrained) {
    EXPECT_EQ(extract_json(expr::op("and", {})), "{}");
}

TEST(RowFilter, Or_CombinesConstrainedArms) {
    const auto e = expr::op("or", {public_eq(), owner_eq()});
    EXPECT_EQ(extract_json(e), R"({"OR":[{"isPublic":true},{"ownerId":"user-123"}]})");
}

TEST(RowFilter, Or_UnconstrainedArmWidensWholeFilter) {
    // admin 갈래는 모든 행을 허용할 수 있으므로 필터는 제약 없음이어야 한다
    const auto e = expr::op("or", {public_eq(), owner_eq(), expr::permission("hasRole", {"admin"})});
    const RowFilter f = extract_row_filter(*e, make_user());
    EXPECT_TRUE(f.is_unconstrained());
}

TEST(RowFilter, Or_EmptyMatchesNothing) {
    const RowFilter f = extract_row_filter(*expr::op("or", {}), make_user());
    EXPECT_TRUE(f.is_match_none());
    EXPECT_EQ(f.to_json(), R"({"OR":[]})");
}

TEST(RowFilter, NestedAndInsideOr) {
    const auto e = expr::op("or", {
        public_eq(),
        expr::op("and", {owner_eq(), expr::cond("eq", expr::field("status"), expr::literal("draft"))}),
    });
    EXPECT_EQ(extract_json(e),
              R"({"OR":[{"isPublic":true},{"AND":[{"ownerId":"user-123"},{"status":"draft"}]}]})");
}

// ===========================================================================
// Step 3: matches
// ===========================================================================

TEST(RowFilter, Matches_EvaluatesAgainstRecord) {
    const auto f = extract_row_filter(*expr::op("or", {public_eq(), owner_eq()}), make_user());
    EXPECT_TRUE(f.matches(Value::object({{"isPublic", true}, {"ownerId", "other"}})));
    EXPECT_TRUE(f.matches(Value::object({{"isPublic", false}, {"ownerId", "user-123"}})));
    EXPECT_FALSE(f.matches(Value::object({{"isPublic", false}, {"ownerId", "other"}})));
    EXPECT_FALSE(f.matches(Value::object({})));
}

TEST(RowFilter, Matches_SpecialFilters) {
    const Value record = Value::object({{"id", 1}});
    EXPECT_TRUE(RowFilter::unconstrained().matches(record));
    EXPECT_FALSE(RowFilter::match_none().matches(record));
}

// ===========================================================================
// Step 4: merge_where
// ===========================================================================

TEST(MergeWhere, EmptyWhereReturnsFilter) {
    const RowFilter f = RowFilter::leaf("ownerId", "user-123");
    EXPECT_EQ(merge_where(Value{}, f).to_json(), R"({"ownerId":"user-123"})");
    EXPECT_EQ(merge_where(Value{Value::Object{}}, f).to_json(), R"({"ownerId":"user-123"})");
}

TEST(MergeWhere, UnconstrainedFilterKeepsWhere) {
    const Value where = Value::object({{"genre", "synthwave"}});
    EXPECT_EQ(merge_where(where, RowFilter::unconstrained()), where);
}

TEST(MergeWhere, BothPresentCombinedWithAnd) {
    const Value where = Value::object({{"genre", "synthwave"}});
    EXPECT_EQ(merge_where(where, RowFilter::leaf("ownerId", "user-123")).to_json(),
              R"({"AND":[{"genre":"synthwave"},{"ownerId":"user-123"}]})");
}

TEST(MergeWhere, MatchNoneStillRestrictsWhere) {
    const Value where = Value::object({{"genre", "synthwave"}});
    EXPECT_EQ(merge_where(where, RowFilter::match_none()).to_json(),
              R"({"AND":[{"genre":"synthwave"},{"OR":[]}]})");
    EXPECT_EQ(merge_where(Value{}, RowFilter::match_none()).to_json(), R"({"OR":[]})");
}
