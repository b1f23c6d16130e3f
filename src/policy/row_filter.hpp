#pragma once

// ---------------------------------------------------------------------------
// row_filter.hpp
//
// 정책 allow 표현식 → 저장소 WHERE 술어 변환.
//
// [RowFilter 형태]
//   {}                     : 제약 없음 (모든 행이 후보)
//   {field: value}         : 단일 동등 조건
//   {AND: [f1, f2, ...]}   : 모든 조건
//   {OR:  [f1, f2, ...]}   : 하나 이상의 조건
//   {OR:  []}              : 어떤 행도 일치하지 않음 (deny-all)
//
// [추출 원칙: 넓히기만 한다]
// 추출은 평가가 아니라 구조 변환이다. 술어로 정확히 옮길 수 없는 노드
// (권한 검사, 순서 비교, 일반 연산, 와일드카드 경로) 는 {} 로 대체한다.
// 결과 필터는 항상 정책이 허용하는 행의 상위 집합을 고르며, 더 좁은 필터를
// 만드는 경우는 없다. 행 단위 최종 판정은 접근 검사 경로의 몫이다.
//
//   OR : 한 갈래라도 {} 이면 전체가 {} (그 갈래로 모든 행이 통과 가능)
//   AND: {} 갈래는 제거 (다른 갈래의 제약만 남는다)
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "common/value.hpp"
#include "expr/expression.hpp"

class RowFilter {
public:
    enum class Kind : std::uint8_t {
        kAll  = 0,  // {}
        kLeaf = 1,  // {field: value}
        kAnd  = 2,
        kOr   = 3,
    };

    RowFilter() = default;  // {}

    [[nodiscard]] static RowFilter unconstrained() { return RowFilter{}; }
    [[nodiscard]] static RowFilter match_none();
    [[nodiscard]] static RowFilter leaf(std::string field, Value value);

    // 자식 목록을 그대로 결합한다 (정규화 없음). 정규화는 extract_row_filter 담당.
    [[nodiscard]] static RowFilter all_of(std::vector<RowFilter> children);
    [[nodiscard]] static RowFilter any_of(std::vector<RowFilter> children);

    [[nodiscard]] Kind                          kind() const noexcept { return kind_; }
    [[nodiscard]] bool                          is_unconstrained() const noexcept { return kind_ == Kind::kAll; }
    [[nodiscard]] bool                          is_match_none() const noexcept { return kind_ == Kind::kOr && children_.empty(); }
    [[nodiscard]] const std::string&            field() const noexcept { return field_; }
    [[nodiscard]] const Value&                  value() const noexcept { return value_; }
    [[nodiscard]] const std::vector<RowFilter>& children() const noexcept { return children_; }

    // matches
    //   메모리 내 레코드에 필터를 적용한다. leaf 의 field 는 점 구분 경로로
    //   레코드를 탐색하며 구조적 동등 비교를 한다.
    [[nodiscard]] bool matches(const Value& record) const;

    // to_value / to_json
    //   Prisma 스타일 where 객체 ({}, {"a": 1}, {"AND": [...]}, {"OR": [...]}).
    [[nodiscard]] Value       to_value() const;
    [[nodiscard]] std::string to_json() const { return to_value().to_json(); }

    friend bool operator==(const RowFilter& lhs, const RowFilter& rhs);

private:
    Kind                   kind_{Kind::kAll};
    std::string            field_{};
    Value                  value_{};
    std::vector<RowFilter> children_{};
};

// ---------------------------------------------------------------------------
// extract_row_filter
//   allow 표현식에서 행 필터를 추출한다. 평가하지 않으며 부수 효과가 없다.
//
//   Condition(eq, field, user.* field) → {field: user 값}
//   Condition(eq, field, literal)      → {field: literal}   (좌우 대칭)
//     단, 값이 배열/객체이거나 필드 첫 세그먼트가 AND/OR/NOT 이면 {}
//   Operation(and, ...)                → {} 제거 후 0개 {} / 1개 그대로 / AND
//   Operation(or, ...)                 → {} 가 하나라도 있으면 {} / 1개 그대로 / OR
//   그 외                               → {}
// ---------------------------------------------------------------------------
[[nodiscard]] RowFilter extract_row_filter(const Expression& expr, const UserInfo& user);

// merge_where
//   호출자 where 와 정책 필터를 {AND: [where, filter]} 로 결합한다.
//   where 가 비어 있으면 filter 만, filter 가 {} 이면 where 만 반환한다.
[[nodiscard]] Value merge_where(const Value& where, const RowFilter& filter);
