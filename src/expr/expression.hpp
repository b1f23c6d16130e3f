#pragma once

// ---------------------------------------------------------------------------
// expression.hpp
//
// 선언적 표현식 트리 정의.
//
// [닫힌 노드 집합]
// Literal | FieldAccess | Operation | Condition | Permission
// std::variant 로 표현하며, evaluator / sandbox validator / row filter
// 추출기는 모두 std::visit 로 노드 종류를 전수 처리한다. 노드 종류를
// 추가하면 세 곳 모두 컴파일 단계에서 누락이 드러난다.
//
// [불변성]
// 자식 노드는 std::shared_ptr<const Expression> 으로 공유된다. 한번 생성된
// 트리는 변경되지 않으므로 정책 집합 reload 와 진행 중인 평가가 안전하게
// 같은 트리를 참조할 수 있다.
//
// [제한 없음]
// 트리 깊이/인자 수는 타입이 제한하지 않는다. 제한은 오직 sandbox 의
// EvaluationBudget 이 담당한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/value.hpp"

class Expression;
using ExprPtr = std::shared_ptr<const Expression>;

// 와일드카드 경로 세그먼트: "items.*" 는 items 배열 자체를 반환한다.
inline constexpr std::string_view kWildcardSegment = "*";

struct LiteralExpr {
    Value value{};
};

// path: 점(.) 구분 경로 (예: "author.id", "items.*")
struct FieldAccessExpr {
    std::string path{};
};

struct OperationExpr {
    std::string          op{};
    std::vector<ExprPtr> args{};
};

// op: eq | ne | gt | lt | gte | lte | in | exists
struct ConditionExpr {
    std::string op{};
    ExprPtr     left{};
    ExprPtr     right{};
};

// check: 권한 연산 이름 (hasRole, isOwner, ...). args 는 문자열 상수만 허용.
struct PermissionExpr {
    std::string              check{};
    std::vector<std::string> args{};
};

enum class ExprKind : std::uint8_t {
    kLiteral     = 0,
    kFieldAccess = 1,
    kOperation   = 2,
    kCondition   = 3,
    kPermission  = 4,
};

[[nodiscard]] std::string_view kind_name(ExprKind kind) noexcept;

class Expression {
public:
    using Node = std::variant<LiteralExpr, FieldAccessExpr, OperationExpr, ConditionExpr, PermissionExpr>;

    explicit Expression(Node node) : node_(std::move(node)) {}

    [[nodiscard]] const Node& node() const noexcept { return node_; }
    [[nodiscard]] ExprKind    kind() const noexcept { return static_cast<ExprKind>(node_.index()); }

    // 해당 종류가 아니면 nullptr.
    template <typename T>
    [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&node_); }

private:
    Node node_;
};

// ---------------------------------------------------------------------------
// 트리 생성 헬퍼
//   expr::op("or", {expr::cond("eq", expr::field("isPublic"), expr::literal(true)), ...})
// ---------------------------------------------------------------------------
namespace expr {

[[nodiscard]] ExprPtr literal(Value value);
[[nodiscard]] ExprPtr field(std::string path);
[[nodiscard]] ExprPtr op(std::string name, std::vector<ExprPtr> args = {});
[[nodiscard]] ExprPtr cond(std::string op, ExprPtr left, ExprPtr right);
[[nodiscard]] ExprPtr permission(std::string check, std::vector<std::string> args = {});

}  // namespace expr

// split_path
//   "a.b.*" → {"a", "b", "*"}. 빈 세그먼트도 그대로 보존한다 ("a..b" → {"a", "", "b"}).
[[nodiscard]] std::vector<std::string> split_path(std::string_view path);

// is_user_path
//   첫 세그먼트가 "user" 인 경로 ("user", "user.id", "user.roles").
//   이 경로들은 레코드가 아닌 행위자(UserInfo)를 기준으로 해석된다.
[[nodiscard]] bool is_user_path(std::string_view path) noexcept;

// describe
//   로그용 한 줄 요약 (예: "operation(or, 2 args)", "field(user.id)").
[[nodiscard]] std::string describe(const Expression& expr);
