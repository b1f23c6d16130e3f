#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책 설정 구조체 정의.
// yaml-cpp 를 통해 config/policy.yaml 에서 로드된다 (PolicyLoader).
//
// [설계 원칙]
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 이 헤더의 구조체는 판정 로직을 포함하지 않는다. 판정은 PolicyEngine.
// - PolicySet 은 생성 후 변경되지 않는다. reload 는 새 PolicySet 으로의
//   shared_ptr 교체로만 이루어진다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "expr/expression.hpp"
#include "sandbox/evaluation_budget.hpp"

// 필드 목록 와일드카드: ["*"] 는 레코드의 모든 필드.
inline constexpr std::string_view kAllFields = "*";

// ---------------------------------------------------------------------------
// FieldSpec
//   필드 단위 권한 선언.
//   read/write 가 없으면 ["*"] 로 해석한다.
//   deny 는 read/write 보다 항상 우선한다 (선언 순서와 무관).
// ---------------------------------------------------------------------------
struct FieldSpec {
    std::optional<std::vector<std::string>> read{};
    std::optional<std::vector<std::string>> write{};
    std::vector<std::string>                deny{};
};

// ---------------------------------------------------------------------------
// Policy
//   (resource, action) 에 바인딩된 allow 표현식.
//   fields 가 없으면 모든 필드 읽기/쓰기 허용.
// ---------------------------------------------------------------------------
struct Policy {
    std::string              resource{};
    Action                   action{Action::kRead};
    ExprPtr                  allow{};
    std::optional<FieldSpec> fields{};

    // 감사 로그용 규칙 식별자 ("Track:read")
    [[nodiscard]] std::string rule_id() const;
};

// ---------------------------------------------------------------------------
// EngineConfig
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   budget:    접근 검사마다 SafeEvaluator 에 적용되는 예산
// ---------------------------------------------------------------------------
struct EngineConfig {
    std::string      log_level{"info"};
    EvaluationBudget budget{};
};

// ---------------------------------------------------------------------------
// PolicySet
//   (resource, action) → Policy 불변 컬렉션.
//
//   [유일성]
//   같은 (resource, action) 이 두 번 나오면 create() 가 실패한다.
//   조회는 항상 정확히 하나의 정책 또는 없음이다. "여러 정책 중 첫 번째"
//   같은 순서 의존 동작이 존재하지 않는다.
// ---------------------------------------------------------------------------
class PolicySet {
public:
    // create
    //   allow 가 null 인 정책 또는 중복 키가 있으면 오류 문자열 반환.
    [[nodiscard]] static std::expected<PolicySet, std::string> create(std::vector<Policy> policies);

    PolicySet() = default;

    // find
    //   정확히 일치하는 정책. 없으면 nullptr.
    [[nodiscard]] const Policy* find(std::string_view resource, Action action) const;

    [[nodiscard]] const std::vector<Policy>& policies() const noexcept { return policies_; }
    [[nodiscard]] std::size_t                size() const noexcept { return policies_.size(); }
    [[nodiscard]] bool                       empty() const noexcept { return policies_.empty(); }

private:
    std::vector<Policy>                                   policies_{};
    std::map<std::pair<std::string, Action>, std::size_t> index_{};
};
