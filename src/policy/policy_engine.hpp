#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// (resource, action, user, record) 요청을 받아 허용/차단 판정, 행 필터,
// 필드 권한을 계산하는 엔진.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 정책 집합 없음 (nullptr) → 차단
// 2. (resource, action) 에 일치하는 정책 없음 → 차단 (default deny)
// 3. allow 평가 오류 (종류 불문) → 차단
// 4. 엔진 내부 예외 → 차단
// 5. 허용은 allow 결과가 truthy 일 때만
//
// ❌ 금지: 평가 오류 → 허용 (fail-open)
// ❌ 금지: 정책 불확실 → 허용 (default allow)
// ❌ 금지: 예외 처리 중 허용 반환
//
// 모든 차단 결과는 make_denied() 한 곳에서만 생성된다.
//
// [Hot Reload]
// reload() 는 std::atomic<std::shared_ptr<const PolicySet>> 교체로 수행된다.
// 진행 중인 evaluate() 는 시작 시 load() 한 버전으로 끝까지 평가한다.
//
// [스레드 안전성]
// 엔진 자체는 평가 상태를 갖지 않는다. 호출마다 SafeEvaluator 를 새로
// 만들기 때문에 모든 public 메서드는 동시 호출에 안전하다.
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → rule.hpp / row_filter.hpp / field_filter.hpp (단방향)
// policy_engine.hpp → logger/structured_logger.hpp (단방향)
// ❌ rule.hpp → policy_engine.hpp 금지
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "expr/operation_registry.hpp"
#include "logger/structured_logger.hpp"
#include "policy/field_filter.hpp"
#include "policy/row_filter.hpp"
#include "policy/rule.hpp"
#include "sandbox/evaluation_budget.hpp"

// ---------------------------------------------------------------------------
// AccessRequest
//   data : 대상 레코드 (create 는 쓰기 payload, read/update/delete 는 기존 행)
//   where: 호출자 쿼리 조건 (Prisma 스타일 object). 평가 시 globals.where 로 노출.
// ---------------------------------------------------------------------------
struct AccessRequest {
    std::string resource{};
    Action      action{Action::kRead};
    UserInfo    user{};
    Value       data{Value::Object{}};
    Value       where{};
};

// ---------------------------------------------------------------------------
// AccessDecision
//   matched_rule: 판정 근거 규칙 ("Track:read"). 정책 없음은 "default-deny",
//                 정책 집합 없음은 "no-policy-set".
//   reason: 사람이 읽을 수 있는 판정 이유 (감사 로그용).
//           클라이언트에 그대로 노출하지 말 것.
//   row_filter: 허용 시 추출된 필터, 차단 시 deny-all ({OR: []}).
//   error: 평가 오류로 차단된 경우 그 오류.
// ---------------------------------------------------------------------------
struct AccessDecision {
    bool                     allowed{false};  // 기본값 차단 (fail-close)
    std::string              matched_rule{};
    std::string              reason{};
    RowFilter                row_filter{RowFilter::match_none()};
    std::vector<std::string> read_fields{};
    std::vector<std::string> write_fields{};
    std::vector<std::string> denied_fields{};
    std::optional<EvalError> error{};
};

class PolicyEngine {
public:
    // 생성자
    //   policies 가 nullptr 이면 모든 요청이 차단된다 (fail-close).
    //   audit 이 nullptr 이면 감사 로그를 남기지 않는다 (spdlog 진단 로그는 유지).
    explicit PolicyEngine(std::shared_ptr<const PolicySet> policies,
                          EvaluationBudget                  budget   = {},
                          std::shared_ptr<StructuredLogger> audit    = nullptr,
                          const OperationRegistry&          registry = OperationRegistry::defaults());

    ~PolicyEngine() = default;

    // 복사/이동 금지 (atomic 멤버)
    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = delete;
    PolicyEngine& operator=(PolicyEngine&&)      = delete;

    // check_access
    //   evaluate(request).allowed
    [[nodiscard]] bool check_access(const AccessRequest& request) const;

    // evaluate
    //   [평가 순서]
    //   1. 정책 집합 로드 (atomic)
    //   2. (resource, action) 정확 일치 조회. 없으면 차단
    //   3. SafeEvaluator 로 allow 평가 (호출마다 새 인스턴스)
    //   4. 오류 → 차단. security/budget 오류는 SecurityLog 추가 기록
    //   5. truthy → 허용 + 행 필터 + 필드 권한
    [[nodiscard]] AccessDecision evaluate(const AccessRequest& request) const;

    // apply_row_filters
    //   정책 없음 / sandbox 정적 검증 실패 → deny-all {OR: []}
    //   where 가 비어 있지 않으면 {AND: [where, filter]}
    [[nodiscard]] Value apply_row_filters(std::string_view resource,
                                          Action           action,
                                          const UserInfo&  user,
                                          const Value&     where = Value{}) const;

    // allowed_fields
    //   정책 없음 → {[], []}. fields 선언 없음 → {["*"], ["*"]}.
    [[nodiscard]] AllowedFields allowed_fields(std::string_view resource, Action action) const;

    // reload
    //   새 정책 집합으로 원자적 교체. nullptr 이면 이후 모든 요청 차단.
    void reload(std::shared_ptr<const PolicySet> new_policies);

    [[nodiscard]] std::size_t policy_count() const;

private:
    [[nodiscard]] AccessDecision make_denied(const AccessRequest&     request,
                                             std::string              matched_rule,
                                             std::string              reason,
                                             std::optional<EvalError> error = std::nullopt) const;

    void audit_access(const AccessRequest&                  request,
                      const AccessDecision&                 decision,
                      std::chrono::steady_clock::time_point started) const;

    std::atomic<std::shared_ptr<const PolicySet>> policies_;
    EvaluationBudget                               budget_;
    std::shared_ptr<StructuredLogger>              audit_;
    OperationRegistry                              registry_;
};
