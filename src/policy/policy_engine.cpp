// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 접근 판정 / 행 필터 / 필드 권한 엔진 구현.
//
// [Fail-close 원칙: 절대 위반 금지]
// 1. policies_ == nullptr → 차단
// 2. 정책 일치 없음 → 차단 (default deny)
// 3. allow 평가 오류 → 차단
// 4. 내부 예외 → 차단
// 5. 허용은 allow 결과가 truthy 일 때만
//
// [평가 컨텍스트]
// data    : request.data
// user    : request.user
// params  : {}
// globals : {resource, action, where}
//
// [로그 레벨]
// - kSecurityViolation → spdlog::error + SecurityLog
// - kBudgetExceeded    → spdlog::warn  + SecurityLog
// - 그 외 평가 오류     → spdlog::warn  (정책 작성 오류)
// - 정책 없음           → spdlog::info
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "sandbox/safe_evaluator.hpp"

namespace {

constexpr std::string_view kDefaultDenyRule = "default-deny";
constexpr std::string_view kNoPolicySetRule = "no-policy-set";
constexpr std::string_view kInternalRule    = "internal-error";

EvaluationContext build_context(const AccessRequest& request) {
    EvaluationContext ctx;
    ctx.data    = request.data.is_null() ? Value{Value::Object{}} : request.data;
    ctx.user    = request.user;
    ctx.params  = Value{Value::Object{}};
    ctx.globals = Value::object({
        {"resource", request.resource},
        {"action", action_to_string(request.action)},
        {"where", request.where},
    });
    return ctx;
}

AllowedFields fields_for(const Policy& policy) {
    if (!policy.fields) {
        return AllowedFields{{std::string{kAllFields}}, {std::string{kAllFields}}, {}};
    }
    return filter_fields(*policy.fields);
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyEngine 생성자
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine(std::shared_ptr<const PolicySet> policies,
                           EvaluationBudget                  budget,
                           std::shared_ptr<StructuredLogger> audit,
                           const OperationRegistry&          registry)
    : policies_(std::move(policies))
    , budget_(std::move(budget))
    , audit_(std::move(audit))
    , registry_(registry) {
    const auto current = policies_.load();
    if (!current) {
        spdlog::warn("policy_engine: constructed with nullptr policy set, all requests will be denied (fail-close)");
    } else {
        spdlog::info("policy_engine: initialized with {} policies, budget depth={} ops={} timeout={}ms",
                     current->size(), budget_.max_depth, budget_.max_operations, budget_.timeout.count());
    }
}

bool PolicyEngine::check_access(const AccessRequest& request) const {
    return evaluate(request).allowed;
}

// ---------------------------------------------------------------------------
// PolicyEngine::evaluate
//
// 모든 예외는 catch 후 차단 반환 (fail-close).
// ---------------------------------------------------------------------------
AccessDecision PolicyEngine::evaluate(const AccessRequest& request) const {
    const auto started = std::chrono::steady_clock::now();

    // Step 1: 정책 집합 로드. 이후 reload 와 무관하게 이 버전으로 평가한다.
    const auto policies = policies_.load();
    if (!policies) {
        spdlog::error("policy_engine: policy set is null, denying (fail-close) resource={} action={}",
                      request.resource, action_to_string(request.action));
        auto decision = make_denied(request, std::string{kNoPolicySetRule}, "Policy set unavailable");
        audit_access(request, decision, started);
        return decision;
    }

    // Step 2: 정확 일치 조회
    const Policy* policy = policies->find(request.resource, request.action);
    if (policy == nullptr) {
        spdlog::info("policy_engine: no policy for {}.{}, denying (default deny) user='{}'",
                     request.resource, action_to_string(request.action), request.user.id);
        auto decision = make_denied(request, std::string{kDefaultDenyRule},
                                    fmt::format("No policy defined for {}.{}", request.resource,
                                                action_to_string(request.action)));
        audit_access(request, decision, started);
        return decision;
    }

    // Step 3: sandbox 평가
    EvalResult result;
    try {
        SafeEvaluator sandbox{budget_, registry_};
        result = sandbox.evaluate(policy->allow, build_context(request));
    } catch (const std::exception& ex) {
        spdlog::error("policy_engine: exception while evaluating {}, denying (fail-close): {}",
                      policy->rule_id(), ex.what());
        auto decision = make_denied(request, std::string{kInternalRule},
                                    "Internal error during policy evaluation");
        audit_access(request, decision, started);
        return decision;
    }

    // Step 4: 오류 → 차단
    if (!result) {
        const EvalError& err = result.error();
        if (err.code == EvalErrorCode::kSecurityViolation) {
            spdlog::error("policy_engine: security violation in {} user='{}' msg='{}'",
                          policy->rule_id(), request.user.id, err.message);
        } else {
            spdlog::warn("policy_engine: evaluation failed for {} code={} msg='{}', denying",
                         policy->rule_id(), error_code_to_string(err.code), err.message);
        }
        if (audit_ && is_terminal(err.code)) {
            audit_->log_security(SecurityLog{
                request.user.id,
                request.resource,
                std::string{action_to_string(request.action)},
                std::string{error_code_to_string(err.code)},
                err.message,
                err.context,
                std::chrono::system_clock::now(),
            });
        }
        auto decision = make_denied(request, policy->rule_id(),
                                    fmt::format("Policy evaluation failed: {}", err.message), err);
        audit_access(request, decision, started);
        return decision;
    }

    if (!result->truthy()) {
        spdlog::debug("policy_engine: {} denied user='{}'", policy->rule_id(), request.user.id);
        auto decision = make_denied(request, policy->rule_id(),
                                    fmt::format("Access denied by policy for {}.{}", request.resource,
                                                action_to_string(request.action)));
        audit_access(request, decision, started);
        return decision;
    }

    // Step 5: 허용
    const AllowedFields fields = fields_for(*policy);
    AccessDecision decision{
        true,
        policy->rule_id(),
        "Access allowed",
        extract_row_filter(*policy->allow, request.user),
        fields.read,
        fields.write,
        fields.denied,
        std::nullopt,
    };
    spdlog::debug("policy_engine: {} allowed user='{}' row_filter={}",
                  decision.matched_rule, request.user.id, decision.row_filter.to_json());
    audit_access(request, decision, started);
    return decision;
}

// ---------------------------------------------------------------------------
// make_denied
//   모든 차단 결과의 단일 생성 지점.
// ---------------------------------------------------------------------------
AccessDecision PolicyEngine::make_denied(const AccessRequest&     request,
                                         std::string              matched_rule,
                                         std::string              reason,
                                         std::optional<EvalError> error) const {
    if (audit_) {
        audit_->log_deny(DenyLog{
            request.user.id,
            request.resource,
            std::string{action_to_string(request.action)},
            matched_rule,
            reason,
            error ? std::string{error_code_to_string(error->code)} : std::string{},
            std::chrono::system_clock::now(),
        });
    }
    AccessDecision decision;
    decision.allowed      = false;
    decision.matched_rule = std::move(matched_rule);
    decision.reason       = std::move(reason);
    decision.row_filter   = RowFilter::match_none();
    decision.error        = std::move(error);
    return decision;
}

void PolicyEngine::audit_access(const AccessRequest&                  request,
                                const AccessDecision&                 decision,
                                std::chrono::steady_clock::time_point started) const {
    if (!audit_) {
        return;
    }
    audit_->log_access(AccessLog{
        request.user.id,
        request.user.roles,
        request.resource,
        std::string{action_to_string(request.action)},
        decision.allowed,
        decision.matched_rule,
        decision.allowed ? decision.row_filter.to_json() : std::string{},
        std::chrono::system_clock::now(),
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started),
    });
}

// ---------------------------------------------------------------------------
// PolicyEngine::apply_row_filters
//
// allow 를 평가하지 않는다. 접근 검사는 호출자가 별도로 수행해야 하며,
// 이 함수는 저장소 쿼리에 덧붙일 조건만 만든다.
// ---------------------------------------------------------------------------
Value PolicyEngine::apply_row_filters(std::string_view resource,
                                      Action           action,
                                      const UserInfo&  user,
                                      const Value&     where) const {
    const auto policies = policies_.load();
    const Policy* policy = policies ? policies->find(resource, action) : nullptr;
    if (policy == nullptr) {
        spdlog::info("policy_engine: no policy for {}.{}, row filter is deny-all",
                     resource, action_to_string(action));
        return merge_where(where, RowFilter::match_none());
    }
    // 정적 검증을 통과하지 못한 정책은 접근 검사에서도 항상 차단되므로 deny-all.
    // 검증은 깊이를 제한하므로 이후 추출 재귀도 max_depth 안에 머문다.
    const SafeEvaluator checker{budget_, registry_};
    if (auto err = checker.validate(*policy->allow)) {
        spdlog::warn("policy_engine: {} rejected by sandbox code={} msg='{}', row filter is deny-all",
                     policy->rule_id(), error_code_to_string(err->code), err->message);
        return merge_where(where, RowFilter::match_none());
    }
    return merge_where(where, extract_row_filter(*policy->allow, user));
}

AllowedFields PolicyEngine::allowed_fields(std::string_view resource, Action action) const {
    const auto policies = policies_.load();
    const Policy* policy = policies ? policies->find(resource, action) : nullptr;
    if (policy == nullptr) {
        return AllowedFields{};
    }
    return fields_for(*policy);
}

// ---------------------------------------------------------------------------
// PolicyEngine::reload
//
// [new_policies == nullptr 동작]
// nullptr 로 교체하면 이후 모든 evaluate() 가 차단을 반환한다 (fail-close).
// ---------------------------------------------------------------------------
void PolicyEngine::reload(std::shared_ptr<const PolicySet> new_policies) {
    if (!new_policies) {
        spdlog::warn("policy_engine: reload called with nullptr policy set, "
                     "all requests will be denied after reload (fail-close)");
    } else {
        spdlog::info("policy_engine: reloading policy set with {} policies", new_policies->size());
    }
    policies_.store(std::move(new_policies));
}

std::size_t PolicyEngine::policy_count() const {
    const auto policies = policies_.load();
    return policies ? policies->size() : 0;
}
