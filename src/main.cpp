#include "policy/field_filter.hpp"
#include "policy/policy_engine.hpp"
#include "policy/policy_loader.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// rowguard_check
//
// 정책 파일과 요청 파일을 읽어 접근 판정 결과를 출력하는 CLI.
//
// [종료 코드]
// 0: 허용
// 1: 차단
// 2: 설정/요청 파일 오류
// ---------------------------------------------------------------------------

namespace {

constexpr int kExitAllowed     = 0;
constexpr int kExitDenied      = 1;
constexpr int kExitConfigError = 2;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += items[i];
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// main
//   인자 1: 정책 경로 (POLICY_PATH 보다 우선)
//   인자 2: 요청 경로 (REQUEST_PATH 보다 우선)
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (인자 > 환경변수 > 기본값) ─────────────────────────────
    const std::string policy_path  = argc > 1 ? argv[1] : env_str("POLICY_PATH", "config/policy.yaml");
    const std::string request_path = argc > 2 ? argv[2] : env_str("REQUEST_PATH", "config/request.yaml");
    const std::string audit_path   = env_str("AUDIT_LOG_PATH", "/tmp/rowguard.log");
    const std::string level_env    = env_str("LOG_LEVEL", "");

    spdlog::info("Starting rowguard check");
    spdlog::info("Policy: {}", policy_path);
    spdlog::info("Request: {}", request_path);

    auto loaded = PolicyLoader::load(policy_path);
    if (!loaded) {
        std::fprintf(stderr, "error: %s\n", loaded.error().c_str());
        return kExitConfigError;
    }

    const std::string log_level = level_env.empty() ? loaded->engine.log_level : level_env;
    spdlog::set_level(spdlog::level::from_str(log_level));
    spdlog::info("Log level: {}", log_level);

    auto request = PolicyLoader::load_request(request_path);
    if (!request) {
        std::fprintf(stderr, "error: %s\n", request.error().c_str());
        return kExitConfigError;
    }

    // ── 감사 로거 (파일 전용) ──────────────────────────────────────────
    std::shared_ptr<StructuredLogger> audit;
    try {
        audit = std::make_shared<StructuredLogger>(log_level_from_string(log_level), audit_path, false);
    } catch (const std::exception& ex) {
        spdlog::warn("Audit log disabled: {}", ex.what());
    }

    PolicyEngine engine{loaded->policies, loaded->engine.budget, audit};
    const AccessDecision decision = engine.evaluate(*request);

    // ── 결과 출력 ───────────────────────────────────────────────────────
    std::printf("decision: %s\n", decision.allowed ? "allow" : "deny");
    std::printf("rule: %s\n", decision.matched_rule.c_str());
    std::printf("reason: %s\n", decision.reason.c_str());
    if (decision.error) {
        std::printf("error: %s\n", std::string{error_code_to_string(decision.error->code)}.c_str());
    }

    if (decision.allowed) {
        const Value where = merge_where(request->where, decision.row_filter);
        std::printf("where: %s\n", where.to_json().c_str());
        std::printf("read: [%s]\n", join(decision.read_fields).c_str());
        std::printf("write: [%s]\n", join(decision.write_fields).c_str());

        const AllowedFields fields{decision.read_fields, decision.write_fields, decision.denied_fields};
        std::printf("record: %s\n",
                    filter_data_fields(request->data, fields, FieldMode::kRead).to_json().c_str());
    }

    if (audit) {
        audit->flush();
    }
    spdlog::info("rowguard check finished");

    return decision.allowed ? kExitAllowed : kExitDenied;
}
