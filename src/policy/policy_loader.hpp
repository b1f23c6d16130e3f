#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 EngineConfig + PolicySet 으로 변환하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 반드시 기존 정책을 유지하거나 서비스를 차단해야 한다.
// - All-or-nothing: 정책 하나라도 잘못되면 전체 로드가 실패한다.
//   부분적으로 파싱된 정책 집합을 반환하지 않는다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp, policy_engine.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
//
// [보안 고려사항]
// - YAML 파일 경로는 config 에서만 지정하고 사용자 입력을 직접 사용 금지.
// - 경로는 로드 전에 canonical 로 정규화한다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것
//   (민감 정보 노출 방지).
//
// [스칼라 타입 규칙]
// 따옴표 스칼라 → string. plain 스칼라는 true/false → bool,
// null/~ → null, 숫자 → number, 그 외 → string.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

#include "policy/policy_engine.hpp"  // AccessRequest
#include "policy/rule.hpp"           // EngineConfig, PolicySet

// ---------------------------------------------------------------------------
// LoadedPolicies
//   load()/parse() 의 결과. policies 는 PolicyEngine 에 그대로 전달한다.
// ---------------------------------------------------------------------------
struct LoadedPolicies {
    EngineConfig                     engine{};
    std::shared_ptr<const PolicySet> policies{};
};

class PolicyLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 정책 집합으로 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 스키마 불일치, 중복 (resource, action),
    //   registry 에 없는 allowed_operations 항목 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<LoadedPolicies, std::string>
    load(const std::filesystem::path& config_path);

    // parse
    //   YAML 문자열에서 load() 와 동일하게 파싱한다.
    [[nodiscard]] static std::expected<LoadedPolicies, std::string>
    parse(const std::string& yaml_text);

    // parse_expression
    //   단일 표현식 YAML ({type: ..., ...}) 을 트리로 변환한다.
    [[nodiscard]] static std::expected<ExprPtr, std::string>
    parse_expression(const std::string& yaml_text);

    // load_request
    //   CLI 요청 파일 (resource, action, user, data, where) 을 읽는다.
    [[nodiscard]] static std::expected<AccessRequest, std::string>
    load_request(const std::filesystem::path& request_path);
};
