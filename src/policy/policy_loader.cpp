// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 EngineConfig + PolicySet 으로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 오류 메시지에는 YAML 내 위치 (policies[2].allow.args[0]) 를 포함한다.
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - engine 섹션 누락 시 기본값(구조체 기본값)을 적용한다.
//
// [표현식 YAML 형태]
//   {type: literal,    value: <any>}
//   {type: field,      path: "a.b"}
//   {type: operation,  op: name, args: [<expr>...]}
//   {type: condition,  op: eq, left: <expr>, right: <expr>}   (exists 는 right 생략 가능)
//   {type: permission, check: hasRole, args: [admin]}
//
// [로드 시점 사전 검증]
// 각 allow 표현식을 engine.budget 기준으로 정적 검증한다. 실패해도 로드는
// 계속하되 경고를 남긴다 (해당 정책은 실행 시 항상 차단된다).
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <set>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "expr/operation_registry.hpp"
#include "sandbox/safe_evaluator.hpp"

namespace {

using LoadError = std::unexpected<std::string>;

LoadError fail(std::string_view where, std::string_view what) {
    return std::unexpected(fmt::format("{}: {}", where, what));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: plain 스칼라를 number 로 해석 (전체 문자열이 유한 실수일 때만)
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    double value{0.0};
    const char* begin = text.data();
    const char* end   = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드 → Value
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Value, std::string> to_value(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) {
        return Value{};
    }
    if (node.IsScalar()) {
        const std::string& text = node.Scalar();
        if (node.Tag() == "!") {
            return Value{text};  // 따옴표 스칼라
        }
        if (text == "true" || text == "True" || text == "TRUE") {
            return Value{true};
        }
        if (text == "false" || text == "False" || text == "FALSE") {
            return Value{false};
        }
        if (text == "null" || text == "Null" || text == "NULL" || text == "~") {
            return Value{};
        }
        if (const auto number = parse_number(text)) {
            return Value{*number};
        }
        return Value{text};
    }
    if (node.IsSequence()) {
        Value::Array items;
        items.reserve(node.size());
        std::size_t i = 0;
        for (const auto& item : node) {
            auto v = to_value(item, fmt::format("{}[{}]", where, i++));
            if (!v) {
                return v;
            }
            items.push_back(std::move(*v));
        }
        return Value{std::move(items)};
    }
    if (node.IsMap()) {
        Value::Object members;
        for (const auto& kv : node) {
            if (!kv.first.IsScalar()) {
                return fail(where, "map keys must be scalars");
            }
            const std::string key = kv.first.Scalar();
            auto v = to_value(kv.second, where + "." + key);
            if (!v) {
                return v;
            }
            members.insert_or_assign(key, std::move(*v));
        }
        return Value{std::move(members)};
    }
    return fail(where, "unsupported YAML node");
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 필수 문자열 키
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::string, std::string>
require_string(const YAML::Node& parent, const char* key, const std::string& where) {
    const YAML::Node node = parent[key];
    if (!node || !node.IsScalar()) {
        return fail(where, fmt::format("missing or non-scalar '{}'", key));
    }
    return node.Scalar();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다. 스칼라가 아닌 항목은 오류.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
read_string_sequence(const YAML::Node& node, const std::string& where) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return fail(where, "expected a sequence of strings");
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return fail(where, "expected a sequence of strings");
        }
        result.push_back(item.Scalar());
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 표현식 노드 파싱 (재귀)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ExprPtr, std::string> parse_expr(const YAML::Node& node, const std::string& where) {
    if (!node || !node.IsMap()) {
        return fail(where, "expression must be a map with a 'type' key");
    }
    auto type = require_string(node, "type", where);
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "literal") {
        auto value = to_value(node["value"], where + ".value");
        if (!value) {
            return std::unexpected(value.error());
        }
        return expr::literal(std::move(*value));
    }

    if (*type == "field") {
        auto path = require_string(node, "path", where);
        if (!path) {
            return std::unexpected(path.error());
        }
        if (path->empty()) {
            return fail(where, "field path must not be empty");
        }
        return expr::field(std::move(*path));
    }

    if (*type == "operation") {
        auto op = require_string(node, "op", where);
        if (!op) {
            return std::unexpected(op.error());
        }
        const YAML::Node args_node = node["args"];
        std::vector<ExprPtr> args;
        if (args_node && !args_node.IsNull()) {
            if (!args_node.IsSequence()) {
                return fail(where + ".args", "expected a sequence of expressions");
            }
            std::size_t i = 0;
            for (const auto& item : args_node) {
                auto child = parse_expr(item, fmt::format("{}.args[{}]", where, i++));
                if (!child) {
                    return child;
                }
                args.push_back(std::move(*child));
            }
        }
        return expr::op(std::move(*op), std::move(args));
    }

    if (*type == "condition") {
        auto op = require_string(node, "op", where);
        if (!op) {
            return std::unexpected(op.error());
        }
        if (!is_comparator(*op)) {
            return fail(where, fmt::format("unknown condition operator '{}'", *op));
        }
        auto left = parse_expr(node["left"], where + ".left");
        if (!left) {
            return left;
        }
        ExprPtr right;
        const YAML::Node right_node = node["right"];
        if (right_node || *op != "exists") {
            auto parsed = parse_expr(right_node, where + ".right");
            if (!parsed) {
                return parsed;
            }
            right = std::move(*parsed);
        }
        return expr::cond(std::move(*op), std::move(*left), std::move(right));
    }

    if (*type == "permission") {
        auto check = require_string(node, "check", where);
        if (!check) {
            return std::unexpected(check.error());
        }
        auto args = read_string_sequence(node["args"], where + ".args");
        if (!args) {
            return std::unexpected(args.error());
        }
        return expr::permission(std::move(*check), std::move(*args));
    }

    return fail(where, fmt::format("unknown expression type '{}'", *type));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: UserInfo 파싱 (요청 파일용)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<UserInfo, std::string> parse_user(const YAML::Node& node, const std::string& where) {
    UserInfo user;
    if (!node || node.IsNull()) {
        return user;  // 익명
    }
    if (!node.IsMap()) {
        return fail(where, "user must be a map");
    }
    if (node["id"] && node["id"].IsScalar()) {
        user.id = node["id"].Scalar();
    }
    auto roles = read_string_sequence(node["roles"], where + ".roles");
    if (!roles) {
        return std::unexpected(roles.error());
    }
    user.roles = std::move(*roles);
    if (node["permissions"] && !node["permissions"].IsNull()) {
        auto perms = read_string_sequence(node["permissions"], where + ".permissions");
        if (!perms) {
            return std::unexpected(perms.error());
        }
        user.permissions = std::move(*perms);
    }
    return user;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: fields 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::optional<FieldSpec>, std::string>
parse_fields(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) {
        return std::optional<FieldSpec>{};
    }
    if (!node.IsMap()) {
        return fail(where, "fields must be a map");
    }
    FieldSpec spec;
    for (const char* key : {"read", "write"}) {
        const YAML::Node list = node[key];
        if (!list || list.IsNull()) {
            continue;
        }
        auto names = read_string_sequence(list, fmt::format("{}.{}", where, key));
        if (!names) {
            return std::unexpected(names.error());
        }
        (std::string_view{key} == "read" ? spec.read : spec.write) = std::move(*names);
    }
    auto deny = read_string_sequence(node["deny"], where + ".deny");
    if (!deny) {
        return std::unexpected(deny.error());
    }
    spec.deny = std::move(*deny);
    return std::optional<FieldSpec>{std::move(spec)};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: engine 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<EngineConfig, std::string> parse_engine(const YAML::Node& node) {
    EngineConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return fail("engine", "must be a map");
    }

    if (node["log_level"]) {
        static constexpr std::array<std::string_view, 6> kLevels = {
            "trace", "debug", "info", "warn", "error", "critical"};
        cfg.log_level = node["log_level"].as<std::string>();
        if (std::find(kLevels.begin(), kLevels.end(), cfg.log_level) == kLevels.end()) {
            return fail("engine.log_level", fmt::format("unknown level '{}'", cfg.log_level));
        }
    }

    const YAML::Node budget = node["budget"];
    if (!budget || budget.IsNull()) {
        return cfg;
    }
    if (!budget.IsMap()) {
        return fail("engine.budget", "must be a map");
    }
    if (budget["max_depth"]) {
        cfg.budget.max_depth = budget["max_depth"].as<std::size_t>();
    }
    if (budget["max_operations"]) {
        cfg.budget.max_operations = budget["max_operations"].as<std::size_t>();
    }
    if (budget["timeout_ms"]) {
        cfg.budget.timeout = std::chrono::milliseconds{budget["timeout_ms"].as<std::uint32_t>()};
    }
    if (budget["allowed_operations"] && !budget["allowed_operations"].IsNull()) {
        auto names = read_string_sequence(budget["allowed_operations"], "engine.budget.allowed_operations");
        if (!names) {
            return std::unexpected(names.error());
        }
        const auto& registry = OperationRegistry::defaults();
        std::set<std::string, std::less<>> allowed;
        for (auto& name : *names) {
            if (!registry.contains(name)) {
                return fail("engine.budget.allowed_operations", fmt::format("unknown operation '{}'", name));
            }
            allowed.insert(std::move(name));
        }
        cfg.budget.allowed_operations = std::move(allowed);
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 정책 1건 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Policy, std::string> parse_policy(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        return fail(where, "policy must be a map");
    }
    Policy policy;

    auto resource = require_string(node, "resource", where);
    if (!resource) {
        return std::unexpected(resource.error());
    }
    policy.resource = std::move(*resource);

    auto action_name = require_string(node, "action", where);
    if (!action_name) {
        return std::unexpected(action_name.error());
    }
    const auto action = action_from_string(*action_name);
    if (!action) {
        return fail(where, fmt::format("invalid action '{}' (expected create|read|update|delete)", *action_name));
    }
    policy.action = *action;

    auto allow = parse_expr(node["allow"], where + ".allow");
    if (!allow) {
        return std::unexpected(allow.error());
    }
    policy.allow = std::move(*allow);

    auto fields = parse_fields(node["fields"], where + ".fields");
    if (!fields) {
        return std::unexpected(fields.error());
    }
    policy.fields = std::move(*fields);
    return policy;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 루트 노드 → LoadedPolicies
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<LoadedPolicies, std::string> build(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return std::unexpected(std::string{"top-level YAML node must be a map"});
    }

    LoadedPolicies loaded;
    try {
        auto engine = parse_engine(root["engine"]);
        if (!engine) {
            return std::unexpected(engine.error());
        }
        loaded.engine = std::move(*engine);

        const YAML::Node list = root["policies"];
        if (!list || !list.IsSequence()) {
            return std::unexpected(std::string{"'policies' must be a sequence"});
        }
        std::vector<Policy> policies;
        policies.reserve(list.size());
        std::size_t i = 0;
        for (const auto& item : list) {
            auto policy = parse_policy(item, fmt::format("policies[{}]", i++));
            if (!policy) {
                return std::unexpected(policy.error());
            }
            policies.push_back(std::move(*policy));
        }

        auto set = PolicySet::create(std::move(policies));
        if (!set) {
            return std::unexpected(set.error());
        }
        loaded.policies = std::make_shared<const PolicySet>(std::move(*set));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("YAML error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    }

    // 사전 검증: 실행 시 항상 차단될 정책을 조기에 알린다.
    const SafeEvaluator checker{loaded.engine.budget};
    for (const auto& policy : loaded.policies->policies()) {
        if (auto err = checker.validate(*policy.allow)) {
            spdlog::warn("policy_loader: policy {} will always be denied: {} ({})",
                         policy.rule_id(), err->message, error_code_to_string(err->code));
        }
    }
    if (loaded.policies->empty()) {
        spdlog::warn("policy_loader: policy set is empty, every request will be denied");
    }
    return loaded;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<LoadedPolicies, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 정책 구성 (all-or-nothing)
    auto loaded = build(root);
    if (!loaded) {
        const std::string err = fmt::format("policy_loader: '{}': {}", canonical_path.string(), loaded.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: policy loaded successfully, policies={}, log_level={}",
                 loaded->policies->size(), loaded->engine.log_level);
    return loaded;
}

std::expected<LoadedPolicies, std::string> PolicyLoader::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("policy_loader: YAML parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    }
    auto loaded = build(root);
    if (!loaded) {
        return std::unexpected("policy_loader: " + loaded.error());
    }
    return loaded;
}

std::expected<ExprPtr, std::string> PolicyLoader::parse_expression(const std::string& yaml_text) {
    try {
        return parse_expr(YAML::Load(yaml_text), "expression");
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("policy_loader: YAML parse error at line {}, col {}: {}",
                                           e.mark.line + 1, e.mark.column + 1, e.what()));
    }
}

// ---------------------------------------------------------------------------
// PolicyLoader::load_request 구현
//
// 요청 파일 형태:
//   resource: Track
//   action: read
//   user: {id: user-123, roles: [user], permissions: [tracks.read]}
//   data: {...}
//   where: {...}
// ---------------------------------------------------------------------------
std::expected<AccessRequest, std::string>
PolicyLoader::load_request(const std::filesystem::path& request_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(request_path, ec);
    if (ec) {
        return std::unexpected(fmt::format("policy_loader: cannot resolve request path '{}': {}",
                                           request_path.string(), ec.message()));
    }

    try {
        const YAML::Node root = YAML::LoadFile(canonical_path.string());
        if (!root || !root.IsMap()) {
            return std::unexpected(std::string{"policy_loader: request must be a YAML map"});
        }

        AccessRequest request;
        auto resource = require_string(root, "resource", "request");
        if (!resource) {
            return std::unexpected(resource.error());
        }
        request.resource = std::move(*resource);

        auto action_name = require_string(root, "action", "request");
        if (!action_name) {
            return std::unexpected(action_name.error());
        }
        const auto action = action_from_string(*action_name);
        if (!action) {
            return std::unexpected(fmt::format("request: invalid action '{}'", *action_name));
        }
        request.action = *action;

        auto user = parse_user(root["user"], "request.user");
        if (!user) {
            return std::unexpected(user.error());
        }
        request.user = std::move(*user);

        auto data = to_value(root["data"], "request.data");
        if (!data) {
            return std::unexpected(data.error());
        }
        request.data = data->is_null() ? Value{Value::Object{}} : std::move(*data);

        auto where = to_value(root["where"], "request.where");
        if (!where) {
            return std::unexpected(where.error());
        }
        request.where = std::move(*where);
        return request;
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("policy_loader: cannot read request '{}': {}",
                                           canonical_path.string(), e.what()));
    }
}
