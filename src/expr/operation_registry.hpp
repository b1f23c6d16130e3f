#pragma once

// ---------------------------------------------------------------------------
// operation_registry.hpp
//
// 연산 이름 → 순수 함수 매핑.
//
// [설계 원칙]
// - 기본 registry 는 프로세스에서 한 번만 생성되고 이후 읽기 전용이다.
// - custom 연산은 기본 registry 를 변경하지 않고 병합된 사본을 만든다
//   (with_custom). 공유 프로세스에서 테넌트 간 연산 누수가 없다.
// - custom 연산이 built-in 이름과 충돌하면 조용히 덮어쓰지 않고
//   kDuplicateOperation 을 반환한다.
//
// [연산 함수 계약]
// - 인자는 이미 평가된 Value 이다 (eager, 왼쪽→오른쪽).
// - I/O, 시계 읽기, 전역 상태 변경 금지. 동일 입력 → 동일 출력.
// - 권한 계열 연산(ContextOperation)만 EvaluationContext 를 받는다.
//   컨텍스트는 const-ref 로만 전달되며 변경 경로가 없다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"

using PureOperation    = std::function<EvalResult(std::span<const Value> args)>;
using ContextOperation = std::function<EvalResult(std::span<const Value> args,
                                                  const EvaluationContext& context)>;

enum class OperationCategory : std::uint8_t {
    kMath       = 0,
    kString     = 1,
    kDate       = 2,
    kLogic      = 3,
    kComparison = 4,
    kArray      = 5,
    kPermission = 6,
    kCustom     = 7,
};

// ---------------------------------------------------------------------------
// OperationDef
//   fn 이 ContextOperation 이면 evaluator 가 컨텍스트를 추가로 전달한다.
// ---------------------------------------------------------------------------
struct OperationDef {
    std::variant<PureOperation, ContextOperation> fn{};
    OperationCategory                             category{OperationCategory::kCustom};

    [[nodiscard]] bool needs_context() const noexcept {
        return std::holds_alternative<ContextOperation>(fn);
    }

    [[nodiscard]] EvalResult invoke(std::span<const Value>   args,
                                    const EvaluationContext& context) const;
};

using OperationMap = std::map<std::string, OperationDef, std::less<>>;

// Condition 노드에서 사용할 수 있는 비교 연산자.
// 각 비교는 Operation 과 동일한 registry 함수를 재사용한다.
inline constexpr std::array<std::string_view, 8> kComparators = {
    "eq", "ne", "gt", "lt", "gte", "lte", "in", "exists",
};

[[nodiscard]] bool is_comparator(std::string_view name) noexcept;

class OperationRegistry {
public:
    // defaults
    //   built-in 연산 전체 (math/string/date/logic/comparison/array/permission).
    //   최초 호출 시 한 번 생성되며 이후 같은 인스턴스를 공유한다.
    [[nodiscard]] static const OperationRegistry& defaults();

    // with_custom
    //   현재 registry 에 custom 연산을 병합한 새 registry 를 반환한다.
    //   이름 충돌 시 std::unexpected(kDuplicateOperation). this 는 변경되지 않는다.
    [[nodiscard]] std::expected<OperationRegistry, EvalError>
    with_custom(const OperationMap& custom) const;

    // find
    //   이름으로 연산 조회. 없으면 nullptr.
    [[nodiscard]] const OperationDef* find(std::string_view name) const;

    [[nodiscard]] bool        contains(std::string_view name) const { return find(name) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return ops_ ? ops_->size() : 0; }
    [[nodiscard]] std::vector<std::string> names() const;

private:
    explicit OperationRegistry(std::shared_ptr<const OperationMap> ops) : ops_(std::move(ops)) {}

    std::shared_ptr<const OperationMap> ops_;
};
