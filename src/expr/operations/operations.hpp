#pragma once

// ---------------------------------------------------------------------------
// operations.hpp
//
// 카테고리별 built-in 연산 등록 함수와 연산 구현 공용 헬퍼.
// OperationRegistry::defaults() 에서만 호출된다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "expr/operation_registry.hpp"

void register_math_operations(OperationMap& ops);
void register_string_operations(OperationMap& ops);
void register_date_operations(OperationMap& ops);
void register_logic_operations(OperationMap& ops);
void register_comparison_operations(OperationMap& ops);
void register_array_operations(OperationMap& ops);
void register_permission_operations(OperationMap& ops);

namespace ops_detail {

// define_pure / define_contextual
//   ops 에 연산을 등록한다. 같은 이름이 이미 있으면 덮어쓰지 않는다.
void define_pure(OperationMap& ops, std::string name, OperationCategory category, PureOperation fn);
void define_contextual(OperationMap& ops, std::string name, ContextOperation fn);

// arg
//   index 위치 인자. 없으면 null 을 돌려준다 (선택 인자 처리용).
[[nodiscard]] const Value& arg(std::span<const Value> args, std::size_t index);

// require_arity
//   인자 수가 [min, max] 범위 밖이면 kTypeError.
[[nodiscard]] std::optional<EvalError> require_arity(std::string_view       op,
                                                     std::span<const Value> args,
                                                     std::size_t            min,
                                                     std::size_t            max);

// number_arg / string_arg
//   타입이 맞지 않으면 kTypeError.
[[nodiscard]] std::expected<double, EvalError>
number_arg(std::string_view op, std::span<const Value> args, std::size_t index);

[[nodiscard]] std::expected<std::string, EvalError>
string_arg(std::string_view op, std::span<const Value> args, std::size_t index);

// element_field
//   배열 원소에서 field 를 꺼낸다. 원소가 object 가 아니면 원소 자체.
//   field 가 비어 있으면 원소 자체.
[[nodiscard]] Value element_field(const Value& item, const std::string& field);

// resolve_path
//   root 에서 점 구분 경로를 따라간다. 중간에 null/누락이면 null.
[[nodiscard]] Value resolve_path(const Value& root, std::string_view path);

}  // namespace ops_detail
