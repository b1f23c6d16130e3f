#pragma once

// ---------------------------------------------------------------------------
// field_filter.hpp
//
// 필드 단위 읽기/쓰기 권한 계산 및 레코드 필터링.
//
// [deny 우선]
// deny 에 있는 필드는 read/write 선언 순서와 무관하게 항상 제거된다.
// read/write 가 ["*"] 이면 목록에서 제거할 수 없으므로 denied 를 함께
// 들고 다니며, 레코드에 적용하는 시점에 다시 제거한다.
//
// [쓰기 경로]
// 쓰기 payload 에 허용 목록 밖의 필드 (예: role, ownerId) 를 끼워 넣어
// 권한을 상승시키는 시도를 막는 마지막 방어선이다. 결과 레코드에는 원본에
// 없던 필드가 절대 생기지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

#include "common/value.hpp"
#include "policy/rule.hpp"

struct AllowedFields {
    std::vector<std::string> read{};
    std::vector<std::string> write{};
    std::vector<std::string> denied{};
};

enum class FieldMode : std::uint8_t {
    kRead  = 0,
    kWrite = 1,
};

// filter_fields
//   read/write 기본값 ["*"], deny 항목 제거. 순서는 선언 순서를 유지한다.
[[nodiscard]] AllowedFields filter_fields(const FieldSpec& spec);

// filter_data_fields
//   data 의 키 중 allowed 에 있는 것만 남긴 새 object.
//   allowed 에 "*" 가 있으면 data 그대로. data 가 object 가 아니면 {}.
[[nodiscard]] Value filter_data_fields(const Value& data, const std::vector<std::string>& allowed);

// filter_data_fields (mode)
//   mode 에 해당하는 목록을 적용한 뒤 denied 를 제거한다 ("*" 를 통과해도 deny 우선).
[[nodiscard]] Value filter_data_fields(const Value& data, const AllowedFields& fields, FieldMode mode);
