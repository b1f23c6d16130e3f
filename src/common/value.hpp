#pragma once

// ---------------------------------------------------------------------------
// value.hpp
//
// 표현식 언어가 다루는 동적 값 타입 (JSON 유사).
// null | bool | number(double) | string | array | object
//
// [불변성 설계]
// - array/object 는 std::shared_ptr<const ...> 로 보관한다.
//   Value 복사는 저장소를 공유할 뿐이며, 어떤 보유자도 공유된 내용을
//   변경할 수 없다 (persistent structure).
// - 따라서 평가 컨텍스트를 Value 로 구성하면 연산 함수가 컨텍스트를
//   되써서 권한을 상승시키는 경로가 타입 수준에서 차단된다.
//
// [결정성]
// - object 는 std::map (정렬된 키) 을 사용한다. 직렬화/순회 결과가
//   항상 동일하므로 row filter / 감사 로그 비교가 안정적이다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ValueType
//   Value 가 담고 있는 값의 종류.
// ---------------------------------------------------------------------------
enum class ValueType : std::uint8_t {
    kNull   = 0,
    kBool   = 1,
    kNumber = 2,
    kString = 3,
    kArray  = 4,
    kObject = 5,
};

class Value {
public:
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    Value() = default;  // null
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(std::int64_t n) : data_(static_cast<double>(n)) {}
    Value(std::size_t n) : data_(static_cast<double>(n)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string{s}) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string{s}) {}
    Value(Array arr) : data_(std::make_shared<const Array>(std::move(arr))) {}
    Value(Object obj) : data_(std::make_shared<const Object>(std::move(obj))) {}

    // 편의 생성: Value::array({1, 2}), Value::object({{"id", "u1"}})
    [[nodiscard]] static Value array(std::initializer_list<Value> items);
    [[nodiscard]] static Value object(std::initializer_list<std::pair<const std::string, Value>> items);

    [[nodiscard]] ValueType type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept   { return type() == ValueType::kNull; }
    [[nodiscard]] bool is_bool() const noexcept   { return type() == ValueType::kBool; }
    [[nodiscard]] bool is_number() const noexcept { return type() == ValueType::kNumber; }
    [[nodiscard]] bool is_string() const noexcept { return type() == ValueType::kString; }
    [[nodiscard]] bool is_array() const noexcept  { return type() == ValueType::kArray; }
    [[nodiscard]] bool is_object() const noexcept { return type() == ValueType::kObject; }

    // 타입이 맞지 않으면 std::bad_variant_access. 호출 전 is_xxx() 확인 필수.
    [[nodiscard]] bool               as_bool() const;
    [[nodiscard]] double             as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Array&       as_array() const;
    [[nodiscard]] const Object&      as_object() const;

    // get
    //   object 의 멤버를 조회한다. object 가 아니거나 키가 없으면 nullptr.
    [[nodiscard]] const Value* get(std::string_view key) const;

    // truthy
    //   엔진 공통 진리값 규칙.
    //   false, null, 0, NaN, "", [] → false. 그 외 (object 포함) → true.
    [[nodiscard]] bool truthy() const noexcept;

    // to_json
    //   compact JSON 직렬화 (감사 로그, CLI 출력용).
    //   정수값 number 는 소수점 없이 출력한다 (8.0 → 8).
    [[nodiscard]] std::string to_json() const;

    // 구조적 동등성: 타입과 내용이 같으면 같다.
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    using Storage = std::variant<
        std::monostate,
        bool,
        double,
        std::string,
        std::shared_ptr<const Array>,
        std::shared_ptr<const Object>>;

    Storage data_{};
};

// type_name
//   오류 메시지용 타입 이름 ("null", "number", ...).
[[nodiscard]] std::string_view type_name(ValueType type) noexcept;
