#include "policy/row_filter.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kAndKey = "AND";
constexpr std::string_view kOrKey  = "OR";

// 저장소 필터에서 조합자로 해석되는 키. 이 이름의 필드 leaf 는 조합자와 구분되지 않는다.
constexpr std::array<std::string_view, 3> kReservedKeys = {"AND", "OR", "NOT"};

bool is_reserved_field(std::string_view path) {
    const auto first = path.substr(0, path.find('.'));
    return std::find(kReservedKeys.begin(), kReservedKeys.end(), first) != kReservedKeys.end();
}

// leaf 값은 스칼라만 허용한다. 배열/객체는 저장소 쪽에서 연산자 필터
// ({in: ...}, {not: ...}) 로 해석되어 allow 보다 좁아질 수 있다.
RowFilter scalar_leaf(const std::string& path, const Value& value) {
    if (value.is_array() || value.is_object()) {
        return RowFilter::unconstrained();
    }
    return RowFilter::leaf(path, value);
}

bool has_wildcard(std::string_view path) {
    const auto parts = split_path(path);
    return std::find(parts.begin(), parts.end(), kWildcardSegment) != parts.end();
}

// 레코드 쪽 필드로 쓸 수 있는 경로인가 (user.* 아님, 와일드카드 없음)
bool is_record_field(const Expression* e) {
    const auto* f = e != nullptr ? e->as<FieldAccessExpr>() : nullptr;
    return f != nullptr && !f->path.empty() && !is_user_path(f->path) && !has_wildcard(f->path);
}

// user.* 경로를 UserInfo 에 대해 해석한다. 와일드카드가 있으면 std::nullopt.
std::optional<Value> resolve_user_field(const Expression* e, const UserInfo& user) {
    const auto* f = e != nullptr ? e->as<FieldAccessExpr>() : nullptr;
    if (f == nullptr || !is_user_path(f->path) || has_wildcard(f->path)) {
        return std::nullopt;
    }
    const auto parts = split_path(f->path);
    Value current = user.to_value();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        const Value* next = current.get(parts[i]);
        if (next == nullptr || next->is_null()) {
            return Value{};
        }
        current = *next;
    }
    return current;
}

RowFilter extract_equality(const ConditionExpr& node, const UserInfo& user) {
    const Expression* sides[2] = {node.left.get(), node.right.get()};
    for (int i = 0; i < 2; ++i) {
        const Expression* field_side = sides[i];
        const Expression* other_side = sides[1 - i];
        if (!is_record_field(field_side) || other_side == nullptr) {
            continue;
        }
        const std::string& path = field_side->as<FieldAccessExpr>()->path;
        if (is_reserved_field(path)) {
            return RowFilter::unconstrained();
        }
        if (const auto resolved = resolve_user_field(other_side, user)) {
            return scalar_leaf(path, *resolved);
        }
        if (const auto* lit = other_side->as<LiteralExpr>()) {
            return scalar_leaf(path, lit->value);
        }
    }
    return RowFilter::unconstrained();
}

RowFilter extract_and(const OperationExpr& node, const UserInfo& user) {
    std::vector<RowFilter> parts;
    for (const auto& arg : node.args) {
        if (!arg) {
            continue;
        }
        auto part = extract_row_filter(*arg, user);
        if (!part.is_unconstrained()) {
            parts.push_back(std::move(part));
        }
    }
    if (parts.empty()) {
        return RowFilter::unconstrained();
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return RowFilter::all_of(std::move(parts));
}

RowFilter extract_or(const OperationExpr& node, const UserInfo& user) {
    std::vector<RowFilter> parts;
    for (const auto& arg : node.args) {
        if (!arg) {
            return RowFilter::unconstrained();
        }
        auto part = extract_row_filter(*arg, user);
        if (part.is_unconstrained()) {
            // 제약 없는 갈래가 있으면 모든 행이 후보가 된다.
            return RowFilter::unconstrained();
        }
        parts.push_back(std::move(part));
    }
    if (parts.empty()) {
        // or() 는 항상 false 로 평가된다.
        return RowFilter::match_none();
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return RowFilter::any_of(std::move(parts));
}

Value lookup(const Value& record, std::string_view path) {
    const Value* current = &record;
    for (const auto& part : split_path(path)) {
        current = current->get(part);
        if (current == nullptr) {
            return Value{};
        }
    }
    return *current;
}

}  // namespace

RowFilter RowFilter::match_none() {
    RowFilter f;
    f.kind_ = Kind::kOr;
    return f;
}

RowFilter RowFilter::leaf(std::string field, Value value) {
    RowFilter f;
    f.kind_  = Kind::kLeaf;
    f.field_ = std::move(field);
    f.value_ = std::move(value);
    return f;
}

RowFilter RowFilter::all_of(std::vector<RowFilter> children) {
    RowFilter f;
    f.kind_     = Kind::kAnd;
    f.children_ = std::move(children);
    return f;
}

RowFilter RowFilter::any_of(std::vector<RowFilter> children) {
    RowFilter f;
    f.kind_     = Kind::kOr;
    f.children_ = std::move(children);
    return f;
}

bool RowFilter::matches(const Value& record) const {
    switch (kind_) {
        case Kind::kAll:
            return true;
        case Kind::kLeaf:
            return lookup(record, field_) == value_;
        case Kind::kAnd:
            return std::all_of(children_.begin(), children_.end(),
                               [&](const RowFilter& c) { return c.matches(record); });
        case Kind::kOr:
            return std::any_of(children_.begin(), children_.end(),
                               [&](const RowFilter& c) { return c.matches(record); });
    }
    return false;
}

Value RowFilter::to_value() const {
    switch (kind_) {
        case Kind::kAll:
            return Value{Value::Object{}};
        case Kind::kLeaf:
            return Value{Value::Object{{field_, value_}}};
        case Kind::kAnd:
        case Kind::kOr: {
            Value::Array items;
            items.reserve(children_.size());
            for (const auto& c : children_) {
                items.push_back(c.to_value());
            }
            const std::string key{kind_ == Kind::kAnd ? kAndKey : kOrKey};
            return Value{Value::Object{{key, Value{std::move(items)}}}};
        }
    }
    return Value{Value::Object{}};
}

bool operator==(const RowFilter& lhs, const RowFilter& rhs) {
    return lhs.kind_ == rhs.kind_ && lhs.field_ == rhs.field_ && lhs.value_ == rhs.value_ &&
           lhs.children_ == rhs.children_;
}

RowFilter extract_row_filter(const Expression& expr, const UserInfo& user) {
    return std::visit(
        [&](const auto& node) -> RowFilter {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ConditionExpr>) {
                if (node.op == "eq") {
                    return extract_equality(node, user);
                }
                return RowFilter::unconstrained();
            } else if constexpr (std::is_same_v<T, OperationExpr>) {
                if (node.op == "and") {
                    return extract_and(node, user);
                }
                if (node.op == "or") {
                    return extract_or(node, user);
                }
                spdlog::debug("row_filter: operation '{}' not reducible, no row constraint", node.op);
                return RowFilter::unconstrained();
            } else {
                // Literal / FieldAccess / Permission: 행과 무관하거나 술어로 옮길 수 없음
                return RowFilter::unconstrained();
            }
        },
        expr.node());
}

Value merge_where(const Value& where, const RowFilter& filter) {
    const bool where_empty = where.is_null() || (where.is_object() && where.as_object().empty());
    if (where_empty) {
        return filter.to_value();
    }
    if (filter.is_unconstrained()) {
        return where;
    }
    return Value{Value::Object{{std::string{kAndKey}, Value::array({where, filter.to_value()})}}};
}
