#include "policy/field_filter.hpp"

#include <algorithm>

namespace {

bool contains(const std::vector<std::string>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::vector<std::string> without_denied(const std::optional<std::vector<std::string>>& declared,
                                        const std::vector<std::string>&                deny) {
    if (!declared) {
        return {std::string{kAllFields}};
    }
    std::vector<std::string> out;
    for (const auto& name : *declared) {
        if (!contains(deny, name)) {
            out.push_back(name);
        }
    }
    return out;
}

}  // namespace

AllowedFields filter_fields(const FieldSpec& spec) {
    return AllowedFields{
        without_denied(spec.read, spec.deny),
        without_denied(spec.write, spec.deny),
        spec.deny,
    };
}

Value filter_data_fields(const Value& data, const std::vector<std::string>& allowed) {
    if (!data.is_object()) {
        return Value{Value::Object{}};
    }
    if (contains(allowed, kAllFields)) {
        return data;
    }
    Value::Object out;
    for (const auto& [key, value] : data.as_object()) {
        if (contains(allowed, key)) {
            out.emplace(key, value);
        }
    }
    return Value{std::move(out)};
}

Value filter_data_fields(const Value& data, const AllowedFields& fields, FieldMode mode) {
    const auto& allowed = mode == FieldMode::kRead ? fields.read : fields.write;
    const Value filtered = filter_data_fields(data, allowed);
    if (fields.denied.empty() || !filtered.is_object()) {
        return filtered;
    }
    Value::Object out;
    for (const auto& [key, value] : filtered.as_object()) {
        if (!contains(fields.denied, key)) {
            out.emplace(key, value);
        }
    }
    return Value{std::move(out)};
}
