// ---------------------------------------------------------------------------
// string_ops.cpp
//
// 문자열 연산: concat upper lower trim length substring contains
//              startsWith endsWith replace split join
//
// [인코딩]
// 바이트 단위로 처리한다. upper/lower 는 ASCII 만 변환하며 멀티바이트
// UTF-8 문자는 그대로 둔다. length/substring 도 바이트 기준 (알려진 한계).
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

// concat/join 용 문자열화. null → "", 문자열은 따옴표 없이.
std::string stringify(const Value& v) {
    if (v.is_null()) {
        return {};
    }
    if (v.is_string()) {
        return v.as_string();
    }
    return v.to_json();
}

// 음수 인덱스는 0 으로, 길이 초과는 길이로 자른다.
std::size_t clamp_index(double idx, std::size_t size) {
    if (std::isnan(idx) || idx <= 0.0) {
        return 0;
    }
    if (idx >= static_cast<double>(size)) {
        return size;
    }
    return static_cast<std::size_t>(idx);
}

template <typename Fn>
PureOperation string_unary(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 1, 1)) {
            return std::unexpected(*err);
        }
        auto s = string_arg(name, args, 0);
        if (!s) {
            return std::unexpected(s.error());
        }
        return Value{fn(std::move(*s))};
    };
}

template <typename Fn>
PureOperation string_predicate(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 2, 2)) {
            return std::unexpected(*err);
        }
        auto s = string_arg(name, args, 0);
        if (!s) {
            return std::unexpected(s.error());
        }
        auto part = string_arg(name, args, 1);
        if (!part) {
            return std::unexpected(part.error());
        }
        return Value{fn(*s, *part)};
    };
}

}  // namespace

void register_string_operations(OperationMap& ops) {
    constexpr auto kString = OperationCategory::kString;

    define_pure(ops, "concat", kString, [](std::span<const Value> args) -> EvalResult {
        std::string out;
        for (const auto& v : args) {
            out += stringify(v);
        }
        return Value{std::move(out)};
    });

    define_pure(ops, "upper", kString, string_unary("upper", [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }));

    define_pure(ops, "lower", kString, string_unary("lower", [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }));

    define_pure(ops, "trim", kString, string_unary("trim", [](std::string s) {
        const auto not_space = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
        s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
        return s;
    }));

    // length: 문자열 길이 또는 배열 원소 수. 그 외는 0.
    define_pure(ops, "length", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("length", args, 1, 1)) {
            return std::unexpected(*err);
        }
        const Value& v = args[0];
        if (v.is_string()) {
            return Value{v.as_string().size()};
        }
        if (v.is_array()) {
            return Value{v.as_array().size()};
        }
        return Value{0};
    });

    // substring(str, start, end?): [start, end)
    define_pure(ops, "substring", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("substring", args, 2, 3)) {
            return std::unexpected(*err);
        }
        auto s = string_arg("substring", args, 0);
        if (!s) {
            return std::unexpected(s.error());
        }
        auto start = number_arg("substring", args, 1);
        if (!start) {
            return std::unexpected(start.error());
        }
        const std::size_t begin = clamp_index(*start, s->size());
        std::size_t end = s->size();
        if (args.size() == 3 && !args[2].is_null()) {
            auto e = number_arg("substring", args, 2);
            if (!e) {
                return std::unexpected(e.error());
            }
            end = clamp_index(*e, s->size());
        }
        if (end <= begin) {
            return Value{std::string{}};
        }
        return Value{s->substr(begin, end - begin)};
    });

    // contains(haystack, needle): 문자열 부분 일치 또는 배열 포함.
    define_pure(ops, "contains", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("contains", args, 2, 2)) {
            return std::unexpected(*err);
        }
        const Value& haystack = args[0];
        if (haystack.is_array()) {
            const auto& items = haystack.as_array();
            return Value{std::find(items.begin(), items.end(), args[1]) != items.end()};
        }
        if (haystack.is_string() && args[1].is_string()) {
            return Value{haystack.as_string().find(args[1].as_string()) != std::string::npos};
        }
        return Value{false};
    });

    define_pure(ops, "startsWith", kString, string_predicate("startsWith",
        [](const std::string& s, const std::string& prefix) { return s.starts_with(prefix); }));

    define_pure(ops, "endsWith", kString, string_predicate("endsWith",
        [](const std::string& s, const std::string& suffix) { return s.ends_with(suffix); }));

    // replace(str, from, to): 모든 출현을 치환한다. from 이 빈 문자열이면 원문 그대로.
    define_pure(ops, "replace", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("replace", args, 3, 3)) {
            return std::unexpected(*err);
        }
        auto s = string_arg("replace", args, 0);
        auto from = string_arg("replace", args, 1);
        auto to = string_arg("replace", args, 2);
        if (!s) { return std::unexpected(s.error()); }
        if (!from) { return std::unexpected(from.error()); }
        if (!to) { return std::unexpected(to.error()); }
        if (from->empty()) {
            return Value{std::move(*s)};
        }
        std::string out;
        std::size_t pos = 0;
        while (true) {
            const auto hit = s->find(*from, pos);
            if (hit == std::string::npos) {
                out.append(*s, pos, std::string::npos);
                break;
            }
            out.append(*s, pos, hit - pos);
            out += *to;
            pos = hit + from->size();
        }
        return Value{std::move(out)};
    });

    // split(str, sep): sep 이 빈 문자열이면 바이트 단위 분할.
    define_pure(ops, "split", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("split", args, 2, 2)) {
            return std::unexpected(*err);
        }
        auto s = string_arg("split", args, 0);
        auto sep = string_arg("split", args, 1);
        if (!s) { return std::unexpected(s.error()); }
        if (!sep) { return std::unexpected(sep.error()); }

        Value::Array parts;
        if (sep->empty()) {
            for (char c : *s) {
                parts.emplace_back(std::string(1, c));
            }
            return Value{std::move(parts)};
        }
        std::size_t pos = 0;
        while (true) {
            const auto hit = s->find(*sep, pos);
            if (hit == std::string::npos) {
                parts.emplace_back(s->substr(pos));
                break;
            }
            parts.emplace_back(s->substr(pos, hit - pos));
            pos = hit + sep->size();
        }
        return Value{std::move(parts)};
    });

    // join(arr, sep?): sep 기본값 ","
    define_pure(ops, "join", kString, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("join", args, 1, 2)) {
            return std::unexpected(*err);
        }
        if (!args[0].is_array()) {
            return Value{std::string{}};
        }
        std::string sep = ",";
        if (args.size() == 2 && !args[1].is_null()) {
            auto s = string_arg("join", args, 1);
            if (!s) {
                return std::unexpected(s.error());
            }
            sep = std::move(*s);
        }
        std::string out;
        bool first = true;
        for (const auto& item : args[0].as_array()) {
            if (!first) {
                out += sep;
            }
            first = false;
            out += stringify(item);
        }
        return Value{std::move(out)};
    });
}
