// ---------------------------------------------------------------------------
// date_ops.cpp
//
// 날짜 연산: parseDate formatDate addDays diffDays year month day
//            isBefore isAfter
//
// [입력 형식]
// - ISO-8601 문자열: "YYYY-MM-DD" 또는 "YYYY-MM-DDTHH:MM[:SS[.fff]][Z]"
//   (시간대 오프셋 미지원, 항상 UTC 로 해석)
// - number: epoch milliseconds (|ms| <= 8.64e15, 그 밖은 kTypeError)
//
// [순수성]
// 현재 시각(now)을 읽는 연산은 제공하지 않는다. 평가는 같은 입력에 대해
// 항상 같은 결과를 내야 하므로, 기준 시각이 필요하면 호출자가
// params/globals 로 넘긴다.
// ---------------------------------------------------------------------------

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "expr/operations/operations.hpp"

using namespace ops_detail;

namespace {

constexpr double kMillisPerDay = 86'400'000.0;

// epoch ms 허용 범위 (±1억 일)
constexpr double kMaxEpochMillis = 8.64e15;

// year_month_day 로 표현 가능한 일 수 범위
constexpr auto kMinCivilDays =
    std::chrono::sys_days{std::chrono::year::min() / std::chrono::January / 1}.time_since_epoch().count();
constexpr auto kMaxCivilDays =
    std::chrono::sys_days{std::chrono::year::max() / std::chrono::December / 31}.time_since_epoch().count();

// 고정 길이 10진수 필드 파싱. 자릿수가 정확히 width 가 아니면 실패.
std::optional<int> parse_fixed(std::string_view text, std::size_t pos, std::size_t width) {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    const char* begin = text.data() + pos;
    const char* end   = begin + width;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// ISO-8601 → epoch ms. 형식 오류 또는 존재하지 않는 날짜면 std::nullopt.
std::optional<double> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    const auto y = parse_fixed(text, 0, 4);
    if (!y || text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto mo = parse_fixed(text, 5, 2);
    const auto d  = parse_fixed(text, 8, 2);
    if (!mo || !d) {
        return std::nullopt;
    }
    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    int hh = 0, mm = 0, ss = 0, millis = 0;
    std::size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        const auto h = parse_fixed(text, pos + 1, 2);
        const auto m = parse_fixed(text, pos + 4, 2);
        if (!h || !m || text.size() < pos + 6 || text[pos + 3] != ':') {
            return std::nullopt;
        }
        hh = *h;
        mm = *m;
        pos += 6;
        if (pos < text.size() && text[pos] == ':') {
            const auto s = parse_fixed(text, pos + 1, 2);
            if (!s) {
                return std::nullopt;
            }
            ss = *s;
            pos += 3;
            if (pos < text.size() && text[pos] == '.') {
                // 소수 초: 최대 3자리까지만 반영 (밀리초 정밀도)
                std::size_t digits = 0;
                ++pos;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                    if (digits < 3) {
                        millis = millis * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) {
                    return std::nullopt;
                }
                for (; digits < 3; ++digits) {
                    millis *= 10;
                }
            }
        }
        if (hh > 23 || mm > 59 || ss > 59) {
            return std::nullopt;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const sys_days days{ymd};
    const auto tp = days + hours{hh} + minutes{mm} + seconds{ss} + milliseconds{millis};
    return static_cast<double>(duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

// 인자를 epoch ms 로 변환한다.
std::expected<double, EvalError>
date_arg(std::string_view op, std::span<const Value> args, std::size_t index) {
    const Value& v = arg(args, index);
    if (v.is_number() && std::isfinite(v.as_number())) {
        if (std::fabs(v.as_number()) > kMaxEpochMillis) {
            return make_error(EvalErrorCode::kTypeError,
                              fmt::format("{}: date {} is out of range", op, v.as_number()),
                              std::string{op});
        }
        return v.as_number();
    }
    if (v.is_string()) {
        if (const auto ms = parse_iso8601(v.as_string())) {
            return *ms;
        }
        return make_error(EvalErrorCode::kTypeError,
                          fmt::format("{}: invalid date string '{}'", op, v.as_string()),
                          std::string{op});
    }
    return make_error(EvalErrorCode::kTypeError,
                      fmt::format("{}: argument {} must be a date, got {}", op, index, type_name(v.type())),
                      std::string{op});
}

struct CivilTime {
    std::chrono::year_month_day ymd;
    std::chrono::hh_mm_ss<std::chrono::milliseconds> hms;
};

// epoch_ms 는 date_arg 를 거쳐 ±kMaxEpochMillis 안에 있어야 한다.
// 달력 연도 범위를 벗어나면 kTypeError.
std::expected<CivilTime, EvalError> to_civil(std::string_view op, double epoch_ms) {
    using namespace std::chrono;
    const sys_time<milliseconds> tp{milliseconds{static_cast<std::int64_t>(std::floor(epoch_ms))}};
    const auto dp = floor<days>(tp);
    const auto day_count = dp.time_since_epoch().count();
    if (day_count < kMinCivilDays || day_count > kMaxCivilDays) {
        return make_error(EvalErrorCode::kTypeError,
                          fmt::format("{}: date {} is outside the calendar range", op, epoch_ms),
                          std::string{op});
    }
    return CivilTime{year_month_day{dp}, hh_mm_ss<milliseconds>{tp - dp}};
}

template <typename Fn>
PureOperation date_unary(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 1, 1)) {
            return std::unexpected(*err);
        }
        auto ms = date_arg(name, args, 0);
        if (!ms) {
            return std::unexpected(ms.error());
        }
        auto civil = to_civil(name, *ms);
        if (!civil) {
            return std::unexpected(civil.error());
        }
        return Value{fn(*civil)};
    };
}

template <typename Fn>
PureOperation date_binary(std::string name, Fn fn) {
    return [name = std::move(name), fn](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity(name, args, 2, 2)) {
            return std::unexpected(*err);
        }
        auto a = date_arg(name, args, 0);
        if (!a) {
            return std::unexpected(a.error());
        }
        auto b = date_arg(name, args, 1);
        if (!b) {
            return std::unexpected(b.error());
        }
        return Value{fn(*a, *b)};
    };
}

}  // namespace

void register_date_operations(OperationMap& ops) {
    constexpr auto kDate = OperationCategory::kDate;

    define_pure(ops, "parseDate", kDate, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("parseDate", args, 1, 1)) {
            return std::unexpected(*err);
        }
        auto ms = date_arg("parseDate", args, 0);
        if (!ms) {
            return std::unexpected(ms.error());
        }
        return Value{*ms};
    });

    // formatDate(date, style?): style "date" → "YYYY-MM-DD", 기본값은 전체 ISO-8601.
    define_pure(ops, "formatDate", kDate, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("formatDate", args, 1, 2)) {
            return std::unexpected(*err);
        }
        auto ms = date_arg("formatDate", args, 0);
        if (!ms) {
            return std::unexpected(ms.error());
        }
        const auto civil_result = to_civil("formatDate", *ms);
        if (!civil_result) {
            return std::unexpected(civil_result.error());
        }
        const CivilTime& civil = *civil_result;
        const int  y  = static_cast<int>(civil.ymd.year());
        const auto mo = static_cast<unsigned>(civil.ymd.month());
        const auto d  = static_cast<unsigned>(civil.ymd.day());

        const Value& style = arg(args, 1);
        if (style.is_string() && style.as_string() == "date") {
            return Value{fmt::format("{:04}-{:02}-{:02}", y, mo, d)};
        }
        return Value{fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                                 y, mo, d,
                                 civil.hms.hours().count(),
                                 civil.hms.minutes().count(),
                                 civil.hms.seconds().count(),
                                 civil.hms.subseconds().count())};
    });

    // addDays(date, n) → epoch ms
    define_pure(ops, "addDays", kDate, [](std::span<const Value> args) -> EvalResult {
        if (auto err = require_arity("addDays", args, 2, 2)) {
            return std::unexpected(*err);
        }
        auto ms = date_arg("addDays", args, 0);
        if (!ms) {
            return std::unexpected(ms.error());
        }
        auto n = number_arg("addDays", args, 1);
        if (!n) {
            return std::unexpected(n.error());
        }
        return Value{*ms + *n * kMillisPerDay};
    });

    // diffDays(a, b) = b - a (일 단위, 0 방향 절삭)
    define_pure(ops, "diffDays", kDate, date_binary("diffDays", [](double a, double b) {
        return std::trunc((b - a) / kMillisPerDay);
    }));

    define_pure(ops, "isBefore", kDate, date_binary("isBefore", [](double a, double b) { return a < b; }));
    define_pure(ops, "isAfter",  kDate, date_binary("isAfter",  [](double a, double b) { return a > b; }));

    define_pure(ops, "year", kDate, date_unary("year", [](const CivilTime& c) {
        return static_cast<int>(c.ymd.year());
    }));
    define_pure(ops, "month", kDate, date_unary("month", [](const CivilTime& c) {
        return static_cast<int>(static_cast<unsigned>(c.ymd.month()));
    }));
    define_pure(ops, "day", kDate, date_unary("day", [](const CivilTime& c) {
        return static_cast<int>(static_cast<unsigned>(c.ymd.day()));
    }));
}
