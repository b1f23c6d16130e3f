// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/value.hpp"

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 리터럴 (따옴표 포함, 이스케이프 처리)
//   Value::to_json 의 이스케이프 규칙을 그대로 사용한다.
// ---------------------------------------------------------------------------
static std::string json_string(const std::string& str) {
    return Value{str}.to_json();
}

static std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += json_string(items[i]);
    }
    out += ']';
    return out;
}

LogLevel log_level_from_string(const std::string& name) noexcept {
    if (name == "debug" || name == "trace") {
        return LogLevel::kDebug;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
//
// spdlog registry 이름은 인스턴스마다 고유하게 만든다 (테스트에서 여러
// 인스턴스가 동시에 존재할 수 있음).
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         to_stdout)
    : min_level_(min_level)
    , log_path_(log_path) {
    static std::atomic<std::uint32_t> instance_counter{0};
    name_ = "rowguard_audit_" + std::to_string(instance_counter.fetch_add(1));

    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>(name_, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 본문만 출력
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(name_);
    }
}

// ---------------------------------------------------------------------------
// log_access: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_access(const AccessLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"access","user_id":)" << json_string(entry.user_id)
         << R"(,"roles":)" << json_string_array(entry.roles)
         << R"(,"resource":)" << json_string(entry.resource)
         << R"(,"action":)" << json_string(entry.action)
         << R"(,"allowed":)" << (entry.allowed ? "true" : "false")
         << R"(,"matched_rule":)" << json_string(entry.matched_rule);
    if (!entry.row_filter_json.empty()) {
        // 이미 직렬화된 JSON 을 그대로 삽입
        json << R"(,"row_filter":)" << entry.row_filter_json;
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_deny: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_deny(const DenyLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kWarn) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"access_denied","user_id":)" << json_string(entry.user_id)
         << R"(,"resource":)" << json_string(entry.resource)
         << R"(,"action":)" << json_string(entry.action)
         << R"(,"matched_rule":)" << json_string(entry.matched_rule)
         << R"(,"reason":)" << json_string(entry.reason);
    if (!entry.error_code.empty()) {
        json << R"(,"error_code":)" << json_string(entry.error_code);
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_security: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_security(const SecurityLog& entry) {
    if (!logger_) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"security_violation","user_id":)" << json_string(entry.user_id)
         << R"(,"resource":)" << json_string(entry.resource)
         << R"(,"action":)" << json_string(entry.action)
         << R"(,"error_code":)" << json_string(entry.error_code)
         << R"(,"message":)" << json_string(entry.message)
         << R"(,"location":)" << json_string(entry.location)
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->error(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
