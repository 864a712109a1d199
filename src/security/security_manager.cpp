/**
 * @file security_manager.cpp
 * @brief SecurityManager implementation
 *
 * @date 2025
 */

#include "capsule/security/security_manager.hpp"
#include "capsule/utils/hash_utils.hpp"
#include "capsule/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace capsule {
namespace security {

namespace {

constexpr std::size_t kCodePreviewLength = 200;
constexpr std::size_t kLogPreviewLength = 50;
constexpr std::size_t kResultPreviewLength = 1000;

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    gmtime_r(&time_t_value, &tm_value);

    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// CONFIGURATION
// ============================================================================

SecurityConfig SecurityConfig::Default() {
    SecurityConfig config;
    config.blocked_patterns = {
        R"(\b__\w+__\b)",                   // dunder access (__import__, __class__, ...)
        R"(\bimport\s+[A-Za-z_])",
        R"(\bfrom\s+[\w.]+\s+import\b)",
        R"(\bexec\s*\()",
        R"(\beval\s*\()",
        R"(\bcompile\s*\()",
        R"(\bopen\s*\()",
        R"(\bos\.)",
        R"(\bsys\.)",
        R"(\bsubprocess\b)",
        R"(\bsocket\.)",
        R"(\bglobals\s*\()",
        R"(\blocals\s*\()"
    };
    return config;
}

void to_json(nlohmann::json& j, const SecurityConfig& config) {
    j = nlohmann::json{
        {"maxCodeLength", config.max_code_length},
        {"maxExecutionsPerMinute", config.max_executions_per_minute},
        {"maxResultSize", config.max_result_size},
        {"blockedPatterns", config.blocked_patterns}
    };
}

void from_json(const nlohmann::json& j, SecurityConfig& config) {
    config.max_code_length = j.value("maxCodeLength", config.max_code_length);
    config.max_executions_per_minute = j.value("maxExecutionsPerMinute", config.max_executions_per_minute);
    config.max_result_size = j.value("maxResultSize", config.max_result_size);
    if (j.contains("blockedPatterns")) {
        config.blocked_patterns = j.at("blockedPatterns").get<std::vector<std::string>>();
    }
}

void to_json(nlohmann::json& j, const ExecutionRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"clientId", record.client_id ? nlohmann::json(*record.client_id) : nlohmann::json()},
        {"timestamp", FormatTimestamp(record.timestamp)},
        {"codePreview", record.code_preview},
        {"codeSha256", record.code_sha256},
        {"result", record.result},
        {"readonly", record.readonly}
    };
}

// ============================================================================
// SECURITY MANAGER
// ============================================================================

SecurityManager::SecurityManager(SecurityConfig config, Clock clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    patterns_.reserve(config_.blocked_patterns.size());
    for (const auto& source : config_.blocked_patterns) {
        patterns_.emplace_back(source, std::regex(source, std::regex::ECMAScript));
    }
}

ValidationResult SecurityManager::ValidateCode(const std::string& code) const {
    ValidationResult validation;

    if (utils::StringUtils::Trim(code).empty()) {
        validation.errors.push_back("Code must be a non-empty string");
        return validation;
    }

    if (code.size() > config_.max_code_length) {
        validation.errors.push_back("Code exceeds maximum length of " +
                                    std::to_string(config_.max_code_length) + " bytes");
        return validation;
    }

    for (const auto& [source, pattern] : patterns_) {
        if (std::regex_search(code, pattern)) {
            validation.errors.push_back("Blocked pattern detected: " + source);
        }
    }

    validation.valid = validation.errors.empty();
    return validation;
}

bool SecurityManager::CheckRateLimit(const std::string& client_id) {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(rate_mutex_);

    auto it = rate_limits_.find(client_id);
    if (it == rate_limits_.end() || now >= it->second.reset_time) {
        rate_limits_[client_id] = RateLimitEntry{1, now + kRateLimitWindow};
        return true;
    }

    if (it->second.count >= config_.max_executions_per_minute) {
        spdlog::warn("Rate limit reached for client '{}'", client_id);
        return false;
    }

    ++it->second.count;
    return true;
}

std::size_t SecurityManager::GetRateLimitRemaining(const std::string& client_id) const {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(rate_mutex_);

    auto it = rate_limits_.find(client_id);
    if (it == rate_limits_.end() || now >= it->second.reset_time) {
        return config_.max_executions_per_minute;
    }
    return config_.max_executions_per_minute > it->second.count
        ? config_.max_executions_per_minute - it->second.count
        : 0;
}

void SecurityManager::CleanupRateLimits() {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(rate_mutex_);

    for (auto it = rate_limits_.begin(); it != rate_limits_.end();) {
        if (now >= it->second.reset_time) {
            it = rate_limits_.erase(it);
        } else {
            ++it;
        }
    }
}

nlohmann::json SecurityManager::SanitizeResult(const nlohmann::json& result) const {
    std::string serialized;
    try {
        serialized = result.dump();
    } catch (const nlohmann::json::type_error& e) {
        spdlog::debug("Result serialization failed: {}", e.what());
        return nlohmann::json{
            {"_error", "Result could not be serialized"},
            {"_type", result.type_name()}
        };
    }

    if (serialized.size() <= config_.max_result_size) {
        return result;
    }

    return nlohmann::json{
        {"_truncated", true},
        {"_originalSize", serialized.size()},
        {"_maxSize", config_.max_result_size},
        {"preview", utils::StringUtils::Truncate(serialized, kResultPreviewLength, "") + "..."}
    };
}

ExecutionRecord SecurityManager::CreateExecutionRecord(const std::string& code,
                                                       const core::SandboxResult& result,
                                                       bool readonly,
                                                       const std::optional<std::string>& client_id) const {
    ExecutionRecord record;
    record.id = utils::HashUtils::GenerateUuid();
    record.client_id = client_id;
    record.timestamp = std::chrono::system_clock::now();
    record.code_preview = utils::StringUtils::Truncate(code, kCodePreviewLength);
    record.code_sha256 = utils::HashUtils::ComputeSHA256(code);
    record.result = result;
    record.readonly = readonly;
    return record;
}

void SecurityManager::AuditLog(const ExecutionRecord& record) const {
    const std::string client = record.client_id.value_or("anonymous");
    const auto& metrics = record.result.metrics;

    if (record.result.success) {
        spdlog::info("Code execution completed: {}... [id={} client={} readonly={} wall={}ms memory={}MB]",
                     utils::StringUtils::Truncate(record.code_preview, kLogPreviewLength, ""),
                     record.id, client, record.readonly,
                     metrics.wall_time_ms, metrics.memory_used_mb);
    } else {
        spdlog::warn("Code execution failed: {} [id={} client={} readonly={} wall={}ms memory={}MB]",
                     record.result.error.value_or("unknown error"),
                     record.id, client, record.readonly,
                     metrics.wall_time_ms, metrics.memory_used_mb);
    }
}

} // namespace security
} // namespace capsule
