/**
 * @file security_manager.hpp
 * @brief Pre-execution validation, rate limiting and audit records
 *
 * The SecurityManager guards the executor service, not the sandbox itself:
 * - ValidateCode() rejects oversized code and source matching blocked
 *   patterns before any interpreter sees it
 * - CheckRateLimit() applies a fixed one-minute window per client
 * - SanitizeResult() caps the size of what is handed back to callers
 * - CreateExecutionRecord() / AuditLog() produce the audit trail
 *
 * @date 2025
 */

#pragma once

#include "capsule/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace capsule {
namespace security {

/**
 * @struct SecurityConfig
 * @brief Limits enforced by the SecurityManager
 */
struct SecurityConfig {
    std::size_t max_code_length{50 * 1024};          ///< Bytes (50KB default)
    std::size_t max_executions_per_minute{60};       ///< Per client id
    std::size_t max_result_size{10 * 1024 * 1024};   ///< Serialized bytes (10MB default)
    std::vector<std::string> blocked_patterns;       ///< ECMAScript regular expressions

    /// Defaults including the standard blocked pattern list
    static SecurityConfig Default();
};

void to_json(nlohmann::json& j, const SecurityConfig& config);
void from_json(const nlohmann::json& j, SecurityConfig& config);

/**
 * @struct ValidationResult
 * @brief Outcome of ValidateCode()
 */
struct ValidationResult {
    bool valid{false};
    std::vector<std::string> errors;
};

/**
 * @struct ExecutionRecord
 * @brief Audit entry for one execution
 */
struct ExecutionRecord {
    std::string id;                                  ///< UUID v4
    std::optional<std::string> client_id;            ///< Caller identity, if known
    std::chrono::system_clock::time_point timestamp;
    std::string code_preview;                        ///< First 200 characters
    std::string code_sha256;                         ///< Fingerprint of the full code
    core::SandboxResult result;
    bool readonly{false};
};

void to_json(nlohmann::json& j, const ExecutionRecord& record);

/**
 * @class SecurityManager
 * @brief Validation, rate limiting and auditing for code execution requests
 *
 * **Usage**:
 * @code
 * SecurityManager security;
 * auto validation = security.ValidateCode(code);
 * if (validation.valid && security.CheckRateLimit(client)) {
 *     auto result = pool.Execute(code, capabilities);
 *     result.result = security.SanitizeResult(result.result);
 *     security.AuditLog(security.CreateExecutionRecord(code, result, true, client));
 * }
 * @endcode
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class SecurityManager {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /// Length of one rate-limit window
    static constexpr std::chrono::milliseconds kRateLimitWindow{60000};

    /**
     * @param config Limits and blocked patterns
     * @param clock Time source for rate limiting (steady_clock::now by default)
     * @throws std::regex_error if a blocked pattern does not compile
     */
    explicit SecurityManager(SecurityConfig config = SecurityConfig::Default(), Clock clock = {});

    /**
     * @brief Check code before it is executed
     *
     * Empty and oversized code stop validation immediately; otherwise every
     * blocked pattern that matches contributes one error.
     */
    ValidationResult ValidateCode(const std::string& code) const;

    /**
     * @brief Count one execution against @p client_id
     * @return false if the client already used its quota for the window
     */
    bool CheckRateLimit(const std::string& client_id);

    std::size_t GetRateLimitRemaining(const std::string& client_id) const;

    /// Drop rate-limit entries whose window has ended
    void CleanupRateLimits();

    /**
     * @brief Replace oversized results by a truncated preview
     *
     * Results whose serialization exceeds `max_result_size` become
     * `{_truncated, _originalSize, _maxSize, preview}`.
     */
    nlohmann::json SanitizeResult(const nlohmann::json& result) const;

    ExecutionRecord CreateExecutionRecord(const std::string& code,
                                          const core::SandboxResult& result,
                                          bool readonly,
                                          const std::optional<std::string>& client_id = std::nullopt) const;

    /// Info on success, warning on failure
    void AuditLog(const ExecutionRecord& record) const;

    const SecurityConfig& Config() const { return config_; }

private:
    struct RateLimitEntry {
        std::size_t count{0};
        std::chrono::steady_clock::time_point reset_time;
    };

    SecurityConfig config_;
    std::vector<std::pair<std::string, std::regex>> patterns_;
    Clock clock_;

    mutable std::mutex rate_mutex_;
    std::map<std::string, RateLimitEntry> rate_limits_;
};

} // namespace security
} // namespace capsule
