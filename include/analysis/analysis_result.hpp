/**
 * @file analysis_result.hpp
 * @brief Verdict input and stored analysis result types
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PhishLedger {

enum class ConfidenceLevel {
    High,
    Medium,
    Low
};

const char* to_string(ConfidenceLevel level);

/**
 * @brief Exact match against "high", "medium", "low"
 */
std::optional<ConfidenceLevel> parse_confidence_level(const std::string& value);

constexpr int MIN_RISK_SCORE = 0;
constexpr int MAX_RISK_SCORE = 100;

/**
 * @brief Outcome of one analysis run, as produced by the external analyzers
 *
 * virustotal_result and heuristic_result are opaque and stored verbatim.
 */
struct Verdict {
    bool is_phishing = false;
    int risk_score = 0;
    std::string confidence_level;
    std::optional<std::string> analysis_date;     // store's now() when absent
    std::optional<nlohmann::json> virustotal_result;
    std::optional<nlohmann::json> heuristic_result;
    std::optional<int> analysis_duration_ms;
    std::vector<std::string> sources_checked;
    std::optional<std::string> error_log;

    /**
     * @brief Parse an analyzer workflow payload
     *
     * is_phishing, risk_score and confidence_level are required.
     * sources_checked may be an array of strings or a comma-separated string.
     * JSON null is treated as an absent optional field.
     * @throws ValidationError on missing or mistyped fields
     */
    static Verdict from_json(const nlohmann::json& json);
};

/**
 * @brief Check the write-time invariants of a verdict
 *
 * risk_score in [0, 100], confidence_level one of high/medium/low,
 * analysis_duration_ms non-negative, analysis_date well-formed.
 * @throws ValidationError describing the first violation
 */
void validate_verdict(const Verdict& verdict);

/**
 * @brief One immutable row of the analysis_results relation
 */
struct AnalysisResult {
    std::string id;
    std::string url_id;
    std::string analysis_date;
    bool is_phishing = false;
    int risk_score = 0;
    ConfidenceLevel confidence_level = ConfidenceLevel::Low;
    std::optional<nlohmann::json> virustotal_result;
    std::optional<nlohmann::json> heuristic_result;
    std::optional<int> analysis_duration_ms;
    std::vector<std::string> sources_checked;
    std::optional<std::string> error_log;
    std::string created_at;

    nlohmann::json to_json() const;
};

} // namespace PhishLedger
