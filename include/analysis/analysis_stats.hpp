/**
 * @file analysis_stats.hpp
 * @brief Aggregate reporting over recorded analysis results
 */

#pragma once

#include <analysis/analysis_recorder.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PhishLedger {

// Risk bands: low < 40 <= medium < 70 <= high
constexpr int MEDIUM_RISK_THRESHOLD = 40;
constexpr int HIGH_RISK_THRESHOLD = 70;

struct RiskDistribution {
    size_t low = 0;
    size_t medium = 0;
    size_t high = 0;
};

struct AnalysisStats {
    size_t total_analyses = 0;
    size_t phishing_detected = 0;
    size_t safe_urls = 0;
    double avg_risk_score = 0.0;       // rounded to 2 decimals
    double phishing_percentage = 0.0;  // rounded to 2 decimals
    RiskDistribution risk_distribution;
    std::map<std::string, size_t> confidence_distribution;
    std::map<std::string, size_t> sources_usage;
    std::vector<std::pair<std::string, size_t>> daily_counts;  // ascending by date

    nlohmann::json to_json() const;
};

/**
 * @brief Folds results into AnalysisStats one at a time
 */
class StatsAccumulator {
public:
    void add(const AnalysisResult& result);
    AnalysisStats finish() const;

private:
    size_t total_ = 0;
    size_t phishing_ = 0;
    long long risk_sum_ = 0;
    RiskDistribution risk_;
    std::map<std::string, size_t> confidence_ = {{"low", 0}, {"medium", 0}, {"high", 0}};
    std::map<std::string, size_t> sources_;
    std::map<std::string, size_t> daily_;
};

/**
 * @brief Statistics over all results, or over the results inside `range`
 */
AnalysisStats collect_statistics(AnalysisRecorder& recorder, const std::optional<DateRange>& range = std::nullopt);

double round2(double value);

} // namespace PhishLedger
