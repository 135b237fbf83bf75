/**
 * @file analysis_stats.cpp
 * @brief Statistics accumulation over analysis results
 */

#include <analysis/analysis_stats.hpp>
#include <utils/logger.hpp>
#include <cmath>

namespace PhishLedger {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

void StatsAccumulator::add(const AnalysisResult& result) {
    ++total_;
    if (result.is_phishing) ++phishing_;
    risk_sum_ += result.risk_score;

    if (result.risk_score < MEDIUM_RISK_THRESHOLD) {
        ++risk_.low;
    } else if (result.risk_score < HIGH_RISK_THRESHOLD) {
        ++risk_.medium;
    } else {
        ++risk_.high;
    }

    ++confidence_[to_string(result.confidence_level)];

    for (const auto& source : result.sources_checked) {
        ++sources_[source];
    }

    if (result.analysis_date.size() >= 10) {
        ++daily_[result.analysis_date.substr(0, 10)];
    }
}

AnalysisStats StatsAccumulator::finish() const {
    AnalysisStats stats;
    stats.total_analyses = total_;
    stats.phishing_detected = phishing_;
    stats.safe_urls = total_ - phishing_;
    stats.risk_distribution = risk_;
    stats.confidence_distribution = confidence_;
    stats.sources_usage = sources_;
    stats.daily_counts.assign(daily_.begin(), daily_.end());

    if (total_ > 0) {
        stats.avg_risk_score = round2(static_cast<double>(risk_sum_) / static_cast<double>(total_));
        stats.phishing_percentage = round2(static_cast<double>(phishing_) / static_cast<double>(total_) * 100.0);
    }
    return stats;
}

nlohmann::json AnalysisStats::to_json() const {
    nlohmann::json daily = nlohmann::json::array();
    for (const auto& [date, count] : daily_counts) {
        daily.push_back({{"date", date}, {"count", count}});
    }

    return {
        {"total_analyses", total_analyses},
        {"phishing_detected", phishing_detected},
        {"safe_urls", safe_urls},
        {"avg_risk_score", avg_risk_score},
        {"phishing_percentage", phishing_percentage},
        {"risk_distribution", {
            {"low", risk_distribution.low},
            {"medium", risk_distribution.medium},
            {"high", risk_distribution.high}
        }},
        {"confidence_distribution", confidence_distribution},
        {"sources_usage", sources_usage},
        {"daily_counts", daily}
    };
}

AnalysisStats collect_statistics(AnalysisRecorder& recorder, const std::optional<DateRange>& range) {
    StatsAccumulator accumulator;
    recorder.for_each_result(range, [&](const AnalysisResult& result) { accumulator.add(result); });

    AnalysisStats stats = accumulator.finish();
    Logger::debug("Statistics over " + std::to_string(stats.total_analyses) + " analyses" +
                  (range ? " from " + range->start + " to " + range->end : std::string()));
    return stats;
}

} // namespace PhishLedger
