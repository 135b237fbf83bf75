/**
 * @file analysis_result.cpp
 * @brief Verdict parsing and validation, result serialization
 */

#include <analysis/analysis_result.hpp>
#include <errors.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <limits>

namespace PhishLedger {

namespace {

bool present(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    return it != json.end() && !it->is_null();
}

const nlohmann::json& required(const nlohmann::json& json, const char* key) {
    if (!present(json, key)) {
        throw ValidationError(std::string("verdict field '") + key + "' is required");
    }
    return json.at(key);
}

int to_int(const nlohmann::json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw ValidationError(std::string("verdict field '") + key + "' must be an integer");
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw ValidationError(std::string("verdict field '") + key + "' is out of range");
        }
        return static_cast<int>(u);
    }
    auto v = value.get<long long>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ValidationError(std::string("verdict field '") + key + "' is out of range");
    }
    return static_cast<int>(v);
}

std::string to_str(const nlohmann::json& value, const char* key) {
    if (!value.is_string()) {
        throw ValidationError(std::string("verdict field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

const char* to_string(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::High:   return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low:    return "low";
    }
    return "low";
}

std::optional<ConfidenceLevel> parse_confidence_level(const std::string& value) {
    if (value == "high") return ConfidenceLevel::High;
    if (value == "medium") return ConfidenceLevel::Medium;
    if (value == "low") return ConfidenceLevel::Low;
    return std::nullopt;
}

Verdict Verdict::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ValidationError("verdict must be a JSON object");
    }

    Verdict verdict;

    const auto& phishing = required(json, "is_phishing");
    if (!phishing.is_boolean()) {
        throw ValidationError("verdict field 'is_phishing' must be a boolean");
    }
    verdict.is_phishing = phishing.get<bool>();
    verdict.risk_score = to_int(required(json, "risk_score"), "risk_score");
    verdict.confidence_level = to_str(required(json, "confidence_level"), "confidence_level");

    if (present(json, "analysis_date")) {
        verdict.analysis_date = to_str(json.at("analysis_date"), "analysis_date");
    }
    if (present(json, "virustotal_result")) {
        verdict.virustotal_result = json.at("virustotal_result");
    }
    if (present(json, "heuristic_result")) {
        verdict.heuristic_result = json.at("heuristic_result");
    }
    if (present(json, "analysis_duration_ms")) {
        verdict.analysis_duration_ms = to_int(json.at("analysis_duration_ms"), "analysis_duration_ms");
    }
    if (present(json, "error_log")) {
        verdict.error_log = to_str(json.at("error_log"), "error_log");
    }

    if (present(json, "sources_checked")) {
        const auto& sources = json.at("sources_checked");
        if (sources.is_string()) {
            verdict.sources_checked = split_csv(sources.get<std::string>());
        } else if (sources.is_array()) {
            for (const auto& s : sources) {
                std::string name = trim(to_str(s, "sources_checked"));
                if (!name.empty()) verdict.sources_checked.push_back(name);
            }
        } else {
            throw ValidationError("verdict field 'sources_checked' must be an array or a comma-separated string");
        }
    }

    return verdict;
}

void validate_verdict(const Verdict& verdict) {
    if (verdict.risk_score < MIN_RISK_SCORE || verdict.risk_score > MAX_RISK_SCORE) {
        throw ValidationError("risk_score must be between 0 and 100, got " + std::to_string(verdict.risk_score));
    }
    if (!parse_confidence_level(verdict.confidence_level)) {
        throw ValidationError("confidence_level must be one of high, medium, low; got '" +
                              verdict.confidence_level + "'");
    }
    if (verdict.analysis_duration_ms && *verdict.analysis_duration_ms < 0) {
        throw ValidationError("analysis_duration_ms must not be negative, got " +
                              std::to_string(*verdict.analysis_duration_ms));
    }
    if (verdict.analysis_date) {
        parse_date_bound(*verdict.analysis_date, false);
    }
}

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json json = {
        {"id", id},
        {"url_id", url_id},
        {"analysis_date", analysis_date},
        {"is_phishing", is_phishing},
        {"risk_score", risk_score},
        {"confidence_level", to_string(confidence_level)},
        {"virustotal_result", virustotal_result ? *virustotal_result : nlohmann::json()},
        {"heuristic_result", heuristic_result ? *heuristic_result : nlohmann::json()},
        {"analysis_duration_ms", analysis_duration_ms ? nlohmann::json(*analysis_duration_ms) : nlohmann::json()},
        {"sources_checked", sources_checked},
        {"error_log", error_log ? nlohmann::json(*error_log) : nlohmann::json()},
        {"created_at", created_at}
    };
    return json;
}

} // namespace PhishLedger
