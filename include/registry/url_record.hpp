/**
 * @file url_record.hpp
 * @brief Registered URL record and batch submission report types
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PhishLedger {

/**
 * @brief One row of the urls relation
 */
struct UrlRecord {
    std::string id;            // uuid, immutable
    std::string url;           // normalized, unique
    std::string domain;        // lower-cased host
    std::string submitted_at;
    std::string source;        // provenance, "manual" by default
    std::string created_at;
    std::string updated_at;
    std::string url_hash;      // BLAKE3-128 hex of url

    nlohmann::json to_json() const;
};

struct UrlSubmission {
    std::string url;
    std::string domain;   // derived from url when empty (batch only)
    std::string source;   // registry default when empty
};

struct BatchItemResult {
    std::string url;
    std::optional<std::string> id;
    std::optional<std::string> error;
};

struct BatchSubmitReport {
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    std::vector<BatchItemResult> results;

    nlohmann::json to_json() const;
};

} // namespace PhishLedger
