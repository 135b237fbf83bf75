/**
 * @file url_registry.cpp
 * @brief URL registry: deduplicating submit, lookups, touch and remove
 */

#include <registry/url_registry.hpp>
#include <database/sql_format.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/url.hpp>

namespace PhishLedger {

namespace {

std::string select_columns() {
    return "SELECT id, url, domain, " + iso_timestamp_sql("submitted_at") +
           ", COALESCE(source, ''), " + iso_timestamp_sql("created_at") + ", " +
           iso_timestamp_sql("updated_at") + ", COALESCE(url_hash, '') FROM urls ";
}

} // namespace

nlohmann::json UrlRecord::to_json() const {
    return {
        {"id", id},
        {"url", url},
        {"domain", domain},
        {"submitted_at", submitted_at},
        {"source", source},
        {"created_at", created_at},
        {"updated_at", updated_at},
        {"url_hash", url_hash}
    };
}

nlohmann::json BatchSubmitReport::to_json() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json item = {{"url", r.url}, {"status", r.id ? "success" : "error"}};
        if (r.id) item["id"] = *r.id;
        if (r.error) item["error"] = *r.error;
        items.push_back(std::move(item));
    }
    return {
        {"total_urls", total},
        {"successful", successful},
        {"failed", failed},
        {"results", items}
    };
}

UrlRegistry::UrlRegistry(PostgresConnection& db, std::string default_source)
    : db_(db), default_source_(std::move(default_source)) {
    if (trim(default_source_).empty()) default_source_ = "manual";
}

std::string UrlRegistry::resolve_source(const std::string& source) const {
    std::string trimmed = trim(source);
    return trimmed.empty() ? default_source_ : trimmed;
}

std::string UrlRegistry::submit(const std::string& url, const std::string& domain, const std::string& source) {
    std::string normalized = normalize_url(url);
    if (normalized.empty()) {
        throw ValidationError("url must not be empty");
    }

    std::string normalized_domain = to_lower(trim(domain));
    if (normalized_domain.empty()) {
        throw ValidationError("domain must not be empty for url " + normalized);
    }

    return submit_normalized(normalized, normalized_domain, resolve_source(source),
                             BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(normalized)));
}

std::string UrlRegistry::submit_normalized(const std::string& normalized_url, const std::string& domain,
                                           const std::string& source, const std::string& url_hash) {
    if (auto existing = find_id(normalized_url)) {
        Logger::debug("URL already registered: " + normalized_url + " -> " + *existing);
        return *existing;
    }

    try {
        auto id = db_.query_single(
            "INSERT INTO urls (url, domain, source, url_hash) VALUES ($1, $2, $3, $4) RETURNING id",
            {normalized_url, domain, source, url_hash});
        if (!id) {
            throw StorageError("INSERT INTO urls returned no id for " + normalized_url);
        }
        Logger::info("Registered " + normalized_url + " as " + *id + " (source: " + source + ")");
        return *id;
    } catch (const ConflictError&) {
        // Another submitter inserted the same URL between our lookup and insert
        Logger::warn("Concurrent submission of " + normalized_url + ", resolving to the existing record");
        if (auto existing = find_id(normalized_url)) {
            return *existing;
        }
        throw;
    }
}

BatchSubmitReport UrlRegistry::submit_batch(const std::vector<UrlSubmission>& submissions) {
    if (submissions.empty()) {
        throw ValidationError("batch must contain at least one URL");
    }
    if (submissions.size() > MAX_BATCH_SIZE) {
        throw ValidationError("batch of " + std::to_string(submissions.size()) +
                              " URLs exceeds the limit of " + std::to_string(MAX_BATCH_SIZE));
    }

    std::vector<std::string> normalized;
    normalized.reserve(submissions.size());
    for (const auto& s : submissions) {
        normalized.push_back(normalize_url(s.url));
    }
    auto hashes = BLAKE3Pipeline::hash_batch(normalized);

    BatchSubmitReport report;
    report.total = submissions.size();

    for (size_t i = 0; i < submissions.size(); ++i) {
        BatchItemResult item;
        item.url = submissions[i].url;

        std::string domain = to_lower(trim(submissions[i].domain));
        if (domain.empty()) domain = extract_domain(normalized[i]);

        if (normalized[i].empty()) {
            item.error = "url must not be empty";
        } else if (domain.empty()) {
            item.error = "could not determine domain for url " + normalized[i];
        } else {
            try {
                item.id = submit_normalized(normalized[i], domain, resolve_source(submissions[i].source),
                                            BLAKE3Pipeline::to_hex(hashes[i]));
            } catch (const ValidationError& e) {
                item.error = e.what();
            }
        }

        if (item.id) {
            ++report.successful;
        } else {
            ++report.failed;
        }
        report.results.push_back(std::move(item));
    }

    Logger::info("Batch submission: " + std::to_string(report.successful) + "/" +
                 std::to_string(report.total) + " URLs registered");
    return report;
}

std::optional<std::string> UrlRegistry::find_id(const std::string& normalized_url) {
    return db_.query_single("SELECT id FROM urls WHERE url = $1", {normalized_url});
}

std::optional<UrlRecord> UrlRegistry::select_one(const std::string& where_clause, const std::string& param) {
    std::optional<UrlRecord> record;
    db_.query(select_columns() + where_clause, {param}, [&](const PostgresConnection::Row& row) {
        record = parse_row(row);
    });
    return record;
}

std::optional<UrlRecord> UrlRegistry::lookup_by_url(const std::string& url) {
    std::string normalized = normalize_url(url);
    if (normalized.empty()) return std::nullopt;
    return select_one("WHERE url = $1", normalized);
}

std::optional<UrlRecord> UrlRegistry::lookup_by_id(const std::string& id) {
    if (!is_uuid(id)) return std::nullopt;
    return select_one("WHERE id = $1::uuid", id);
}

std::vector<UrlRecord> UrlRegistry::list_by_domain(const std::string& domain) {
    std::string normalized_domain = to_lower(trim(domain));
    if (normalized_domain.empty()) {
        throw ValidationError("domain must not be empty");
    }

    std::vector<UrlRecord> records;
    db_.query(select_columns() + "WHERE domain = $1 ORDER BY submitted_at DESC, id DESC",
              {normalized_domain},
              [&](const PostgresConnection::Row& row) { records.push_back(parse_row(row)); });

    Logger::debug("Domain " + normalized_domain + ": " + std::to_string(records.size()) + " URLs");
    return records;
}

void UrlRegistry::touch(const std::string& id, const std::optional<std::string>& source) {
    std::string new_source = source ? trim(*source) : "";

    size_t updated = 0;
    if (is_uuid(id)) {
        updated = db_.execute(
            "UPDATE urls SET updated_at = now(), source = COALESCE(NULLIF($2, ''), source) WHERE id = $1::uuid",
            {id, new_source});
    }
    if (updated == 0) {
        throw NotFoundError("No URL with id " + id);
    }
}

bool UrlRegistry::remove(const std::string& id) {
    if (!is_uuid(id)) return false;

    size_t deleted = db_.execute("DELETE FROM urls WHERE id = $1::uuid", {id});
    if (deleted > 0) {
        Logger::info("Removed URL " + id + " and its analysis results");
    }
    return deleted > 0;
}

UrlRecord UrlRegistry::parse_row(const PostgresConnection::Row& row) {
    if (row.size() < 8) {
        throw StorageError("urls row has " + std::to_string(row.size()) + " columns, expected 8");
    }

    UrlRecord record;
    record.id = row[0];
    record.url = row[1];
    record.domain = row[2];
    record.submitted_at = row[3];
    record.source = row[4];
    record.created_at = row[5];
    record.updated_at = row[6];
    record.url_hash = row[7];
    return record;
}

} // namespace PhishLedger
