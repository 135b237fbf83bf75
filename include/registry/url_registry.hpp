/**
 * @file url_registry.hpp
 * @brief Deduplicating registry of submitted URLs (urls relation)
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <registry/url_record.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PhishLedger {

/**
 * @brief Assigns one identity per normalized URL
 *
 * Uniqueness is enforced by the store's UNIQUE(url) constraint, so
 * concurrent submitters of the same URL converge on one record. submit()
 * must not be called inside an open transaction: a lost insert race aborts
 * the enclosing transaction before the re-lookup can run.
 */
class UrlRegistry {
public:
    static constexpr size_t MAX_BATCH_SIZE = 100;

    explicit UrlRegistry(PostgresConnection& db, std::string default_source = "manual");

    /**
     * @brief Register a URL, or return the id it already has
     *
     * Resubmitting a known URL returns its id unchanged; the existing
     * record, including its source, is left as is.
     * @throws ValidationError if url or domain is blank
     */
    std::string submit(const std::string& url, const std::string& domain, const std::string& source = "");

    /**
     * @brief Register up to MAX_BATCH_SIZE URLs
     *
     * Items with a blank domain get extract_domain(url). Invalid items are
     * reported in the result instead of aborting the batch.
     * @throws ValidationError if the batch is empty or too large
     */
    BatchSubmitReport submit_batch(const std::vector<UrlSubmission>& submissions);

    /**
     * @brief Find by URL (normalized before lookup)
     */
    std::optional<UrlRecord> lookup_by_url(const std::string& url);

    std::optional<UrlRecord> lookup_by_id(const std::string& id);

    /**
     * @brief All URLs of a domain, most recently submitted first
     */
    std::vector<UrlRecord> list_by_domain(const std::string& domain);

    /**
     * @brief Refresh updated_at, optionally replacing the source tag
     * @throws NotFoundError if no record has this id
     */
    void touch(const std::string& id, const std::optional<std::string>& source = std::nullopt);

    /**
     * @brief Administrative delete; the URL's analysis results go with it
     * @return true if a record was deleted
     */
    bool remove(const std::string& id);

    const std::string& default_source() const { return default_source_; }

private:
    std::string submit_normalized(const std::string& normalized_url, const std::string& domain,
                                  const std::string& source, const std::string& url_hash);
    std::optional<std::string> find_id(const std::string& normalized_url);
    std::optional<UrlRecord> select_one(const std::string& where_clause, const std::string& param);
    std::string resolve_source(const std::string& source) const;

    static UrlRecord parse_row(const PostgresConnection::Row& row);

    PostgresConnection& db_;
    std::string default_source_;
};

} // namespace PhishLedger
