/**
 * @file analysis_recorder.hpp
 * @brief Append-only store of analysis results (analysis_results relation)
 */

#pragma once

#include <analysis/analysis_result.hpp>
#include <database/postgres_connection.hpp>
#include <utils/time.hpp>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace PhishLedger {

/**
 * @brief Results of one URL, newest analysis_date first
 *
 * Lazy: nothing is read until begin() is called. Restartable: every begin()
 * starts again from the newest result. Rows are fetched page by page with
 * keyset pagination on (analysis_date, id), one round trip per page.
 * Rows stored without an analysis_date come last, with an empty date.
 * The connection must outlive the history and its iterators.
 */
class ResultHistory {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AnalysisResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const AnalysisResult*;
        using reference = const AnalysisResult&;

        iterator() = default;

        reference operator*() const { return page_[index_]; }
        pointer operator->() const { return &page_[index_]; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const { return at_end() && other.at_end(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ResultHistory;
        explicit iterator(const ResultHistory* owner);

        bool at_end() const { return owner_ == nullptr; }
        void load_page();

        const ResultHistory* owner_ = nullptr;
        std::vector<AnalysisResult> page_;
        size_t index_ = 0;
        bool last_page_ = false;
    };

    ResultHistory(PostgresConnection& db, std::string url_id, size_t page_size);

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    const std::string& url_id() const { return url_id_; }
    size_t page_size() const { return page_size_; }

    /**
     * @brief One page strictly older than `after` (or the newest page)
     */
    std::vector<AnalysisResult> fetch_page(const AnalysisResult* after) const;

private:
    PostgresConnection* db_;
    std::string url_id_;
    size_t page_size_;
};

/**
 * @brief Records and reads analysis results keyed to registered URLs
 */
class AnalysisRecorder {
public:
    explicit AnalysisRecorder(PostgresConnection& db, size_t history_page_size = 50);

    /**
     * @brief Append one analysis result
     * @return id of the new result
     * @throws ValidationError if the verdict breaks an invariant
     * @throws NotFoundError if url_id does not reference a registered URL
     */
    std::string record_result(const std::string& url_id, const Verdict& verdict);

    /**
     * @brief Result with the greatest analysis_date, if any
     *
     * A row without an analysis_date is returned only when no dated row exists.
     */
    std::optional<AnalysisResult> latest_result(const std::string& url_id);

    ResultHistory history(const std::string& url_id) const;

    /**
     * @brief All results inside the range (all results when no range), newest first
     */
    std::vector<AnalysisResult> results_in_range(const std::optional<DateRange>& range);

    /**
     * @brief Stream results inside the range, newest first, one row in memory at a time
     */
    void for_each_result(const std::optional<DateRange>& range,
                         const std::function<void(const AnalysisResult&)>& callback);

    /**
     * @brief Column list matching parse_row(), for "SELECT <columns> FROM analysis_results"
     */
    static std::string select_columns();
    static AnalysisResult parse_row(const PostgresConnection::Row& row);

private:
    PostgresConnection& db_;
    size_t history_page_size_;
};

} // namespace PhishLedger
