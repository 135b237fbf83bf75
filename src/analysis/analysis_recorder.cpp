/**
 * @file analysis_recorder.cpp
 * @brief Analysis result writes, keyset-paged history and range reads
 */

#include <analysis/analysis_recorder.hpp>
#include <database/sql_format.hpp>
#include <errors.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>

namespace PhishLedger {

namespace {

std::optional<nlohmann::json> parse_payload(const std::string& text, const char* column) {
    if (text.empty()) return std::nullopt;
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw StorageError(std::string("Unreadable ") + column + " payload: " + e.what());
    }
}

std::string range_clause(const std::optional<DateRange>& range, std::vector<std::string>& params) {
    if (!range) return "";
    params.push_back(range->start);
    params.push_back(range->end);
    return " WHERE analysis_date >= $1::timestamptz AND analysis_date <= $2::timestamptz";
}

} // namespace

// ResultHistory

ResultHistory::ResultHistory(PostgresConnection& db, std::string url_id, size_t page_size)
    : db_(&db), url_id_(std::move(url_id)), page_size_(page_size == 0 ? 1 : page_size) {}

std::vector<AnalysisResult> ResultHistory::fetch_page(const AnalysisResult* after) const {
    std::vector<AnalysisResult> page;
    if (!is_uuid(url_id_)) return page;

    std::string sql = "SELECT " + AnalysisRecorder::select_columns() +
                      " FROM analysis_results WHERE url_id = $1::uuid";
    std::vector<std::string> params = {url_id_};

    // Rows without a date sort after every dated row
    if (after && after->analysis_date.empty()) {
        sql += " AND analysis_date IS NULL AND id < $2::uuid";
        params.push_back(after->id);
    } else if (after) {
        sql += " AND ((analysis_date, id) < ($2::timestamptz, $3::uuid) OR analysis_date IS NULL)";
        params.push_back(after->analysis_date);
        params.push_back(after->id);
    }
    sql += " ORDER BY analysis_date DESC NULLS LAST, id DESC LIMIT " + std::to_string(page_size_);

    page.reserve(page_size_);
    db_->query(sql, params, [&](const PostgresConnection::Row& row) {
        page.push_back(AnalysisRecorder::parse_row(row));
    });
    return page;
}

ResultHistory::iterator::iterator(const ResultHistory* owner) : owner_(owner) {
    load_page();
}

void ResultHistory::iterator::load_page() {
    std::optional<AnalysisResult> cursor;
    if (!page_.empty()) cursor = page_.back();

    page_ = owner_->fetch_page(cursor ? &*cursor : nullptr);
    index_ = 0;
    last_page_ = page_.size() < owner_->page_size();

    if (page_.empty()) owner_ = nullptr;
}

ResultHistory::iterator& ResultHistory::iterator::operator++() {
    if (at_end()) return *this;

    ++index_;
    if (index_ < page_.size()) return *this;

    if (last_page_) {
        owner_ = nullptr;
        page_.clear();
    } else {
        load_page();
    }
    return *this;
}

// AnalysisRecorder

AnalysisRecorder::AnalysisRecorder(PostgresConnection& db, size_t history_page_size)
    : db_(db), history_page_size_(history_page_size == 0 ? 1 : history_page_size) {}

std::string AnalysisRecorder::select_columns() {
    return "id, url_id, " + iso_timestamp_sql("analysis_date") +
           ", is_phishing, risk_score, confidence_level"
           ", COALESCE(virustotal_result::text, ''), COALESCE(heuristic_result::text, '')"
           ", COALESCE(analysis_duration_ms::text, '')"
           ", COALESCE(array_to_json(sources_checked)::text, '[]')"
           ", COALESCE(error_log, ''), " + iso_timestamp_sql("created_at");
}

AnalysisResult AnalysisRecorder::parse_row(const PostgresConnection::Row& row) {
    if (row.size() < 12) {
        throw StorageError("analysis_results row has " + std::to_string(row.size()) + " columns, expected 12");
    }

    AnalysisResult result;
    result.id = row[0];
    result.url_id = row[1];
    result.analysis_date = row[2];
    result.is_phishing = (row[3] == "t" || row[3] == "true");
    result.risk_score = std::stoi(row[4]);

    auto level = parse_confidence_level(row[5]);
    if (!level) {
        throw StorageError("Unexpected confidence_level '" + row[5] + "' in result " + result.id);
    }
    result.confidence_level = *level;

    result.virustotal_result = parse_payload(row[6], "virustotal_result");
    result.heuristic_result = parse_payload(row[7], "heuristic_result");
    if (!row[8].empty()) result.analysis_duration_ms = std::stoi(row[8]);

    auto sources = parse_payload(row[9], "sources_checked");
    if (sources && sources->is_array()) {
        for (const auto& s : *sources) {
            if (s.is_string()) result.sources_checked.push_back(s.get<std::string>());
        }
    }

    if (!row[10].empty()) result.error_log = row[10];
    result.created_at = row[11];
    return result;
}

std::string AnalysisRecorder::record_result(const std::string& url_id, const Verdict& verdict) {
    if (trim(url_id).empty()) {
        throw ValidationError("url_id must not be empty");
    }
    validate_verdict(verdict);

    if (!is_uuid(url_id)) {
        throw NotFoundError("No URL with id '" + url_id + "'");
    }

    std::string analysis_date = verdict.analysis_date ? parse_date_bound(*verdict.analysis_date, false) : "";

    static const std::string sql = R"(
        INSERT INTO analysis_results (
            url_id, analysis_date, is_phishing, risk_score, confidence_level,
            virustotal_result, heuristic_result, analysis_duration_ms,
            sources_checked, error_log
        ) VALUES (
            $1::uuid,
            COALESCE(NULLIF($2, '')::timestamptz, now()),
            $3::boolean,
            $4::integer,
            $5,
            NULLIF($6, '')::jsonb,
            NULLIF($7, '')::jsonb,
            NULLIF($8, '')::integer,
            ARRAY(SELECT e FROM jsonb_array_elements_text($9::jsonb) WITH ORDINALITY AS t(e, n) ORDER BY n),
            NULLIF($10, '')
        )
        RETURNING id
    )";

    std::vector<std::string> params = {
        url_id,
        analysis_date,
        verdict.is_phishing ? "true" : "false",
        std::to_string(verdict.risk_score),
        verdict.confidence_level,
        verdict.virustotal_result ? verdict.virustotal_result->dump() : "",
        verdict.heuristic_result ? verdict.heuristic_result->dump() : "",
        verdict.analysis_duration_ms ? std::to_string(*verdict.analysis_duration_ms) : "",
        nlohmann::json(verdict.sources_checked).dump(),
        verdict.error_log ? *verdict.error_log : ""
    };

    std::optional<std::string> id;
    try {
        id = db_.query_single(sql, params);
    } catch (const NotFoundError&) {
        throw NotFoundError("No URL with id " + url_id);
    }
    if (!id) {
        throw StorageError("INSERT INTO analysis_results returned no id for URL " + url_id);
    }

    Logger::info("Recorded analysis " + *id + " for URL " + url_id + " (risk " +
                 std::to_string(verdict.risk_score) + ", " + verdict.confidence_level +
                 (verdict.is_phishing ? ", phishing)" : ", clean)"));
    return *id;
}

std::optional<AnalysisResult> AnalysisRecorder::latest_result(const std::string& url_id) {
    auto page = ResultHistory(db_, url_id, 1).fetch_page(nullptr);
    if (page.empty()) return std::nullopt;
    return page.front();
}

ResultHistory AnalysisRecorder::history(const std::string& url_id) const {
    return ResultHistory(db_, url_id, history_page_size_);
}

std::vector<AnalysisResult> AnalysisRecorder::results_in_range(const std::optional<DateRange>& range) {
    std::vector<std::string> params;
    std::string sql = "SELECT " + select_columns() + " FROM analysis_results" +
                      range_clause(range, params) + " ORDER BY analysis_date DESC NULLS LAST, id DESC";

    std::vector<AnalysisResult> results;
    db_.query(sql, params, [&](const PostgresConnection::Row& row) { results.push_back(parse_row(row)); });
    return results;
}

void AnalysisRecorder::for_each_result(const std::optional<DateRange>& range,
                                       const std::function<void(const AnalysisResult&)>& callback) {
    std::vector<std::string> params;
    std::string sql = "SELECT " + select_columns() + " FROM analysis_results" +
                      range_clause(range, params) + " ORDER BY analysis_date DESC NULLS LAST, id DESC";

    db_.stream_query(sql, params, [&](const PostgresConnection::Row& row) { callback(parse_row(row)); });
}

} // namespace PhishLedger
