/**
 * @file schema.cpp
 * @brief Schema DDL and idempotent apply
 */

#include <database/schema.hpp>
#include <utils/logger.hpp>

namespace PhishLedger {

const std::vector<std::string>& schema_statements() {
    static const std::vector<std::string> statements = {
        R"(CREATE TABLE IF NOT EXISTS urls (
    id uuid NOT NULL DEFAULT gen_random_uuid(),
    url text NOT NULL UNIQUE,
    domain text NOT NULL,
    submitted_at timestamp with time zone DEFAULT now(),
    source text DEFAULT 'manual'::text,
    created_at timestamp with time zone DEFAULT now(),
    updated_at timestamp with time zone DEFAULT now(),
    url_hash text,
    CONSTRAINT urls_pkey PRIMARY KEY (id)
))",
        "CREATE INDEX IF NOT EXISTS idx_urls_domain ON urls(domain)",
        "CREATE INDEX IF NOT EXISTS idx_urls_submitted_at ON urls(submitted_at DESC)",

        R"(CREATE TABLE IF NOT EXISTS analysis_results (
    id uuid NOT NULL DEFAULT gen_random_uuid(),
    url_id uuid NOT NULL,
    analysis_date timestamp with time zone DEFAULT now(),
    is_phishing boolean NOT NULL,
    risk_score integer NOT NULL CHECK (risk_score >= 0 AND risk_score <= 100),
    confidence_level text NOT NULL CHECK (confidence_level = ANY (ARRAY['high'::text, 'medium'::text, 'low'::text])),
    virustotal_result jsonb,
    heuristic_result jsonb,
    analysis_duration_ms integer,
    sources_checked text[],
    error_log text,
    created_at timestamp with time zone DEFAULT now(),
    CONSTRAINT analysis_results_pkey PRIMARY KEY (id),
    CONSTRAINT analysis_results_url_id_fkey FOREIGN KEY (url_id)
        REFERENCES urls(id) ON DELETE CASCADE
))",
        "CREATE INDEX IF NOT EXISTS idx_analysis_results_url_id ON analysis_results(url_id)",
        "CREATE INDEX IF NOT EXISTS idx_analysis_results_analysis_date ON analysis_results(analysis_date DESC NULLS LAST)",
        "CREATE INDEX IF NOT EXISTS idx_analysis_results_is_phishing ON analysis_results(is_phishing)",
    };
    return statements;
}

std::string schema_sql() {
    std::string sql;
    for (const auto& statement : schema_statements()) {
        sql += statement;
        sql += ";\n\n";
    }
    return sql;
}

void apply_schema(PostgresConnection& db) {
    Logger::step("Applying schema (" + std::to_string(schema_statements().size()) + " statements)");

    PostgresConnection::Transaction tx(db);
    for (const auto& statement : schema_statements()) {
        db.execute(statement);
    }
    tx.commit();

    Logger::success("Schema applied");
}

} // namespace PhishLedger
