/**
 * @file phishledger.cpp
 * @brief Command-line front end for the URL registry and analysis recorder
 */

#include <analysis/analysis_recorder.hpp>
#include <analysis/analysis_stats.hpp>
#include <config/config.hpp>
#include <database/postgres_connection.hpp>
#include <database/schema.hpp>
#include <registry/url_registry.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <utils/url.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace PhishLedger;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [args]\n"
              << "\nCommands:\n"
              << "  init-schema                          Create tables and indexes\n"
              << "  print-schema                         Print the DDL\n"
              << "  submit <url> [domain] [source]       Register a URL (domain derived when omitted)\n"
              << "  submit-batch <file|->                Register up to 100 URLs, one per line\n"
              << "  lookup <url>                         Show the record of a URL\n"
              << "  list-domain <domain>                 URLs of a domain, newest first\n"
              << "  record <url_id> <verdict.json|->     Record an analysis verdict\n"
              << "  latest <url_id>                      Most recent analysis of a URL\n"
              << "  history <url_id> [limit]             Analyses of a URL, newest first\n"
              << "  analyses [start end]                 All analyses, optionally in a date range\n"
              << "  stats [start end]                    Aggregate statistics\n"
              << "  daily <start> <end>                  Analyses per day\n"
              << "  touch <url_id> [source]              Refresh a URL's metadata\n"
              << "  remove <url_id>                      Delete a URL and its analyses\n"
              << "\nDatabase settings come from PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD\n"
              << "or PHISHLEDGER_DATABASE_URL.\n";
}

std::string read_input(const std::string& path) {
    if (path == "-") {
        std::stringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<DateRange> range_from_args(const std::vector<std::string>& args, size_t first) {
    if (args.size() <= first) return std::nullopt;
    if (args.size() < first + 2) {
        throw ValidationError("Both a start and an end date are required");
    }
    return DateRange::parse(args[first], args[first + 1]);
}

void print_json(const nlohmann::json& json) {
    std::cout << json.dump(2) << std::endl;
}

int run(const std::vector<std::string>& args, const AppConfig& config) {
    const std::string& command = args[0];

    auto require = [&](size_t count) {
        if (args.size() < count + 1) {
            throw ValidationError("'" + command + "' expects at least " + std::to_string(count) + " argument(s)");
        }
    };

    if (command == "print-schema") {
        std::cout << schema_sql();
        return 0;
    }

    PostgresConnection db(config.db);
    UrlRegistry registry(db, config.default_source);
    AnalysisRecorder recorder(db, config.history_page_size);

    if (command == "init-schema") {
        apply_schema(db);
    } else if (command == "submit") {
        require(1);
        std::string domain = args.size() > 2 ? args[2] : extract_domain(args[1]);
        std::string source = args.size() > 3 ? args[3] : "";
        print_json({{"id", registry.submit(args[1], domain, source)}});
    } else if (command == "submit-batch") {
        require(1);
        std::vector<UrlSubmission> submissions;
        std::istringstream lines(read_input(args[1]));
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            submissions.push_back({line, "", ""});
        }
        print_json(registry.submit_batch(submissions).to_json());
    } else if (command == "lookup") {
        require(1);
        auto record = registry.lookup_by_url(args[1]);
        if (!record) throw NotFoundError("URL not registered: " + args[1]);
        print_json(record->to_json());
    } else if (command == "list-domain") {
        require(1);
        nlohmann::json out = nlohmann::json::array();
        for (const auto& record : registry.list_by_domain(args[1])) {
            out.push_back(record.to_json());
        }
        print_json(out);
    } else if (command == "record") {
        require(2);
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(read_input(args[2]));
        } catch (const nlohmann::json::parse_error& e) {
            throw ValidationError(std::string("Verdict is not valid JSON: ") + e.what());
        }
        Timer timer;
        std::string id = recorder.record_result(args[1], Verdict::from_json(payload));
        Logger::debug("Recorded in " + std::to_string(timer.elapsed_ms()) + " ms");
        print_json({{"id", id}});
    } else if (command == "latest") {
        require(1);
        auto result = recorder.latest_result(args[1]);
        if (!result) throw NotFoundError("No analysis results for URL " + args[1]);
        print_json(result->to_json());
    } else if (command == "history") {
        require(1);
        size_t limit = 0;
        if (args.size() > 2 && !parse_count(args[2], limit)) {
            throw ValidationError("limit must be a non-negative integer: " + args[2]);
        }
        nlohmann::json out = nlohmann::json::array();
        for (const auto& result : recorder.history(args[1])) {
            if (limit != 0 && out.size() >= limit) break;
            out.push_back(result.to_json());
        }
        print_json(out);
    } else if (command == "analyses") {
        nlohmann::json data = nlohmann::json::array();
        for (const auto& result : recorder.results_in_range(range_from_args(args, 1))) {
            data.push_back(result.to_json());
        }
        print_json({{"total", data.size()}, {"data", data}});
    } else if (command == "stats") {
        print_json(collect_statistics(recorder, range_from_args(args, 1)).to_json());
    } else if (command == "daily") {
        require(2);
        AnalysisStats stats = collect_statistics(recorder, range_from_args(args, 1));
        print_json({{"data", stats.to_json().at("daily_counts")}});
    } else if (command == "touch") {
        require(1);
        std::optional<std::string> source;
        if (args.size() > 2) source = args[2];
        registry.touch(args[1], source);
        print_json({{"id", args[1]}, {"touched", true}});
    } else if (command == "remove") {
        require(1);
        print_json({{"id", args[1]}, {"removed", registry.remove(args[1])}});
    } else {
        throw ValidationError("Unknown command: " + command);
    }

    db.close();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        AppConfig config = AppConfig::load_from_env();
        Logger::set_min_level(config.log_level);
        return run(args, config);
    } catch (const Error& e) {
        Logger::error(std::string(error_kind_name(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal Error: ") + e.what());
        return 1;
    }
}
