#pragma once
// JSON shapes returned by the HTTP endpoint layer.
//
//   result:  {"columns":[{"name","type"}], "rows":[{col: value}], "rowCount": N [, "message"]}
//   error:   {"error": <message>, "suggestion": <string|null>}
//
// Pure functions; no I/O.
#include <chrono>
#include <exception>
#include <string>
#include <nlohmann/json.hpp>

#include "../query/query_types.hpp"

namespace phxgw {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

class ResponseMapper {
public:
    static constexpr const char* NO_ROWS_MESSAGE =
        "Query executed successfully but returned no results. "
        "This may indicate no data exists matching the query criteria.";
    static constexpr const char* NO_TABLES_MESSAGE =
        "No tables found in Phoenix. Create a table using: POST /api/phoenix/execute with SQL: CREATE TABLE ...";
    static constexpr const char* NO_VIEWS_MESSAGE =
        "No views found in Phoenix. Create a view using: POST /api/phoenix/views";

    // null -> JSON null, bytes -> base64 string
    static nlohmann::json cell_to_json(const Cell& cell);

    static nlohmann::json result_to_json(const TabularResult& result);

    // "Table undefined", "TableNotFoundException" or "Table not found"
    static bool is_table_not_found(const std::string& message);

    // Suggestion text for a failed statement of the given kind; empty when none applies
    static std::string suggestion_for(const std::string& message, StatementKind kind);

    static ApiResponse ok(nlohmann::json body) { return {200, std::move(body)}; }

    // {"error": message} plus "suggestion" when given
    static ApiResponse error(int status, const std::string& message,
                             const std::string& suggestion = {});

    // Statement failure: 500 with the table-not-found suggestion or null
    static ApiResponse statement_failure(const std::exception& e, StatementKind kind);

    // Non-statement failure: invalid_argument / JSON parse -> 400, anything else -> 500
    static ApiResponse failure(const std::exception& e);

    // ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
    static std::string iso_timestamp(std::chrono::system_clock::time_point tp);
};

} // namespace phxgw
