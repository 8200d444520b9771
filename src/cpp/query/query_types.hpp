#pragma once
// Transport-agnostic query model: statements in, tabular results out,
// and the failure taxonomy used to drive fallback/retry decisions.
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace phxgw {

// ============================================================================
// Failure taxonomy
// ============================================================================

enum class FailureKind {
    UNAVAILABLE,     // driver/library missing -- permanent, triggers fallback
    CONNECT_FAILED,  // network or handshake failure
    PROTOCOL_ERROR,  // malformed response (wire-compatibility break)
    REMOTE_ERROR,    // server-reported SQL/engine error
    NOT_OPEN         // execute() called before a successful open()
};

inline const char* failure_kind_str(FailureKind k) {
    switch (k) {
        case FailureKind::UNAVAILABLE:    return "unavailable";
        case FailureKind::CONNECT_FAILED: return "connect_failed";
        case FailureKind::PROTOCOL_ERROR: return "protocol_error";
        case FailureKind::REMOTE_ERROR:   return "remote_error";
        case FailureKind::NOT_OPEN:       return "not_open";
    }
    return "??";
}

class QueryError : public std::runtime_error {
public:
    QueryError(FailureKind kind, const std::string& message,
               std::string sql_state = {}, int error_code = 0)
        : std::runtime_error(message), kind_(kind),
          sql_state_(std::move(sql_state)), error_code_(error_code) {}

    [[nodiscard]] FailureKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& sql_state() const noexcept { return sql_state_; }
    [[nodiscard]] int error_code() const noexcept { return error_code_; }

    // SQLSTATE class 08: the server no longer has our session
    [[nodiscard]] bool connection_lost() const noexcept {
        return sql_state_.compare(0, 2, "08") == 0;
    }

private:
    FailureKind kind_;
    std::string sql_state_;
    int error_code_;
};

// ============================================================================
// Statements
// ============================================================================

enum class StatementKind { QUERY, EXECUTE };

struct StatementRequest {
    std::string sql;
    StatementKind kind = StatementKind::QUERY;

    static StatementRequest query(std::string sql) {
        return {std::move(sql), StatementKind::QUERY};
    }
    static StatementRequest execute(std::string sql) {
        return {std::move(sql), StatementKind::EXECUTE};
    }
};

// Strip surrounding whitespace and any trailing ';' terminators
// ("SELECT 1 ;  ;" -> "SELECT 1"). Phoenix rejects terminated statements.
std::string trim_statement(const std::string& sql);

// ============================================================================
// Tabular result
// ============================================================================

using Bytes = std::vector<uint8_t>;

using Cell = std::variant<
    std::monostate,  // NULL
    std::string,
    int64_t,
    double,
    bool,
    Bytes
>;

inline bool is_null(const Cell& c) { return std::holds_alternative<std::monostate>(c); }

// Text rendering used by the console printer and for DATE-like values
std::string cell_to_string(const Cell& c);

struct ColumnDescriptor {
    std::string name;
    std::string logical_type;  // engine type name, e.g. "VARCHAR", "BIGINT"
};

struct Row {
    std::map<std::string, Cell> cells;

    [[nodiscard]] const Cell& at(const std::string& column) const { return cells.at(column); }
};

struct TabularResult {
    std::vector<ColumnDescriptor> columns;
    std::vector<Row> rows;
    int64_t update_count = -1;  // rows affected for EXECUTE; -1 when not reported

    [[nodiscard]] size_t row_count() const { return rows.size(); }
    [[nodiscard]] bool empty() const { return rows.empty(); }
};

} // namespace phxgw
