#include "odbc_transport.hpp"
#include "../query/result_normalizer.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <vector>

namespace phxgw {

namespace {

inline bool sql_ok(SQLRETURN rc) { return rc == SQL_SUCCESS || rc == SQL_SUCCESS_WITH_INFO; }

inline SQLCHAR* to_sqlchar(const char* s) {
    return const_cast<SQLCHAR*>(reinterpret_cast<const SQLCHAR*>(s));
}

struct Diagnostic {
    std::string sql_state;
    int native_error = 0;
    std::string message;
};

// Collects all diagnostic records; sql_state/native_error come from the first
Diagnostic read_diag(SQLSMALLINT handle_type, SQLHANDLE handle) {
    Diagnostic d;
    for (SQLSMALLINT i = 1; i <= 20; ++i) {
        SQLCHAR state[6] = {0};
        SQLINTEGER native = 0;
        SQLCHAR text[1024];
        SQLSMALLINT len = 0;
        SQLRETURN rc = SQLGetDiagRec(handle_type, handle, i, state, &native,
                                     text, sizeof(text), &len);
        if (!sql_ok(rc)) break;
        if (i == 1) {
            d.sql_state = reinterpret_cast<char*>(state);
            d.native_error = static_cast<int>(native);
        } else {
            d.message += " | ";
        }
        if (len > static_cast<SQLSMALLINT>(sizeof(text) - 1)) len = sizeof(text) - 1;
        d.message += "[" + std::string(reinterpret_cast<char*>(state)) + "] " +
                     std::string(reinterpret_cast<char*>(text), len);
    }
    if (d.message.empty()) d.message = "ODBC error (no diagnostics)";
    return d;
}

// Frees the statement handle on every exit path
class StatementHandle {
public:
    explicit StatementHandle(SQLHDBC dbc) {
        if (!sql_ok(SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_))) {
            Diagnostic d = read_diag(SQL_HANDLE_DBC, dbc);
            stmt_ = SQL_NULL_HSTMT;
            throw QueryError(FailureKind::CONNECT_FAILED,
                "cannot allocate ODBC statement handle: " + d.message, d.sql_state, d.native_error);
        }
    }
    ~StatementHandle() {
        if (stmt_ != SQL_NULL_HSTMT) SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
    }
    StatementHandle(const StatementHandle&) = delete;
    StatementHandle& operator=(const StatementHandle&) = delete;

    SQLHSTMT get() const { return stmt_; }

private:
    SQLHSTMT stmt_ = SQL_NULL_HSTMT;
};

[[noreturn]] void throw_statement_error(SQLHSTMT stmt, const char* where) {
    Diagnostic d = read_diag(SQL_HANDLE_STMT, stmt);
    // 08xxx: communication link failure
    FailureKind kind = d.sql_state.rfind("08", 0) == 0 ? FailureKind::CONNECT_FAILED
                                                      : FailureKind::REMOTE_ERROR;
    throw QueryError(kind, std::string(where) + ": " + d.message, d.sql_state, d.native_error);
}

bool is_binary_type(SQLSMALLINT t) {
    return t == SQL_BINARY || t == SQL_VARBINARY || t == SQL_LONGVARBINARY;
}

// Reads one column value in chunks; nullopt for SQL NULL
DriverValue fetch_value(SQLHSTMT stmt, SQLUSMALLINT col, bool binary) {
    SQLSMALLINT target = binary ? SQL_C_BINARY : SQL_C_CHAR;
    std::string out;
    char buf[4096];

    for (;;) {
        SQLLEN ind = 0;
        SQLRETURN rc = SQLGetData(stmt, col, target, buf, sizeof(buf), &ind);
        if (rc == SQL_NO_DATA) break;
        if (!sql_ok(rc)) throw_statement_error(stmt, "SQLGetData");
        if (ind == SQL_NULL_DATA) return std::nullopt;

        size_t cap = binary ? sizeof(buf) : sizeof(buf) - 1;  // char data is NUL-terminated
        size_t got = (ind == SQL_NO_TOTAL || static_cast<size_t>(ind) > cap)
            ? cap : static_cast<size_t>(ind);
        out.append(buf, got);
        if (rc == SQL_SUCCESS) break;  // SUCCESS_WITH_INFO (01004) means truncated, keep reading
    }
    return out;
}

} // namespace

OdbcTransport::OdbcTransport(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

OdbcTransport::~OdbcTransport() {
    close();
}

const char* OdbcTransport::sql_type_name(SQLSMALLINT data_type) {
    switch (data_type) {
        case SQL_CHAR:           return "CHAR";
        case SQL_VARCHAR:        return "VARCHAR";
        case SQL_LONGVARCHAR:    return "VARCHAR";
        case SQL_WCHAR:          return "CHAR";
        case SQL_WVARCHAR:       return "VARCHAR";
        case SQL_WLONGVARCHAR:   return "VARCHAR";
        case SQL_TINYINT:        return "TINYINT";
        case SQL_SMALLINT:       return "SMALLINT";
        case SQL_INTEGER:        return "INTEGER";
        case SQL_BIGINT:         return "BIGINT";
        case SQL_REAL:           return "FLOAT";
        case SQL_FLOAT:          return "DOUBLE";
        case SQL_DOUBLE:         return "DOUBLE";
        case SQL_DECIMAL:        return "DECIMAL";
        case SQL_NUMERIC:        return "DECIMAL";
        case SQL_BIT:            return "BOOLEAN";
        case SQL_BINARY:         return "BINARY";
        case SQL_VARBINARY:      return "VARBINARY";
        case SQL_LONGVARBINARY:  return "VARBINARY";
        case SQL_TYPE_DATE:      return "DATE";
        case SQL_TYPE_TIME:      return "TIME";
        case SQL_TYPE_TIMESTAMP: return "TIMESTAMP";
        default:                 return "";
    }
}

bool OdbcTransport::is_driver_missing(const std::string& sql_state, const std::string& message) {
    // IM002: data source / driver not found, IM003: driver could not be loaded,
    // IM004: driver's SQLAllocHandle failed
    if (sql_state == "IM002" || sql_state == "IM003" || sql_state == "IM004") return true;
    return message.find("Can't open lib") != std::string::npos ||
           message.find("file not found") != std::string::npos;
}

static void free_handles(SQLHENV env, SQLHDBC dbc) {
    if (dbc != SQL_NULL_HDBC) SQLFreeHandle(SQL_HANDLE_DBC, dbc);
    if (env != SQL_NULL_HENV) SQLFreeHandle(SQL_HANDLE_ENV, env);
}

OdbcTransport::Session::~Session() {
    if (connected_ && !disconnect()) {
        LOG_WRN("[odbc] SQLDisconnect of a retired session failed (ignored)");
    }
    free_handles(env_, dbc_);
}

bool OdbcTransport::Session::disconnect() {
    if (!connected_) return true;
    connected_ = false;
    if (!sql_ok(SQLDisconnect(dbc_))) {
        Diagnostic d = read_diag(SQL_HANDLE_DBC, dbc_);
        LOG_WRN("[odbc] SQLDisconnect failed: %s", d.message.c_str());
        return false;
    }
    return true;
}

ConnectResult OdbcTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_) return ConnectResult::success();

    if (connection_string_.empty()) {
        return ConnectResult::failure(FailureKind::UNAVAILABLE, "no ODBC connection string configured");
    }

    SQLHENV env = SQL_NULL_HENV;
    SQLHDBC dbc = SQL_NULL_HDBC;
    if (!sql_ok(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env))) {
        return ConnectResult::failure(FailureKind::UNAVAILABLE, "cannot allocate ODBC environment handle");
    }
    if (!sql_ok(SQLSetEnvAttr(env, SQL_ATTR_ODBC_VERSION,
                              reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0))) {
        Diagnostic d = read_diag(SQL_HANDLE_ENV, env);
        free_handles(env, SQL_NULL_HDBC);
        return ConnectResult::failure(FailureKind::UNAVAILABLE,
            "cannot select ODBC 3 behaviour: " + d.message);
    }
    if (!sql_ok(SQLAllocHandle(SQL_HANDLE_DBC, env, &dbc))) {
        Diagnostic d = read_diag(SQL_HANDLE_ENV, env);
        free_handles(env, SQL_NULL_HDBC);
        return ConnectResult::failure(FailureKind::UNAVAILABLE,
            "cannot allocate ODBC connection handle: " + d.message);
    }

    Timer timer;
    SQLCHAR out[1024];
    SQLSMALLINT out_len = 0;
    SQLRETURN rc = SQLDriverConnect(dbc, nullptr, to_sqlchar(connection_string_.c_str()), SQL_NTS,
                                    out, sizeof(out), &out_len, SQL_DRIVER_NOPROMPT);
    if (!sql_ok(rc)) {
        Diagnostic d = read_diag(SQL_HANDLE_DBC, dbc);
        free_handles(env, dbc);
        FailureKind kind = is_driver_missing(d.sql_state, d.message)
            ? FailureKind::UNAVAILABLE : FailureKind::CONNECT_FAILED;
        return ConnectResult::failure(kind, "SQLDriverConnect failed: " + d.message,
                                      d.sql_state, d.native_error);
    }

    session_ = std::make_shared<Session>(env, dbc);
    LOG_INF("[odbc] Connected via driver (%lld ms)", static_cast<long long>(timer.elapsed_ms()));
    return ConnectResult::success();
}

bool OdbcTransport::close() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session.swap(session_);
    }
    if (!session) return true;

    // Statements still running keep the handles alive until they finish
    if (session.use_count() > 1) return true;
    bool ok = session->disconnect();
    if (ok) LOG_INF("[odbc] Disconnected");
    return ok;
}

bool OdbcTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ != nullptr;
}

std::shared_ptr<OdbcTransport::Session> OdbcTransport::current_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void OdbcTransport::retire_session(const std::shared_ptr<Session>& session, const QueryError& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ != session) return;
    session_.reset();
    LOG_WRN("[odbc] Connection lost (SQLSTATE %s); the next open reconnects", cause.sql_state().c_str());
}

TabularResult OdbcTransport::execute(const StatementRequest& request) {
    std::shared_ptr<Session> session = current_session();
    if (!session) {
        throw QueryError(FailureKind::NOT_OPEN, "ODBC connection is not open. Call open() first.");
    }

    try {
        return run_statement(session->dbc(), trim_statement(request.sql));
    } catch (const QueryError& e) {
        if (e.connection_lost()) retire_session(session, e);
        throw;
    }
}

TabularResult OdbcTransport::run_statement(SQLHDBC dbc, const std::string& sql) {
    StatementHandle stmt(dbc);

    SQLRETURN rc = SQLExecDirect(stmt.get(), to_sqlchar(sql.c_str()), SQL_NTS);
    if (rc != SQL_NO_DATA && !sql_ok(rc)) throw_statement_error(stmt.get(), "SQLExecDirect");

    SQLSMALLINT ncols = 0;
    if (!sql_ok(SQLNumResultCols(stmt.get(), &ncols))) {
        throw_statement_error(stmt.get(), "SQLNumResultCols");
    }

    std::vector<DriverColumn> columns;
    std::vector<bool> binary;
    columns.reserve(ncols);
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(ncols); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT name_len = 0, data_type = 0, digits = 0, nullable = 0;
        SQLULEN size = 0;
        if (!sql_ok(SQLDescribeCol(stmt.get(), i, name, sizeof(name), &name_len,
                                   &data_type, &size, &digits, &nullable))) {
            throw_statement_error(stmt.get(), "SQLDescribeCol");
        }
        columns.push_back({reinterpret_cast<char*>(name), sql_type_name(data_type)});
        binary.push_back(is_binary_type(data_type));
    }

    std::vector<DriverRow> rows;
    if (ncols > 0) {
        for (;;) {
            rc = SQLFetch(stmt.get());
            if (rc == SQL_NO_DATA) break;
            if (!sql_ok(rc)) throw_statement_error(stmt.get(), "SQLFetch");

            DriverRow row;
            row.reserve(ncols);
            for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(ncols); ++i) {
                row.push_back(fetch_value(stmt.get(), i, binary[i - 1]));
            }
            rows.push_back(std::move(row));
        }
    }

    TabularResult result = ResultNormalizer::from_driver(columns, rows);
    if (ncols == 0) {
        SQLLEN affected = -1;
        if (sql_ok(SQLRowCount(stmt.get(), &affected))) result.update_count = affected;
    }
    return result;
}

} // namespace phxgw
