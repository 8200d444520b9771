#pragma once
// Phoenix driver transport via the ODBC driver manager (unixODBC).
// Preferred when a Phoenix ODBC driver is installed and configured; when it
// is not, connect() reports UNAVAILABLE and the manager falls back to Avatica.
//
// Statements run concurrently on the shared connection handle (ODBC handles
// are thread-safe); the mutex only guards which session is current. A
// statement failing with SQLSTATE 08xxx retires the session, and the handles
// are released once the last statement still using them finishes.
#include <memory>
#include <mutex>
#include <string>

#include <sql.h>
#include <sqlext.h>

#include "query_transport.hpp"

namespace phxgw {

class OdbcTransport : public QueryTransport {
public:
    explicit OdbcTransport(std::string connection_string);
    ~OdbcTransport() override;

    OdbcTransport(const OdbcTransport&) = delete;
    OdbcTransport& operator=(const OdbcTransport&) = delete;

    ConnectResult connect() override;
    bool close() override;
    [[nodiscard]] bool is_open() const override;

    TabularResult execute(const StatementRequest& request) override;

    [[nodiscard]] TransportKind kind() const override { return TransportKind::DRIVER; }
    [[nodiscard]] const char* transport_name() const override { return "odbc"; }

    // ODBC SQL type code -> Phoenix-style type name used by the normalizer
    static const char* sql_type_name(SQLSMALLINT data_type);

    // SQLSTATE / driver-manager text that means "no usable driver"
    static bool is_driver_missing(const std::string& sql_state, const std::string& message);

private:
    // Environment + connected DBC pair; disconnects and frees on destruction
    class Session {
    public:
        Session(SQLHENV env, SQLHDBC dbc) : env_(env), dbc_(dbc) {}
        ~Session();
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        SQLHDBC dbc() const { return dbc_; }

        // SQLDisconnect now; false when the driver reported an error
        bool disconnect();

    private:
        SQLHENV env_;
        SQLHDBC dbc_;
        bool connected_ = true;
    };

    std::string connection_string_;
    mutable std::mutex mutex_;
    std::shared_ptr<Session> session_;

    std::shared_ptr<Session> current_session() const;
    void retire_session(const std::shared_ptr<Session>& session, const QueryError& cause);
    static TabularResult run_statement(SQLHDBC dbc, const std::string& sql);
};

} // namespace phxgw
