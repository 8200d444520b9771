#pragma once
// Abstract query transport. Two implementations talk to the Phoenix Query
// Server: the ODBC driver transport and the Avatica HTTP/JSON transport.
// The ConnectionManager selects one at open() time and routes every
// statement through it.
//
// connect() reports its outcome as a ConnectResult:
//   UNAVAILABLE     transport cannot work on this host (no driver)
//   CONNECT_FAILED  server unreachable or handshake rejected
// execute() throws QueryError: REMOTE_ERROR, PROTOCOL_ERROR, or
// CONNECT_FAILED. An execute error whose SQLSTATE is class 08 also drops
// the session, so is_open() turns false and the next connect() starts over.
#include <string>
#include "../query/query_types.hpp"

namespace phxgw {

enum class TransportKind { NONE, DRIVER, PROTOCOL };

inline const char* transport_kind_str(TransportKind k) {
    switch (k) {
        case TransportKind::NONE:     return "none";
        case TransportKind::DRIVER:   return "driver";
        case TransportKind::PROTOCOL: return "protocol";
    }
    return "??";
}

struct ConnectResult {
    bool ok = true;
    FailureKind kind = FailureKind::CONNECT_FAILED;
    std::string message;
    std::string sql_state;
    int error_code = 0;

    static ConnectResult success() { return {}; }

    static ConnectResult failure(FailureKind kind, std::string message,
                                 std::string sql_state = {}, int error_code = 0) {
        ConnectResult r;
        r.ok = false;
        r.kind = kind;
        r.message = std::move(message);
        r.sql_state = std::move(sql_state);
        r.error_code = error_code;
        return r;
    }
};

class QueryTransport {
public:
    virtual ~QueryTransport() = default;

    // Establish the transport's session. Never throws; a no-op success
    // while the session is alive.
    virtual ConnectResult connect() = 0;

    // connect(), raising the failure as QueryError
    void open() {
        ConnectResult r = connect();
        if (!r.ok) throw QueryError(r.kind, r.message, r.sql_state, r.error_code);
    }

    // Best-effort; never throws. Returns false if the remote close failed.
    virtual bool close() = 0;

    // Local state only; no round trip to the server
    [[nodiscard]] virtual bool is_open() const = 0;

    // Runs one statement. The SQL has already been trimmed by the caller,
    // transports trim again so they are safe to use directly.
    virtual TabularResult execute(const StatementRequest& request) = 0;

    // Opaque session id issued by the server; empty when not applicable
    [[nodiscard]] virtual std::string connection_token() const { return {}; }

    [[nodiscard]] virtual TransportKind kind() const = 0;
    [[nodiscard]] virtual const char* transport_name() const = 0;
};

} // namespace phxgw
