#pragma once
// Owns the single logical connection to Phoenix and the two transports
// behind it. Shared by the warm-up thread and every HTTP handler.
//
//   open():    CLOSED/FAILED -> OPENING -> OPEN (driver, else protocol) | FAILED
//   execute(): requires OPEN; routed to the active transport
//   close():   -> CLOSED
//
// The driver transport is tried at most once per open; after any failure
// it stays ineligible for the life of the process. open() on an OPEN
// manager whose transport has lost its session selects a transport again.
// A statement already failed by the lost session is not replayed.
#include <memory>
#include <mutex>
#include <string>

#include "query_types.hpp"
#include "../connectors/query_transport.hpp"

namespace phxgw {

enum class ConnectionState { CLOSED, OPENING, OPEN, FAILED };

inline const char* connection_state_str(ConnectionState s) {
    switch (s) {
        case ConnectionState::CLOSED:  return "closed";
        case ConnectionState::OPENING: return "opening";
        case ConnectionState::OPEN:    return "open";
        case ConnectionState::FAILED:  return "failed";
    }
    return "??";
}

class ConnectionManager {
public:
    // `driver` may be null (no driver transport built in); `protocol` is required.
    ConnectionManager(std::unique_ptr<QueryTransport> driver,
                      std::unique_ptr<QueryTransport> protocol);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Idempotent while the session is alive. Blocks for the protocol
    // transport's whole retry sequence. Throws QueryError(CONNECT_FAILED)
    // when every transport failed; the state is FAILED on any exception.
    void open();

    TabularResult execute(const StatementRequest& request);
    TabularResult query(const std::string& sql) { return execute(StatementRequest::query(sql)); }
    TabularResult execute_update(const std::string& sql) { return execute(StatementRequest::execute(sql)); }

    // open() then execute(); what request handlers call
    TabularResult ensure_open_and_execute(const StatementRequest& request);

    void close();

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] TransportKind active_transport() const;
    [[nodiscard]] std::string connection_token() const;
    [[nodiscard]] bool driver_eligible() const;
    [[nodiscard]] bool is_open() const { return state() == ConnectionState::OPEN; }

private:
    std::unique_ptr<QueryTransport> driver_;
    std::unique_ptr<QueryTransport> protocol_;

    // Held for the whole open()/close() so they never interleave
    std::mutex lifecycle_mutex_;

    // Guards the fields below; never held across network I/O
    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::CLOSED;
    TransportKind active_kind_ = TransportKind::NONE;
    QueryTransport* active_ = nullptr;
    std::string token_;
    bool driver_eligible_ = true;

    void set_state(ConnectionState s);
    void mark_failed();
    bool try_driver();
};

} // namespace phxgw
