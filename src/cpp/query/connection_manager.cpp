#include "connection_manager.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

namespace phxgw {

ConnectionManager::ConnectionManager(std::unique_ptr<QueryTransport> driver,
                                     std::unique_ptr<QueryTransport> protocol)
    : driver_(std::move(driver)), protocol_(std::move(protocol)) {
    if (!protocol_) {
        throw std::invalid_argument("ConnectionManager requires a protocol transport");
    }
    if (!driver_) driver_eligible_ = false;
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::set_state(ConnectionState s) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = s;
}

bool ConnectionManager::try_driver() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!driver_eligible_) return false;
    }

    ConnectResult r = driver_->connect();
    if (r.ok) return true;

    LOG_WRN("[conn] Driver transport %s (%s) -- falling back to protocol transport permanently",
        failure_kind_str(r.kind), r.message.c_str());
    std::lock_guard<std::mutex> lock(state_mutex_);
    driver_eligible_ = false;
    return false;
}

void ConnectionManager::mark_failed() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = ConnectionState::FAILED;
    active_ = nullptr;
    active_kind_ = TransportKind::NONE;
    token_.clear();
}

void ConnectionManager::open() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    QueryTransport* current = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::OPEN) current = active_;
    }
    if (current) {
        if (current->is_open()) return;
        LOG_WRN("[conn] %s session was lost; reconnecting", current->transport_name());
        if (!current->close()) {
            LOG_DBG("[conn] Closing the lost %s session failed (ignored)", current->transport_name());
        }
    }

    set_state(ConnectionState::OPENING);
    Timer timer;

    try {
        if (try_driver()) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            active_ = driver_.get();
            active_kind_ = TransportKind::DRIVER;
            token_.clear();
            state_ = ConnectionState::OPEN;
            LOG_INF("[conn] Open via %s transport (%lld ms)",
                driver_->transport_name(), static_cast<long long>(timer.elapsed_ms()));
            return;
        }

        ConnectResult r = protocol_->connect();
        if (!r.ok) {
            mark_failed();
            LOG_ERR("[conn] Open failed after %lld ms: %s",
                static_cast<long long>(timer.elapsed_ms()), r.message.c_str());
            throw QueryError(FailureKind::CONNECT_FAILED, r.message, r.sql_state, r.error_code);
        }
    } catch (...) {
        // Never leave the state at OPENING
        mark_failed();
        throw;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    active_ = protocol_.get();
    active_kind_ = TransportKind::PROTOCOL;
    token_ = protocol_->connection_token();
    state_ = ConnectionState::OPEN;
    LOG_INF("[conn] Open via %s transport, token %s (%lld ms)",
        protocol_->transport_name(), token_.c_str(), static_cast<long long>(timer.elapsed_ms()));
}

TabularResult ConnectionManager::execute(const StatementRequest& request) {
    QueryTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ConnectionState::OPEN || !active_) {
            throw QueryError(FailureKind::NOT_OPEN,
                std::string("Connection is not open (state: ") + connection_state_str(state_) +
                "). Call open() first.");
        }
        transport = active_;
    }

    StatementRequest trimmed{trim_statement(request.sql), request.kind};
    try {
        return transport->execute(trimmed);
    } catch (const QueryError& e) {
        LOG_WRN("[conn] %s failed (%s): %s",
            trimmed.kind == StatementKind::QUERY ? "Query" : "Execute",
            failure_kind_str(e.kind()), e.what());
        throw;
    }
}

TabularResult ConnectionManager::ensure_open_and_execute(const StatementRequest& request) {
    open();
    return execute(request);
}

void ConnectionManager::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    QueryTransport* transport = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport = active_;
        active_ = nullptr;
        active_kind_ = TransportKind::NONE;
        token_.clear();
        state_ = ConnectionState::CLOSED;
    }
    if (transport && !transport->close()) {
        LOG_WRN("[conn] %s transport did not close cleanly", transport->transport_name());
    }
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TransportKind ConnectionManager::active_transport() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_kind_;
}

std::string ConnectionManager::connection_token() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return token_;
}

bool ConnectionManager::driver_eligible() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return driver_eligible_;
}

} // namespace phxgw
