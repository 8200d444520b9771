#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "query/connection_manager.hpp"
#include "connectors/avatica_transport.hpp"
#include "fakes.hpp"

using namespace phxgw;
using phxgw::fakes::FakeHttpClient;
using phxgw::fakes::FakeTransport;

namespace {

struct Fixture {
    FakeTransport* driver = nullptr;
    FakeTransport* protocol = nullptr;
    std::unique_ptr<ConnectionManager> manager;

    explicit Fixture(bool with_driver = true) {
        std::unique_ptr<FakeTransport> d;
        if (with_driver) {
            d = std::make_unique<FakeTransport>(TransportKind::DRIVER, "fake-driver");
            driver = d.get();
        }
        auto p = std::make_unique<FakeTransport>(TransportKind::PROTOCOL, "fake-protocol");
        p->token = "conn-1";
        protocol = p.get();
        manager = std::make_unique<ConnectionManager>(std::move(d), std::move(p));
    }
};

} // namespace

TEST(ConnectionManagerTest, StartsClosed) {
    Fixture f;
    EXPECT_EQ(f.manager->state(), ConnectionState::CLOSED);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::NONE);
    EXPECT_TRUE(f.manager->driver_eligible());
}

TEST(ConnectionManagerTest, RequiresProtocolTransport) {
    EXPECT_THROW(ConnectionManager(nullptr, nullptr), std::invalid_argument);
}

TEST(ConnectionManagerTest, DriverPreferredWhenItOpens) {
    Fixture f;
    f.manager->open();
    EXPECT_EQ(f.manager->state(), ConnectionState::OPEN);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::DRIVER);
    EXPECT_TRUE(f.manager->connection_token().empty());
    EXPECT_EQ(f.protocol->open_calls, 0);
}

TEST(ConnectionManagerTest, MissingDriverFallsBackToProtocol) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "Can't open lib");
    f.manager->open();

    EXPECT_EQ(f.manager->state(), ConnectionState::OPEN);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::PROTOCOL);
    EXPECT_EQ(f.manager->connection_token(), "conn-1");
    EXPECT_FALSE(f.manager->driver_eligible());
}

TEST(ConnectionManagerTest, NoDriverBuiltIn) {
    Fixture f(false);
    EXPECT_FALSE(f.manager->driver_eligible());
    f.manager->open();
    EXPECT_EQ(f.manager->active_transport(), TransportKind::PROTOCOL);
}

TEST(ConnectionManagerTest, DriverNeverRetriedAfterFailure) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::CONNECT_FAILED, "refused");
    f.manager->open();
    f.manager->close();
    f.manager->open();

    EXPECT_EQ(f.driver->open_calls, 1);
    EXPECT_EQ(f.protocol->open_calls, 2);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::PROTOCOL);
}

TEST(ConnectionManagerTest, OpenIsIdempotent) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "missing");
    f.manager->open();
    f.manager->open();
    f.manager->open();
    EXPECT_EQ(f.protocol->open_calls, 1);
}

TEST(ConnectionManagerTest, ProtocolFailureLeavesFailedState) {
    Fixture f(false);
    f.protocol->open_failure = std::make_unique<QueryError>(FailureKind::PROTOCOL_ERROR, "garbage");

    try {
        f.manager->open();
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::CONNECT_FAILED);
        EXPECT_STREQ(e.what(), "garbage");
    }
    EXPECT_EQ(f.manager->state(), ConnectionState::FAILED);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::NONE);

    // A later open may still succeed
    f.protocol->open_failure.reset();
    f.manager->open();
    EXPECT_TRUE(f.manager->is_open());
}

TEST(ConnectionManagerTest, ExecuteBeforeOpen) {
    Fixture f;
    try {
        f.manager->query("SELECT 1");
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::NOT_OPEN);
    }
    EXPECT_TRUE(f.driver->executed.empty());
}

TEST(ConnectionManagerTest, ExecuteRoutesTrimmedSqlToActiveTransport) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "missing");
    f.protocol->result = fakes::single_value("C1", int64_t(1));
    f.manager->open();

    TabularResult r = f.manager->query("  SELECT 1 ; ");
    ASSERT_EQ(f.protocol->executed.size(), 1u);
    EXPECT_EQ(f.protocol->executed[0].sql, "SELECT 1");
    EXPECT_EQ(f.protocol->executed[0].kind, StatementKind::QUERY);
    EXPECT_EQ(std::get<int64_t>(r.rows[0].at("C1")), 1);

    f.manager->execute_update("UPSERT INTO T VALUES (1)");
    EXPECT_EQ(f.protocol->executed[1].kind, StatementKind::EXECUTE);
}

TEST(ConnectionManagerTest, ExecuteFailureKeepsConnectionOpen) {
    Fixture f;
    f.manager->open();
    f.driver->execute_failure = std::make_unique<QueryError>(FailureKind::REMOTE_ERROR, "Table undefined");

    EXPECT_THROW(f.manager->query("SELECT * FROM NOPE"), QueryError);
    EXPECT_EQ(f.manager->state(), ConnectionState::OPEN);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::DRIVER);
    EXPECT_EQ(f.protocol->open_calls, 0);
}

TEST(ConnectionManagerTest, EnsureOpenAndExecuteOpensFirst) {
    Fixture f;
    f.driver->result = fakes::single_value("N", int64_t(5));
    TabularResult r = f.manager->ensure_open_and_execute(StatementRequest::query("SELECT 5 AS N"));
    EXPECT_TRUE(f.manager->is_open());
    EXPECT_EQ(std::get<int64_t>(r.rows[0].at("N")), 5);
}

TEST(ConnectionManagerTest, CloseResetsState) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "missing");
    f.manager->open();
    f.manager->close();

    EXPECT_EQ(f.manager->state(), ConnectionState::CLOSED);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::NONE);
    EXPECT_TRUE(f.manager->connection_token().empty());
    EXPECT_EQ(f.protocol->close_calls, 1);
    EXPECT_FALSE(f.manager->driver_eligible());
}

TEST(ConnectionManagerTest, EndToEndOverAvatica) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = [](const HttpRequest& req) {
        auto j = nlohmann::json::parse(req.body);
        HttpResponse r;
        r.transport_ok = true;
        r.status = 200;
        std::string op = j["request"];
        if (op == "openConnection") {
            r.body = R"({"response":"openConnection"})";
        } else if (op == "createStatement") {
            r.body = R"({"response":"createStatement","statementId":9})";
        } else if (op == "prepareAndExecute") {
            r.body = R"({"results":[{"columns":["C1"],"rows":[[1]]}]})";
        } else {
            r.body = "{}";
        }
        return r;
    };

    PhoenixConfig cfg;
    cfg.open_attempts = 1;
    cfg.open_retry_delay_ms = 0;
    auto driver = std::make_unique<FakeTransport>(TransportKind::DRIVER, "fake-driver");
    driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "no driver");
    ConnectionManager manager(std::move(driver), std::make_unique<AvaticaTransport>(http, cfg));

    manager.open();
    EXPECT_EQ(manager.active_transport(), TransportKind::PROTOCOL);
    EXPECT_FALSE(manager.connection_token().empty());

    TabularResult r = manager.query("SELECT 1");
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(r.rows[0].at("C1")), 1);
}

TEST(ConnectionManagerTest, UnexpectedConnectExceptionLeavesFailedState) {
    Fixture f(false);
    f.protocol->throw_on_connect = true;
    EXPECT_THROW(f.manager->open(), std::runtime_error);
    EXPECT_EQ(f.manager->state(), ConnectionState::FAILED);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::NONE);

    f.protocol->throw_on_connect = false;
    f.manager->open();
    EXPECT_TRUE(f.manager->is_open());
}

TEST(ConnectionManagerTest, LostSessionIsReestablished) {
    Fixture f;
    f.driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "missing");
    f.manager->open();
    f.manager->open();
    EXPECT_EQ(f.protocol->open_calls, 1);

    f.protocol->lose_session();
    f.manager->open();
    EXPECT_EQ(f.protocol->open_calls, 2);
    EXPECT_EQ(f.protocol->close_calls, 1);
    EXPECT_TRUE(f.manager->is_open());
    EXPECT_EQ(f.manager->active_transport(), TransportKind::PROTOCOL);
    EXPECT_EQ(f.driver->open_calls, 1);
}

TEST(ConnectionManagerTest, LostDriverSessionReconnectsDriver) {
    Fixture f;
    f.manager->open();
    f.driver->lose_session();
    f.manager->open();
    EXPECT_EQ(f.driver->open_calls, 2);
    EXPECT_EQ(f.manager->active_transport(), TransportKind::DRIVER);
    EXPECT_EQ(f.protocol->open_calls, 0);
}

namespace {

std::string op_of(const HttpRequest& req) {
    return nlohmann::json::parse(req.body)["request"].get<std::string>();
}

HttpResponse reply(long status, std::string body) {
    HttpResponse r;
    r.transport_ok = true;
    r.status = status;
    r.body = std::move(body);
    return r;
}

HttpResponse query_server(const HttpRequest& req) {
    std::string op = op_of(req);
    if (op == "createStatement") return reply(200, R"({"response":"createStatement","statementId":1})");
    if (op == "prepareAndExecute") return reply(200, R"({"results":[{"columns":["C1"],"rows":[[1]]}]})");
    return reply(200, R"({"response":")" + op + R"("})");
}

PhoenixConfig avatica_config(int attempts, int delay_ms) {
    PhoenixConfig cfg;
    cfg.open_attempts = attempts;
    cfg.open_retry_delay_ms = delay_ms;
    return cfg;
}

} // namespace

TEST(ConnectionManagerTest, ConcurrentOpenHandshakesOnce) {
    auto http = std::make_shared<FakeHttpClient>();
    std::atomic<int> handshakes{0};
    http->handler = [&handshakes](const HttpRequest& req) {
        if (op_of(req) == "openConnection") {
            ++handshakes;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return query_server(req);
    };
    ConnectionManager manager(nullptr, std::make_unique<AvaticaTransport>(http, avatica_config(1, 0)));

    std::thread a([&] { manager.open(); });
    std::thread b([&] { manager.open(); });
    a.join();
    b.join();

    EXPECT_EQ(handshakes.load(), 1);
    EXPECT_TRUE(manager.is_open());
}

TEST(ConnectionManagerTest, FallbackOpensOnThirdProtocolAttempt) {
    auto http = std::make_shared<FakeHttpClient>();
    http->push_unreachable();
    http->push_unreachable();
    http->push(200, R"({"response":"openConnection"})");

    auto driver = std::make_unique<FakeTransport>(TransportKind::DRIVER, "fake-driver");
    driver->open_failure = std::make_unique<QueryError>(FailureKind::UNAVAILABLE, "Can't open lib");
    FakeTransport* driver_ptr = driver.get();
    ConnectionManager manager(std::move(driver),
                              std::make_unique<AvaticaTransport>(http, avatica_config(10, 20)));

    manager.open();

    EXPECT_EQ(manager.state(), ConnectionState::OPEN);
    EXPECT_EQ(manager.active_transport(), TransportKind::PROTOCOL);
    EXPECT_FALSE(manager.connection_token().empty());
    EXPECT_FALSE(manager.driver_eligible());
    EXPECT_EQ(driver_ptr->open_calls, 1);
    ASSERT_EQ(http->requests.size(), 3u);
    for (size_t i = 1; i < http->times.size(); ++i) {
        EXPECT_GE(http->times[i] - http->times[i - 1], std::chrono::milliseconds(20));
    }
}

TEST(ConnectionManagerTest, ForgottenConnectionIsReopened) {
    auto http = std::make_shared<FakeHttpClient>();
    bool forgotten = false;
    http->handler = [&forgotten](const HttpRequest& req) {
        if (op_of(req) == "createStatement" && forgotten) {
            forgotten = false;
            return reply(500, R"({"response":"error","errorMessage":)"
                              R"("org.apache.calcite.avatica.NoSuchConnectionException"})");
        }
        return query_server(req);
    };
    ConnectionManager manager(nullptr, std::make_unique<AvaticaTransport>(http, avatica_config(1, 0)));
    manager.open();
    std::string first_token = manager.connection_token();

    forgotten = true;
    EXPECT_THROW(manager.ensure_open_and_execute(StatementRequest::query("SELECT 1")), QueryError);

    TabularResult r = manager.ensure_open_and_execute(StatementRequest::query("SELECT 1"));
    ASSERT_EQ(r.rows.size(), 1u);

    int handshakes = 0;
    for (const auto& req : http->requests) {
        if (op_of(req) == "openConnection") ++handshakes;
    }
    EXPECT_EQ(handshakes, 2);
    EXPECT_NE(manager.connection_token(), first_token);
}
