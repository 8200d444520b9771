#include <gtest/gtest.h>

#include "connectors/avatica_transport.hpp"
#include "fakes.hpp"

using namespace phxgw;
using phxgw::fakes::FakeHttpClient;
using json = nlohmann::json;

namespace {

PhoenixConfig test_config(int attempts, int delay_ms) {
    PhoenixConfig cfg;
    cfg.server = "pqs";
    cfg.port = 8765;
    cfg.open_attempts = attempts;
    cfg.open_retry_delay_ms = delay_ms;
    return cfg;
}

HttpResponse ok_json(const std::string& body) {
    HttpResponse r;
    r.transport_ok = true;
    r.status = 200;
    r.body = body;
    return r;
}

std::string request_name(const HttpRequest& req) {
    return json::parse(req.body).value("request", "");
}

// Answers like a healthy query server
HttpResponse healthy_server(const HttpRequest& req) {
    json j = json::parse(req.body);
    std::string op = j.value("request", "");
    if (op == "openConnection") {
        return ok_json(json{{"response", "openConnection"}, {"connectionId", j["connectionId"]}}.dump());
    }
    if (op == "createStatement") {
        return ok_json(R"({"response":"createStatement","connectionId":"x","statementId":1})");
    }
    if (op == "prepareAndExecute") {
        return ok_json(R"({"response":"executeResults","results":[{"columns":["C1"],"rows":[[1]]}]})");
    }
    return ok_json(R"({"response":"closeStatement"})");
}

} // namespace

TEST(AvaticaTransportTest, EndpointGetsJsonSuffix) {
    EXPECT_EQ(AvaticaTransport::normalize_endpoint("http://pqs:8765"), "http://pqs:8765/json");
    EXPECT_EQ(AvaticaTransport::normalize_endpoint("http://pqs:8765/"), "http://pqs:8765/json");
    EXPECT_EQ(AvaticaTransport::normalize_endpoint("http://pqs:8765/json"), "http://pqs:8765/json");
}

TEST(AvaticaTransportTest, OpenSucceedsOnThirdAttempt) {
    auto http = std::make_shared<FakeHttpClient>();
    http->push_unreachable();
    http->push(503, "Service Unavailable");
    http->push(200, R"({"response":"openConnection"})");

    AvaticaTransport t(http, test_config(10, 20));
    t.open();

    ASSERT_EQ(http->requests.size(), 3u);
    EXPECT_TRUE(t.is_open());
    EXPECT_FALSE(t.connection_token().empty());

    for (size_t i = 1; i < http->times.size(); ++i) {
        EXPECT_GE(http->times[i] - http->times[i - 1], std::chrono::milliseconds(20));
    }

    // All attempts use the same client-generated id, which becomes the token
    std::string id = json::parse(http->requests[0].body)["connectionId"];
    EXPECT_EQ(json::parse(http->requests[2].body)["connectionId"], id);
    EXPECT_EQ(t.connection_token(), id);
    EXPECT_EQ(http->requests[0].url, "http://pqs:8765/json");
    EXPECT_EQ(http->requests[0].method, "POST");
}

TEST(AvaticaTransportTest, RetryExhaustion) {
    auto http = std::make_shared<FakeHttpClient>();
    AvaticaTransport t(http, test_config(3, 25));

    auto start = std::chrono::steady_clock::now();
    try {
        t.open();
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::CONNECT_FAILED);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(http->requests.size(), 3u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(50));  // delays between attempts only
    EXPECT_FALSE(t.is_open());
    EXPECT_TRUE(t.connection_token().empty());
}

TEST(AvaticaTransportTest, ProtobufServerHint) {
    auto http = std::make_shared<FakeHttpClient>();
    http->push(500, "com.google.protobuf.InvalidProtocolBufferException: While parsing a protocol message");
    AvaticaTransport t(http, test_config(1, 0));

    try {
        t.open();
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_NE(std::string(e.what()).find("serialization"), std::string::npos);
    }
}

TEST(AvaticaTransportTest, OpenIsIdempotent) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = healthy_server;
    AvaticaTransport t(http, test_config(3, 0));
    t.open();
    t.open();
    EXPECT_EQ(http->requests.size(), 1u);
}

TEST(AvaticaTransportTest, ExecuteBeforeOpen) {
    auto http = std::make_shared<FakeHttpClient>();
    AvaticaTransport t(http, test_config(1, 0));
    try {
        t.execute(StatementRequest::query("SELECT 1"));
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::NOT_OPEN);
    }
    EXPECT_TRUE(http->requests.empty());
}

TEST(AvaticaTransportTest, ExecuteStatementSequence) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = healthy_server;
    AvaticaTransport t(http, test_config(1, 0));
    t.open();

    TabularResult r = t.execute(StatementRequest::query("SELECT 1 ;"));
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(r.rows[0].at("C1")), 1);

    ASSERT_EQ(http->requests.size(), 4u);
    EXPECT_EQ(request_name(http->requests[1]), "createStatement");
    EXPECT_EQ(request_name(http->requests[2]), "prepareAndExecute");
    EXPECT_EQ(request_name(http->requests[3]), "closeStatement");

    json exec = json::parse(http->requests[2].body);
    EXPECT_EQ(exec["sql"], "SELECT 1");
    EXPECT_EQ(exec["connectionId"], t.connection_token());
    EXPECT_EQ(exec["statementId"], 1);
}

TEST(AvaticaTransportTest, RemoteErrorStillClosesStatement) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = [](const HttpRequest& req) {
        if (request_name(req) == "prepareAndExecute") {
            HttpResponse r;
            r.transport_ok = true;
            r.status = 500;
            r.body = R"({"response":"error","errorMessage":"Table undefined. tableName=NOPE","sqlState":"42M03"})";
            return r;
        }
        return healthy_server(req);
    };
    AvaticaTransport t(http, test_config(1, 0));
    t.open();

    try {
        t.execute(StatementRequest::query("SELECT * FROM NOPE"));
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::REMOTE_ERROR);
        EXPECT_EQ(e.sql_state(), "42M03");
    }
    EXPECT_EQ(request_name(http->requests.back()), "closeStatement");
    EXPECT_TRUE(t.is_open());
}

TEST(AvaticaTransportTest, ServerGoneDuringExecute) {
    auto http = std::make_shared<FakeHttpClient>();
    http->push(200, R"({"response":"openConnection"})");
    AvaticaTransport t(http, test_config(1, 0));
    t.open();

    try {
        t.execute(StatementRequest::query("SELECT 1"));
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::CONNECT_FAILED);
    }
}

TEST(AvaticaTransportTest, CloseSendsCloseConnection) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = healthy_server;
    AvaticaTransport t(http, test_config(1, 0));
    t.open();
    std::string token = t.connection_token();

    EXPECT_TRUE(t.close());
    EXPECT_FALSE(t.is_open());
    json last = json::parse(http->requests.back().body);
    EXPECT_EQ(last["request"], "closeConnection");
    EXPECT_EQ(last["connectionId"], token);

    // Nothing left to close
    size_t sent = http->requests.size();
    EXPECT_TRUE(t.close());
    EXPECT_EQ(http->requests.size(), sent);
}

TEST(AvaticaTransportTest, NullResponseFieldStillOpens) {
    auto http = std::make_shared<FakeHttpClient>();
    http->push(200, R"({"response":null})");
    AvaticaTransport t(http, test_config(5, 0));

    ConnectResult r = t.connect();
    EXPECT_TRUE(r.ok) << r.message;
    EXPECT_EQ(http->requests.size(), 1u);
    EXPECT_TRUE(t.is_open());
}

TEST(AvaticaTransportTest, MalformedReplyUsesWholeRetryBudget) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = [](const HttpRequest&) { return ok_json("[1]"); };
    AvaticaTransport t(http, test_config(5, 0));

    ConnectResult r = t.connect();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, FailureKind::CONNECT_FAILED);
    EXPECT_NE(r.message.find("after 5 attempts"), std::string::npos);
    EXPECT_EQ(http->requests.size(), 5u);
    EXPECT_FALSE(t.is_open());
}

TEST(AvaticaTransportTest, MistypedExecuteReplyIsProtocolError) {
    auto http = std::make_shared<FakeHttpClient>();
    http->handler = [](const HttpRequest& req) {
        if (request_name(req) == "prepareAndExecute") return ok_json(R"({"missingStatement":"yes"})");
        return healthy_server(req);
    };
    AvaticaTransport t(http, test_config(1, 0));
    t.open();

    try {
        t.execute(StatementRequest::query("SELECT 1"));
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.kind(), FailureKind::PROTOCOL_ERROR);
    }
    EXPECT_TRUE(t.is_open());
    EXPECT_EQ(request_name(http->requests.back()), "closeStatement");
}

TEST(AvaticaTransportTest, LostConnectionDropsSession) {
    auto http = std::make_shared<FakeHttpClient>();
    bool forgotten = true;
    http->handler = [&forgotten](const HttpRequest& req) {
        if (request_name(req) == "prepareAndExecute" && forgotten) {
            forgotten = false;
            HttpResponse r;
            r.transport_ok = true;
            r.status = 500;
            r.body = R"({"response":"error",)"
                     R"("exceptions":["org.apache.calcite.avatica.NoSuchConnectionException"],)"
                     R"("errorMessage":"NoSuchConnectionException"})";
            return r;
        }
        return healthy_server(req);
    };
    AvaticaTransport t(http, test_config(1, 0));
    t.open();
    std::string first_token = t.connection_token();

    try {
        t.execute(StatementRequest::query("SELECT 1"));
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_TRUE(e.connection_lost());
    }
    EXPECT_FALSE(t.is_open());
    EXPECT_EQ(request_name(http->requests.back()), "prepareAndExecute");

    // A fresh handshake with a new id
    t.open();
    EXPECT_EQ(request_name(http->requests.back()), "openConnection");
    EXPECT_NE(t.connection_token(), first_token);
    EXPECT_EQ(t.execute(StatementRequest::query("SELECT 1")).rows.size(), 1u);
}
