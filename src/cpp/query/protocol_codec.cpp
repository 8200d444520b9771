#include "protocol_codec.hpp"
#include "result_normalizer.hpp"
#include "../utils/logger.hpp"

namespace phxgw {

// ---- encoders ----

std::string ProtocolCodec::encode_open_connection(const std::string& connection_id) const {
    nlohmann::json j;
    j["request"] = "openConnection";
    j["connectionId"] = connection_id;
    j["info"] = nlohmann::json::object();
    return j.dump();
}

std::string ProtocolCodec::encode_create_statement(const std::string& token) const {
    nlohmann::json j;
    j["request"] = "createStatement";
    j["connectionId"] = token;
    return j.dump();
}

std::string ProtocolCodec::encode_prepare_and_execute(const std::string& token, int statement_id,
                                                      const std::string& sql) const {
    nlohmann::json j;
    j["request"] = "prepareAndExecute";
    j["connectionId"] = token;
    j["statementId"] = statement_id;
    j["sql"] = trim_statement(sql);
    j["maxRowCount"] = max_row_count_;
    return j.dump();
}

std::string ProtocolCodec::encode_close_statement(const std::string& token, int statement_id) const {
    nlohmann::json j;
    j["request"] = "closeStatement";
    j["connectionId"] = token;
    j["statementId"] = statement_id;
    return j.dump();
}

std::string ProtocolCodec::encode_close_connection(const std::string& token) const {
    nlohmann::json j;
    j["request"] = "closeConnection";
    j["connectionId"] = token;
    return j.dump();
}

// ---- decoders ----

static std::string first_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        for (const auto& e : v) {
            std::string s = first_string(e);
            if (!s.empty()) return s;
        }
    }
    if (v.is_object()) {
        for (const char* key : {"message", "errorMessage", "error"}) {
            auto it = v.find(key);
            if (it != v.end()) {
                std::string s = first_string(*it);
                if (!s.empty()) return s;
            }
        }
    }
    return "";
}

static bool string_member_is(const nlohmann::json& obj, const char* key, const char* expected) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() && it->get<std::string>() == expected;
}

static bool bool_member(const nlohmann::json& obj, const char* key, bool def) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() ? it->get<bool>() : def;
}

// Malformed members surface as nlohmann exceptions; callers only ever see QueryError
template <typename Fn>
static auto guard_protocol(const char* operation, const std::string& body, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw QueryError(FailureKind::PROTOCOL_ERROR,
            std::string(operation) + " response is malformed (" + e.what() + "): " + body.substr(0, 200));
    }
}

std::string ProtocolCodec::error_message_of(const nlohmann::json& obj) {
    if (!obj.is_object()) return "";

    bool is_error = string_member_is(obj, "response", "error");
    for (const char* key : {"error", "exception", "exceptions", "errorMessage"}) {
        if (obj.contains(key) && !obj[key].is_null()) is_error = true;
    }
    if (!is_error) return "";

    // errorMessage is the engine's own text; exceptions carry stack traces
    for (const char* key : {"errorMessage", "error", "exception", "exceptions"}) {
        auto it = obj.find(key);
        if (it == obj.end()) continue;
        std::string msg = first_string(*it);
        if (!msg.empty()) return msg;
    }
    return "query server returned an error response without a message";
}

nlohmann::json ProtocolCodec::parse_response(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR,
            "query server response is not valid JSON: " + body.substr(0, 200));
    }
    if (!j.is_object()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR,
            "query server response is not a JSON object: " + body.substr(0, 200));
    }

    std::string err = guard_protocol("query server", body, [&] { return error_message_of(j); });
    if (!err.empty()) {
        std::string sql_state;
        if (j.contains("sqlState") && j["sqlState"].is_string()) sql_state = j["sqlState"].get<std::string>();
        int code = 0;
        if (j.contains("errorCode") && j["errorCode"].is_number_integer()) code = j["errorCode"].get<int>();
        // The server forgot our connection (restart, idle expiry)
        if (sql_state.empty() && body.find(NO_SUCH_CONNECTION) != std::string::npos) {
            sql_state = CONNECTION_LOST_STATE;
        }
        throw QueryError(FailureKind::REMOTE_ERROR, err, sql_state, code);
    }
    return j;
}

std::string ProtocolCodec::decode_open_connection(const std::string& body,
                                                  const std::string& requested_id) {
    nlohmann::json j = parse_response(body);
    return guard_protocol("openConnection", body, [&] {
        auto it = j.find("connectionId");
        if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
        return requested_id;
    });
}

int ProtocolCodec::decode_create_statement(const std::string& body) {
    nlohmann::json j = parse_response(body);
    auto it = j.find("statementId");
    if (it == j.end() || !it->is_number_integer()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR,
            "createStatement response carries no statementId: " + body.substr(0, 200));
    }
    return guard_protocol("createStatement", body, [&] { return it->get<int>(); });
}

TabularResult ProtocolCodec::decode_execute(const std::string& body) {
    nlohmann::json j = parse_response(body);
    return guard_protocol("prepareAndExecute", body, [&] { return decode_results(j, body); });
}

TabularResult ProtocolCodec::decode_results(const nlohmann::json& j, const std::string& body) {
    auto results = j.find("results");
    if (results == j.end() || !results->is_array()) {
        if (bool_member(j, "missingStatement", false)) {
            throw QueryError(FailureKind::REMOTE_ERROR,
                "statement is no longer known to the query server", CONNECTION_LOST_STATE);
        }
        throw QueryError(FailureKind::PROTOCOL_ERROR,
            "execute response carries no results array: " + body.substr(0, 200));
    }

    if (results->empty()) return TabularResult{};

    const auto& first = (*results)[0];
    if (!first.is_object()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR, "results[0] is not a JSON object");
    }

    static const nlohmann::json NONE;
    const nlohmann::json* columns = &NONE;
    const nlohmann::json* rows = &NONE;

    if (first.contains("columns")) {
        columns = &first["columns"];
    } else if (first.contains("signature") && first["signature"].is_object() &&
               first["signature"].contains("columns")) {
        columns = &first["signature"]["columns"];
    }

    if (first.contains("rows")) {
        rows = &first["rows"];
    } else if (first.contains("firstFrame") && first["firstFrame"].is_object()) {
        const auto& frame = first["firstFrame"];
        if (frame.contains("rows")) rows = &frame["rows"];
        if (!bool_member(frame, "done", true)) {
            LOG_DBG("[codec] first frame not done -- result truncated at maxRowCount");
        }
    }

    if (!columns->is_null() && !columns->is_array()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR, "result columns is not an array");
    }
    if (!rows->is_null() && !rows->is_array()) {
        throw QueryError(FailureKind::PROTOCOL_ERROR, "result rows is not an array");
    }

    TabularResult result = ResultNormalizer::from_avatica(*columns, *rows);
    if (first.contains("updateCount") && first["updateCount"].is_number_integer()) {
        result.update_count = first["updateCount"].get<int64_t>();
    }
    return result;
}

} // namespace phxgw
