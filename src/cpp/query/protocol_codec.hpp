#pragma once
// Avatica JSON wire codec for the Phoenix Query Server protocol transport.
//
// Every request is a JSON object POSTed to the server's single /json
// endpoint; the "request" member names the operation:
//
//   openConnection     {"request","connectionId","info"}
//   createStatement    {"request","connectionId"}
//   prepareAndExecute  {"request","connectionId","statementId","sql","maxRowCount"}
//   closeStatement     {"request","connectionId","statementId"}
//   closeConnection    {"request","connectionId"}
//
// Decoders throw QueryError only: PROTOCOL_ERROR for bodies that are not a
// JSON object or carry missing or mistyped members, REMOTE_ERROR for
// well-formed error responses. Error responses never reach the
// ResultNormalizer. A lost server-side connection (NoSuchConnectionException,
// missingStatement) is REMOTE_ERROR with SQLSTATE 08003.
#include <string>
#include <nlohmann/json.hpp>

#include "query_types.hpp"

namespace phxgw {

class ProtocolCodec {
public:
    static constexpr int DEFAULT_MAX_ROW_COUNT = 10000;

    // SQLSTATE given to errors that mean the server lost our connection
    static constexpr const char* CONNECTION_LOST_STATE = "08003";
    static constexpr const char* NO_SUCH_CONNECTION = "NoSuchConnectionException";

    explicit ProtocolCodec(int max_row_count = DEFAULT_MAX_ROW_COUNT)
        : max_row_count_(max_row_count) {}

    [[nodiscard]] int max_row_count() const { return max_row_count_; }

    // ---- encoders ----
    std::string encode_open_connection(const std::string& connection_id) const;
    std::string encode_create_statement(const std::string& token) const;
    // `sql` is trimmed here (trailing ';' and whitespace) before framing
    std::string encode_prepare_and_execute(const std::string& token, int statement_id,
                                           const std::string& sql) const;
    std::string encode_close_statement(const std::string& token, int statement_id) const;
    std::string encode_close_connection(const std::string& token) const;

    // ---- decoders ----

    // Parses the body and raises on error responses; returns the object.
    static nlohmann::json parse_response(const std::string& body);

    // Token issued for the connection: the server's connectionId when it
    // reports one, otherwise the client-generated id it accepted.
    static std::string decode_open_connection(const std::string& body,
                                              const std::string& requested_id);

    static int decode_create_statement(const std::string& body);

    // results[0] in either compact ({columns, rows}) or native Avatica
    // ({signature.columns, firstFrame.rows}) form. Empty results array is a
    // zero-row success.
    static TabularResult decode_execute(const std::string& body);

    // Extracts the engine message from an error object, or "" when the
    // object is not an error response.
    static std::string error_message_of(const nlohmann::json& obj);

private:
    int max_row_count_;

    static TabularResult decode_results(const nlohmann::json& j, const std::string& body);
};

} // namespace phxgw
