#include "response_mapper.hpp"
#include "../utils/base64.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <type_traits>

namespace phxgw {

nlohmann::json ResponseMapper::cell_to_json(const Cell& cell) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return Base64::encode(v);
        } else {
            return v;
        }
    }, cell);
}

nlohmann::json ResponseMapper::result_to_json(const TabularResult& result) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& c : result.columns) {
        columns.push_back({{"name", c.name}, {"type", c.logical_type}});
    }

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& r : result.rows) {
        nlohmann::json row = nlohmann::json::object();
        for (const auto& c : result.columns) {
            auto it = r.cells.find(c.name);
            row[c.name] = it == r.cells.end() ? nlohmann::json(nullptr) : cell_to_json(it->second);
        }
        rows.push_back(std::move(row));
    }

    nlohmann::json j;
    j["columns"] = std::move(columns);
    j["rows"] = std::move(rows);
    j["rowCount"] = result.row_count();
    if (result.rows.empty() && !result.columns.empty()) {
        j["message"] = NO_ROWS_MESSAGE;
    }
    return j;
}

bool ResponseMapper::is_table_not_found(const std::string& message) {
    return message.find("Table undefined") != std::string::npos ||
           message.find("TableNotFoundException") != std::string::npos ||
           message.find("Table not found") != std::string::npos;
}

std::string ResponseMapper::suggestion_for(const std::string& message, StatementKind kind) {
    if (!is_table_not_found(message)) return {};
    static const char* example =
        "Example: CREATE TABLE IF NOT EXISTS users (id INTEGER PRIMARY KEY, "
        "username VARCHAR(50), email VARCHAR(100))";
    if (kind == StatementKind::QUERY) {
        return std::string("The table does not exist. Create it using: POST /api/phoenix/execute "
                           "with SQL: CREATE TABLE ... ") + example;
    }
    return std::string("The table does not exist. Create it first using CREATE TABLE statement. ") +
           example;
}

ApiResponse ResponseMapper::error(int status, const std::string& message,
                                  const std::string& suggestion) {
    nlohmann::json j;
    j["error"] = message;
    if (!suggestion.empty()) j["suggestion"] = suggestion;
    return {status, std::move(j)};
}

ApiResponse ResponseMapper::statement_failure(const std::exception& e, StatementKind kind) {
    std::string suggestion = suggestion_for(e.what(), kind);
    nlohmann::json j;
    j["error"] = e.what();
    j["suggestion"] = suggestion.empty() ? nlohmann::json(nullptr) : nlohmann::json(suggestion);
    return {500, std::move(j)};
}

ApiResponse ResponseMapper::failure(const std::exception& e) {
    if (dynamic_cast<const std::invalid_argument*>(&e) ||
        dynamic_cast<const nlohmann::json::exception*>(&e)) {
        return error(400, e.what());
    }
    return error(500, e.what());
}

std::string ResponseMapper::iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if (frac < 0) { frac += 1000; --secs; }

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", frac);
    return buf;
}

} // namespace phxgw
