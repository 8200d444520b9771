#include "query_types.hpp"
#include "../utils/base64.hpp"
#include <cctype>
#include <cstdio>

namespace phxgw {

std::string trim_statement(const std::string& sql) {
    size_t begin = 0;
    while (begin < sql.size() && std::isspace(static_cast<unsigned char>(sql[begin]))) ++begin;

    size_t end = sql.size();
    while (end > begin) {
        unsigned char c = static_cast<unsigned char>(sql[end - 1]);
        if (std::isspace(c) || c == ';') {
            --end;
        } else {
            break;
        }
    }
    return sql.substr(begin, end - begin);
}

std::string cell_to_string(const Cell& c) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", v);
            return buf;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            return Base64::encode(v);
        }
    }, c);
}

} // namespace phxgw
