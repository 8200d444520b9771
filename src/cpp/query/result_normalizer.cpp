#include "result_normalizer.hpp"
#include "../utils/base64.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <set>

namespace phxgw {

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

CellKind cell_kind_for_type(const std::string& type_name) {
    if (type_name.empty()) return CellKind::ANY;
    std::string t = upper(type_name);

    // Phoenix array types ("VARCHAR ARRAY", "INTEGER ARRAY") render as text
    if (t.find("ARRAY") != std::string::npos) return CellKind::STRING;

    if (t == "INTEGER" || t == "INT" || t == "BIGINT" || t == "SMALLINT" ||
        t == "TINYINT" || t == "UNSIGNED_INT" || t == "UNSIGNED_LONG" ||
        t == "UNSIGNED_SMALLINT" || t == "UNSIGNED_TINYINT") {
        return CellKind::INTEGER;
    }
    if (t == "DOUBLE" || t == "FLOAT" || t == "REAL" ||
        t == "UNSIGNED_DOUBLE" || t == "UNSIGNED_FLOAT") {
        return CellKind::FLOAT;
    }
    if (t == "DECIMAL" || t == "NUMERIC") return CellKind::DECIMAL;
    if (t == "BOOLEAN" || t == "BIT") return CellKind::BOOLEAN;
    if (t == "BINARY" || t == "VARBINARY" || t == "LONGVARBINARY") return CellKind::BYTES;
    if (t == "DATE" || t == "UNSIGNED_DATE") return CellKind::DATE;
    if (t == "TIME" || t == "UNSIGNED_TIME") return CellKind::TIME;
    if (t == "TIMESTAMP" || t == "UNSIGNED_TIMESTAMP") return CellKind::TIMESTAMP;
    return CellKind::STRING;
}

// ---- temporal rendering ----
// Avatica JSON sends DATE as days since epoch, TIME as ms of day and
// TIMESTAMP as ms since epoch (all UTC).

static std::string format_epoch_ms(int64_t epoch_ms, bool with_date, bool with_time) {
    int64_t secs = epoch_ms / 1000;
    int64_t ms = epoch_ms % 1000;
    if (ms < 0) { ms += 1000; secs -= 1; }

    time_t t = static_cast<time_t>(secs);
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char buf[40];
    if (with_date && with_time) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms));
    } else if (with_date) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
    } else {
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    }
    return buf;
}

static bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

static bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

// More than 15 significant digits do not survive a round trip through double
static bool decimal_fits_double(const std::string& s) {
    int digits = 0;
    bool leading = true;
    for (char c : s) {
        if (c == 'e' || c == 'E') break;
        if (!std::isdigit(static_cast<unsigned char>(c))) continue;
        if (leading && c == '0') continue;
        leading = false;
        ++digits;
    }
    return digits <= 15;
}

Cell ResultNormalizer::coerce_json(const nlohmann::json& value, CellKind kind) {
    if (value.is_null()) return std::monostate{};

    // Avatica TypedValue objects: {"type":"INTEGER","value":42}
    if (value.is_object() && value.contains("value")) {
        auto null_flag = value.find("null");
        if (null_flag != value.end() && null_flag->is_boolean() && null_flag->get<bool>()) {
            return std::monostate{};
        }
        return coerce_json(value["value"], kind);
    }

    switch (kind) {
        case CellKind::INTEGER:
            if (value.is_number_integer()) return value.get<int64_t>();
            if (value.is_number_float()) {
                double d = value.get<double>();
                if (std::floor(d) == d && std::fabs(d) < 9.2e18) return static_cast<int64_t>(d);
                return d;
            }
            if (value.is_string()) return coerce_text(value.get<std::string>(), kind);
            break;

        case CellKind::FLOAT:
            if (value.is_number()) return value.get<double>();
            if (value.is_string()) return coerce_text(value.get<std::string>(), kind);
            break;

        case CellKind::DECIMAL:
            if (value.is_number_integer()) return value.get<int64_t>();
            if (value.is_number_float()) return value.get<double>();
            if (value.is_string()) return coerce_text(value.get<std::string>(), kind);
            break;

        case CellKind::BOOLEAN:
            if (value.is_boolean()) return value.get<bool>();
            if (value.is_number()) return value.get<double>() != 0.0;
            if (value.is_string()) return coerce_text(value.get<std::string>(), kind);
            break;

        case CellKind::BYTES:
            if (value.is_string()) {
                Bytes bytes;
                if (Base64::decode(value.get<std::string>(), bytes)) return bytes;
                return value.get<std::string>();
            }
            if (value.is_array()) {
                Bytes bytes;
                for (const auto& b : value) {
                    if (!b.is_number_integer()) return value.dump();
                    bytes.push_back(static_cast<uint8_t>(b.get<int64_t>() & 0xFF));
                }
                return bytes;
            }
            break;

        case CellKind::DATE:
            if (value.is_number_integer())
                return format_epoch_ms(value.get<int64_t>() * 86400000LL, true, false);
            if (value.is_string()) return value.get<std::string>();
            break;

        case CellKind::TIME:
            if (value.is_number_integer()) return format_epoch_ms(value.get<int64_t>(), false, true);
            if (value.is_string()) return value.get<std::string>();
            break;

        case CellKind::TIMESTAMP:
            if (value.is_number_integer()) return format_epoch_ms(value.get<int64_t>(), true, true);
            if (value.is_string()) return value.get<std::string>();
            break;

        case CellKind::ANY:
            if (value.is_boolean()) return value.get<bool>();
            if (value.is_number_integer()) return value.get<int64_t>();
            if (value.is_number_float()) return value.get<double>();
            if (value.is_string()) return value.get<std::string>();
            break;

        case CellKind::STRING:
            if (value.is_string()) return value.get<std::string>();
            if (value.is_boolean()) return std::string(value.get<bool>() ? "true" : "false");
            break;
    }

    // Arrays, objects, and type mismatches keep their JSON text
    return value.dump();
}

Cell ResultNormalizer::coerce_text(const std::string& raw, CellKind kind) {
    switch (kind) {
        case CellKind::INTEGER: {
            int64_t v = 0;
            if (parse_int64(raw, v)) return v;
            double d = 0;
            if (parse_double(raw, d)) return d;
            return raw;
        }
        case CellKind::FLOAT: {
            double d = 0;
            if (parse_double(raw, d)) return d;
            return raw;
        }
        case CellKind::DECIMAL: {
            int64_t v = 0;
            if (parse_int64(raw, v)) return v;
            double d = 0;
            if (decimal_fits_double(raw) && parse_double(raw, d)) return d;
            return raw;
        }
        case CellKind::BOOLEAN: {
            std::string u = upper(raw);
            if (u == "1" || u == "TRUE" || u == "T" || u == "Y") return true;
            if (u == "0" || u == "FALSE" || u == "F" || u == "N") return false;
            return raw;
        }
        case CellKind::BYTES:
            return Bytes(raw.begin(), raw.end());
        default:
            return raw;
    }
}

void ResultNormalizer::make_unique_names(std::vector<ColumnDescriptor>& columns) {
    std::set<std::string> seen;
    for (size_t i = 0; i < columns.size(); ++i) {
        auto& col = columns[i];
        if (col.name.empty()) col.name = "Column" + std::to_string(i + 1);
        if (seen.count(col.name)) col.name += "_" + std::to_string(i + 1);
        seen.insert(col.name);
    }
}

std::vector<ColumnDescriptor> ResultNormalizer::describe_avatica(const nlohmann::json& columns) {
    std::vector<ColumnDescriptor> out;
    if (!columns.is_array()) return out;

    for (const auto& c : columns) {
        ColumnDescriptor desc;
        if (c.is_string()) {
            desc.name = c.get<std::string>();
        } else if (c.is_object()) {
            for (const char* key : {"columnName", "label", "name"}) {
                auto it = c.find(key);
                if (it != c.end() && it->is_string() && !it->get<std::string>().empty()) {
                    desc.name = it->get<std::string>();
                    break;
                }
            }
            auto type = c.find("type");
            if (type != c.end()) {
                if (type->is_string()) {
                    desc.logical_type = type->get<std::string>();
                } else if (type->is_object()) {
                    auto name = type->find("name");
                    if (name != type->end() && name->is_string()) desc.logical_type = name->get<std::string>();
                }
            }
        }
        out.push_back(std::move(desc));
    }
    make_unique_names(out);
    return out;
}

TabularResult ResultNormalizer::from_avatica(const nlohmann::json& columns,
                                             const nlohmann::json& rows) {
    TabularResult result;
    result.columns = describe_avatica(columns);

    std::vector<CellKind> kinds;
    kinds.reserve(result.columns.size());
    for (const auto& c : result.columns) kinds.push_back(cell_kind_for_type(c.logical_type));

    if (!rows.is_array()) return result;

    result.rows.reserve(rows.size());
    for (const auto& raw : rows) {
        Row row;
        for (size_t i = 0; i < result.columns.size(); ++i) {
            const auto& name = result.columns[i].name;
            if (raw.is_array() && i < raw.size()) {
                row.cells[name] = coerce_json(raw[i], kinds[i]);
            } else if (raw.is_object() && raw.contains(name)) {
                row.cells[name] = coerce_json(raw[name], kinds[i]);
            } else {
                row.cells[name] = std::monostate{};  // short row: explicit null
            }
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

TabularResult ResultNormalizer::from_driver(const std::vector<DriverColumn>& columns,
                                            const std::vector<DriverRow>& rows) {
    TabularResult result;
    result.columns.reserve(columns.size());
    for (const auto& c : columns) result.columns.push_back({c.name, c.type_name});
    make_unique_names(result.columns);

    std::vector<CellKind> kinds;
    for (const auto& c : result.columns) kinds.push_back(cell_kind_for_type(c.logical_type));

    result.rows.reserve(rows.size());
    for (const auto& raw : rows) {
        Row row;
        for (size_t i = 0; i < result.columns.size(); ++i) {
            const auto& name = result.columns[i].name;
            if (i < raw.size() && raw[i].has_value()) {
                row.cells[name] = coerce_text(*raw[i], kinds[i]);
            } else {
                row.cells[name] = std::monostate{};
            }
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

} // namespace phxgw
