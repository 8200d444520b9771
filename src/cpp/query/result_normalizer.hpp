#pragma once
// Converts either transport's native result shape into TabularResult.
//
//   Protocol transport: Avatica column metadata objects + JSON row arrays
//   Driver transport:   ODBC column descriptions + fetched text/binary values
//
// Both paths go through the same logical-type -> cell-kind mapping, so a
// BIGINT column yields int64 cells no matter which transport produced it.
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query_types.hpp"

namespace phxgw {

enum class CellKind { STRING, INTEGER, FLOAT, DECIMAL, BOOLEAN, BYTES, DATE, TIME, TIMESTAMP, ANY };

// Maps an engine type name ("BIGINT", "UNSIGNED_LONG", "VARCHAR ARRAY", ...)
// to the cell kind used for coercion. Empty/unknown names map to ANY,
// which infers the kind from the wire value itself.
CellKind cell_kind_for_type(const std::string& type_name);

// One column as described by the ODBC driver (type name already mapped
// from the SQL type code by the driver transport).
struct DriverColumn {
    std::string name;
    std::string type_name;
};

// nullopt = SQL NULL; otherwise the raw bytes fetched with SQLGetData
using DriverValue = std::optional<std::string>;
using DriverRow = std::vector<DriverValue>;

class ResultNormalizer {
public:
    // columns: Avatica ColumnMetaData array; rows: array of positional arrays.
    // A non-array `rows` (absent frame) is treated as zero rows.
    static TabularResult from_avatica(const nlohmann::json& columns,
                                      const nlohmann::json& rows);

    static TabularResult from_driver(const std::vector<DriverColumn>& columns,
                                     const std::vector<DriverRow>& rows);

    static Cell coerce_json(const nlohmann::json& value, CellKind kind);
    static Cell coerce_text(const std::string& raw, CellKind kind);

private:
    static std::vector<ColumnDescriptor> describe_avatica(const nlohmann::json& columns);
    static void make_unique_names(std::vector<ColumnDescriptor>& columns);
};

} // namespace phxgw
