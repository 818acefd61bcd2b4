#pragma once

#include <cstdint>
#include <string>

namespace wpdb {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from MySQL field types. Decides how a raw column value is decoded
 * into a Value (see core/types.hpp).
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,

    // Binary
    BLOB,

    // JSON
    JSON,

    // Vendor-specific fallback (BIT, GEOMETRY)
    VENDOR_SPECIFIC,
};

/**
 * @brief Column metadata carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // MySQL enum_field_types
    bool is_binary = false;            // binary collation (charsetnr 63)

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, bool binary)
        : generic_type(gt), vendor_type_id(vid), is_binary(binary) {}
};

} // namespace wpdb
