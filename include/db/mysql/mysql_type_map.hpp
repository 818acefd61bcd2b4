#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include <mysql/mysql.h>
#include <cstddef>

namespace wpdb {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field metadata to GenericColumnType and decodes the textual
 * wire form of a column into a Value.
 */
class MysqlTypeMap {
public:
    /// Charset number MySQL reports for binary strings and BLOBs
    static constexpr unsigned int kBinaryCharset = 63;

    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @return Generic column type
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @brief Build a full ColumnTypeInfo from MySQL field metadata
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);

    /**
     * @brief Decode one non-NULL column value
     * @param info Column metadata from build_type_info()
     * @param data Raw bytes as delivered by the client library
     * @param length Byte count of data
     *
     * Integers become int64_t, floating and DECIMAL values double, temporal
     * values Timestamp with an ISO-8601 'T' separator, binary columns Bytes.
     * Anything that fails to parse falls back to text.
     */
    [[nodiscard]] static Value decode(const ColumnTypeInfo& info, const char* data, size_t length);
};

} // namespace wpdb
