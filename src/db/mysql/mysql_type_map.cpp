#include "db/mysql/mysql_type_map.hpp"
#include <algorithm>
#include <charconv>
#include <string>
#include <string_view>

namespace wpdb {

namespace {

Value decode_integer(std::string_view text) {
    int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return v;
    }
    // BIGINT UNSIGNED above INT64_MAX
    return std::string(text);
}

Value decode_floating(std::string_view text) {
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec == std::errc{} && ptr == text.data() + text.size()) {
        return v;
    }
    return std::string(text);
}

Value decode_temporal(std::string_view text) {
    // MySQL zero dates have no ISO-8601 form
    if (text.starts_with("0000-00-00")) {
        return std::string(text);
    }
    std::string iso(text);
    if (iso.size() > 10 && iso[10] == ' ') {
        iso[10] = 'T';
    }
    return Timestamp{std::move(iso)};
}

Value decode_bytes(const char* data, size_t length) {
    const auto* begin = reinterpret_cast<const uint8_t*>(data);
    return Bytes(begin, begin + length);
}

} // namespace

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return GenericColumnType::BLOB;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    return ColumnTypeInfo(
        field_type_to_generic(field.type),
        static_cast<uint32_t>(field.type),
        field.charsetnr == kBinaryCharset);
}

Value MysqlTypeMap::decode(const ColumnTypeInfo& info, const char* data, size_t length) {
    const std::string_view text(data, length);

    switch (info.generic_type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return decode_integer(text);

        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return decode_floating(text);

        case GenericColumnType::BOOLEAN:
            return text == "1";

        case GenericColumnType::DATE:
        case GenericColumnType::TIMESTAMP:
            return decode_temporal(text);

        case GenericColumnType::TIME:
            return Timestamp{std::string(text)};

        case GenericColumnType::VENDOR_SPECIFIC:
            return decode_bytes(data, length);

        case GenericColumnType::JSON:
            return std::string(text);

        default:
            // CHAR/VARCHAR/TEXT and BLOB share wire types; the charset decides
            if (info.is_binary) {
                return decode_bytes(data, length);
            }
            return std::string(text);
    }
}

} // namespace wpdb
