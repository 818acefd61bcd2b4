#include "core/error.hpp"

namespace wpdb {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                return "none";
        case ErrorCode::VALIDATION_REJECTED: return "validation_error";
        case ErrorCode::NOT_INITIALIZED:     return "not_initialized";
        case ErrorCode::POOL_EXHAUSTED:      return "pool_exhausted";
        case ErrorCode::CONNECTION_ERROR:    return "connection_error";
        case ErrorCode::TIMEOUT:             return "timeout";
        case ErrorCode::QUERY_ERROR:         return "query_error";
        case ErrorCode::TABLE_NOT_FOUND:     return "table_not_found";
        case ErrorCode::INTERNAL_ERROR:      return "internal_error";
    }
    return "internal_error";
}

std::string Error::public_message() const {
    switch (code) {
        case ErrorCode::NONE:
            return "";
        case ErrorCode::VALIDATION_REJECTED:
        case ErrorCode::TABLE_NOT_FOUND:
            // Produced locally from caller input, safe to echo
            return detail;
        case ErrorCode::NOT_INITIALIZED:
            return "Database connection not initialized. Server may still be starting up.";
        case ErrorCode::POOL_EXHAUSTED:
            return "Database connection pool exhausted. Try again later.";
        case ErrorCode::CONNECTION_ERROR:
            return "Database connection error.";
        case ErrorCode::TIMEOUT:
            return "Query timed out.";
        case ErrorCode::QUERY_ERROR:
            return "Database query failed.";
        case ErrorCode::INTERNAL_ERROR:
            return "An unexpected error occurred.";
    }
    return "An unexpected error occurred.";
}

} // namespace wpdb
