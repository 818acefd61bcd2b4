#include "format/result_formatter.hpp"
#include "core/utils.hpp"
#include <format>
#include <type_traits>
#include <variant>

namespace wpdb {

namespace {

constexpr std::string_view kCrlf = "\r\n";

std::string bytes_to_text(const Bytes& bytes) {
    if (ResultFormatter::is_valid_utf8(bytes)) {
        return std::string(bytes.begin(), bytes.end());
    }
    return std::format("<binary {} bytes>", bytes.size());
}

// RFC 4180: quote fields holding a delimiter, quote or line break
void append_csv_field(std::string& out, const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        out += field;
        return;
    }
    out += '"';
    for (const char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
}

// "wp_" -> 1, "wp_7_" -> 7
int site_id_for(const std::string& base, const std::string& prefix) {
    if (prefix.size() <= base.size() + 1) {
        return 1;
    }
    const std::string_view digits(prefix.data() + base.size(), prefix.size() - base.size() - 1);
    return utils::parse_int<int>(digits, 1);
}

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    const std::string lower = utils::to_lower(std::string(name));
    if (lower == "json") return OutputFormat::JSON;
    if (lower == "csv") return OutputFormat::CSV;
    return std::nullopt;
}

bool ResultFormatter::is_valid_utf8(const Bytes& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const uint8_t c = bytes[i];
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            const uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates, beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

ResultFormatter::json ResultFormatter::value_to_json(const Value& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return bytes_to_text(v);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return v.iso;
        } else {
            return v;
        }
    }, value);
}

std::string ResultFormatter::value_to_text(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return bytes_to_text(v);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return v.iso;
        } else {
            return std::format("{}", v);
        }
    }, value);
}

ResultFormatter::json ResultFormatter::rows_to_json(const RowSet& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        json obj = json::object();
        for (const auto& [column, value] : row.fields) {
            obj[column] = value_to_json(value);
        }
        out.push_back(std::move(obj));
    }
    return out;
}

std::string ResultFormatter::rows_to_csv(const RowSet& rows) {
    if (rows.empty()) {
        return "";
    }

    std::string out;
    const auto& header = rows.front().fields;
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) out += ',';
        append_csv_field(out, header[i].first);
    }
    out += kCrlf;

    for (const auto& row : rows) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (i > 0) out += ',';
            const Value* v = row.get(header[i].first);
            append_csv_field(out, v ? value_to_text(*v) : std::string{});
        }
        out += kCrlf;
    }
    return out;
}

std::string ResultFormatter::query_response(
    const QueryRows& result, size_t limit, OutputFormat format) {

    if (format == OutputFormat::CSV) {
        return rows_to_csv(result.rows);
    }

    json doc = json::object();
    doc["row_count"] = result.rows.size();
    doc["has_more"] = result.has_more;
    doc["limit"] = limit;
    doc["rows"] = rows_to_json(result.rows);
    return dump(doc);
}

std::string ResultFormatter::rows_response(const RowSet& rows, OutputFormat format) {
    if (format == OutputFormat::CSV) {
        return rows_to_csv(rows);
    }
    return dump(rows_to_json(rows));
}

std::string ResultFormatter::describe_response(
    const TableDescription& description, OutputFormat format) {

    if (format == OutputFormat::CSV) {
        return rows_to_csv(description.columns);
    }

    json doc = json::object();
    doc["table"] = description.table;
    doc["columns"] = rows_to_json(description.columns);
    doc["indexes"] = rows_to_json(description.indexes);
    return dump(doc);
}

std::string ResultFormatter::sites_response(
    const std::string& base_prefix, const std::vector<std::string>& prefixes,
    OutputFormat format) {

    if (format == OutputFormat::CSV) {
        std::string out = "site_id,prefix";
        out += kCrlf;
        for (const auto& p : prefixes) {
            out += std::to_string(site_id_for(base_prefix, p));
            out += ',';
            append_csv_field(out, p);
            out += kCrlf;
        }
        return out;
    }

    json sites = json::array();
    for (const auto& p : prefixes) {
        json entry = json::object();
        entry["site_id"] = site_id_for(base_prefix, p);
        entry["prefix"] = p;
        sites.push_back(std::move(entry));
    }

    json doc = json::object();
    doc["base_prefix"] = base_prefix;
    doc["sites"] = std::move(sites);
    return dump(doc);
}

std::string ResultFormatter::error_response(const Error& error) {
    json doc = json::object();
    doc["error"] = error.public_message();
    doc["code"] = error_code_to_string(error.code);
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ResultFormatter::dump(const json& doc) {
    // Text columns are utf8mb4, but a mislabeled column must not abort output
    return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace wpdb
