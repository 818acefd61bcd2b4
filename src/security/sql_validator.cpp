#include "security/sql_validator.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <regex>

namespace wpdb {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Same rule as regex \b: word-ness differs on the two sides of `pos`
bool at_word_boundary(std::string_view text, size_t pos) {
    const bool before = pos > 0 && is_word_char(text[pos - 1]);
    const bool after = pos < text.size() && is_word_char(text[pos]);
    return before != after;
}

size_t skip_whitespace(std::string_view text, size_t pos) {
    const size_t next = text.find_first_not_of(kWhitespace, pos);
    return next == std::string_view::npos ? text.size() : next;
}

// Replace every `open ... close` span with a single space. With an empty
// `close` the span runs to (not including) the next newline.
std::string strip_spans(const std::string& sql, std::string_view open, std::string_view close) {
    std::string out;
    out.reserve(sql.size());
    size_t pos = 0;
    while (pos < sql.size()) {
        const size_t start = sql.find(open, pos);
        if (start == std::string::npos) break;

        size_t end;
        if (close.empty()) {
            end = sql.find('\n', start + open.size());
            if (end == std::string::npos) end = sql.size();
        } else {
            const size_t close_pos = sql.find(close, start + open.size());
            if (close_pos == std::string::npos) break;  // unterminated: keep as text
            end = close_pos + close.size();
        }

        out.append(sql, pos, start - pos);
        out += ' ';
        pos = end;
    }
    out.append(sql, pos, std::string::npos);
    return out;
}

} // anonymous namespace

const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::MULTIPLE_STATEMENTS:  return "multiple-statements";
        case RejectReason::DISALLOWED_VERB:      return "disallowed-verb";
        case RejectReason::DISALLOWED_KEYWORD:   return "disallowed-keyword";
        case RejectReason::SYSTEM_SCHEMA_ACCESS: return "system-schema-access";
    }
    return "unknown";
}

std::string Rejection::message() const {
    switch (reason) {
        case RejectReason::MULTIPLE_STATEMENTS:
            return "Multiple SQL statements are not allowed.";
        case RejectReason::DISALLOWED_VERB:
            return "Only SELECT, SHOW, DESCRIBE and EXPLAIN statements are allowed.";
        case RejectReason::DISALLOWED_KEYWORD:
            return std::format("Write/DDL operations are not allowed ({}). Read-only access only.",
                               matched);
        case RejectReason::SYSTEM_SCHEMA_ACCESS:
            return std::format("Access to system schema '{}' is not allowed.", matched);
    }
    return "Statement rejected.";
}

SqlValidator::SqlValidator(const Config& config) {
    blocked_schemas_.reserve(config.blocked_schemas.size());
    for (const auto& schema : config.blocked_schemas) {
        if (!schema.empty()) {
            blocked_schemas_.push_back({schema, utils::to_lower(schema)});
        }
    }
}

std::string SqlValidator::strip_comments(std::string_view sql) {
    std::string clean = strip_spans(std::string(sql), "/*", "*/");
    clean = strip_spans(clean, "--", "");
    clean = strip_spans(clean, "#", "");
    return clean;
}

ValidationOutcome SqlValidator::validate(std::string_view sql) const {
    const std::string clean = strip_comments(sql);

    if (has_embedded_semicolon(clean)) {
        return ValidationOutcome::rejected(RejectReason::MULTIPLE_STATEMENTS);
    }

    if (!starts_with_allowed_verb(clean)) {
        return ValidationOutcome::rejected(RejectReason::DISALLOWED_VERB);
    }

    if (auto keyword = find_blocked_keyword(clean)) {
        return ValidationOutcome::rejected(RejectReason::DISALLOWED_KEYWORD, std::move(*keyword));
    }

    if (auto schema = find_blocked_schema(clean)) {
        return ValidationOutcome::rejected(RejectReason::SYSTEM_SCHEMA_ACCESS, std::move(*schema));
    }

    return ValidationOutcome::approved();
}

bool SqlValidator::has_embedded_semicolon(const std::string& clean) {
    std::string trimmed = utils::trim_right(clean);
    if (!trimmed.empty() && trimmed.back() == ';') {
        trimmed.pop_back();
    }
    trimmed = utils::trim_right(trimmed);
    return trimmed.find(';') != std::string::npos;
}

bool SqlValidator::starts_with_allowed_verb(const std::string& clean) {
    static const std::regex verb_re(R"(^(SELECT|SHOW|DESCRIBE|EXPLAIN)\b)", kRegexFlags);

    std::string head = utils::trim(clean);
    if (!head.empty() && head.front() == '(') {
        head.erase(0, 1);
    }
    return std::regex_search(head, verb_re);
}

std::optional<std::string> SqlValidator::find_blocked_keyword(const std::string& clean) {
    // Single words only; the two-word phrases are scanned by hand because a
    // quantified whitespace run costs one regex recursion level per character.
    static const std::regex keyword_re(
        R"(\b(INSERT|UPDATE|DELETE|DROP|ALTER|CREATE|TRUNCATE|REPLACE|GRANT|REVOKE|LOAD)\b)",
        kRegexFlags);

    std::optional<std::string> found;
    size_t found_pos = clean.size();

    std::smatch match;
    if (std::regex_search(clean, match, keyword_re)) {
        found_pos = static_cast<size_t>(match.position(1));
        found = match[1].str();
    }

    if (const auto phrase = find_file_export(utils::to_lower(clean))) {
        if (phrase->first < found_pos) {
            found = clean.substr(phrase->first, phrase->second - phrase->first);
        }
    }
    return found;
}

std::optional<std::pair<size_t, size_t>> SqlValidator::find_file_export(std::string_view lower) {
    static constexpr std::string_view kInto = "into";
    static constexpr std::string_view kTargets[] = {"outfile", "dumpfile"};

    for (size_t pos = lower.find(kInto); pos != std::string_view::npos;
         pos = lower.find(kInto, pos + 1)) {
        if (!at_word_boundary(lower, pos)) {
            continue;
        }
        const size_t gap = pos + kInto.size();
        const size_t word = skip_whitespace(lower, gap);
        if (word == gap) {
            continue;  // INTO must be followed by at least one whitespace character
        }
        for (const auto target : kTargets) {
            const size_t end = word + target.size();
            if (lower.compare(word, target.size(), target) == 0 && at_word_boundary(lower, end)) {
                return std::make_pair(pos, end);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> SqlValidator::find_blocked_schema(const std::string& clean) const {
    const std::string lower = utils::to_lower(clean);

    // schema.table, `schema`.table, schema`table`, whitespace allowed before the separator
    for (const auto& blocked : blocked_schemas_) {
        const std::string& name = blocked.lowered;
        for (size_t pos = lower.find(name); pos != std::string::npos;
             pos = lower.find(name, pos + 1)) {
            if (!at_word_boundary(lower, pos)) {
                continue;
            }
            const size_t next = skip_whitespace(lower, pos + name.size());
            if (next < lower.size() && (lower[next] == '.' || lower[next] == '`')) {
                return blocked.name;
            }
        }
    }
    return std::nullopt;
}

} // namespace wpdb
