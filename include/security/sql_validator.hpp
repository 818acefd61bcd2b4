#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wpdb {

/**
 * @brief Rule that rejected a statement
 */
enum class RejectReason {
    MULTIPLE_STATEMENTS,
    DISALLOWED_VERB,
    DISALLOWED_KEYWORD,
    SYSTEM_SCHEMA_ACCESS
};

[[nodiscard]] const char* reject_reason_to_string(RejectReason reason);

struct Rejection {
    RejectReason reason;
    std::string matched;    // offending keyword / schema name, empty for other rules

    [[nodiscard]] std::string message() const;
};

/**
 * @brief Approved, or Rejected with the rule that fired
 */
class ValidationOutcome {
public:
    static ValidationOutcome approved() { return ValidationOutcome{}; }

    static ValidationOutcome rejected(RejectReason reason, std::string matched = {}) {
        ValidationOutcome outcome;
        outcome.rejection_ = Rejection{reason, std::move(matched)};
        return outcome;
    }

    [[nodiscard]] bool is_approved() const { return !rejection_.has_value(); }
    [[nodiscard]] bool is_rejected() const { return rejection_.has_value(); }

    // Only valid when is_rejected()
    [[nodiscard]] const Rejection& rejection() const { return *rejection_; }
    [[nodiscard]] RejectReason reason() const { return rejection_->reason; }

private:
    std::optional<Rejection> rejection_;
};

/**
 * @brief Lexical read-only policy for caller-supplied SQL
 *
 * Not a parser. Comments are stripped first, then four checks run in order:
 * statement count, leading verb, keyword blocklist, system schema access.
 * The first failing check decides the outcome. The statement that is later
 * executed is always the caller's original text.
 *
 * Keywords inside quoted string literals are matched like any other text.
 */
class SqlValidator {
public:
    struct Config {
        std::vector<std::string> blocked_schemas = {
            "information_schema", "mysql", "performance_schema", "sys"};
    };

    SqlValidator() : SqlValidator(Config{}) {}
    explicit SqlValidator(const Config& config);

    [[nodiscard]] ValidationOutcome validate(std::string_view sql) const;

    /**
     * @brief Remove block, `--` and `#` comments (in that order)
     *
     * Each comment, body included, is replaced by one space. An unterminated
     * block comment is left in place.
     */
    [[nodiscard]] static std::string strip_comments(std::string_view sql);

private:
    struct BlockedSchema {
        std::string name;
        std::string lowered;
    };

    [[nodiscard]] static bool has_embedded_semicolon(const std::string& clean);
    [[nodiscard]] static bool starts_with_allowed_verb(const std::string& clean);
    [[nodiscard]] static std::optional<std::string> find_blocked_keyword(const std::string& clean);
    [[nodiscard]] std::optional<std::string> find_blocked_schema(const std::string& clean) const;

    // [begin, end) of the first INTO OUTFILE / INTO DUMPFILE in lowercased text
    [[nodiscard]] static std::optional<std::pair<size_t, size_t>> find_file_export(std::string_view lower);

    std::vector<BlockedSchema> blocked_schemas_;
};

} // namespace wpdb
