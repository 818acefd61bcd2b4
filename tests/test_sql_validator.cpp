#include <catch2/catch_test_macros.hpp>
#include "security/sql_validator.hpp"

using namespace wpdb;

namespace {

RejectReason reason_of(const SqlValidator& v, std::string_view sql) {
    const auto outcome = v.validate(sql);
    REQUIRE(outcome.is_rejected());
    return outcome.reason();
}

} // namespace

TEST_CASE("SqlValidator: allowed verbs approve in any case and spacing", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT * FROM wp_posts").is_approved());
    CHECK(v.validate("select ID from wp_posts").is_approved());
    CHECK(v.validate("  \n\tSeLeCt 1  ").is_approved());
    CHECK(v.validate("SHOW TABLES").is_approved());
    CHECK(v.validate("show columns from wp_options").is_approved());
    CHECK(v.validate("DESCRIBE wp_posts").is_approved());
    CHECK(v.validate("EXPLAIN SELECT * FROM wp_posts").is_approved());
    CHECK(v.validate("explain select 1").is_approved());
}

TEST_CASE("SqlValidator: single trailing semicolon is tolerated", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT 1;").is_approved());
    CHECK(v.validate("SELECT 1 ;  \n").is_approved());
    CHECK(v.validate("SHOW TABLES;").is_approved());
}

TEST_CASE("SqlValidator: embedded semicolons are multiple statements", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "SELECT * FROM t; DROP TABLE t") == RejectReason::MULTIPLE_STATEMENTS);
    CHECK(reason_of(v, "SELECT 1; SELECT 2") == RejectReason::MULTIPLE_STATEMENTS);
    CHECK(reason_of(v, "SELECT 1;;") == RejectReason::MULTIPLE_STATEMENTS);
    CHECK(reason_of(v, "SELECT 1; ;") == RejectReason::MULTIPLE_STATEMENTS);
}

TEST_CASE("SqlValidator: statement count is checked before the verb", "[validator]") {
    const SqlValidator v;
    CHECK(reason_of(v, "DROP TABLE a; DROP TABLE b") == RejectReason::MULTIPLE_STATEMENTS);
}

TEST_CASE("SqlValidator: other verbs are rejected", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "CALL proc()") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "SET @a = 1") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "WITH x AS (SELECT 1) SELECT * FROM x") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "HANDLER wp_posts OPEN") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "   ") == RejectReason::DISALLOWED_VERB);
}

TEST_CASE("SqlValidator: verb must be a whole word", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "SELECTED FROM t") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "SHOWTABLES") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "EXPLAINED") == RejectReason::DISALLOWED_VERB);
}

TEST_CASE("SqlValidator: one leading parenthesis is allowed", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("(SELECT 1)").is_approved());
    CHECK(v.validate("  (SELECT ID FROM wp_posts) UNION (SELECT ID FROM wp_pages)").is_approved());
    CHECK(reason_of(v, "((SELECT 1))") == RejectReason::DISALLOWED_VERB);
}

TEST_CASE("SqlValidator: write and DDL keywords anywhere are rejected", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "SELECT * FROM t INTO OUTFILE '/x'") == RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT * FROM t INTO   DUMPFILE '/x'") == RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT * FROM t into\noutfile '/x'") == RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT (DELETE FROM t)") == RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT 1 FROM t WHERE x IN (SELECT 1) OR update") == RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT REPLACE(post_title, 'a', 'b') FROM wp_posts") == RejectReason::DISALLOWED_KEYWORD);

    for (const char* kw : {"INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "CREATE",
                           "TRUNCATE", "REPLACE", "GRANT", "REVOKE", "LOAD"}) {
        const std::string sql = std::string("SELECT 1 FROM t WHERE ") + kw + " x";
        INFO(sql);
        CHECK(reason_of(v, sql) == RejectReason::DISALLOWED_KEYWORD);
    }
}

TEST_CASE("SqlValidator: keyword rejection names the keyword", "[validator]") {
    const SqlValidator v;

    const auto outcome = v.validate("SELECT * FROM t WHERE 1 OR drop");
    REQUIRE(outcome.is_rejected());
    CHECK(outcome.rejection().matched == "drop");
    CHECK(outcome.rejection().message() ==
          "Write/DDL operations are not allowed (drop). Read-only access only.");
}

TEST_CASE("SqlValidator: keywords inside identifiers do not match", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT LOAD_FILE('/tmp/x')").is_approved());

    CHECK(v.validate("SELECT updated_at, created_by FROM wp_posts").is_approved());
    CHECK(v.validate("SELECT post_modified FROM wp_posts WHERE post_status = 'draft'").is_approved());
    CHECK(v.validate("SELECT * FROM wp_droplets").is_approved());
}

TEST_CASE("SqlValidator: keywords inside string literals still match", "[validator]") {
    const SqlValidator v;
    CHECK(reason_of(v, "SELECT * FROM wp_posts WHERE post_title = 'how to delete'") ==
          RejectReason::DISALLOWED_KEYWORD);
}

TEST_CASE("SqlValidator: system schemas are rejected in every quoting form", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "SELECT * FROM information_schema.TABLES") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM INFORMATION_SCHEMA.tables") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM `information_schema`.`TABLES`") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM information_schema `TABLES`") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT user FROM mysql.user") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM mysql . user") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM performance_schema.threads") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM sys.session") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(reason_of(v, "SELECT * FROM SYS.session") == RejectReason::SYSTEM_SCHEMA_ACCESS);
}

TEST_CASE("SqlValidator: schema rejection names the schema", "[validator]") {
    const SqlValidator v;

    const auto outcome = v.validate("SELECT * FROM MySQL.user");
    REQUIRE(outcome.is_rejected());
    CHECK(outcome.rejection().matched == "mysql");
    CHECK(outcome.rejection().message() == "Access to system schema 'mysql' is not allowed.");
    CHECK(std::string(reject_reason_to_string(outcome.reason())) == "system-schema-access");
}

TEST_CASE("SqlValidator: schema names as substrings are allowed", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT * FROM wp_sys_log").is_approved());
    CHECK(v.validate("SELECT * FROM wp_sys.x").is_approved());
    CHECK(v.validate("SELECT mysql_version FROM wp_stats").is_approved());
}

TEST_CASE("SqlValidator: blocked schemas are configurable", "[validator]") {
    SqlValidator::Config cfg;
    cfg.blocked_schemas = {"secrets"};
    const SqlValidator v(cfg);

    CHECK(reason_of(v, "SELECT * FROM secrets.keys") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(v.validate("SELECT * FROM mysql.user").is_approved());
}

TEST_CASE("SqlValidator: comments are ignored by every check", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT /* x */ * FROM t -- trailing").is_approved());
    CHECK(v.validate("SELECT * FROM t # trailing").is_approved());
    CHECK(v.validate("/* leading */ SELECT 1").is_approved());
    CHECK(v.validate("-- header\nSELECT 1").is_approved());
    CHECK(v.validate("# header\nSHOW TABLES").is_approved());
    CHECK(v.validate("SELECT 1 /* ; DROP TABLE t */").is_approved());
    CHECK(v.validate("SELECT 1 -- ; DELETE FROM t").is_approved());
    CHECK(v.validate("SELECT 1 /* multi\nline\ncomment */ FROM t").is_approved());
}

TEST_CASE("SqlValidator: stripping removes comment bodies, not just markers", "[validator]") {
    const SqlValidator v;

    // DR/**/OP becomes "DR OP": no DROP keyword, and the verb check fails
    CHECK(reason_of(v, "DR/**/OP TABLE wp_posts") == RejectReason::DISALLOWED_VERB);
    CHECK(SqlValidator::strip_comments("DR/**/OP") == "DR OP");
    CHECK(SqlValidator::strip_comments("a /* b */ c") == "a   c");
    CHECK(SqlValidator::strip_comments("a -- b\nc") == "a  \nc");
    CHECK(SqlValidator::strip_comments("a # b") == "a  ");
}

TEST_CASE("SqlValidator: comments cannot hide a disallowed verb", "[validator]") {
    const SqlValidator v;

    CHECK(reason_of(v, "/* SELECT */ DELETE FROM t") == RejectReason::DISALLOWED_VERB);
    CHECK(reason_of(v, "-- SELECT\nDROP TABLE t") == RejectReason::DISALLOWED_VERB);
}

TEST_CASE("SqlValidator: unterminated block comment stays as text", "[validator]") {
    const SqlValidator v;

    CHECK(SqlValidator::strip_comments("SELECT 1 /* open") == "SELECT 1 /* open");
    CHECK(reason_of(v, "SELECT 1 /* DROP") == RejectReason::DISALLOWED_KEYWORD);
}

TEST_CASE("SqlValidator: rejection reason strings are stable", "[validator]") {
    CHECK(std::string(reject_reason_to_string(RejectReason::MULTIPLE_STATEMENTS)) == "multiple-statements");
    CHECK(std::string(reject_reason_to_string(RejectReason::DISALLOWED_VERB)) == "disallowed-verb");
    CHECK(std::string(reject_reason_to_string(RejectReason::DISALLOWED_KEYWORD)) == "disallowed-keyword");
    CHECK(std::string(reject_reason_to_string(RejectReason::SYSTEM_SCHEMA_ACCESS)) == "system-schema-access");
}

TEST_CASE("SqlValidator: long whitespace runs are scanned without recursion", "[validator]") {
    const SqlValidator v;
    const std::string gap(200000, ' ');

    CHECK(v.validate("SELECT 1 FROM wp_posts WHERE a = 'INTO" + gap + "x'").is_approved());
    CHECK(reason_of(v, "SELECT 1 FROM wp_posts INTO" + gap + "OUTFILE '/x'") ==
          RejectReason::DISALLOWED_KEYWORD);
    CHECK(reason_of(v, "SELECT * FROM mysql" + gap + ".user") == RejectReason::SYSTEM_SCHEMA_ACCESS);
    CHECK(v.validate("SELECT 1 FROM wp_posts WHERE a = 'mysql" + gap + "x'").is_approved());
    CHECK(v.validate("SELECT 1 FROM wp_posts WHERE a = 'sys" + std::string(200000, '\t') + "'").is_approved());
}

TEST_CASE("SqlValidator: file export phrases need whitespace and whole words", "[validator]") {
    const SqlValidator v;

    CHECK(v.validate("SELECT intooutfile FROM wp_posts").is_approved());
    CHECK(v.validate("SELECT * FROM wp_posts WHERE a = 'into outfiles'").is_approved());
    CHECK(v.validate("SELECT * FROM wp_posts WHERE a = 'pinto outfile'").is_approved());

    const auto outcome = v.validate("SELECT * FROM t Into \t DumpFile '/x'");
    REQUIRE(outcome.is_rejected());
    CHECK(outcome.rejection().matched == "Into \t DumpFile");
}

TEST_CASE("SqlValidator: earliest blocked keyword is reported", "[validator]") {
    const SqlValidator v;

    const auto phrase_first = v.validate("SELECT * FROM t INTO OUTFILE '/x' WHERE 1 OR drop");
    REQUIRE(phrase_first.is_rejected());
    CHECK(phrase_first.rejection().matched == "INTO OUTFILE");

    const auto word_first = v.validate("SELECT * FROM t WHERE 1 OR drop INTO OUTFILE '/x'");
    REQUIRE(word_first.is_rejected());
    CHECK(word_first.rejection().matched == "drop");
}
