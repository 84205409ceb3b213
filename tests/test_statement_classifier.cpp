#include <catch2/catch_test_macros.hpp>
#include "security/statement_classifier.hpp"

using namespace sqlgate;

namespace {

ReasonCode reason_of(const StatementClassifier& c, std::string_view sql) {
    return c.classify(sql).reason;
}

} // namespace

TEST_CASE("StatementClassifier: accepts plain SELECT forms", "[classifier]") {
    StatementClassifier c;

    const char* accepted[] = {
        "SELECT 1",
        "select * from orders where id = 7",
        "SELECT * FROM t;",
        "  -- leading comment\n SELECT a FROM t",
        "/* block */ SELECT a FROM t",
        "SELECT 'DELETE FROM t' AS note",
        "SELECT CASE WHEN a > 1 THEN 'x' ELSE 'y' END FROM t",
        "SELECT a FROM t UNION SELECT b FROM u",
        "SELECT * FROM (SELECT a FROM t) AS s WHERE s.a IN (SELECT a FROM u)",
        "SELECT \"Mixed Case\" FROM \"Orders\"",
        "SELECT count(*) FROM t GROUP BY a HAVING count(*) > 2 ORDER BY 1 LIMIT 10 OFFSET 5",
    };
    for (const auto* sql : accepted) {
        INFO(sql);
        const auto v = c.classify(sql);
        CHECK(v.allowed);
        CHECK(v.reason == ReasonCode::OK);
    }
}

TEST_CASE("StatementClassifier: NOT_SELECT", "[classifier]") {
    StatementClassifier c;

    SECTION("Other statement kinds") {
        CHECK(reason_of(c, "INSERT INTO t VALUES (1)") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "UPDATE t SET a = 1") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "DELETE FROM t") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "DROP TABLE t") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "EXPLAIN SELECT 1") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "VALUES (1)") == ReasonCode::NOT_SELECT);
    }

    SECTION("CTE-led statements are not accepted") {
        CHECK(reason_of(c, "WITH x AS (SELECT 1) SELECT * FROM x") == ReasonCode::NOT_SELECT);
    }

    SECTION("Empty input") {
        CHECK(reason_of(c, "") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "   \n\t") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "-- only a comment") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, ";") == ReasonCode::NOT_SELECT);
    }

    SECTION("Lexical errors fail closed") {
        CHECK(reason_of(c, "SELECT 'unterminated") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "SELECT (1") == ReasonCode::NOT_SELECT);
        CHECK(reason_of(c, "SELECT 1 /* open") == ReasonCode::NOT_SELECT);
    }

    SECTION("Parser errors fail closed") {
        CHECK(reason_of(c, "SELECT * FROM WHERE") == ReasonCode::NOT_SELECT);
    }
}

TEST_CASE("StatementClassifier: STACKED_STATEMENT", "[classifier]") {
    StatementClassifier c;

    const auto v = c.classify("SELECT * FROM t; DROP TABLE t");
    CHECK_FALSE(v.allowed);
    CHECK(v.reason == ReasonCode::STACKED_STATEMENT);

    CHECK(reason_of(c, "SELECT 1; SELECT 2") == ReasonCode::STACKED_STATEMENT);
    CHECK(reason_of(c, "SELECT 1;;") == ReasonCode::STACKED_STATEMENT);

    // A semicolon inside a literal is not a terminator
    CHECK(reason_of(c, "SELECT ';' AS s") == ReasonCode::OK);
}

TEST_CASE("StatementClassifier: FORBIDDEN_KEYWORD", "[classifier]") {
    StatementClassifier c;

    SECTION("Writes and locks from a SELECT") {
        CHECK(reason_of(c, "SELECT * INTO copy_t FROM t") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM t FOR UPDATE") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM t FOR SHARE") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM t FOR NO KEY UPDATE") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM t FOR KEY SHARE") == ReasonCode::FORBIDDEN_KEYWORD);
    }

    SECTION("Denied keyword at any depth") {
        CHECK(reason_of(c, "SELECT * FROM (DELETE FROM t RETURNING *) x") ==
              ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT (SELECT 1 FROM (SELECT 1) a WHERE EXISTS (SELECT 1 FROM t FOR UPDATE))") ==
              ReasonCode::FORBIDDEN_KEYWORD);
    }

    SECTION("Procedural bodies") {
        CHECK(reason_of(c, "SELECT $$ BEGIN RETURN 1; END $$") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT $fn$x$fn$") == ReasonCode::FORBIDDEN_KEYWORD);
    }

    SECTION("Dangerous functions") {
        CHECK(reason_of(c, "SELECT pg_sleep(10)") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT PG_SLEEP (10)") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT \"pg_sleep\"(1)") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT pg_catalog.pg_read_file('/etc/passwd')") ==
              ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT nextval('seq')") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT set_config('role', 'admin', false)") ==
              ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM dblink('host=x', 'select 1') AS t(a int)") ==
              ReasonCode::FORBIDDEN_KEYWORD);
    }

    SECTION("System packages") {
        CHECK(reason_of(c, "SELECT dbms_random.value FROM dual") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT utl_http.request('x') FROM dual") == ReasonCode::FORBIDDEN_KEYWORD);
        CHECK(reason_of(c, "SELECT * FROM sys.users") == ReasonCode::FORBIDDEN_KEYWORD);
    }

    SECTION("Keywords inside literals and quoted names are data") {
        CHECK(reason_of(c, "SELECT 'DROP' AS a") == ReasonCode::OK);
        CHECK(reason_of(c, "SELECT \"update\" FROM t") == ReasonCode::OK);
        CHECK(reason_of(c, "SELECT a FROM t -- DELETE everything\n") == ReasonCode::OK);
    }
}

TEST_CASE("StatementClassifier: configured extras", "[classifier]") {
    ValidationConfig cfg;
    cfg.extra_denied_keywords = {"lateral"};
    cfg.extra_denied_functions = {" audit_bypass "};
    StatementClassifier c(cfg);

    CHECK(reason_of(c, "SELECT * FROM t, LATERAL (SELECT 1) x") == ReasonCode::FORBIDDEN_KEYWORD);
    CHECK(reason_of(c, "SELECT audit_bypass(1)") == ReasonCode::FORBIDDEN_KEYWORD);
    CHECK(reason_of(c, "SELECT 1") == ReasonCode::OK);
}

TEST_CASE("StatementClassifier: normalized text", "[classifier]") {
    StatementClassifier c;
    const auto v = c.classify("select  a,\n b\nfrom t -- note\n;");
    REQUIRE(v.allowed);
    CHECK(v.normalized_text == "SELECT A, B FROM T");
}

TEST_CASE("StatementClassifier: validate_identifier", "[classifier]") {
    StatementClassifier c;

    SECTION("Valid names") {
        for (const auto* name : {"USERS", "users", "_t", "orders_2024", "x$y#z"}) {
            INFO(name);
            const auto v = c.validate_identifier(name);
            CHECK(v.allowed);
            CHECK(v.normalized_text == name);
        }
    }

    SECTION("Injection attempts and malformed names") {
        for (const auto* name : {"1=1", "", "a b", "t;drop", "t--", "9lives", "\"quoted\"", "s.t"}) {
            INFO(name);
            CHECK(c.validate_identifier(name).reason == ReasonCode::INVALID_IDENTIFIER);
        }
    }

    SECTION("Length limit") {
        CHECK(c.validate_identifier(std::string(128, 'a')).allowed);
        CHECK(c.validate_identifier(std::string(129, 'a')).reason == ReasonCode::INVALID_IDENTIFIER);
    }

    SECTION("System catalog prefixes, any case") {
        CHECK(c.validate_identifier("pg_authid").reason == ReasonCode::INVALID_IDENTIFIER);
        CHECK(c.validate_identifier("PG_SHADOW").reason == ReasonCode::INVALID_IDENTIFIER);
        CHECK(c.validate_identifier("Information_Schema").reason == ReasonCode::INVALID_IDENTIFIER);
    }

    SECTION("Custom prefix list replaces the default") {
        ValidationConfig cfg;
        cfg.denied_identifier_prefixes = {"secret_"};
        StatementClassifier custom(cfg);
        CHECK(custom.validate_identifier("pg_class").allowed);
        CHECK_FALSE(custom.validate_identifier("secret_keys").allowed);
    }
}

TEST_CASE("StatementClassifier: redact and executable_text", "[classifier]") {

    SECTION("Literals are replaced") {
        CHECK(StatementClassifier::redact("select * from u where pw = 'hunter2' and id = 5") ==
              "SELECT * FROM U WHERE PW = ? AND ID = ?");
    }

    SECTION("Unlexable text is summarized") {
        CHECK(StatementClassifier::redact("SELECT 'oops") == "<unlexable: 12 bytes>");
    }

    SECTION("One trailing terminator is stripped") {
        CHECK(StatementClassifier::executable_text("SELECT 1;") == "SELECT 1");
        CHECK(StatementClassifier::executable_text("SELECT 1 ; -- done") == "SELECT 1 ");
        CHECK(StatementClassifier::executable_text("SELECT ';'") == "SELECT ';'");
        CHECK(StatementClassifier::executable_text("select  A") == "select  A");
    }
}
