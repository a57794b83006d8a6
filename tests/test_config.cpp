#include <catch2/catch.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include "config.hpp"
#include "helpers.hpp"

namespace {

    Config parse(const char* text) {
        jdoc d;
        REQUIRE(jhlp::parse_str(text, d));
        return Config::from_json(d);
    }

    // sets a variable for the scope of a test
    struct EnvVar {
        EnvVar(const char* name, const char* value)
            : name_(name) { ::setenv(name, value, 1); }
        ~EnvVar() { ::unsetenv(name_); }
        const char* name_;
    };

} // namespace

TEST_CASE("config defaults", "[config]") {
    Config c = parse("{}");
    CHECK(c.dialect == Dialect::SQLite);
    CHECK(c.dsn == "relmap.db");
    CHECK(c.pool_size == 1);
    CHECK(c.acquire_timeout.count() == 1500);
    CHECK(c.schema_dir == "schema");
    CHECK(c.log_level == "info");
    CHECK_FALSE(c.confirm_destructive);
}

TEST_CASE("config reads every key", "[config]") {
    Config c = parse(R"({ "dialect": "postgres", "dsn": "host=db dbname=app", "pool_size": 4,
        "acquire_timeout_ms": 250, "schema_dir": "defs", "log_level": "debug",
        "log_pattern": "%v", "confirm_destructive": true })");
    CHECK(c.dialect == Dialect::Postgres);
    CHECK(c.dsn == "host=db dbname=app");
    CHECK(c.pool_size == 4);
    CHECK(c.acquire_timeout.count() == 250);
    CHECK(c.schema_dir == "defs");
    CHECK(c.log_level == "debug");
    CHECK(c.log_pattern == "%v");
    CHECK(c.confirm_destructive);
}

TEST_CASE("config rejects invalid values", "[config]") {
    CHECK_THROWS_AS(parse("[]"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "dialect": "oracle" })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "dsn": "" })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "dsn": 5 })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "pool_size": 0 })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "pool_size": "2" })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "acquire_timeout_ms": -1 })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "log_level": "loud" })"), std::runtime_error);
    CHECK_THROWS_AS(parse(R"({ "confirm_destructive": "yes" })"), std::runtime_error);
}

TEST_CASE("config loads from a file", "[config]") {
    TempDir dir("config");
    const std::string path = dir.file("relmap.json");
    std::ofstream(path) << R"({ "dsn": "app.db", "pool_size": 2 })";

    Config c = Config::load(path);
    CHECK(c.dsn == "app.db");
    CHECK(c.pool_size == 2);

    CHECK_THROWS_AS(Config::load(dir.file("missing.json")), std::runtime_error);
    std::ofstream(dir.file("broken.json")) << "{ \"dsn\": ";
    CHECK_THROWS_AS(Config::load(dir.file("broken.json")), std::runtime_error);
}

TEST_CASE("environment overrides the file", "[config]") {
    Config c = parse(R"({ "dsn": "file.db", "log_level": "warn" })");
    {
        EnvVar dsn("RELMAP_DSN", "env.db");
        EnvVar level("RELMAP_LOG_LEVEL", "trace");
        EnvVar dir("RELMAP_SCHEMA_DIR", "/tmp/defs");
        c.apply_env();
    }
    CHECK(c.dsn == "env.db");
    CHECK(c.log_level == "trace");
    CHECK(c.schema_dir == "/tmp/defs");
    CHECK(c.dialect == Dialect::SQLite);

    EnvVar bad("RELMAP_DIALECT", "mssql");
    CHECK_THROWS(c.apply_env());
}
