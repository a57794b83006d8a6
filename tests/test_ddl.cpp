#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include "ddl_visitor.hpp"
#include "helpers.hpp"
#include "schemadiff.hpp"

namespace {

    bool contains(const std::string& text, const std::string& part) {
        return text.find(part) != std::string::npos;
    }

    size_t count_of(const std::vector<std::string>& stmts, const std::string& part) {
        size_t n = 0;
        for (const auto& s : stmts) n += contains(s, part) ? 1 : 0;
        return n;
    }

    std::vector<std::string> plan_between(Dialect d, const char* from, const char* to) {
        auto a = from ? SchemaSnapshot::parse(from) : nullptr;
        auto b = SchemaSnapshot::parse(to);
        return make_ddl_visitor(d)->plan(diff(a.get(), *b).ops);
    }

} // namespace

TEST_CASE("sqlite CREATE TABLE covers identity, uniqueness and inline keys", "[ddl]") {
    auto snap = SchemaSnapshot::parse(fixtures::POSTS_V2);
    SqliteDDLVisitor sqlite;

    const std::string user = sqlite.visit(*snap->find("User"));
    CHECK(contains(user, "CREATE TABLE \"User\" ("));
    CHECK(contains(user, "\"id\" INTEGER PRIMARY KEY"));
    CHECK(contains(user, "\"email\" TEXT NOT NULL UNIQUE"));
    CHECK(contains(user, "\"name\" TEXT\n"));

    const std::string post = sqlite.visit(*snap->find("Post"), true);
    CHECK(contains(post, "CREATE TABLE IF NOT EXISTS \"Post\""));
    CHECK(contains(post, "\"published\" BOOLEAN NOT NULL DEFAULT FALSE"));
    CHECK(contains(post, "\"created_at\" TIMESTAMP NOT NULL"));
    CHECK(contains(post,
        "CONSTRAINT \"fk_Post_authorId\" FOREIGN KEY (\"authorId\") REFERENCES \"User\" (\"id\") ON DELETE RESTRICT"));
}

TEST_CASE("postgres CREATE TABLE leaves foreign keys to add-relation", "[ddl]") {
    auto snap = SchemaSnapshot::parse(fixtures::PROFILES_V3);
    PgDDLVisitor pg;

    const std::string user = pg.visit(*snap->find("User"));
    CHECK(contains(user, "\"id\" BIGINT GENERATED BY DEFAULT AS IDENTITY PRIMARY KEY"));
    CHECK(contains(user, "\"email\" TEXT NOT NULL CONSTRAINT \"uq_User_email\" UNIQUE"));

    const std::string profile = pg.visit(*snap->find("Profile"));
    CHECK(contains(profile, "\"prefs\" JSONB"));
    CHECK(contains(profile, "\"bio\" TEXT DEFAULT ''"));
    CHECK_FALSE(contains(profile, "FOREIGN KEY"));

    const std::string tag = pg.visit(*snap->find("Tag"));
    CHECK(contains(tag, "\"id\" TEXT PRIMARY KEY"));
    CHECK_FALSE(contains(tag, "IDENTITY"));
}

TEST_CASE("column types per dialect", "[ddl]") {
    OrmProp f;
    SqliteDDLVisitor sqlite;
    PgDDLVisitor pg;

    f.type = PropType::Tm_Stamp;
    CHECK(sqlite.sql_type(f) == "TIMESTAMP");
    CHECK(pg.sql_type(f) == "TIMESTAMPTZ");
    f.type = PropType::Number;
    CHECK(sqlite.sql_type(f) == "REAL");
    CHECK(pg.sql_type(f) == "DOUBLE PRECISION");
    f.type = PropType::Bin;
    CHECK(sqlite.sql_type(f) == "BLOB");
    CHECK(pg.sql_type(f) == "TEXT");
}

TEST_CASE("json defaults are emitted as JSON text", "[ddl]") {
    OrmProp f;
    f.type = PropType::Json;
    f.policy = DefaultPolicy::Static;
    f.default_kind = DefaultKind::String;
    f.default_value = "hi";
    SqliteDDLVisitor sqlite;
    CHECK(sqlite.sql_default(f) == "'\"hi\"'");

    f.default_kind = DefaultKind::Raw;
    f.default_value = R"({"a":1})";
    CHECK(sqlite.sql_default(f) == R"('{"a":1}')");
}

TEST_CASE("initial plans create tables before relations", "[ddl]") {
    SECTION("sqlite") {
        auto stmts = plan_between(Dialect::SQLite, nullptr, fixtures::POSTS_V2);
        REQUIRE(stmts.size() == 3);
        CHECK(contains(stmts[0], "CREATE TABLE \"Post\""));
        CHECK(contains(stmts[1], "CREATE TABLE \"User\""));
        CHECK(stmts[2] == "CREATE INDEX IF NOT EXISTS \"fk_Post_authorId_idx\" ON \"Post\" (\"authorId\")");
    }
    SECTION("postgres") {
        auto stmts = plan_between(Dialect::Postgres, nullptr, fixtures::POSTS_V2);
        REQUIRE(stmts.size() == 4);
        CHECK(contains(stmts[0], "CREATE TABLE \"Post\""));
        CHECK(contains(stmts[1], "CREATE TABLE \"User\""));
        CHECK(stmts[2] == "ALTER TABLE \"Post\" ADD CONSTRAINT \"fk_Post_authorId\" FOREIGN KEY (\"authorId\")"
                          " REFERENCES \"User\" (\"id\") ON DELETE RESTRICT");
        CHECK(stmts[3] == "CREATE INDEX IF NOT EXISTS \"fk_Post_authorId_idx\" ON \"Post\" (\"authorId\")");
    }
}

TEST_CASE("sqlite rebuilds a table once per migration", "[ddl]") {
    auto stmts = plan_between(Dialect::SQLite, fixtures::POSTS_V2, fixtures::PROFILES_V3);

    CHECK(count_of(stmts, "CREATE TABLE \"_relmap_new_User\"") == 1);
    CHECK(count_of(stmts, "INSERT INTO \"_relmap_new_User\" (\"id\", \"email\") SELECT \"id\", \"email\" FROM \"User\"") == 1);
    CHECK(count_of(stmts, "DROP TABLE \"User\"") == 1);
    CHECK(count_of(stmts, "ALTER TABLE \"_relmap_new_User\" RENAME TO \"User\"") == 1);
    CHECK(count_of(stmts, "CREATE UNIQUE INDEX IF NOT EXISTS \"fk_Profile_userId_idx\"") == 1);
    CHECK(count_of(stmts, "CREATE INDEX \"idx_Tag_label\" ON \"Tag\" (\"label\")") == 1);
}

TEST_CASE("sqlite adds plain columns in place", "[ddl]") {
    auto before = SchemaSnapshot::parse(fixtures::USERS_V1);
    auto after = SchemaSnapshot::parse(R"({ "version": 2, "entities": [
        { "name": "User", "properties": {
            "id": { "type": "integer", "idprop": true },
            "email": { "type": "string", "unique": true },
            "name": { "type": "string" },
            "active": { "type": "boolean", "default": true },
            "seen": { "type": "datetime", "generated": "update" } },
          "required": ["email", "active", "seen"] } ] })");
    auto ops = diff(before.get(), *after).ops;

    SECTION("a required static default fits ALTER TABLE ADD COLUMN, a generated one does not") {
        SqliteDDLVisitor sqlite;
        CHECK(SqliteDDLVisitor::can_add_column(*after->find("User"), *after->find("User")->find("active")));
        CHECK_FALSE(SqliteDDLVisitor::can_add_column(*after->find("User"), *after->find("User")->find("seen")));
        auto stmts = sqlite.plan(ops);
        // seen forces a rebuild, which carries active too
        CHECK(count_of(stmts, "ADD COLUMN") == 0);
        CHECK(count_of(stmts, "strftime('%Y-%m-%dT%H:%M:%S', 'now')") == 1);
    }

    SECTION("postgres backfills the generated column before NOT NULL") {
        PgDDLVisitor pg;
        auto stmts = pg.plan(ops);
        REQUIRE(stmts.size() == 4);
        CHECK(stmts[0] == "ALTER TABLE \"User\" ADD COLUMN \"active\" BOOLEAN NOT NULL DEFAULT TRUE");
        CHECK(stmts[1] == "ALTER TABLE \"User\" ADD COLUMN \"seen\" TIMESTAMP");
        CHECK(stmts[2] == "UPDATE \"User\" SET \"seen\" = (now() AT TIME ZONE 'UTC')::timestamp(0)");
        CHECK(stmts[3] == "ALTER TABLE \"User\" ALTER COLUMN \"seen\" SET NOT NULL");
    }
}

TEST_CASE("postgres alters columns in place", "[ddl]") {
    auto before = SchemaSnapshot::parse(R"({ "version": 1, "entities": [
        { "name": "Item", "properties": {
            "id": { "type": "integer", "idprop": true },
            "qty": { "type": "integer", "default": 1 },
            "flag": { "type": "boolean" } } } ] })");
    auto after = SchemaSnapshot::parse(R"({ "version": 2, "entities": [
        { "name": "Item", "properties": {
            "id": { "type": "integer", "idprop": true },
            "qty": { "type": "number", "default": 1.5 },
            "flag": { "type": "integer", "unique": true } },
          "required": ["qty"] } ] })");
    PgDDLVisitor pg;
    auto stmts = pg.plan(diff(before.get(), *after).ops);
    const std::string alter = "ALTER TABLE \"Item\" ALTER COLUMN ";
    CHECK(count_of(stmts, alter + "\"qty\" DROP DEFAULT") == 1);
    CHECK(count_of(stmts, alter + "\"qty\" TYPE DOUBLE PRECISION USING \"qty\"::DOUBLE PRECISION") == 1);
    CHECK(count_of(stmts, alter + "\"qty\" SET DEFAULT 1.5") == 1);
    CHECK(count_of(stmts, "UPDATE \"Item\" SET \"qty\" = 1.5 WHERE \"qty\" IS NULL") == 1);
    CHECK(count_of(stmts, alter + "\"qty\" SET NOT NULL") == 1);
    CHECK(count_of(stmts, alter + "\"flag\" TYPE BIGINT USING \"flag\"::int::BIGINT") == 1);
    CHECK(count_of(stmts, "ADD CONSTRAINT \"uq_Item_flag\" UNIQUE (\"flag\")") == 1);
}

TEST_CASE("postgres refuses identity changes", "[ddl]") {
    auto before = SchemaSnapshot::parse(R"({ "version": 1, "entities": [
        { "name": "Item", "properties": { "id": { "type": "integer", "idprop": true } } } ] })");
    auto after = SchemaSnapshot::parse(R"({ "version": 2, "entities": [
        { "name": "Item", "properties": { "id": { "type": "string", "idprop": true } } } ] })");
    PgDDLVisitor pg;
    try {
        pg.plan(diff(before.get(), *after).ops);
        FAIL("identity change was planned");
    } catch (const ApplyError& e) {
        CHECK(e.kind() == ApplyErrorKind::DialectUnsupported);
    }
}

TEST_CASE("session statements per dialect", "[ddl]") {
    SqliteDDLVisitor sqlite;
    PgDDLVisitor pg;
    CHECK(sqlite.before_migration() == std::vector<std::string> { "PRAGMA foreign_keys=OFF" });
    CHECK(sqlite.after_migration() == std::vector<std::string> { "PRAGMA foreign_keys=ON" });
    CHECK(sqlite.integrity_check() == "PRAGMA foreign_key_check");
    CHECK(sqlite.lock_ledger().empty());
    CHECK(pg.lock_ledger().size() == 1);
    CHECK(contains(pg.lock_ledger()[0], "pg_advisory_xact_lock"));
    CHECK(render_sql({ "A", "B" }) == "A;\nB;\n");
}
