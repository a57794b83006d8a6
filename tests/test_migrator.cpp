#include <catch2/catch.hpp>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "fake_sql.hpp"
#include "helpers.hpp"
#include "migrator.hpp"

namespace {

    bool has_table(SQLConnection& conn, const std::string& name) {
        return conn.prepare("SELECT name FROM sqlite_master WHERE type = 'table' AND name = '" + name + "'")
                   ->query()
                   .Size()
            > 0;
    }

    std::vector<std::string> columns_of(SQLConnection& conn, const std::string& table) {
        std::vector<std::string> out;
        jdoc rows = conn.prepare("SELECT name FROM pragma_table_info('" + table + "')")->query();
        for (const auto& r : rows.GetArray()) out.push_back(r["name"].GetString());
        return out;
    }

    SchemaHistory three_versions() {
        SchemaHistory h;
        h.add(SchemaSnapshot::parse(fixtures::USERS_V1));
        h.add(SchemaSnapshot::parse(fixtures::POSTS_V2));
        h.add(SchemaSnapshot::parse(fixtures::PROFILES_V3));
        return h;
    }

    ApplyErrorKind apply_error(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const ApplyError& e) {
            return e.kind();
        }
        FAIL("no ApplyError was raised");
        return ApplyErrorKind::StatementFailed;
    }

} // namespace

TEST_CASE("migrations apply in order and are recorded", "[migrator]") {
    TempDb db("migrate");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto h = three_versions();
    auto ms = h.migrations();

    CHECK(m.history(*conn).empty());

    auto r1 = m.apply(*conn, ms[0].diff.ops, ms[0].name);
    CHECK(r1.applied);
    CHECK(r1.record.seq == 1);
    CHECK(r1.record.checksum == ms[0].checksum);
    CHECK_FALSE(r1.record.applied_at.empty());
    CHECK(has_table(*conn, "User"));

    auto r2 = m.apply(*conn, ms[1].diff.ops, ms[1].name);
    CHECK(r2.record.seq == 2);
    CHECK(has_table(*conn, "Post"));
    CHECK_FALSE(conn->in_transaction());

    auto recorded = m.history(*conn);
    REQUIRE(recorded.size() == 2);
    CHECK(recorded[0].name == "0001_init");
    CHECK(recorded[1].name == "0002_add_posts");
    CHECK_NOTHROW(m.verify(*conn, h));
}

TEST_CASE("re-applying a recorded migration is a no-op", "[migrator]") {
    TempDb db("idempotent");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();

    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    auto again = m.apply(*conn, ms[0].diff.ops, ms[0].name);
    CHECK_FALSE(again.applied);
    CHECK(again.statements.empty());
    CHECK(again.record.seq == 1);
    CHECK(m.history(*conn).size() == 1);
}

TEST_CASE("concurrent appliers record a migration once", "[migrator][concurrency]") {
    TempDb db("race");
    auto h = three_versions();
    auto first = h.migrations()[0];

    // Catch2 assertions stay on this thread
    ApplyResult results[2];
    std::exception_ptr errors[2];
    std::vector<std::thread> appliers;
    for (int i = 0; i < 2; ++i) {
        appliers.emplace_back([&, i]() {
            try {
                auto conn = db.open();
                results[i] = Migrator(Dialect::SQLite).apply(*conn, first.diff.ops, first.name);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }
    for (auto& t : appliers) t.join();
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    CHECK(results[0].applied != results[1].applied);
    CHECK(results[0].record.seq == 1);
    CHECK(results[1].record.seq == 1);
    auto conn = db.open();
    CHECK(Migrator(Dialect::SQLite).history(*conn).size() == 1);
}

TEST_CASE("a recorded name with another checksum is ledger corruption", "[migrator]") {
    TempDb db("corrupt");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();

    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    CHECK_THROWS_AS(m.apply(*conn, ms[1].diff.ops, ms[0].name), LedgerCorruption);
    CHECK_FALSE(has_table(*conn, "Post"));
    CHECK(m.history(*conn).size() == 1);
}

TEST_CASE("verify requires the ledger to be a prefix of the local history", "[migrator]") {
    Migrator m(Dialect::SQLite);
    auto h = three_versions();
    auto ms = h.migrations();

    std::vector<MigrationRecord> ok { { 1, ms[0].name, ms[0].checksum, "" }, { 2, ms[1].name, ms[1].checksum, "" } };
    CHECK_NOTHROW(m.verify(ok, h));

    auto renamed = ok;
    renamed[1].name = "0002_something_else";
    CHECK_THROWS_AS(m.verify(renamed, h), LedgerCorruption);

    auto edited = ok;
    edited[0].checksum = "0000000000000000";
    try {
        m.verify(edited, h);
        FAIL("edited history was accepted");
    } catch (const LedgerCorruption& e) {
        CHECK(e.migration() == "0001_init");
    }

    auto ahead = ok;
    ahead.push_back({ 3, ms[2].name, ms[2].checksum, "" });
    ahead.push_back({ 4, "0004_future", "ffffffffffffffff", "" });
    CHECK_THROWS_AS(m.verify(ahead, h), LedgerCorruption);
}

TEST_CASE("destructive changes need confirmation", "[migrator][destructive]") {
    TempDb db("destructive");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();
    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    m.apply(*conn, ms[1].diff.ops, ms[1].name);

    CHECK(apply_error([&] { m.apply(*conn, ms[2].diff.ops, ms[2].name); }) == ApplyErrorKind::DestructiveUnconfirmed);
    CHECK_FALSE(has_table(*conn, "Profile"));
    CHECK(columns_of(*conn, "User") == std::vector<std::string> { "id", "email", "name" });
    CHECK(m.history(*conn).size() == 2);

    ApplyOptions confirmed;
    confirmed.confirm_destructive = true;
    auto r = m.apply(*conn, ms[2].diff.ops, ms[2].name, confirmed);
    CHECK(r.applied);
    CHECK(columns_of(*conn, "User") == std::vector<std::string> { "id", "email" });
    CHECK(has_table(*conn, "Profile"));
    CHECK(has_table(*conn, "Tag"));
}

TEST_CASE("a table rebuild keeps rows and references", "[migrator][rebuild]") {
    TempDb db("rebuild");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();
    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    m.apply(*conn, ms[1].diff.ops, ms[1].name);

    conn->execute(R"(INSERT INTO "User" ("id", "email", "name") VALUES (1, 'a@x', 'Ann'))");
    conn->execute(R"(INSERT INTO "Post" ("title", "authorId", "published", "created_at", "updated_at")
                     VALUES ('T1', 1, 0, '2024-01-01T00:00:00.000Z', '2024-01-01T00:00:00.000Z'))");

    ApplyOptions confirmed;
    confirmed.confirm_destructive = true;
    m.apply(*conn, ms[2].diff.ops, ms[2].name, confirmed);

    jdoc users = conn->prepare(R"(SELECT "id", "email" FROM "User")")->query();
    REQUIRE(users.Size() == 1);
    CHECK(std::string(users[0u]["email"].GetString()) == "a@x");
    CHECK(conn->prepare("PRAGMA foreign_key_check")->query().Empty());

    // the restrict constraint on Post still points at the rebuilt table
    CHECK_THROWS_AS(conn->execute(R"(DELETE FROM "User" WHERE "id" = 1)"), DbError);
}

TEST_CASE("a failing migration leaves no trace", "[migrator][rollback]") {
    TempDb db("rollback");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();
    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    m.apply(*conn, ms[1].diff.ops, ms[1].name);
    // the name the next migration wants for its index, taken on a table it does not touch
    conn->execute(R"(CREATE INDEX "idx_Tag_label" ON "Post" ("title"))");

    ApplyOptions confirmed;
    confirmed.confirm_destructive = true;
    try {
        m.apply(*conn, ms[2].diff.ops, ms[2].name, confirmed);
        FAIL("migration with a clashing index was applied");
    } catch (const ApplyError& e) {
        CHECK(e.kind() == ApplyErrorKind::StatementFailed);
        CHECK(e.migration() == "0003_profiles");
        REQUIRE_FALSE(e.attempted().empty());
        CHECK(e.attempted().back().find("idx_Tag_label") != std::string::npos);
    }
    CHECK_FALSE(conn->in_transaction());
    CHECK_FALSE(has_table(*conn, "Profile"));
    CHECK_FALSE(has_table(*conn, "_relmap_new_User"));
    CHECK(columns_of(*conn, "User") == std::vector<std::string> { "id", "email", "name" });
    CHECK(m.history(*conn).size() == 2);
}

TEST_CASE("a dropped connection fails the migration once", "[migrator][rollback]") {
    FakeSQLConnection conn(Dialect::SQLite);
    conn.connect("fake");
    conn.fail_on = R"(CREATE TABLE "User")";
    auto ms = three_versions().migrations();

    try {
        Migrator(Dialect::SQLite).apply(conn, ms[0].diff.ops, ms[0].name);
        FAIL("migration survived a lost connection");
    } catch (const ApplyError& e) {
        CHECK(e.kind() == ApplyErrorKind::ConnectionLost);
        CHECK(e.migration() == "0001_init");
        REQUIRE_FALSE(e.attempted().empty());
        CHECK(e.attempted().back().find(R"(CREATE TABLE "User")") != std::string::npos);
    }
    CHECK(conn.rollbacks == 1);
    CHECK(conn.commits == 0);
    CHECK_FALSE(conn.in_transaction());

    int tries = 0;
    for (const auto& sql : conn.executed) {
        if (sql.find(R"(CREATE TABLE "User")") != std::string::npos) ++tries;
    }
    CHECK(tries == 1);
    for (const auto& st : conn.sent) CHECK(st.sql.find("INSERT") == std::string::npos);
}

TEST_CASE("orphaned rows fail the foreign key check of a rebuild", "[migrator][rebuild]") {
    TempDb db("orphan");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();
    m.apply(*conn, ms[0].diff.ops, ms[0].name);
    m.apply(*conn, ms[1].diff.ops, ms[1].name);

    conn->execute("PRAGMA foreign_keys=OFF");
    conn->execute(R"(INSERT INTO "Post" ("title", "authorId", "published", "created_at", "updated_at")
                     VALUES ('lost', 99, 0, '2024-01-01T00:00:00Z', '2024-01-01T00:00:00Z'))");
    conn->execute("PRAGMA foreign_keys=ON");

    ApplyOptions confirmed;
    confirmed.confirm_destructive = true;
    try {
        m.apply(*conn, ms[2].diff.ops, ms[2].name, confirmed);
        FAIL("migration over an orphaned row was applied");
    } catch (const ApplyError& e) {
        CHECK(e.kind() == ApplyErrorKind::ConstraintViolation);
        CHECK(e.migration() == "0003_profiles");
        CHECK_FALSE(e.attempted().empty());
    }
    CHECK_FALSE(conn->in_transaction());
    CHECK_FALSE(has_table(*conn, "Profile"));
    CHECK(columns_of(*conn, "User") == std::vector<std::string> { "id", "email", "name" });
    CHECK(m.history(*conn).size() == 2);
}

TEST_CASE("a cancelled migration is not applied", "[migrator][cancel]") {
    TempDb db("cancel");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto ms = three_versions().migrations();

    ApplyOptions opts;
    opts.cancel.cancel();
    CHECK(apply_error([&] { m.apply(*conn, ms[0].diff.ops, ms[0].name, opts); }) == ApplyErrorKind::Cancelled);
    CHECK_FALSE(has_table(*conn, "User"));
    CHECK(m.history(*conn).empty());
}

TEST_CASE("migrate applies whatever is pending", "[migrator]") {
    TempDb db("pending");
    auto conn = db.open();
    Migrator m(Dialect::SQLite);
    auto h = three_versions();

    ApplyOptions confirmed;
    confirmed.confirm_destructive = true;
    m.apply(*conn, h.migrations()[0].diff.ops, h.migrations()[0].name);

    auto pending = m.pending(*conn, h);
    REQUIRE(pending.size() == 2);
    CHECK(pending[0].name == "0002_add_posts");

    auto results = m.migrate(*conn, h, confirmed);
    REQUIRE(results.size() == 2);
    CHECK(results[1].record.seq == 3);
    CHECK(m.pending(*conn, h).empty());
    CHECK(m.migrate(*conn, h, confirmed).empty());
}

TEST_CASE("postgres adds foreign keys once the tables exist", "[migrator][postgres]") {
    Migrator m(Dialect::Postgres);
    auto ms = three_versions().migrations();
    auto stmts = m.plan(ms[1].diff.ops);
    REQUIRE(stmts.size() == 3);
    CHECK(stmts[1].find("ADD CONSTRAINT \"fk_Post_authorId\"") != std::string::npos);
}
