#include <catch2/catch.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include "client.hpp"
#include "fake_sql.hpp"
#include "helpers.hpp"
#include "migrator.hpp"

namespace {

    jdoc J(const char* text) {
        jdoc d;
        REQUIRE(jhlp::parse_str(text, d));
        return d;
    }

    // A SQLite file migrated to the given snapshots, with a client and a spare connection.
    struct ClientFixture {
        TempDb db { "client" };
        PSQLConnection direct;
        std::shared_ptr<const SchemaSnapshot> snap;
        std::shared_ptr<pool::IDbPool> pool;
        std::unique_ptr<Client> client;

        explicit ClientFixture(std::initializer_list<const char*> versions) {
            SchemaHistory h;
            for (const char* v : versions) h.add(SchemaSnapshot::parse(v));
            direct = db.open();
            ApplyOptions confirmed;
            confirmed.confirm_destructive = true;
            Migrator(Dialect::SQLite).migrate(*direct, h, confirmed);
            snap = h.current();
            pool = make_pool(Dialect::SQLite, db.path(), 1);
            client = std::make_unique<Client>(snap, pool);
        }
    };

    struct BlogFixture : ClientFixture {
        BlogFixture()
            : ClientFixture({ fixtures::USERS_V1, fixtures::POSTS_V2 }) { }

        int64_t add_user(const std::string& email, const std::string& name = "someone") {
            jdoc u(json::kObjectType);
            jhlp::set(u, "email", email);
            jhlp::set(u, "name", name);
            return client->create("User", u)["id"].GetInt64();
        }

        int64_t add_post(const std::string& title, int64_t author) {
            jdoc p(json::kObjectType);
            jhlp::set(p, "title", title);
            jhlp::set(p, "authorId", author);
            return client->create("Post", p)["id"].GetInt64();
        }
    };

    std::string str(const jval& v) { return jhlp::val2str(v); }

    template <typename E>
    E caught(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const E& e) {
            return e;
        }
        FAIL("expected exception was not thrown");
        throw std::logic_error("unreachable");
    }

} // namespace

TEST_CASE_METHOD(BlogFixture, "records round-trip with store and client generated values", "[client]") {
    jdoc user = client->create("User", J(R"({ "email": "a@x", "name": "Ann" })"));
    CHECK(user["id"].GetInt64() == 1);
    CHECK(str(user["email"]) == "a@x");

    jdoc post = client->create("Post", J(R"({ "title": "T1", "authorId": 1 })"));
    CHECK(post["published"].IsBool());
    CHECK_FALSE(post["published"].GetBool()); // store default
    REQUIRE(post["created_at"].IsString());
    CHECK(std::string(post["created_at"].GetString()).size() == 24);
    CHECK(post["updated_at"].IsString());

    jdoc found = client->read("Post", Filter().eq("id", post["id"].GetInt64()));
    REQUIRE(found.Size() == 1);
    CHECK(found[0]["title"] == post["title"]);
    CHECK(found[0]["created_at"] == post["created_at"]);

    jdoc changed = client->update("Post", Filter().eq("id", 1), J(R"({ "published": true })"));
    CHECK(changed["published"].GetBool());
    CHECK(changed["created_at"] == post["created_at"]);
}

TEST_CASE_METHOD(BlogFixture, "users and posts through the relation views", "[client][include]") {
    add_user("a@x", "Ann");
    add_post("T1", 1);

    jdoc users = client->read("User", Filter().eq("id", 1), { "posts" });
    REQUIRE(users.Size() == 1);
    REQUIRE(users[0]["posts"].IsArray());
    REQUIRE(users[0]["posts"].Size() == 1);
    CHECK(str(users[0]["posts"][0]["title"]) == "T1");

    jdoc posts = client->read("Post", Filter(), { "author" });
    REQUIRE(posts.Size() == 1);
    CHECK(str(posts[0]["author"]["email"]) == "a@x");

    auto err = caught<ConstraintError>([&] { client->remove("User", Filter().eq("id", 1)); });
    CHECK(err.kind() == ConstraintKind::ForeignKey);
    CHECK(err.entity() == "Post");
    CHECK(err.field() == "authorId");
    CHECK(client->count("User") == 1);

    client->remove("Post", Filter().eq("id", 1));
    jdoc gone = client->remove("User", Filter().eq("id", 1));
    CHECK(str(gone["email"]) == "a@x");
    CHECK(client->count("User") == 0);
}

TEST_CASE_METHOD(BlogFixture, "an include costs one query however many parents", "[client][include]") {
    for (int i = 1; i <= 3; ++i) add_user("u" + std::to_string(i) + "@x");
    for (int i = 0; i < 5; ++i) add_post("P" + std::to_string(i), 1 + i % 2);

    auto lease = pool::acquire_or_throw(*pool, pool::DbIntent::Read);
    CountingConnection counting(lease.conn());

    jdoc users = client->read(counting, "User", Filter(), { "posts" });
    CHECK(counting.round_trips() == 2);
    REQUIRE(users.Size() == 3);
    CHECK(users[0]["posts"].Size() == 3);
    CHECK(users[1]["posts"].Size() == 2);
    CHECK(users[2]["posts"].Empty()); // no children is an empty collection

    counting.reset();
    jdoc posts = client->read(counting, "Post", Filter(), { "author" });
    CHECK(counting.round_trips() == 2);
    CHECK(posts.Size() == 5);

    counting.reset();
    jdoc none = client->read(counting, "User", Filter().eq("email", "nobody@x"), { "posts" });
    CHECK(none.Empty());
    CHECK(counting.round_trips() == 1);
}

TEST_CASE_METHOD(BlogFixture, "invalid queries never reach the store", "[client][validation]") {
    add_user("a@x");
    auto lease = pool::acquire_or_throw(*pool, pool::DbIntent::Write);
    CountingConnection counting(lease.conn());

    CHECK_THROWS_AS(client->create(counting, "User", J(R"({ "email": "b@x", "age": 3 })")), ValidationError);
    CHECK_THROWS_AS(client->create(counting, "User", J(R"({ "email": 5 })")), ValidationError);
    CHECK_THROWS_AS(client->create(counting, "User", J(R"({ "name": "no email" })")), ValidationError);
    CHECK_THROWS_AS(client->create(counting, "User", J(R"({ "email": null })")), ValidationError);
    CHECK_THROWS_AS(client->create(counting, "Post",
                        J(R"({ "title": "T", "authorId": 1, "created_at": "2024-01-01T00:00:00.000Z" })")),
        ValidationError);
    CHECK_THROWS_AS(client->create(counting, "Comment", J("{}")), ValidationError);
    CHECK_THROWS_AS(client->read(counting, "User", Filter().eq("nick", "x")), ValidationError);
    CHECK_THROWS_AS(client->read(counting, "User", Filter().eq("id", "one")), ValidationError);
    CHECK_THROWS_AS(client->read(counting, "User", Filter().where("id", CmpOp::Gt, nullptr)), ValidationError);
    CHECK_THROWS_AS(client->read(counting, "User", Filter(), { "comments" }), ValidationError);
    CHECK_THROWS_AS(client->read(counting, "User", Filter(), { "posts", "posts" }), ValidationError);
    CHECK_THROWS_AS(client->update(counting, "User", Filter().eq("id", 1), J(R"({ "id": 2 })")), ValidationError);
    CHECK_THROWS_AS(client->update(counting, "User", Filter(), J(R"({ "name": "x" })")), ValidationError);
    CHECK_THROWS_AS(client->remove(counting, "User", Filter()), ValidationError);

    jdoc in_with_null = J(R"([1, null])");
    CHECK_THROWS_AS(client->read(counting, "User", Filter().where("id", CmpOp::In, in_with_null)), ValidationError);

    auto err = caught<ValidationError>([&] { client->create(counting, "User", J(R"({ "email": "b@x", "age": 3 })")); });
    CHECK(err.entity() == "User");
    CHECK(err.field() == "age");

    CHECK(counting.round_trips() == 0);
    CHECK_FALSE(counting.in_transaction());
}

TEST_CASE_METHOD(BlogFixture, "update and delete address exactly one record", "[client]") {
    add_user("a@x", "same");
    add_user("b@x", "same");

    auto nf = caught<NotFound>([&] { client->update("User", Filter().eq("id", 99), J(R"({ "name": "x" })")); });
    CHECK(nf.entity() == "User");
    CHECK_THROWS_AS(client->remove("User", Filter().eq("id", 99)), NotFound);

    CHECK_THROWS_AS(client->update("User", Filter().eq("name", "same"), J(R"({ "name": "changed" })")), ValidationError);
    // the statement ran, the transaction did not commit
    CHECK(client->count("User", Filter().eq("name", "same")) == 2);

    CHECK_THROWS_AS(client->remove("User", Filter().eq("name", "same")), ValidationError);
    CHECK(client->count("User") == 2);

    jdoc one = client->update("User", Filter().eq("email", "b@x"), J(R"({ "name": null })"));
    CHECK(one["name"].IsNull());
}

TEST_CASE_METHOD(BlogFixture, "store constraint violations come back typed", "[client][constraint]") {
    add_user("a@x");

    auto dup = caught<ConstraintError>([&] { client->create("User", J(R"({ "email": "a@x" })")); });
    CHECK(dup.kind() == ConstraintKind::Unique);
    CHECK(dup.entity() == "User");
    CHECK(dup.field() == "email");
    CHECK(dup.value() == "a@x");

    auto orphan = caught<ConstraintError>([&] { client->create("Post", J(R"({ "title": "T", "authorId": 999 })")); });
    CHECK(orphan.kind() == ConstraintKind::ForeignKey);
    CHECK(orphan.field() == "authorId");
    CHECK(orphan.value() == "999");

    CHECK(client->count("Post") == 0);
}

TEST_CASE_METHOD(BlogFixture, "upsert inserts then updates by identity", "[client][upsert]") {
    jdoc first = client->upsert("User", J(R"({ "id": 10, "email": "u@x", "name": "one" })"));
    CHECK(first["id"].GetInt64() == 10);
    jdoc second = client->upsert("User", J(R"({ "id": 10, "email": "u@x", "name": "two" })"));
    CHECK(str(second["name"]) == "two");
    CHECK(client->count("User") == 1);

    // the identity is store generated here, so there is nothing to upsert on
    CHECK_THROWS_AS(client->upsert("User", J(R"({ "email": "v@x" })")), ValidationError);
}

TEST_CASE_METHOD(BlogFixture, "reads filter, order and page", "[client][read]") {
    for (const char* e : { "c@x", "a@x", "d@x", "b@x" }) add_user(e);

    ReadOptions ro;
    ro.order_by.push_back({ "email", true });
    ro.limit = 2;
    ro.offset = 1;
    jdoc page = client->read("User", Filter(), {}, ro);
    REQUIRE(page.Size() == 2);
    CHECK(str(page[0]["email"]) == "c@x");
    CHECK(str(page[1]["email"]) == "b@x");

    jdoc some = client->read("User", Filter().in("email", std::vector<std::string> { "a@x", "d@x", "zz@x" }));
    CHECK(some.Size() == 2);

    CHECK(client->read("User", Filter().in("id", std::vector<int> {})).Empty());
    CHECK(client->count("User", Filter().where("id", CmpOp::Gt, 2)) == 2);
}

TEST_CASE_METHOD(BlogFixture, "queries run from their JSON description", "[client][query]") {
    jdoc created = client->execute(QueryDesc::from_json(J(R"({ "entity": "User", "op": "create",
        "data": { "email": "q@x", "name": "Q" } })")));
    CHECK(created["id"].GetInt64() == 1);
    client->execute(QueryDesc::from_json(J(R"({ "entity": "Post", "op": "create",
        "data": { "title": "B", "authorId": 1 } })")));
    client->execute(QueryDesc::from_json(J(R"({ "entity": "Post", "op": "create",
        "data": { "title": "A", "authorId": 1 } })")));

    jdoc posts = client->execute(QueryDesc::from_json(J(R"({ "entity": "Post", "op": "read",
        "where": { "authorId": { "in": [1] } }, "orderBy": "title", "include": ["author"] })")));
    REQUIRE(posts.Size() == 2);
    CHECK(str(posts[0]["title"]) == "A");
    CHECK(str(posts[1]["author"]["name"]) == "Q");

    jdoc n = client->execute(QueryDesc::from_json(J(R"({ "entity": "Post", "op": "count",
        "where": { "title": { "gte": "B" } } })")));
    CHECK(n["count"].GetInt64() == 1);

    CHECK_THROWS_AS(client->execute(QueryDesc::from_json(J(R"({ "entity": "Post", "op": "create" })"))), ValidationError);
}

TEST_CASE_METHOD(BlogFixture, "calls on the caller's connection join its transaction", "[client][tx]") {
    auto lease = pool::acquire_or_throw(*pool, pool::DbIntent::Write);
    SQLConnection& conn = lease.conn();
    conn.begin(true);
    client->create(conn, "User", J(R"({ "email": "t@x" })"));
    CHECK(conn.in_transaction());
    CHECK(client->count(conn, "User", Filter()) == 1);
    conn.rollback();
    CHECK(client->count(conn, "User", Filter()) == 0);
}

TEST_CASE_METHOD(BlogFixture, "a cancelled call sends nothing", "[client][cancel]") {
    CancelToken token;
    token.cancel();
    CHECK_THROWS_AS(client->create("User", J(R"({ "email": "c@x" })"), token), Cancelled);

    ReadOptions ro;
    ro.cancel = token;
    CHECK_THROWS_AS(client->read("User", Filter(), {}, ro), Cancelled);
    CHECK(client->count("User") == 0);
}

TEST_CASE_METHOD(BlogFixture, "entity handles bind the entity name", "[client]") {
    EntityClient users = client->entity("User");
    users.create(J(R"({ "email": "e@x" })"));
    CHECK(users.count() == 1);
    CHECK(users.name() == "User");
    CHECK_THROWS_AS(client->entity("Nope"), ValidationError);
}

TEST_CASE("one-to-one views, json fields, cascades and client identities", "[client][v3]") {
    ClientFixture f({ fixtures::USERS_V1, fixtures::POSTS_V2, fixtures::PROFILES_V3 });
    Client& c = *f.client;

    c.create("User", J(R"({ "email": "a@x" })"));
    c.create("User", J(R"({ "email": "b@x" })"));
    jdoc profile = c.create("Profile", J(R"({ "userId": 1, "prefs": { "theme": "dark", "size": 3 } })"));
    CHECK(str(profile["bio"]) == ""); // store default
    REQUIRE(profile["prefs"].IsObject());
    CHECK(str(profile["prefs"]["theme"]) == "dark");

    auto dup = caught<ConstraintError>([&] { c.create("Profile", J(R"({ "userId": 1 })")); });
    CHECK(dup.kind() == ConstraintKind::Unique);

    jdoc users = c.read("User", Filter(), { "profile" });
    REQUIRE(users.Size() == 2);
    CHECK(users[0]["profile"].IsObject());
    CHECK(users[0]["profile"]["prefs"]["size"].GetInt64() == 3);
    CHECK(users[1]["profile"].IsNull());

    // cascade is the store's to do
    c.remove("User", Filter().eq("id", 1));
    CHECK(c.count("Profile") == 0);

    jdoc tag = c.create("Tag", J(R"({ "label": "news" })"));
    REQUIRE(tag["id"].IsString());
    CHECK(tag["id"].GetStringLength() == 26);
    jdoc again = c.read("Tag", Filter().eq("id", str(tag["id"])));
    CHECK(again.Size() == 1);
}

TEST_CASE("deleting a parent nulls setnull references", "[client][setnull]") {
    ClientFixture f({ R"({ "version": 1, "entities": [
        { "name": "Team", "properties": { "id": { "type": "integer" }, "name": { "type": "string" } } },
        { "name": "Member",
          "properties": { "id": { "type": "integer" }, "teamId": { "type": "integer" } },
          "relations": [ { "name": "team", "field": "teamId", "target": "Team", "onDelete": "setnull" } ] } ] })" });
    Client& c = *f.client;

    const int64_t team = c.create("Team", J(R"({ "name": "core" })"))["id"].GetInt64();
    jdoc member(json::kObjectType);
    jhlp::set(member, "teamId", team);
    const int64_t id = c.create("Member", member)["id"].GetInt64();

    jdoc gone = c.remove("Team", Filter().eq("id", team));
    CHECK(gone["id"].GetInt64() == team);

    jdoc left = c.read("Member", Filter().eq("id", id));
    REQUIRE(left.Size() == 1);
    CHECK(left[0u]["teamId"].IsNull());
}

TEST_CASE("postgres statements use numbered placeholders", "[client][postgres]") {
    auto snap = SchemaSnapshot::parse(fixtures::POSTS_V2);
    std::vector<FakeSQLConnection*> made;
    auto p = std::make_shared<DbPool>(1, "fake", [&made]() -> PSQLConnection {
        auto conn = std::make_unique<FakeSQLConnection>(Dialect::Postgres);
        made.push_back(conn.get());
        return conn;
    });
    Client c(snap, p);
    CHECK(c.dialect() == Dialect::Postgres);

    made[0]->results.push_back(R"([{ "id": "7", "email": "a@x", "name": null }])");
    jdoc u = c.create("User", J(R"({ "email": "a@x" })"));
    CHECK(u["id"].GetInt64() == 7); // numeric text coerced back

    REQUIRE(made[0]->sent.size() == 1);
    CHECK(made[0]->sent[0].sql == R"(INSERT INTO "User" ("email") VALUES ($1) RETURNING "id", "email", "name")");
    CHECK(made[0]->begins == 1);
    CHECK(made[0]->commits == 1);
}
