#pragma once
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <sqlconnection.hpp>

// ---- Test fakes ----
struct BoundParam {
    int idx {};
    std::string value; // text form, "null" for SQL NULL
    PropType type;
};

class FakeSQLConnection;

class FakeStatement final : public SQLStatement {
public:
    std::string sql;
    std::vector<BoundParam> binds;
    FakeSQLConnection* owner { nullptr }; // set by connection::prepare

    jdoc query() override;

protected:
    void set_null(int idx) override { binds.push_back({ idx, "null", PropType::String }); }
    void set_text(int idx, const std::string& value) override { binds.push_back({ idx, value, PropType::String }); }
    void set_int64(int idx, int64_t value) override { binds.push_back({ idx, std::to_string(value), PropType::Integer }); }
    void set_double(int idx, double value) override { binds.push_back({ idx, std::to_string(value), PropType::Number }); }
    void set_bool(int idx, bool value) override { binds.push_back({ idx, value ? "true" : "false", PropType::Bool }); }
};

// Records every statement; queries answer from a queue of canned result sets.
class FakeSQLConnection final : public SQLConnection {
public:
    struct CapturedStatement {
        std::string sql;
        std::vector<BoundParam> binds;
    };

    explicit FakeSQLConnection(Dialect d = Dialect::SQLite)
        : dialect_(d) { }

    std::vector<CapturedStatement> sent; // in order: conn.sent.back().sql, ...
    std::vector<std::string> executed; // parameterless execute()
    std::deque<std::string> results; // JSON arrays handed out by query()
    int begins { 0 };
    int commits { 0 };
    int rollbacks { 0 };
    // execute() of a statement containing this text throws DbError of fail_kind
    std::string fail_on;
    DbErrorKind fail_kind { DbErrorKind::Connection };

    Dialect dialect() const override { return dialect_; }
    void connect(const std::string&) override { connected_ = true; }
    void disconnect() override { connected_ = false; }
    bool connected() const override { return connected_; }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        auto stmt = std::make_unique<FakeStatement>();
        stmt->owner = this;
        stmt->sql = sql;
        return stmt;
    }

    void execute(const std::string& sql) override {
        executed.push_back(sql);
        if (!fail_on.empty() && sql.find(fail_on) != std::string::npos) {
            throw DbError(fail_kind, "store went away during: " + sql);
        }
    }

    bool begin(bool) override {
        ++begins;
        tr_started_ = true;
        return true;
    }
    bool commit() override {
        ++commits;
        tr_started_ = false;
        return true;
    }
    void rollback() override {
        ++rollbacks;
        tr_started_ = false;
    }

    jdoc next_result() {
        jdoc d;
        if (results.empty()) {
            d.SetArray();
            return d;
        }
        jhlp::parse_str(results.front(), d);
        results.pop_front();
        return d;
    }

private:
    Dialect dialect_;
    bool connected_ { false };
};

// ---- Inline impls that need full types ----
inline jdoc FakeStatement::query() {
    if (!owner) return jdoc(json::kArrayType);
    owner->sent.push_back({ sql, binds });
    return owner->next_result();
}

// Forwards to a real connection and counts the store round-trips.
class CountingConnection final : public SQLConnection {
public:
    explicit CountingConnection(SQLConnection& inner)
        : inner_(inner) { }

    int prepares { 0 };
    int executes { 0 };
    std::vector<std::string> statements;

    int round_trips() const { return prepares + executes; }
    void reset() {
        prepares = executes = 0;
        statements.clear();
    }

    Dialect dialect() const override { return inner_.dialect(); }
    void connect(const std::string& dsn) override { inner_.connect(dsn); }
    void disconnect() override { inner_.disconnect(); }
    bool connected() const override { return inner_.connected(); }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        ++prepares;
        statements.push_back(sql);
        return inner_.prepare(sql);
    }
    void execute(const std::string& sql) override {
        ++executes;
        statements.push_back(sql);
        inner_.execute(sql);
    }
    bool begin(bool immediate) override {
        const bool ok = inner_.begin(immediate);
        tr_started_ = true;
        return ok;
    }
    bool commit() override {
        const bool ok = inner_.commit();
        tr_started_ = false;
        return ok;
    }
    void rollback() override {
        tr_started_ = false;
        inner_.rollback();
    }

private:
    SQLConnection& inner_;
};
