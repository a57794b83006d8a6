#pragma once
#include <memory>
#include <string>
#include <vector>
#include "errors.hpp"
#include "orm.hpp"

/**
 * A prepared statement. Parameters are 1-based and typed by the schema
 * field they feed. query() runs it and returns every result row (none for
 * plain DML) as a JSON object keyed by column name.
 */
class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    // Type-checked bind; throws when the JSON value does not fit the declared type.
    virtual void bind(int idx, const jval& value, const PropType& type);
    virtual jdoc query() = 0; // array of row objects

protected:
    virtual void set_null(int idx) = 0;
    virtual void set_text(int idx, const std::string& value) = 0;
    virtual void set_int64(int idx, int64_t value) = 0;
    virtual void set_double(int idx, double value) = 0;
    virtual void set_bool(int idx, bool value) = 0;

    void set_datetime(int idx, const std::string& value) {
        set_text(idx, value);
    }

    void set_encoded(int idx, const std::string& data) {
        set_text(idx, data);
    }
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    virtual Dialect dialect() const = 0;

    // Connect using a DSN / path (SQLite: filename; Postgres: conninfo).
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;
    virtual bool connected() const = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // Run a parameterless statement, discarding any rows.
    virtual void execute(const std::string& sql) = 0;

    // immediate: take the write lock up front (SQLite BEGIN IMMEDIATE)
    virtual bool begin(bool immediate = false) = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;

    bool in_transaction() const { return tr_started_; }

protected:
    bool tr_started_ = false;
};

using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection();
#if HAVE_POSTGRESQL
PSQLConnection make_postgres_connection();
#endif
PSQLConnection make_connection(Dialect dialect);
