
#include "sqlconnection.hpp"
#include <sqlite3.h>
#include <string>
#include "lib.hpp"

namespace {

    ConstraintKind constraint_kind(int ext) {
        switch (ext) {
            case SQLITE_CONSTRAINT_UNIQUE:
            case SQLITE_CONSTRAINT_PRIMARYKEY: return ConstraintKind::Unique;
            case SQLITE_CONSTRAINT_FOREIGNKEY: return ConstraintKind::ForeignKey;
            case SQLITE_CONSTRAINT_NOTNULL: return ConstraintKind::NotNull;
            case SQLITE_CONSTRAINT_CHECK: return ConstraintKind::Check;
            default: return ConstraintKind::Unknown;
        }
    }

    // "UNIQUE constraint failed: User.email" -> User, email
    void constraint_target(const std::string& msg, DbError& e) {
        const std::string marker = "failed: ";
        auto pos = msg.find(marker);
        if (pos == std::string::npos) return;
        std::string target = msg.substr(pos + marker.size());
        auto comma = target.find(',');
        if (comma != std::string::npos) target.resize(comma);
        auto dot = target.find('.');
        if (dot == std::string::npos) return;
        e.table = target.substr(0, dot);
        e.column = target.substr(dot + 1);
    }

    DbError sqlite_error(sqlite3* db, const std::string& what) {
        const int ext = db ? sqlite3_extended_errcode(db) : SQLITE_CANTOPEN;
        const std::string msg = db ? sqlite3_errmsg(db) : "no database handle";
        DbErrorKind kind = DbErrorKind::Other;
        switch (ext & 0xFF) {
            case SQLITE_CONSTRAINT: kind = DbErrorKind::Constraint; break;
            case SQLITE_BUSY:
            case SQLITE_LOCKED: kind = DbErrorKind::Busy; break;
            case SQLITE_CANTOPEN:
            case SQLITE_IOERR:
            case SQLITE_NOTADB:
            case SQLITE_CORRUPT: kind = DbErrorKind::Connection; break;
            default: break;
        }
        DbError e(kind, "SQLite " + what + ": " + msg);
        if (kind == DbErrorKind::Constraint) {
            e.constraint = constraint_kind(ext);
            constraint_target(msg, e);
        }
        return e;
    }

} // namespace

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3* db, sqlite3_stmt* stmt)
        : db_(db)
        , stmt_(stmt) { }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    jdoc query() override {
        jdoc rows(json::kArrayType);
        auto& a = rows.GetAllocator();
        const int cols = sqlite3_column_count(stmt_);
        int rc;
        while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
            jval row(json::kObjectType);
            for (int c = 0; c < cols; ++c) {
                jval name(sqlite3_column_name(stmt_, c), a);
                jval v;
                switch (sqlite3_column_type(stmt_, c)) {
                    case SQLITE_INTEGER: v.SetInt64(sqlite3_column_int64(stmt_, c)); break;
                    case SQLITE_FLOAT: v.SetDouble(sqlite3_column_double(stmt_, c)); break;
                    case SQLITE_TEXT:
                    case SQLITE_BLOB: {
                        const char* p = reinterpret_cast<const char*>(sqlite3_column_blob(stmt_, c));
                        const int n = sqlite3_column_bytes(stmt_, c);
                        v.SetString(p ? p : "", static_cast<json::SizeType>(n), a);
                    } break;
                    default: v.SetNull(); break;
                }
                row.AddMember(name.Move(), v.Move(), a);
            }
            rows.PushBack(row.Move(), a);
        }
        if (rc != SQLITE_DONE) {
            throw sqlite_error(db_, "query failed");
        }
        return rows;
    }

protected:
    void set_null(int idx) override {
        check(sqlite3_bind_null(stmt_, idx));
    }

    void set_text(int idx, const std::string& value) override {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void set_int64(int idx, int64_t value) override {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void set_double(int idx, double value) override {
        check(sqlite3_bind_double(stmt_, idx, value));
    }

    void set_bool(int idx, bool value) override {
        check(sqlite3_bind_int(stmt_, idx, value ? 1 : 0));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw sqlite_error(db_, "bind failed");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class SQLiteConnection final : public SQLConnection {
public:
    ~SQLiteConnection() override { disconnect(); }

    Dialect dialect() const override { return Dialect::SQLite; }

    void connect(const std::string& dsn) override {
        disconnect();
        const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
        if (sqlite3_open_v2(dsn.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
            DbError e(DbErrorKind::Connection,
                "Failed to open SQLite DB " + dsn + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory"));
            disconnect();
            throw e;
        }
        sqlite3_extended_result_codes(db_, 1);
        // wait for locks instead of failing immediately
        sqlite3_busy_timeout(db_, 5000);
        execute("PRAGMA foreign_keys=ON;");
        if (dsn != ":memory:") {
            // concurrent readers while a writer holds the lock
            execute("PRAGMA journal_mode=WAL;");
        }
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    bool connected() const override { return db_ != nullptr; }

    void execute(const std::string& sql) override {
        if (!db_) throw DbError(DbErrorKind::Connection, "SQLite: not connected");
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
            sqlite3_free(errmsg);
            throw sqlite_error(db_, "exec failed [" + sql + "]");
        }
    }

    // transaction control
    bool begin(bool immediate) override {
        if (tr_started_) return true;
        execute(immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execute("COMMIT;");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // a failed statement may already have ended the transaction
        if (db_ && !sqlite3_get_autocommit(db_)) {
            execute("ROLLBACK;");
        }
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!db_) throw DbError(DbErrorKind::Connection, "SQLite: not connected");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
            throw sqlite_error(db_, "prepare failed [" + sql + "]");
        }
        if (!stmt) THROW("SQLite prepare: empty statement");
        return std::make_unique<SQLiteStatement>(db_, stmt);
    }

private:
    sqlite3* db_ = nullptr;
};

PSQLConnection make_sqlite_connection() {
    return std::make_unique<SQLiteConnection>();
}
