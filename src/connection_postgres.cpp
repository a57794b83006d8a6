// connection_postgres.cpp
#include <libpq-fe.h>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>
#include "lib.hpp"
#include "sqlconnection.hpp"

namespace {

    // pg_type oids the row reader converts to JSON numbers/booleans
    constexpr Oid BOOLOID = 16;
    constexpr Oid INT8OID = 20;
    constexpr Oid INT2OID = 21;
    constexpr Oid INT4OID = 23;
    constexpr Oid FLOAT4OID = 700;
    constexpr Oid FLOAT8OID = 701;
    constexpr Oid NUMERICOID = 1700;

    std::string diag(const PGresult* res, int field) {
        const char* v = res ? PQresultErrorField(res, field) : nullptr;
        return v ? v : "";
    }

    // "Key (email)=(a@b.c) already exists." -> email, a@b.c
    void parse_key_detail(const std::string& detail, DbError& e) {
        auto k = detail.find("Key (");
        if (k == std::string::npos) return;
        auto close = detail.find(")=(", k);
        if (close == std::string::npos) return;
        auto end = detail.find(')', close + 3);
        if (end == std::string::npos) return;
        if (e.column.empty()) e.column = detail.substr(k + 5, close - k - 5);
        e.value = detail.substr(close + 3, end - close - 3);
    }

    DbError pg_error(PGconn* conn, const PGresult* res, const std::string& what) {
        const std::string state = diag(res, PG_DIAG_SQLSTATE);
        std::string msg = res ? PQresultErrorMessage(res) : "";
        if (msg.empty() && conn) msg = PQerrorMessage(conn);

        DbErrorKind kind = DbErrorKind::Other;
        if (conn && PQstatus(conn) == CONNECTION_BAD) kind = DbErrorKind::Connection;
        else if (state.rfind("23", 0) == 0) kind = DbErrorKind::Constraint;
        else if (state.rfind("08", 0) == 0) kind = DbErrorKind::Connection;
        else if (state == "0A000") kind = DbErrorKind::Unsupported;
        else if (state == "40P01" || state == "55P03" || state == "40001") kind = DbErrorKind::Busy;

        DbError e(kind, "Postgres " + what + ": " + msg);
        if (kind == DbErrorKind::Constraint) {
            if (state == "23505") e.constraint = ConstraintKind::Unique;
            else if (state == "23503") e.constraint = ConstraintKind::ForeignKey;
            else if (state == "23502") e.constraint = ConstraintKind::NotNull;
            else if (state == "23514") e.constraint = ConstraintKind::Check;
            e.table = diag(res, PG_DIAG_TABLE_NAME);
            e.column = diag(res, PG_DIAG_COLUMN_NAME);
            parse_key_detail(diag(res, PG_DIAG_MESSAGE_DETAIL), e);
        }
        return e;
    }

    // owns a PGresult for the scope of one call
    struct PgResult {
        PGresult* res;
        explicit PgResult(PGresult* r)
            : res(r) { }
        ~PgResult() {
            if (res) PQclear(res);
        }
        PgResult(const PgResult&) = delete;
        PgResult& operator=(const PgResult&) = delete;
    };

} // namespace

/*=============================  PgStatement  =============================*/
class PgStatement final : public SQLStatement {
public:
    PgStatement(PGconn* conn, std::string sql)
        : conn_(conn)
        , sql_(std::move(sql)) { }

    ~PgStatement() override = default;

    jdoc query() override {
        PgResult r(run());
        jdoc rows(json::kArrayType);
        auto& a = rows.GetAllocator();
        const int n = PQntuples(r.res);
        const int cols = PQnfields(r.res);
        for (int i = 0; i < n; ++i) {
            jval row(json::kObjectType);
            for (int c = 0; c < cols; ++c) {
                jval name(PQfname(r.res, c), a);
                jval v;
                if (!PQgetisnull(r.res, i, c)) {
                    const char* text = PQgetvalue(r.res, i, c);
                    switch (PQftype(r.res, c)) {
                        case INT2OID:
                        case INT4OID:
                        case INT8OID: v.SetInt64(std::strtoll(text, nullptr, 10)); break;
                        case FLOAT4OID:
                        case FLOAT8OID:
                        case NUMERICOID: v.SetDouble(std::strtod(text, nullptr)); break;
                        case BOOLOID: v.SetBool(text[0] == 't'); break;
                        default: v.SetString(text, static_cast<json::SizeType>(PQgetlength(r.res, i, c)), a); break;
                    }
                }
                row.AddMember(name.Move(), v.Move(), a);
            }
            rows.PushBack(row.Move(), a);
        }
        return rows;
    }

protected:
    void set_null(int idx) override {
        ensure_slot(idx);
        nulls_[idx - 1] = true;
    }

    void set_text(int idx, const std::string& value) override {
        ensure_slot(idx);
        values_[idx - 1] = value;
        nulls_[idx - 1] = false;
    }

    void set_int64(int idx, int64_t value) override { set_text(idx, std::to_string(value)); }

    void set_double(int idx, double value) override {
        std::ostringstream os;
        os.precision(17);
        os << value;
        set_text(idx, os.str());
    }

    void set_bool(int idx, bool value) override { set_text(idx, value ? "true" : "false"); }

private:
    void ensure_slot(int idx) {
        if (idx < 1) THROW("bind: index must be >= 1");
        if (static_cast<size_t>(idx) > values_.size()) {
            values_.resize(idx);
            nulls_.resize(idx, true);
        }
    }

    PGresult* run() {
        // pointers are taken after every bind so the vector storage is final
        std::vector<const char*> params(values_.size(), nullptr);
        for (size_t i = 0; i < values_.size(); ++i) {
            if (!nulls_[i]) params[i] = values_[i].c_str();
        }
        const int nParams = static_cast<int>(params.size());
        PGresult* res = PQexecParams(conn_, sql_.c_str(), nParams,
            nullptr, // let the server infer types
            nParams ? params.data() : nullptr,
            nullptr, nullptr, // text format
            0);
        const auto st = res ? PQresultStatus(res) : PGRES_FATAL_ERROR;
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            DbError e = pg_error(conn_, res, "exec failed [" + sql_ + "]");
            if (res) PQclear(res);
            throw e;
        }
        return res;
    }

    PGconn* conn_;
    std::string sql_;
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
};

/*=============================  PgConnection  =============================*/
class PgConnection final : public SQLConnection {
public:
    ~PgConnection() override { disconnect(); }

    Dialect dialect() const override { return Dialect::Postgres; }

    void connect(const std::string& dsn) override {
        disconnect();
        conn_ = PQconnectdb(dsn.c_str());
        if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
            std::string err = conn_ ? PQerrorMessage(conn_) : "no connection";
            disconnect();
            throw DbError(DbErrorKind::Connection, "Postgres connect failed: " + err);
        }
        // keep NOTICEs (IF EXISTS on missing objects) off stderr
        execute("SET client_min_messages TO WARNING;");
    }

    void disconnect() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        tr_started_ = false;
    }

    bool connected() const override { return conn_ && PQstatus(conn_) == CONNECTION_OK; }

    void execute(const std::string& sql) override {
        if (!conn_) throw DbError(DbErrorKind::Connection, "Postgres: not connected");
        PgResult r(PQexec(conn_, sql.c_str()));
        const auto st = r.res ? PQresultStatus(r.res) : PGRES_FATAL_ERROR;
        if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
            throw pg_error(conn_, r.res, "exec failed [" + sql + "]");
        }
    }

    // Postgres takes row and advisory locks lazily; immediate changes nothing
    bool begin(bool) override {
        if (tr_started_) return true;
        execute("BEGIN;");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        tr_started_ = false;
        execute("COMMIT;");
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        execute("ROLLBACK;");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        if (!conn_) throw DbError(DbErrorKind::Connection, "Postgres: not connected");
        return std::make_unique<PgStatement>(conn_, sql);
    }

private:
    PGconn* conn_ = nullptr;
};

PSQLConnection make_postgres_connection() {
    return std::make_unique<PgConnection>();
}
