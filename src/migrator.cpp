#include "migrator.hpp"
#include "bootstrap.hpp"
#include "generators.hpp"
#include "lib.hpp"
#include "logging.hpp"

namespace {

    ApplyErrorKind apply_kind(const DbError& e) {
        switch (e.kind()) {
            case DbErrorKind::Connection: return ApplyErrorKind::ConnectionLost;
            case DbErrorKind::Constraint: return ApplyErrorKind::ConstraintViolation;
            case DbErrorKind::Unsupported: return ApplyErrorKind::DialectUnsupported;
            default: return ApplyErrorKind::StatementFailed;
        }
    }

    // a failed rollback is reported but never replaces the error that caused it
    void safe_rollback(SQLConnection& conn, const std::string& migration) {
        try {
            conn.rollback();
        } catch (const std::exception& e) {
            RELMAP_LOG_ERROR("rollback failed",
                { obs::str_field("migration", migration), obs::str_field("error", e.what()) });
        }
    }

    MigrationRecord to_record(const jval& row) {
        MigrationRecord r;
        r.seq = jhlp::get<int64_t>(row, "seq");
        r.name = jhlp::get<std::string>(row, "name");
        r.checksum = jhlp::get<std::string>(row, "checksum");
        r.applied_at = jhlp::get<std::string>(row, "applied_at");
        return r;
    }

} // namespace

Migrator::Migrator(Dialect dialect)
    : ddl_(make_ddl_visitor(dialect))
    , dml_(make_dml_visitor(dialect)) { }

std::vector<std::string> Migrator::plan(const std::vector<ChangeOp>& ops) const {
    return ddl_->plan(ops);
}

bool Migrator::ledger_exists(SQLConnection& conn) const {
    const char* sql = dialect() == Dialect::SQLite
        ? "SELECT name FROM sqlite_master WHERE type = 'table' AND name = '" LEDGER_TABLE "'"
        : "SELECT table_name FROM information_schema.tables"
          " WHERE table_schema = current_schema() AND table_name = '" LEDGER_TABLE "'";
    return conn.prepare(sql)->query().Size() > 0;
}

std::vector<MigrationRecord> Migrator::read_ledger(SQLConnection& conn, const Filter& filter) const {
    DmlStmt st = dml_->select(ledger_schema(), filter);
    auto stmt = conn.prepare(st.sql);
    DMLVisitor::bind(*stmt, st);
    jdoc rows = stmt->query();
    std::vector<MigrationRecord> out;
    for (const auto& row : rows.GetArray()) out.push_back(to_record(row));
    return out;
}

MigrationRecord Migrator::append_record(SQLConnection& conn, const std::string& name, const std::string& checksum) const {
    jdoc row(json::kObjectType);
    jhlp::set(row, "name", name);
    jhlp::set(row, "checksum", checksum);
    jhlp::set(row, "applied_at", ValueGenerator::now(PropType::Tm_Stamp));

    DmlStmt st = dml_->insert(ledger_schema(), row);
    auto stmt = conn.prepare(st.sql);
    DMLVisitor::bind(*stmt, st);
    jdoc rows = stmt->query();
    if (rows.Empty()) THROW("ledger insert returned no row for %s", name.c_str());
    return to_record(rows[0]);
}

std::vector<MigrationRecord> Migrator::history(SQLConnection& conn) const {
    if (!ledger_exists(conn)) return {};
    return read_ledger(conn, Filter());
}

ApplyResult Migrator::apply(SQLConnection& conn, const std::vector<ChangeOp>& ops, const std::string& name,
    const ApplyOptions& options) const {

    ApplyResult res;
    res.record.name = name;
    res.record.checksum = checksum(ops);

    std::vector<std::string> stmts;
    try {
        stmts = ddl_->plan(ops);
    } catch (const ApplyError& e) {
        throw ApplyError(e.kind(), name, {}, e.what());
    }

    std::vector<std::string>& attempted = res.statements;
    auto run = [&](const std::string& sql) {
        attempted.push_back(sql);
        conn.execute(sql);
    };

    try {
        for (const auto& s : ddl_->before_migration()) conn.execute(s);
    } catch (const DbError& e) {
        throw ApplyError(apply_kind(e), name, {}, e.what());
    }
    Finally restore([&]() {
        for (const auto& s : ddl_->after_migration()) {
            try {
                conn.execute(s);
            } catch (const std::exception& e) {
                RELMAP_LOG_ERROR("session restore failed", { obs::str_field("sql", s), obs::str_field("error", e.what()) });
            }
        }
    });

    try {
        options.cancel.check("migration " + name);
        conn.begin(true);
        for (const auto& s : ddl_->lock_ledger()) run(s);
        run(ddl_->visit(ledger_schema(), true));

        auto recorded = read_ledger(conn, Filter().eq("name", name));
        if (!recorded.empty()) {
            const MigrationRecord& r = recorded.front();
            if (r.checksum != res.record.checksum) {
                throw LedgerCorruption(name, "migration " + name + " is recorded with checksum " + r.checksum
                        + " but derives to " + res.record.checksum);
            }
            conn.commit();
            RELMAP_LOG_INFO("migration already applied", { obs::str_field("migration", name) });
            res.record = r;
            res.applied = false;
            res.statements.clear();
            return res;
        }

        std::vector<std::string> destructive;
        for (const auto& op : ops) {
            if (op.destructive) destructive.push_back(op.describe());
        }
        if (!destructive.empty()) {
            if (!options.confirm_destructive) {
                throw ApplyError(ApplyErrorKind::DestructiveUnconfirmed, name, {},
                    "migration " + name + " has destructive changes: " + join(destructive, "; "));
            }
            RELMAP_LOG_WARN("applying destructive changes",
                { obs::str_field("migration", name), obs::int_field("count", static_cast<int64_t>(destructive.size())) });
        }

        for (const auto& s : stmts) {
            options.cancel.check("migration " + name);
            RELMAP_LOG_DEBUG("ddl", { obs::str_field("migration", name), obs::str_field("sql", s) });
            run(s);
        }

        const std::string check = ddl_->integrity_check();
        if (!check.empty()) {
            jdoc bad = conn.prepare(check)->query();
            if (!bad.Empty()) {
                throw ApplyError(ApplyErrorKind::ConstraintViolation, name, attempted,
                    "foreign key check failed after migration " + name + ": " + jhlp::stringify(bad[0]));
            }
        }

        options.cancel.check("migration " + name);
        res.record = append_record(conn, name, res.record.checksum);
        conn.commit();
    } catch (const ApplyError&) {
        safe_rollback(conn, name);
        throw;
    } catch (const Cancelled& e) {
        safe_rollback(conn, name);
        throw ApplyError(ApplyErrorKind::Cancelled, name, attempted, e.what());
    } catch (const DbError& e) {
        safe_rollback(conn, name);
        RELMAP_LOG_ERROR("migration failed",
            { obs::str_field("migration", name), obs::str_field("kind", to_string(e.kind())), obs::str_field("error", e.what()) });
        throw ApplyError(apply_kind(e), name, attempted, e.what());
    } catch (const std::exception&) {
        safe_rollback(conn, name);
        throw;
    }

    res.applied = true;
    RELMAP_LOG_INFO("migration applied",
        { obs::str_field("migration", name), obs::int_field("seq", res.record.seq),
            obs::int_field("statements", static_cast<int64_t>(stmts.size())) });
    return res;
}

void Migrator::verify(const std::vector<MigrationRecord>& recorded, const SchemaHistory& local) const {
    const auto migrations = local.migrations();
    for (size_t i = 0; i < recorded.size(); ++i) {
        const MigrationRecord& r = recorded[i];
        if (i >= migrations.size()) {
            throw LedgerCorruption(r.name, "recorded migration " + r.name + " is not in the local history");
        }
        const Migration& m = migrations[i];
        if (m.name != r.name) {
            throw LedgerCorruption(r.name, "ledger position " + std::to_string(i + 1) + " holds " + r.name
                    + " where the local history has " + m.name);
        }
        if (m.checksum != r.checksum) {
            throw LedgerCorruption(r.name, "migration " + r.name + " is recorded with checksum " + r.checksum
                    + " but derives to " + m.checksum);
        }
    }
}

std::vector<Migration> Migrator::pending(SQLConnection& conn, const SchemaHistory& local) const {
    const auto recorded = history(conn);
    verify(recorded, local);
    auto migrations = local.migrations();
    migrations.erase(migrations.begin(), migrations.begin() + static_cast<std::ptrdiff_t>(recorded.size()));
    return migrations;
}

std::vector<ApplyResult> Migrator::migrate(SQLConnection& conn, const SchemaHistory& local,
    const ApplyOptions& options) const {
    std::vector<ApplyResult> out;
    for (const auto& m : pending(conn, local)) {
        out.push_back(apply(conn, m.diff.ops, m.name, options));
    }
    if (out.empty()) RELMAP_LOG_INFO("schema is up to date");
    return out;
}
