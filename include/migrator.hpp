#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "cancel.hpp"
#include "ddl_visitor.hpp"
#include "dml_visitor.hpp"
#include "schemadiff.hpp"
#include "schemahistory.hpp"
#include "sqlconnection.hpp"

struct MigrationRecord {
    int64_t seq = 0;
    std::string name;
    std::string checksum;
    std::string applied_at;
};

struct ApplyOptions {
    bool confirm_destructive = false;
    CancelToken cancel;
};

struct ApplyResult {
    MigrationRecord record;
    bool applied = false; // false when the name was already in the ledger
    std::vector<std::string> statements; // statements sent, in order
};

/**
 * Applies change operations to a store, one transaction per migration,
 * and keeps the ledger of what was applied.
 */
class Migrator {
public:
    explicit Migrator(Dialect dialect);

    Dialect dialect() const { return ddl_->dialect(); }

    std::vector<std::string> plan(const std::vector<ChangeOp>& ops) const;

    // Idempotent by name. Throws ApplyError, or LedgerCorruption when the
    // name is recorded with another checksum.
    ApplyResult apply(SQLConnection& conn, const std::vector<ChangeOp>& ops, const std::string& name,
        const ApplyOptions& options = {}) const;

    // Ledger rows by seq; empty when the ledger does not exist yet.
    std::vector<MigrationRecord> history(SQLConnection& conn) const;

    // Recorded migrations must be a prefix of the local derivation. Throws LedgerCorruption.
    void verify(const std::vector<MigrationRecord>& recorded, const SchemaHistory& local) const;
    void verify(SQLConnection& conn, const SchemaHistory& local) const { verify(history(conn), local); }

    // verify, then apply every pending migration in order
    std::vector<ApplyResult> migrate(SQLConnection& conn, const SchemaHistory& local,
        const ApplyOptions& options = {}) const;

    // local migrations not in the ledger yet
    std::vector<Migration> pending(SQLConnection& conn, const SchemaHistory& local) const;

private:
    bool ledger_exists(SQLConnection& conn) const;
    std::vector<MigrationRecord> read_ledger(SQLConnection& conn, const Filter& filter) const;
    MigrationRecord append_record(SQLConnection& conn, const std::string& name, const std::string& checksum) const;

    std::unique_ptr<DDLVisitor> ddl_;
    std::unique_ptr<DMLVisitor> dml_;
};
