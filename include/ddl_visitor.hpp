#pragma once
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "orm.hpp"
#include "schemadiff.hpp"

/**
 * Lowers change operations into structural statements for one dialect.
 *
 * plan() is pure: the same operations always give the same statements, in
 * operation order. The session wrappers (before/after_migration, lock_ledger,
 * integrity_check) are run by the Migrator around the planned statements.
 */
class DDLVisitor {
public:
    virtual ~DDLVisitor() = default;

    virtual Dialect dialect() const = 0;
    virtual std::string sql_type(const OrmProp& f) const = 0;
    virtual std::string sql_default(const OrmProp& f) const;
    // SQL expression yielding "now" in the text form the client generates
    virtual std::string now_expr(PropType type) const = 0;

    // CREATE TABLE for one entity; table overrides the entity name
    virtual std::string visit(const OrmSchema& schema, bool if_not_exists = false,
        const std::string& table = "") const = 0;
    std::string index(const OrmSchema& schema, const OrmIndex& idx, bool if_not_exists = false) const;

    virtual std::vector<std::string> plan(const std::vector<ChangeOp>& ops) const = 0;

    // outside the transaction
    virtual std::vector<std::string> before_migration() const { return {}; }
    virtual std::vector<std::string> after_migration() const { return {}; }
    // first statement inside the transaction
    virtual std::vector<std::string> lock_ledger() const { return {}; }
    // query run before commit; any returned row aborts the migration
    virtual std::string integrity_check() const { return ""; }

protected:
    virtual std::string column(const OrmSchema& schema, const OrmProp& f) const = 0;
    static const char* on_delete_sql(OnDelete action);
};

class PgDDLVisitor : public DDLVisitor {
public:
    Dialect dialect() const override { return Dialect::Postgres; }
    std::string sql_type(const OrmProp& f) const override;
    std::string now_expr(PropType type) const override;
    std::string visit(const OrmSchema& schema, bool if_not_exists = false,
        const std::string& table = "") const override;
    std::vector<std::string> plan(const std::vector<ChangeOp>& ops) const override;
    std::vector<std::string> lock_ledger() const override;

protected:
    std::string column(const OrmSchema& schema, const OrmProp& f) const override;

private:
    void add_field(const ChangeOp& op, std::vector<std::string>& out) const;
    void alter_field(const ChangeOp& op, std::vector<std::string>& out) const;
    void add_relation(const OrmRelation& r, std::vector<std::string>& out) const;
};

class SqliteDDLVisitor : public DDLVisitor {
public:
    Dialect dialect() const override { return Dialect::SQLite; }
    std::string sql_type(const OrmProp& f) const override;
    std::string now_expr(PropType type) const override;
    std::string visit(const OrmSchema& schema, bool if_not_exists = false,
        const std::string& table = "") const override;
    std::vector<std::string> plan(const std::vector<ChangeOp>& ops) const override;
    std::vector<std::string> before_migration() const override;
    std::vector<std::string> after_migration() const override;
    std::string integrity_check() const override;

    // true when SQLite's ALTER TABLE ADD COLUMN can take the field as declared
    static bool can_add_column(const OrmSchema& schema, const OrmProp& f);

protected:
    std::string column(const OrmSchema& schema, const OrmProp& f) const override;

private:
    // entities whose operations are replaced by one table rebuild
    std::set<std::string> rebuilds(const std::vector<ChangeOp>& ops) const;
    void rebuild(const ChangeOp& op, std::vector<std::string>& out) const;
};

std::unique_ptr<DDLVisitor> make_ddl_visitor(Dialect dialect);

// statements joined for display, one per line, each ended by ';'
std::string render_sql(const std::vector<std::string>& statements);
