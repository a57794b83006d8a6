#pragma once
#include <memory>
#include <string>
#include <vector>
#include "orm.hpp"
#include "query.hpp"
#include "sqlconnection.hpp"

// One bound parameter: a value owned by the caller's payload or filter.
struct SqlParam {
    const jval* value = nullptr;
    PropType type = PropType::String;
};

struct DmlStmt {
    std::string sql;
    std::vector<SqlParam> params; // params[i] binds placeholder i+1
};

/**
 * DML generation against one entity.
 * - Columns come from the payload members, in schema declaration order.
 * - Placeholder style:
 *     SQLite   -> ?1, ?2, ...
 *     Postgres -> $1, $2, ...
 * - Every write ends in RETURNING with the full column list, so the caller
 *   gets the stored row (generated identity included) in the same round-trip.
 * - Values are never spliced into the SQL text; LIMIT/OFFSET are integers.
 * Unknown field names throw ValidationError.
 */
class DMLVisitor {
public:
    virtual ~DMLVisitor() = default;

    virtual Dialect dialect() const = 0;

    DmlStmt insert (const OrmSchema& schema, const jval& value) const;
    // INSERT ... ON CONFLICT (identity) DO UPDATE; generated-on-create columns keep their stored value
    DmlStmt upsert (const OrmSchema& schema, const jval& value) const;
    DmlStmt update (const OrmSchema& schema, const jval& changes, const Filter& filter) const;
    DmlStmt remove (const OrmSchema& schema, const Filter& filter) const;
    DmlStmt select (const OrmSchema& schema, const Filter& filter, const ReadOptions& options = {}) const;
    // WHERE field IN (keys); a constant-false WHERE when keys is empty
    DmlStmt select_in(const OrmSchema& schema, const std::string& field, const std::vector<const jval*>& keys) const;
    DmlStmt count  (const OrmSchema& schema, const Filter& filter) const;

    static void bind(SQLStatement& stmt, const DmlStmt& dml);

protected:
    // 1-based placeholder
    virtual std::string ph(size_t index1) const = 0;
    virtual std::string limit_clause(const ReadOptions& options) const;

private:
    std::string where(const OrmSchema& schema, const Filter& filter, DmlStmt& out) const;
    std::string param(DmlStmt& out, const jval& value, PropType type) const;
};

class SqliteDMLVisitor final : public DMLVisitor {
public:
    Dialect dialect() const override { return Dialect::SQLite; }
protected:
    std::string ph(size_t index1) const override; // ?1
    std::string limit_clause(const ReadOptions& options) const override;
};

class PgDMLVisitor final : public DMLVisitor {
public:
    Dialect dialect() const override { return Dialect::Postgres; }
protected:
    std::string ph(size_t index1) const override; // $1
};

std::unique_ptr<DMLVisitor> make_dml_visitor(Dialect dialect);
