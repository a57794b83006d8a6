#include "ddl_visitor.hpp"
#include <algorithm>
#include "lib.hpp"

namespace {

    std::string column_list(const std::vector<std::string>& fields) {
        std::vector<std::string> cols;
        for (const auto& f : fields) cols.push_back(qi(f));
        return join(cols, ", ");
    }

    std::string create_table(const std::string& table, bool if_not_exists, const std::vector<std::string>& defs) {
        std::ostringstream ddl;
        ddl << "CREATE TABLE " << (if_not_exists ? "IF NOT EXISTS " : "") << qi(table) << " (\n    "
            << join(defs, ",\n    ") << "\n)";
        return ddl.str();
    }

    std::string json_text(const std::string& s) {
        jval v(s.c_str(), static_cast<json::SizeType>(s.size()));
        return jhlp::stringify(v);
    }

    // copy with NOT NULL dropped, for add-then-backfill
    OrmProp nullable(const OrmProp& f) {
        OrmProp n = f;
        n.required = false;
        return n;
    }

} // namespace

std::string DDLVisitor::sql_default(const OrmProp& f) const {
    using DK = DefaultKind;
    if (f.policy != DefaultPolicy::Static) return "";
    if (f.type == PropType::Json) {
        // JSON columns hold JSON text, a string default included
        switch (f.default_kind) {
            case DK::String: return qs(json_text(f.default_value));
            case DK::Raw: return f.default_value == VAL_NULL ? VAL_NULL : qs(f.default_value);
            default: return qs(f.default_value);
        }
    }
    switch (f.default_kind) {
        case DK::None:
            return "";
        case DK::String:
            return qs(f.default_value);
        case DK::Boolean:
            return f.default_value == "true" ? "TRUE" : "FALSE";
        case DK::Number:
        case DK::Raw:
            return f.default_value;
    }
    return "";
}

std::string DDLVisitor::index(const OrmSchema& schema, const OrmIndex& idx, bool if_not_exists) const {
    std::ostringstream ddl;
    ddl << "CREATE " << (idx.unique ? "UNIQUE " : "") << "INDEX " << (if_not_exists ? "IF NOT EXISTS " : "")
        << qi(idx.index_name) << " ON " << qi(schema.name) << " (" << column_list(idx.fields) << ")";
    return ddl.str();
}

const char* DDLVisitor::on_delete_sql(OnDelete action) {
    switch (action) {
        case OnDelete::Restrict: return "RESTRICT";
        case OnDelete::Cascade: return "CASCADE";
        case OnDelete::SetNull: return "SET NULL";
    }
    return "RESTRICT";
}

/* ---------- PostgreSQL ---------- */

std::string PgDDLVisitor::sql_type(const OrmProp& f) const {
    if (f.type == PropType::String   ) return "TEXT"            ;
    if (f.type == PropType::Integer  ) return "BIGINT"          ;
    if (f.type == PropType::Number   ) return "DOUBLE PRECISION";
    if (f.type == PropType::Bool     ) return "BOOLEAN"         ;
    if (f.type == PropType::Json     ) return "JSONB"           ;
    if (f.type == PropType::Date     ) return "DATE"            ;
    if (f.type == PropType::Time     ) return "TIME"            ;
    if (f.type == PropType::Dt_Time  ) return "TIMESTAMP"       ;
    if (f.type == PropType::Tm_Stamp ) return "TIMESTAMPTZ"     ;
    if (f.type == PropType::Bin      ) return "TEXT"            ; // binary travels encoded
    return "TEXT";
}

std::string PgDDLVisitor::now_expr(PropType type) const {
    switch (type) {
        case PropType::Date: return "CURRENT_DATE";
        case PropType::Time: return "(now() AT TIME ZONE 'UTC')::time(0)";
        case PropType::Dt_Time: return "(now() AT TIME ZONE 'UTC')::timestamp(0)";
        default: return "now()";
    }
}

std::string PgDDLVisitor::column(const OrmSchema& schema, const OrmProp& f) const {
    std::string def = qi(f.name) + " " + sql_type(f);
    if (f.is_id) {
        if (f.store_id()) def += " GENERATED BY DEFAULT AS IDENTITY";
        return def + " PRIMARY KEY";
    }
    if (f.required) def += " NOT NULL";
    if (f.is_unique) def += " CONSTRAINT " + qi("uq_" + schema.name + "_" + f.name) + " UNIQUE";
    const std::string d = sql_default(f);
    if (!d.empty()) def += " DEFAULT " + d;
    return def;
}

std::string PgDDLVisitor::visit(const OrmSchema& schema, bool if_not_exists, const std::string& table) const {
    std::vector<std::string> defs;
    for (const auto& f : schema.fields) defs.push_back(column(schema, f));
    // foreign keys come from add-relation, once every table exists
    return create_table(table.empty() ? schema.name : table, if_not_exists, defs);
}

std::vector<std::string> PgDDLVisitor::lock_ledger() const {
    return { "SELECT pg_advisory_xact_lock(hashtext('" RESERVED_PREFIX "_migrations'))" };
}

void PgDDLVisitor::add_relation(const OrmRelation& r, std::vector<std::string>& out) const {
    std::ostringstream ddl;
    ddl << "ALTER TABLE " << qi(r.entity) << " ADD CONSTRAINT " << qi(r.constraint_name())
        << " FOREIGN KEY (" << qi(r.field) << ") REFERENCES " << qi(r.target) << " (" << qi(r.target_field)
        << ") ON DELETE " << on_delete_sql(r.on_delete);
    out.push_back(ddl.str());
    OrmSchema owner;
    owner.name = r.entity;
    out.push_back(index(owner, r.support_index(), true));
}

void PgDDLVisitor::add_field(const ChangeOp& op, std::vector<std::string>& out) const {
    const OrmProp& f = *op.field_after;
    const std::string table = qi(op.entity);
    if (f.is_id && op.before) {
        throw ApplyError(ApplyErrorKind::DialectUnsupported, "", {},
            "changing the identity of " + op.entity + " is not supported on postgres");
    }
    if (f.required && f.generated()) {
        // existing rows get "now" before the constraint is set
        out.push_back("ALTER TABLE " + table + " ADD COLUMN " + column(*op.after, nullable(f)));
        out.push_back("UPDATE " + table + " SET " + qi(f.name) + " = " + now_expr(f.type));
        out.push_back("ALTER TABLE " + table + " ALTER COLUMN " + qi(f.name) + " SET NOT NULL");
        return;
    }
    out.push_back("ALTER TABLE " + table + " ADD COLUMN " + column(*op.after, f));
}

void PgDDLVisitor::alter_field(const ChangeOp& op, std::vector<std::string>& out) const {
    const OrmProp& b = *op.field_before;
    const OrmProp& a = *op.field_after;
    const std::string alter = "ALTER TABLE " + qi(op.entity) + " ALTER COLUMN " + qi(a.name);

    if (a.is_id || b.is_id) {
        throw ApplyError(ApplyErrorKind::DialectUnsupported, "", {},
            "changing the identity of " + op.entity + " is not supported on postgres");
    }

    const bool retype = b.type != a.type;
    const bool redefault = b.policy != a.policy || b.default_value != a.default_value || b.default_kind != a.default_kind;
    // the old default may not cast to the new type
    if ((retype || redefault) && b.policy == DefaultPolicy::Static) out.push_back(alter + " DROP DEFAULT");
    if (retype) {
        std::string src = qi(a.name);
        if (b.type == PropType::Bool && (a.type == PropType::Integer || a.type == PropType::Number)) src += "::int";
        out.push_back(alter + " TYPE " + sql_type(a) + " USING " + src + "::" + sql_type(a));
    }
    if ((retype || redefault) && a.policy == DefaultPolicy::Static) out.push_back(alter + " SET DEFAULT " + sql_default(a));

    if (a.required && !b.required) {
        std::string fill;
        if (a.policy == DefaultPolicy::Static) fill = sql_default(a);
        else if (a.generated()) fill = now_expr(a.type);
        if (!fill.empty()) {
            out.push_back("UPDATE " + qi(op.entity) + " SET " + qi(a.name) + " = " + fill + " WHERE " + qi(a.name) + " IS NULL");
        }
        out.push_back(alter + " SET NOT NULL");
    } else if (!a.required && b.required) {
        out.push_back(alter + " DROP NOT NULL");
    }

    const std::string uq = qi("uq_" + op.entity + "_" + a.name);
    if (a.is_unique && !b.is_unique) {
        out.push_back("ALTER TABLE " + qi(op.entity) + " ADD CONSTRAINT " + uq + " UNIQUE (" + qi(a.name) + ")");
    } else if (!a.is_unique && b.is_unique) {
        out.push_back("ALTER TABLE " + qi(op.entity) + " DROP CONSTRAINT IF EXISTS " + uq);
    }
}

std::vector<std::string> PgDDLVisitor::plan(const std::vector<ChangeOp>& ops) const {
    std::vector<std::string> out;
    for (const auto& op : ops) {
        const std::string table = qi(op.entity);
        switch (op.kind) {
        case OpKind::CreateEntity:
            out.push_back(visit(*op.after));
            break;
        case OpKind::DropEntity:
            out.push_back("DROP TABLE IF EXISTS " + table);
            break;
        case OpKind::AddField:
            add_field(op, out);
            break;
        case OpKind::AlterField:
            alter_field(op, out);
            break;
        case OpKind::DropField:
            if (op.field_before->is_id) {
                throw ApplyError(ApplyErrorKind::DialectUnsupported, "", {},
                    "changing the identity of " + op.entity + " is not supported on postgres");
            }
            out.push_back("ALTER TABLE " + table + " DROP COLUMN IF EXISTS " + qi(op.name));
            break;
        case OpKind::CreateIndex:
            out.push_back(index(*op.after, *op.index));
            break;
        case OpKind::DropIndex:
            out.push_back("DROP INDEX IF EXISTS " + qi(op.name));
            break;
        case OpKind::AddRelation:
            add_relation(*op.relation, out);
            break;
        case OpKind::DropRelation:
            out.push_back("ALTER TABLE " + table + " DROP CONSTRAINT IF EXISTS " + qi(op.name));
            out.push_back("DROP INDEX IF EXISTS " + qi(op.relation->support_index().index_name));
            break;
        }
    }
    return out;
}

/* ---------- SQLite ---------- */

std::string SqliteDDLVisitor::sql_type(const OrmProp& f) const {
    if (f.type == PropType::String   ) return "TEXT"     ;
    if (f.type == PropType::Integer  ) return "INTEGER"  ;
    if (f.type == PropType::Number   ) return "REAL"     ;
    if (f.type == PropType::Bool     ) return "BOOLEAN"  ;
    if (f.type == PropType::Json     ) return "JSON"     ;
    if (f.type == PropType::Date     ) return "DATE"     ;
    if (f.type == PropType::Time     ) return "TIME"     ;
    if (f.type == PropType::Dt_Time  ) return "DATETIME" ;
    if (f.type == PropType::Tm_Stamp ) return "TIMESTAMP";
    if (f.type == PropType::Bin      ) return "BLOB"     ;
    return "TEXT";
}

std::string SqliteDDLVisitor::now_expr(PropType type) const {
    switch (type) {
        case PropType::Date: return "strftime('%Y-%m-%d', 'now')";
        case PropType::Time: return "strftime('%H:%M:%S', 'now')";
        case PropType::Dt_Time: return "strftime('%Y-%m-%dT%H:%M:%S', 'now')";
        default: return "strftime('%Y-%m-%dT%H:%M:%fZ', 'now')";
    }
}

std::string SqliteDDLVisitor::column(const OrmSchema&, const OrmProp& f) const {
    std::string def = qi(f.name) + " " + sql_type(f);
    if (f.is_id) {
        // an INTEGER PRIMARY KEY is the rowid: the store numbers rows itself
        return def + (f.type == PropType::Integer ? " PRIMARY KEY" : " NOT NULL PRIMARY KEY");
    }
    if (f.required) def += " NOT NULL";
    if (f.is_unique) def += " UNIQUE";
    const std::string d = sql_default(f);
    if (!d.empty()) def += " DEFAULT " + d;
    return def;
}

std::string SqliteDDLVisitor::visit(const OrmSchema& schema, bool if_not_exists, const std::string& table) const {
    std::vector<std::string> defs;
    for (const auto& f : schema.fields) defs.push_back(column(schema, f));
    for (const auto& r : schema.relations) {
        defs.push_back("CONSTRAINT " + qi(r.constraint_name()) + " FOREIGN KEY (" + qi(r.field) + ") REFERENCES "
            + qi(r.target) + " (" + qi(r.target_field) + ") ON DELETE " + on_delete_sql(r.on_delete));
    }
    return create_table(table.empty() ? schema.name : table, if_not_exists, defs);
}

std::vector<std::string> SqliteDDLVisitor::before_migration() const {
    // table rebuilds would trip the constraints of referencing tables
    return { "PRAGMA foreign_keys=OFF" };
}

std::vector<std::string> SqliteDDLVisitor::after_migration() const {
    return { "PRAGMA foreign_keys=ON" };
}

std::string SqliteDDLVisitor::integrity_check() const {
    return "PRAGMA foreign_key_check";
}

bool SqliteDDLVisitor::can_add_column(const OrmSchema& schema, const OrmProp& f) {
    if (f.is_id || f.is_unique) return false;
    if (f.required && f.policy != DefaultPolicy::Static) return false;
    return schema.relation_on(f.name) == nullptr;
}

std::set<std::string> SqliteDDLVisitor::rebuilds(const std::vector<ChangeOp>& ops) const {
    std::set<std::string> out;
    for (const auto& op : ops) {
        if (!op.before || !op.after) continue;
        switch (op.kind) {
        case OpKind::AlterField:
        case OpKind::DropField:
        case OpKind::AddRelation:
        case OpKind::DropRelation:
            out.insert(op.entity);
            break;
        case OpKind::AddField:
            if (!can_add_column(*op.after, *op.field_after)) out.insert(op.entity);
            break;
        default:
            break;
        }
    }
    return out;
}

void SqliteDDLVisitor::rebuild(const ChangeOp& op, std::vector<std::string>& out) const {
    const OrmSchema& b = *op.before;
    const OrmSchema& a = *op.after;
    const std::string tmp = RESERVED_PREFIX "_new_" + a.name;

    out.push_back(visit(a, false, tmp));

    std::vector<std::string> cols, exprs;
    for (const auto& f : a.fields) {
        const OrmProp* fb = b.find(f.name);
        if (!fb) {
            // new columns take their default; generated ones are stamped now
            if (f.required && f.generated()) {
                cols.push_back(qi(f.name));
                exprs.push_back(now_expr(f.type));
            }
            continue;
        }
        std::string e = qi(f.name);
        if (fb->type != f.type) {
            const std::string t = sql_type(f);
            if (t == "INTEGER" || t == "REAL" || t == "TEXT") e = "CAST(" + e + " AS " + t + ")";
        }
        if (f.required && !fb->required) {
            if (f.policy == DefaultPolicy::Static) e = "COALESCE(" + e + ", " + sql_default(f) + ")";
            else if (f.generated()) e = "COALESCE(" + e + ", " + now_expr(f.type) + ")";
        }
        cols.push_back(qi(f.name));
        exprs.push_back(e);
    }
    if (!cols.empty()) {
        out.push_back("INSERT INTO " + qi(tmp) + " (" + join(cols, ", ") + ") SELECT " + join(exprs, ", ")
            + " FROM " + qi(b.name));
    }
    out.push_back("DROP TABLE " + qi(b.name));
    out.push_back("ALTER TABLE " + qi(tmp) + " RENAME TO " + qi(a.name));
    for (const auto& idx : a.physical_indexes()) {
        out.push_back(index(a, idx, true));
    }
}

std::vector<std::string> SqliteDDLVisitor::plan(const std::vector<ChangeOp>& ops) const {
    const std::set<std::string> rebuilt = rebuilds(ops);
    std::set<std::string> done, dropped;
    for (const auto& op : ops) {
        if (op.kind == OpKind::DropEntity) dropped.insert(op.entity);
    }

    std::vector<std::string> out;
    for (const auto& op : ops) {
        if (rebuilt.count(op.entity)) {
            // one rebuild from the target definition covers every op of the entity
            if (done.insert(op.entity).second) rebuild(op, out);
            continue;
        }
        switch (op.kind) {
        case OpKind::CreateEntity:
            out.push_back(visit(*op.after));
            break;
        case OpKind::DropEntity:
            out.push_back("DROP TABLE IF EXISTS " + qi(op.entity));
            break;
        case OpKind::AddField:
            out.push_back("ALTER TABLE " + qi(op.entity) + " ADD COLUMN " + column(*op.after, *op.field_after));
            break;
        case OpKind::AlterField:
        case OpKind::DropField:
            // always part of a rebuild
            break;
        case OpKind::CreateIndex:
            out.push_back(index(*op.after, *op.index));
            break;
        case OpKind::DropIndex:
            if (!dropped.count(op.entity)) out.push_back("DROP INDEX IF EXISTS " + qi(op.name));
            break;
        case OpKind::AddRelation:
            // the constraint is inline in CREATE TABLE; only the support index remains
            out.push_back(index(*op.after, op.relation->support_index(), true));
            break;
        case OpKind::DropRelation:
            // goes with its table
            break;
        }
    }
    return out;
}

std::unique_ptr<DDLVisitor> make_ddl_visitor(Dialect dialect) {
    switch (dialect) {
    case Dialect::SQLite:
        return std::make_unique<SqliteDDLVisitor>();
    case Dialect::Postgres:
        return std::make_unique<PgDDLVisitor>();
    }
    THROW("unsupported dialect");
}

std::string render_sql(const std::vector<std::string>& statements) {
    std::ostringstream os;
    for (const auto& s : statements) os << s << ";\n";
    return os.str();
}
