#include "dml_visitor.hpp"
#include <sstream>
#include "lib.hpp"

namespace {

    const OrmProp& field_of(const OrmSchema& s, const std::string& name) {
        const OrmProp* f = s.find(name);
        if (!f) throw ValidationError(s.name, name, "unknown field " + s.name + "." + name);
        return *f;
    }

    std::string columns(const OrmSchema& s) {
        std::vector<std::string> cols;
        for (const auto& f : s.fields) cols.push_back(qi(f.name));
        return join(cols, ", ");
    }

    std::string returning(const OrmSchema& s) {
        return " RETURNING " + columns(s);
    }

    const char* cmp_sql(CmpOp op) {
        switch (op) {
            case CmpOp::Eq: return " = ";
            case CmpOp::Ne: return " <> ";
            case CmpOp::Lt: return " < ";
            case CmpOp::Le: return " <= ";
            case CmpOp::Gt: return " > ";
            case CmpOp::Ge: return " >= ";
            default: return " = ";
        }
    }

    const jval& payload_object(const OrmSchema& s, const jval& value, const char* what) {
        if (!value.IsObject()) throw ValidationError(s.name, "", std::string(what) + ": payload must be a JSON object");
        return value;
    }

} // namespace

std::string DMLVisitor::param(DmlStmt& out, const jval& value, PropType type) const {
    out.params.push_back({ &value, type });
    return ph(out.params.size());
}

std::string DMLVisitor::where(const OrmSchema& s, const Filter& filter, DmlStmt& out) const {
    if (filter.empty()) return "";
    std::vector<std::string> conds;
    for (const auto& t : filter.terms()) {
        const OrmProp& f = field_of(s, t.field);
        const std::string col = qi(f.name);
        const jval& v = *t.value;
        switch (t.op) {
        case CmpOp::IsNull:
            conds.push_back(col + " IS NULL");
            break;
        case CmpOp::NotNull:
            conds.push_back(col + " IS NOT NULL");
            break;
        case CmpOp::In: {
            if (!v.IsArray()) throw ValidationError(s.name, f.name, "'in' takes an array");
            if (v.Empty()) {
                conds.push_back("1 = 0");
                break;
            }
            std::vector<std::string> phs;
            for (const auto& el : v.GetArray()) phs.push_back(param(out, el, f.type));
            conds.push_back(col + " IN (" + join(phs, ", ") + ")");
        } break;
        case CmpOp::Eq:
        case CmpOp::Ne:
            // comparing with NULL is never true; spell the intent
            if (v.IsNull()) {
                conds.push_back(col + (t.op == CmpOp::Eq ? " IS NULL" : " IS NOT NULL"));
                break;
            }
            conds.push_back(col + cmp_sql(t.op) + param(out, v, f.type));
            break;
        default:
            if (v.IsNull()) throw ValidationError(s.name, f.name, std::string("'") + to_string(t.op) + "' takes a value");
            conds.push_back(col + cmp_sql(t.op) + param(out, v, f.type));
            break;
        }
    }
    return " WHERE " + join(conds, " AND ");
}

std::string DMLVisitor::limit_clause(const ReadOptions& o) const {
    std::string sql;
    if (o.limit) sql += " LIMIT " + std::to_string(*o.limit);
    if (o.offset > 0) sql += " OFFSET " + std::to_string(o.offset);
    return sql;
}

DmlStmt DMLVisitor::insert(const OrmSchema& s, const jval& value) const {
    const jval& obj = payload_object(s, value, "insert");
    DmlStmt out;
    std::vector<std::string> names, vals;
    // schema order keeps the statement text stable for a given key set
    for (const auto& f : s.fields) {
        auto it = obj.FindMember(f.name.c_str());
        if (it == obj.MemberEnd()) continue;
        names.push_back(qi(f.name));
        vals.push_back(param(out, it->value, f.type));
    }
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) field_of(s, it->name.GetString());

    std::ostringstream sql;
    sql << "INSERT INTO " << qi(s.name);
    if (names.empty()) sql << " DEFAULT VALUES";
    else sql << " (" << join(names, ", ") << ") VALUES (" << join(vals, ", ") << ")";
    sql << returning(s);
    out.sql = sql.str();
    return out;
}

DmlStmt DMLVisitor::upsert(const OrmSchema& s, const jval& value) const {
    const jval& obj = payload_object(s, value, "upsert");
    const OrmProp& pk = s.idprop();
    if (!obj.HasMember(pk.name.c_str())) {
        throw ValidationError(s.name, pk.name, "upsert needs the identity " + pk.name);
    }
    DmlStmt out;
    std::vector<std::string> names, vals, sets;
    for (const auto& f : s.fields) {
        auto it = obj.FindMember(f.name.c_str());
        if (it == obj.MemberEnd()) continue;
        names.push_back(qi(f.name));
        vals.push_back(param(out, it->value, f.type));
        if (!f.is_id && f.policy != DefaultPolicy::OnCreate) {
            sets.push_back(qi(f.name) + " = excluded." + qi(f.name));
        }
    }
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) field_of(s, it->name.GetString());
    // DO NOTHING would return no row
    if (sets.empty()) sets.push_back(qi(pk.name) + " = excluded." + qi(pk.name));

    std::ostringstream sql;
    sql << "INSERT INTO " << qi(s.name) << " (" << join(names, ", ") << ") VALUES (" << join(vals, ", ") << ")"
        << " ON CONFLICT (" << qi(pk.name) << ") DO UPDATE SET " << join(sets, ", ") << returning(s);
    out.sql = sql.str();
    return out;
}

DmlStmt DMLVisitor::update(const OrmSchema& s, const jval& changes, const Filter& filter) const {
    const jval& obj = payload_object(s, changes, "update");
    DmlStmt out;
    std::vector<std::string> sets;
    for (const auto& f : s.fields) {
        auto it = obj.FindMember(f.name.c_str());
        if (it == obj.MemberEnd()) continue;
        sets.push_back(qi(f.name) + " = " + param(out, it->value, f.type));
    }
    for (jit it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) field_of(s, it->name.GetString());
    if (sets.empty()) throw ValidationError(s.name, "", "update: nothing to set");

    out.sql = "UPDATE " + qi(s.name) + " SET " + join(sets, ", ") + where(s, filter, out) + returning(s);
    return out;
}

DmlStmt DMLVisitor::remove(const OrmSchema& s, const Filter& filter) const {
    DmlStmt out;
    out.sql = "DELETE FROM " + qi(s.name) + where(s, filter, out) + returning(s);
    return out;
}

DmlStmt DMLVisitor::select(const OrmSchema& s, const Filter& filter, const ReadOptions& options) const {
    DmlStmt out;
    std::ostringstream sql;
    sql << "SELECT " << columns(s) << " FROM " << qi(s.name) << where(s, filter, out);

    std::vector<std::string> order;
    for (const auto& o : options.order_by) {
        order.push_back(qi(field_of(s, o.field).name) + (o.desc ? " DESC" : " ASC"));
    }
    if (order.empty()) order.push_back(qi(s.idprop().name) + " ASC");
    sql << " ORDER BY " << join(order, ", ");
    if (options.limit && *options.limit < 0) throw ValidationError(s.name, "", "limit must not be negative");
    if (options.offset < 0) throw ValidationError(s.name, "", "offset must not be negative");
    sql << limit_clause(options);
    out.sql = sql.str();
    return out;
}

DmlStmt DMLVisitor::select_in(const OrmSchema& s, const std::string& field, const std::vector<const jval*>& keys) const {
    const OrmProp& f = field_of(s, field);
    DmlStmt out;
    std::string cond = "1 = 0";
    if (!keys.empty()) {
        std::vector<std::string> phs;
        for (const jval* k : keys) phs.push_back(param(out, *k, f.type));
        cond = qi(f.name) + " IN (" + join(phs, ", ") + ")";
    }
    out.sql = "SELECT " + columns(s) + " FROM " + qi(s.name) + " WHERE " + cond + " ORDER BY " + qi(s.idprop().name) + " ASC";
    return out;
}

DmlStmt DMLVisitor::count(const OrmSchema& s, const Filter& filter) const {
    DmlStmt out;
    out.sql = "SELECT COUNT(*) AS " + qi("count") + " FROM " + qi(s.name) + where(s, filter, out);
    return out;
}

void DMLVisitor::bind(SQLStatement& stmt, const DmlStmt& dml) {
    for (size_t i = 0; i < dml.params.size(); ++i) {
        stmt.bind(static_cast<int>(i + 1), *dml.params[i].value, dml.params[i].type);
    }
}

/* ---- SQLite ---- */
std::string SqliteDMLVisitor::ph(size_t i) const { return "?" + std::to_string(i); }

std::string SqliteDMLVisitor::limit_clause(const ReadOptions& o) const {
    // SQLite has no OFFSET without LIMIT
    if (!o.limit && o.offset > 0) return " LIMIT -1 OFFSET " + std::to_string(o.offset);
    return DMLVisitor::limit_clause(o);
}

/* ---- Postgres ---- */
std::string PgDMLVisitor::ph(size_t i) const { return "$" + std::to_string(i); }

std::unique_ptr<DMLVisitor> make_dml_visitor(Dialect dialect) {
    switch (dialect) {
    case Dialect::SQLite:
        return std::make_unique<SqliteDMLVisitor>();
    case Dialect::Postgres:
        return std::make_unique<PgDMLVisitor>();
    }
    THROW("unsupported dialect");
}
