#include "client.hpp"
#include <cstdlib>
#include <map>
#include <set>
#include "lib.hpp"
#include "logging.hpp"
#include "record.hpp"

namespace {

    // Joins the caller's transaction, or owns one for the scope of a call.
    class TxScope {
    public:
        TxScope(SQLConnection& conn, bool immediate = true)
            : conn_(conn)
            , owner_(!conn.in_transaction()) {
            if (owner_) conn_.begin(immediate);
        }
        ~TxScope() {
            if (owner_ && !done_) {
                try {
                    conn_.rollback();
                } catch (const std::exception& e) {
                    RELMAP_LOG_ERROR("rollback failed", { obs::str_field("error", e.what()) });
                }
            }
        }
        TxScope(const TxScope&) = delete;
        TxScope& operator=(const TxScope&) = delete;

        void commit() {
            if (owner_) conn_.commit();
            done_ = true;
        }

    private:
        SQLConnection& conn_;
        bool owner_;
        bool done_ = false;
    };

    bool identity_lookup(const OrmSchema& s, const Filter& f) {
        if (f.terms().size() != 1) return false;
        const Comparison& c = f.terms().front();
        return c.op == CmpOp::Eq && c.field == s.idprop().name && !c.value->IsNull();
    }

    jdoc first_record(const OrmSchema& s, const jdoc& rows) {
        jdoc rec;
        jval v = coerce_row(s, rows[0], rec.GetAllocator());
        static_cast<jval&>(rec).Swap(v);
        return rec;
    }

    bool is_write(QueryKind kind) {
        return kind != QueryKind::Read && kind != QueryKind::Count;
    }

} // namespace

Client::Client(std::shared_ptr<const SchemaSnapshot> snapshot, std::shared_ptr<pool::IDbPool> pool, Dialect dialect)
    : snap_(std::move(snapshot))
    , pool_(std::move(pool))
    , dml_(make_dml_visitor(dialect))
    , gen_(std::make_shared<ValueGenerator>()) {
    if (!snap_) THROW("Client: null snapshot");
}

Client::Client(std::shared_ptr<const SchemaSnapshot> snapshot, std::shared_ptr<pool::IDbPool> pool)
    : Client(snapshot, pool, pool ? pool->dialect() : Dialect::SQLite) { }

EntityClient Client::entity(const std::string& name) const {
    schema(name);
    return EntityClient(*this, name);
}

const OrmSchema& Client::schema(const std::string& entity) const {
    const OrmSchema* s = snap_->find(entity);
    if (!s) throw ValidationError(entity, "", "unknown entity '" + entity + "'");
    return *s;
}

void Client::validate_filter(const OrmSchema& s, const Filter& filter) const {
    for (const auto& t : filter.terms()) {
        const OrmProp* f = s.find(t.field);
        if (!f) throw ValidationError(s.name, t.field, "unknown field " + s.name + "." + t.field);
        const jval& v = *t.value;
        const std::string expects = "expects " + proptype(f->type) + " values";
        switch (t.op) {
        case CmpOp::IsNull:
        case CmpOp::NotNull:
            break;
        case CmpOp::In:
            if (!v.IsArray()) throw ValidationError(s.name, f->name, "'in' takes an array");
            for (const auto& el : v.GetArray()) {
                if (el.IsNull() || !value_fits(*f, el)) throw ValidationError(s.name, f->name, expects);
            }
            break;
        case CmpOp::Eq:
        case CmpOp::Ne:
            if (!v.IsNull() && !value_fits(*f, v)) throw ValidationError(s.name, f->name, expects);
            break;
        default:
            if (v.IsNull() || !value_fits(*f, v)) throw ValidationError(s.name, f->name, expects);
            break;
        }
    }
}

void Client::validate_includes(const OrmSchema& s, const IncludeSet& include) const {
    std::set<std::string> seen;
    for (const auto& name : include) {
        if (!snap_->view(s.name, name)) {
            throw ValidationError(s.name, name, "no relation view '" + name + "' on " + s.name);
        }
        if (!seen.insert(name).second) throw ValidationError(s.name, name, "relation view included twice");
    }
}

jdoc Client::prepare_write(const OrmSchema& s, const jval& payload, bool creating) const {
    if (!payload.IsObject()) throw ValidationError(s.name, "", "payload must be a JSON object");
    jdoc doc(json::kObjectType);

    for (jit it = payload.MemberBegin(); it != payload.MemberEnd(); ++it) {
        const std::string name = it->name.GetString();
        const OrmProp* f = s.find(name);
        if (!f) throw ValidationError(s.name, name, "unknown field " + s.name + "." + name);
        if (f->generated()) throw ValidationError(s.name, name, "value of " + name + " is generated");
        if (!creating && f->is_id) throw ValidationError(s.name, name, "identity is not updatable");
        const jval& v = it->value;
        if (v.IsNull()) {
            if (f->required) throw ValidationError(s.name, name, name + " is required");
        } else if (!value_fits(*f, v)) {
            throw ValidationError(s.name, name, name + " expects a " + proptype(f->type) + " value");
        }
        jhlp::set(doc, name, v);
    }

    for (const auto& f : s.fields) {
        const bool present = doc.HasMember(f.name.c_str());
        if (f.policy == DefaultPolicy::OnUpdate || (creating && f.policy == DefaultPolicy::OnCreate)) {
            jhlp::set(doc, f.name, ValueGenerator::now(f.type));
            continue;
        }
        if (!creating || present) continue;
        if (f.client_id()) {
            if (f.id_kind == IdKind::Ulid) jhlp::set(doc, f.name, ValueGenerator::ulid());
            else jhlp::set(doc, f.name, gen_->snowflake());
        } else if (f.required && !f.store_id() && f.policy != DefaultPolicy::Static) {
            throw ValidationError(s.name, f.name, "missing required field " + f.name);
        }
    }
    return doc;
}

void Client::rethrow_constraint(const OrmSchema& s, const DbError& e, const jval* payload) const {
    std::string entity = e.table.empty() ? s.name : e.table;
    std::string field = e.column;
    std::string value = e.value;
    // SQLite does not name the column of a failed foreign key
    if (field.empty() && e.constraint == ConstraintKind::ForeignKey && payload) {
        for (const auto& r : s.relations) {
            const jval* v = jhlp::find(*payload, r.field.c_str());
            if (v && !v->IsNull()) {
                entity = s.name;
                field = r.field;
                break;
            }
        }
    }
    if (value.empty() && payload && !field.empty() && entity == s.name) {
        if (const jval* v = jhlp::find(*payload, field.c_str())) value = jhlp::val2str(*v);
    }
    throw ConstraintError(e.constraint, entity, field, value, e.what());
}

jdoc Client::run_write(SQLConnection& conn, const OrmSchema& s, const DmlStmt& st, const jval* payload,
    const CancelToken& cancel) const {
    cancel.check(s.name + " write");
    RELMAP_LOG_DEBUG("dml", { obs::str_field("entity", s.name), obs::str_field("sql", st.sql) });
    try {
        auto stmt = conn.prepare(st.sql);
        DMLVisitor::bind(*stmt, st);
        return stmt->query();
    } catch (const DbError& e) {
        if (e.kind() == DbErrorKind::Constraint) rethrow_constraint(s, e, payload);
        throw;
    }
}

jdoc Client::run_read(SQLConnection& conn, const OrmSchema& s, const DmlStmt& st, const CancelToken& cancel) const {
    cancel.check(s.name + " read");
    RELMAP_LOG_DEBUG("dml", { obs::str_field("entity", s.name), obs::str_field("sql", st.sql) });
    auto stmt = conn.prepare(st.sql);
    DMLVisitor::bind(*stmt, st);
    jdoc rows = stmt->query();

    jdoc out(json::kArrayType);
    auto& a = out.GetAllocator();
    for (const auto& row : rows.GetArray()) out.PushBack(coerce_row(s, row, a).Move(), a);
    return out;
}

void Client::load_include(SQLConnection& conn, const OrmSchema& s, jdoc& records, const std::string& view,
    const CancelToken& cancel) const {
    const RelationView rv = *snap_->view(s.name, view);
    const OrmRelation& r = *rv.rel;
    auto& a = records.GetAllocator();

    // forward: parents hold the key; inverse: children point at the parents' identity
    const std::string parent_key = rv.forward ? r.field : s.idprop().name;
    const OrmSchema& related = schema(rv.forward ? r.target : r.entity);
    const std::string related_key = rv.forward ? r.target_field : r.field;

    std::vector<const jval*> keys;
    std::set<std::string> seen;
    for (const auto& rec : records.GetArray()) {
        const jval* k = jhlp::find(rec, parent_key.c_str());
        if (k && !k->IsNull() && seen.insert(jhlp::val2str(*k)).second) keys.push_back(k);
    }

    jdoc found(json::kArrayType);
    if (!keys.empty()) found = run_read(conn, related, dml_->select_in(related, related_key, keys), cancel);

    std::map<std::string, std::vector<const jval*>> groups;
    for (const auto& x : found.GetArray()) {
        const jval* k = jhlp::find(x, related_key.c_str());
        if (k && !k->IsNull()) groups[jhlp::val2str(*k)].push_back(&x);
    }

    for (auto& rec : records.GetArray()) {
        const jval* k = jhlp::find(rec, parent_key.c_str());
        const std::vector<const jval*>* matches = nullptr;
        if (k && !k->IsNull()) {
            auto g = groups.find(jhlp::val2str(*k));
            if (g != groups.end()) matches = &g->second;
        }
        jval v;
        if (rv.collection) {
            v.SetArray();
            if (matches) {
                for (const jval* m : *matches) v.PushBack(jval(*m, a).Move(), a);
            }
        } else if (matches && !matches->empty()) {
            v.CopyFrom(*matches->front(), a);
        }
        jhlp::set(rec, view, v, a);
    }
}

/* ---- connection-level operations ---- */

jdoc Client::create(SQLConnection& conn, const std::string& entity, const jval& payload, const CancelToken& cancel) const {
    const OrmSchema& s = schema(entity);
    jdoc doc = prepare_write(s, payload, true);
    DmlStmt st = dml_->insert(s, doc);

    TxScope tx(conn);
    jdoc rows = run_write(conn, s, st, &doc, cancel);
    if (rows.Empty()) THROW("insert into %s returned no row", s.name.c_str());
    jdoc rec = first_record(s, rows);
    tx.commit();
    return rec;
}

jdoc Client::read(SQLConnection& conn, const std::string& entity, const Filter& filter, const IncludeSet& include,
    const ReadOptions& options) const {
    const OrmSchema& s = schema(entity);
    validate_filter(s, filter);
    validate_includes(s, include);

    ReadOptions opts = options;
    // a direct lookup returns at most one record
    if (identity_lookup(s, filter)) opts.limit = 1;
    DmlStmt st = dml_->select(s, filter, opts);

    if (include.empty()) return run_read(conn, s, st, options.cancel);

    // one snapshot for the parents and every secondary query
    TxScope tx(conn, false);
    jdoc records = run_read(conn, s, st, options.cancel);
    for (const auto& view : include) load_include(conn, s, records, view, options.cancel);
    tx.commit();
    return records;
}

jdoc Client::update(SQLConnection& conn, const std::string& entity, const Filter& filter, const jval& payload,
    const CancelToken& cancel) const {
    const OrmSchema& s = schema(entity);
    if (filter.empty()) throw ValidationError(s.name, "", "update needs a filter addressing one record");
    validate_filter(s, filter);
    jdoc doc = prepare_write(s, payload, false);
    DmlStmt st = dml_->update(s, doc, filter);

    TxScope tx(conn);
    jdoc rows = run_write(conn, s, st, &doc, cancel);
    if (rows.Empty()) throw NotFound(s.name, "no " + s.name + " matches the filter");
    if (rows.Size() > 1) {
        throw ValidationError(s.name, "", "filter matched " + std::to_string(rows.Size()) + " " + s.name
                + " records; update addresses exactly one");
    }
    jdoc rec = first_record(s, rows);
    tx.commit();
    return rec;
}

jdoc Client::remove(SQLConnection& conn, const std::string& entity, const Filter& filter, const CancelToken& cancel) const {
    const OrmSchema& s = schema(entity);
    if (filter.empty()) throw ValidationError(s.name, "", "delete needs a filter addressing one record");
    validate_filter(s, filter);

    TxScope tx(conn);
    ReadOptions two;
    two.limit = 2;
    jdoc found = run_read(conn, s, dml_->select(s, filter, two), cancel);
    if (found.Empty()) throw NotFound(s.name, "no " + s.name + " matches the filter");
    if (found.Size() > 1) throw ValidationError(s.name, "", "filter matched several " + s.name + " records; delete addresses exactly one");

    const OrmProp& pk = s.idprop();
    const jval& key = found[0][pk.name.c_str()];

    // cascade and setnull are left to the store; restrict references block the delete
    for (const OrmRelation* r : snap_->inbound(s.name)) {
        if (r->on_delete != OnDelete::Restrict) continue;
        const OrmSchema& child = schema(r->entity);
        Filter refs;
        refs.eq(r->field, key);
        if (count(conn, child.name, refs, cancel) > 0) {
            throw ConstraintError(ConstraintKind::ForeignKey, r->entity, r->field, jhlp::val2str(key),
                s.name + " " + jhlp::val2str(key) + " is still referenced by " + r->entity + "." + r->field);
        }
    }

    Filter by_id;
    by_id.eq(pk.name, key);
    jdoc rows = run_write(conn, s, dml_->remove(s, by_id), nullptr, cancel);
    if (rows.Empty()) throw NotFound(s.name, "no " + s.name + " matches the filter");
    jdoc rec = first_record(s, rows);
    tx.commit();
    return rec;
}

jdoc Client::upsert(SQLConnection& conn, const std::string& entity, const jval& payload, const CancelToken& cancel) const {
    const OrmSchema& s = schema(entity);
    jdoc doc = prepare_write(s, payload, true);
    const OrmProp& pk = s.idprop();
    if (!doc.HasMember(pk.name.c_str())) {
        throw ValidationError(s.name, pk.name, "upsert needs the identity " + pk.name);
    }
    DmlStmt st = dml_->upsert(s, doc);

    TxScope tx(conn);
    jdoc rows = run_write(conn, s, st, &doc, cancel);
    if (rows.Empty()) THROW("upsert into %s returned no row", s.name.c_str());
    jdoc rec = first_record(s, rows);
    tx.commit();
    return rec;
}

int64_t Client::count(SQLConnection& conn, const std::string& entity, const Filter& filter, const CancelToken& cancel) const {
    const OrmSchema& s = schema(entity);
    validate_filter(s, filter);
    DmlStmt st = dml_->count(s, filter);
    cancel.check(s.name + " count");
    auto stmt = conn.prepare(st.sql);
    DMLVisitor::bind(*stmt, st);
    jdoc rows = stmt->query();
    if (rows.Empty()) THROW("count on %s returned no row", s.name.c_str());
    const jval& n = rows[0]["count"];
    return n.IsInt64() ? n.GetInt64() : std::strtoll(jhlp::val2str(n).c_str(), nullptr, 10);
}

jdoc Client::execute(SQLConnection& conn, const QueryDesc& q) const {
    const CancelToken& cancel = q.options.cancel;
    auto payload = [&]() -> const jval& {
        if (!q.payload) throw ValidationError(q.entity, "", std::string(to_string(q.kind)) + " needs 'data'");
        return *q.payload;
    };
    switch (q.kind) {
    case QueryKind::Create:
        return create(conn, q.entity, payload(), cancel);
    case QueryKind::Read:
        return read(conn, q.entity, q.filter, q.include, q.options);
    case QueryKind::Update:
        return update(conn, q.entity, q.filter, payload(), cancel);
    case QueryKind::Delete:
        return remove(conn, q.entity, q.filter, cancel);
    case QueryKind::Upsert:
        return upsert(conn, q.entity, payload(), cancel);
    case QueryKind::Count: {
        jdoc d(json::kObjectType);
        jhlp::set(d, "count", count(conn, q.entity, q.filter, cancel));
        return d;
    }
    }
    THROW("unsupported query kind");
}

/* ---- pooled operations ---- */

jdoc Client::create(const std::string& entity, const jval& payload, const CancelToken& cancel) const {
    cancel.check(entity + " create");
    return pool::with_tr(*pool_, pool::DbIntent::Write,
        [&](SQLConnection& c) { return create(c, entity, payload, cancel); });
}

jdoc Client::read(const std::string& entity, const Filter& filter, const IncludeSet& include,
    const ReadOptions& options) const {
    options.cancel.check(entity + " read");
    return pool::with_conn(*pool_, pool::DbIntent::Read,
        [&](SQLConnection& c) { return read(c, entity, filter, include, options); });
}

jdoc Client::update(const std::string& entity, const Filter& filter, const jval& payload, const CancelToken& cancel) const {
    cancel.check(entity + " update");
    return pool::with_tr(*pool_, pool::DbIntent::Write,
        [&](SQLConnection& c) { return update(c, entity, filter, payload, cancel); });
}

jdoc Client::remove(const std::string& entity, const Filter& filter, const CancelToken& cancel) const {
    cancel.check(entity + " delete");
    return pool::with_tr(*pool_, pool::DbIntent::Write,
        [&](SQLConnection& c) { return remove(c, entity, filter, cancel); });
}

jdoc Client::upsert(const std::string& entity, const jval& payload, const CancelToken& cancel) const {
    cancel.check(entity + " upsert");
    return pool::with_tr(*pool_, pool::DbIntent::Write,
        [&](SQLConnection& c) { return upsert(c, entity, payload, cancel); });
}

int64_t Client::count(const std::string& entity, const Filter& filter, const CancelToken& cancel) const {
    cancel.check(entity + " count");
    return pool::with_conn(*pool_, pool::DbIntent::Read,
        [&](SQLConnection& c) { return count(c, entity, filter, cancel); });
}

jdoc Client::execute(const QueryDesc& q) const {
    q.options.cancel.check(q.entity + " " + to_string(q.kind));
    if (is_write(q.kind)) {
        return pool::with_tr(*pool_, pool::DbIntent::Write, [&](SQLConnection& c) { return execute(c, q); });
    }
    return pool::with_conn(*pool_, pool::DbIntent::Read, [&](SQLConnection& c) { return execute(c, q); });
}
