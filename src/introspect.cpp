#include "introspect.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include "ddl_visitor.hpp"
#include "lib.hpp"
#include "logging.hpp"

namespace {

    jdoc run(SQLConnection& conn, const std::string& sql, const std::string& arg = "") {
        auto stmt = conn.prepare(sql);
        if (!arg.empty()) {
            jval v(arg.c_str(), static_cast<json::SizeType>(arg.size()));
            stmt->bind(1, v, PropType::String);
        }
        return stmt->query();
    }

    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    bool reserved(const std::string& table) {
        return table.rfind(RESERVED_PREFIX, 0) == 0 || table.rfind("sqlite_", 0) == 0;
    }

    OnDelete on_delete_from(const std::string& rule) {
        const std::string r = upper(rule);
        if (r == "CASCADE") return OnDelete::Cascade;
        if (r == "SET NULL") return OnDelete::SetNull;
        // NO ACTION behaves as RESTRICT at the end of each statement
        return OnDelete::Restrict;
    }

    OrmProp* field_of(OrmSchema& s, const std::string& name) {
        for (auto& f : s.fields) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    // one-to-one relations are the ones backed by a unique single-column index
    void settle_relations(OrmSchema& s) {
        for (auto& r : s.relations) {
            for (const auto& idx : s.indexes) {
                if (idx.unique && idx.fields == std::vector<std::string> { r.field }) r.kind = Cardinality::OneToOne;
            }
        }
        // support indexes are part of the relation, not of the declared indexes
        s.indexes.erase(std::remove_if(s.indexes.begin(), s.indexes.end(),
                            [&](const OrmIndex& idx) {
                                for (const auto& r : s.relations) {
                                    if (idx.index_name == r.support_index().index_name) return true;
                                }
                                return false;
                            }),
            s.indexes.end());
    }

    std::shared_ptr<const SchemaSnapshot> finish(std::map<std::string, OrmSchema>& tables, Dialect dialect) {
        auto snap = std::make_shared<SchemaSnapshot>();
        snap->label = "inspected";
        snap->source = to_string(dialect);
        for (auto& [name, s] : tables) {
            settle_relations(s);
            snap->entities[name] = std::make_shared<const OrmSchema>(std::move(s));
        }
        RELMAP_LOG_DEBUG("store inspected",
            { obs::str_field("dialect", to_string(dialect)), obs::int_field("entities", static_cast<int64_t>(snap->entities.size())) });
        return snap;
    }

    OrmIndex* index_of(OrmSchema& s, const std::string& name) {
        for (auto& idx : s.indexes) {
            if (idx.index_name == name) return &idx;
        }
        return nullptr;
    }

} // namespace

/* ---------- SQLite ---------- */

PropType SqliteIntrospector::field_type(const std::string& declared) {
    const std::string t = upper(declared);
    if (t == "INTEGER" || t == "INT" || t == "BIGINT") return PropType::Integer;
    if (t == "REAL" || t == "DOUBLE" || t == "FLOAT" || t == "NUMERIC") return PropType::Number;
    if (t == "BOOLEAN") return PropType::Bool;
    if (t == "JSON") return PropType::Json;
    if (t == "DATE") return PropType::Date;
    if (t == "TIME") return PropType::Time;
    if (t == "DATETIME") return PropType::Dt_Time;
    if (t == "TIMESTAMP") return PropType::Tm_Stamp;
    if (t == "BLOB") return PropType::Bin;
    return PropType::String;
}

std::shared_ptr<const SchemaSnapshot> SqliteIntrospector::inspect(SQLConnection& conn) const {
    std::map<std::string, OrmSchema> tables;

    jdoc names = run(conn, "SELECT name FROM sqlite_master WHERE type = 'table' ORDER BY name");
    for (const auto& row : names.GetArray()) {
        const std::string table = jhlp::get<std::string>(row, "name");
        if (reserved(table)) continue;
        OrmSchema& s = tables[table];
        s.name = table;

        jdoc cols = run(conn, "SELECT name, type, \"notnull\", pk FROM pragma_table_info(?1) ORDER BY cid", table);
        for (const auto& c : cols.GetArray()) {
            OrmProp f;
            f.name = jhlp::get<std::string>(c, "name");
            f.schema_name = table;
            f.type = field_type(jhlp::get<std::string>(c, "type"));
            f.required = jhlp::get<int64_t>(c, "notnull") != 0;
            f.is_id = jhlp::get<int64_t>(c, "pk") != 0;
            if (f.is_id) {
                f.required = true;
                f.id_kind = f.type == PropType::Integer ? IdKind::DBSerial : IdKind::Ulid;
            }
            s.fields.push_back(f);
        }

        jdoc fks = run(conn, "SELECT \"table\", \"from\", \"to\", on_delete FROM pragma_foreign_key_list(?1) ORDER BY id, seq", table);
        for (const auto& k : fks.GetArray()) {
            OrmRelation r;
            r.entity = table;
            r.field = jhlp::get<std::string>(k, "from");
            r.name = r.field;
            r.target = jhlp::get<std::string>(k, "table");
            r.target_field = jhlp::get<std::string>(k, "to");
            r.on_delete = on_delete_from(jhlp::get<std::string>(k, "on_delete"));
            s.relations.push_back(r);
        }

        jdoc idxs = run(conn, "SELECT name, \"unique\", origin FROM pragma_index_list(?1) ORDER BY name", table);
        for (const auto& i : idxs.GetArray()) {
            const std::string origin = jhlp::get<std::string>(i, "origin");
            if (origin == "pk") continue;
            const std::string iname = jhlp::get<std::string>(i, "name");
            std::vector<std::string> fields;
            jdoc info = run(conn, "SELECT name FROM pragma_index_info(?1) ORDER BY seqno", iname);
            for (const auto& col : info.GetArray()) fields.push_back(jhlp::get<std::string>(col, "name"));

            if (origin == "u") {
                // column-level UNIQUE
                if (fields.size() == 1) {
                    if (OrmProp* f = field_of(s, fields.front())) f->is_unique = true;
                }
                continue;
            }
            OrmIndex idx;
            idx.index_name = iname;
            idx.fields = fields;
            idx.unique = jhlp::get<int64_t>(i, "unique") != 0;
            s.indexes.push_back(idx);
        }
    }
    return finish(tables, Dialect::SQLite);
}

/* ---------- PostgreSQL ---------- */

PropType PgIntrospector::field_type(const std::string& data_type) {
    if (data_type == "bigint" || data_type == "integer" || data_type == "smallint") return PropType::Integer;
    if (data_type == "double precision" || data_type == "real" || data_type == "numeric") return PropType::Number;
    if (data_type == "boolean") return PropType::Bool;
    if (data_type == "jsonb" || data_type == "json") return PropType::Json;
    if (data_type == "date") return PropType::Date;
    if (data_type == "time without time zone") return PropType::Time;
    if (data_type == "timestamp without time zone") return PropType::Dt_Time;
    if (data_type == "timestamp with time zone") return PropType::Tm_Stamp;
    return PropType::String;
}

std::shared_ptr<const SchemaSnapshot> PgIntrospector::inspect(SQLConnection& conn) const {
    std::map<std::string, OrmSchema> tables;

    jdoc cols = run(conn,
        "SELECT c.table_name, c.column_name, c.data_type, c.is_nullable, c.is_identity"
        " FROM information_schema.columns c"
        " JOIN information_schema.tables t ON t.table_schema = c.table_schema AND t.table_name = c.table_name"
        " WHERE c.table_schema = current_schema() AND t.table_type = 'BASE TABLE'"
        " ORDER BY c.table_name, c.ordinal_position");
    for (const auto& c : cols.GetArray()) {
        const std::string table = jhlp::get<std::string>(c, "table_name");
        if (reserved(table)) continue;
        OrmSchema& s = tables[table];
        s.name = table;
        OrmProp f;
        f.name = jhlp::get<std::string>(c, "column_name");
        f.schema_name = table;
        f.type = field_type(jhlp::get<std::string>(c, "data_type"));
        f.required = jhlp::get<std::string>(c, "is_nullable") == "NO";
        // a store-numbered identity; reset below for anything that is not the key
        f.id_kind = jhlp::get<std::string>(c, "is_identity") == "YES" ? IdKind::DBSerial : IdKind::Ulid;
        s.fields.push_back(f);
    }

    jdoc keys = run(conn,
        "SELECT tc.table_name, tc.constraint_name, tc.constraint_type, kcu.column_name"
        " FROM information_schema.table_constraints tc"
        " JOIN information_schema.key_column_usage kcu ON kcu.constraint_schema = tc.constraint_schema"
        "  AND kcu.constraint_name = tc.constraint_name AND kcu.table_name = tc.table_name"
        " WHERE tc.table_schema = current_schema() AND tc.constraint_type IN ('PRIMARY KEY', 'UNIQUE')"
        " ORDER BY tc.table_name, tc.constraint_name, kcu.ordinal_position");
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> uniques;
    for (const auto& k : keys.GetArray()) {
        const std::string table = jhlp::get<std::string>(k, "table_name");
        auto t = tables.find(table);
        if (t == tables.end()) continue;
        const std::string column = jhlp::get<std::string>(k, "column_name");
        if (jhlp::get<std::string>(k, "constraint_type") == "PRIMARY KEY") {
            if (OrmProp* f = field_of(t->second, column)) {
                f->is_id = true;
                f->required = true;
                if (f->id_kind != IdKind::DBSerial && f->type == PropType::Integer) f->id_kind = IdKind::Snowflake;
            }
        } else {
            uniques[{ table, jhlp::get<std::string>(k, "constraint_name") }].push_back(column);
        }
    }
    for (const auto& [key, columns] : uniques) {
        if (columns.size() != 1) continue;
        if (OrmProp* f = field_of(tables[key.first], columns.front())) f->is_unique = true;
    }
    for (auto& [name, s] : tables) {
        for (auto& f : s.fields) {
            if (!f.is_id) f.id_kind = IdKind::DBSerial;
        }
    }

    jdoc fks = run(conn,
        "SELECT kcu.table_name, kcu.column_name, ccu.table_name AS target, ccu.column_name AS target_field, rc.delete_rule"
        " FROM information_schema.referential_constraints rc"
        " JOIN information_schema.key_column_usage kcu ON kcu.constraint_schema = rc.constraint_schema"
        "  AND kcu.constraint_name = rc.constraint_name"
        " JOIN information_schema.constraint_column_usage ccu ON ccu.constraint_schema = rc.unique_constraint_schema"
        "  AND ccu.constraint_name = rc.unique_constraint_name"
        " WHERE kcu.table_schema = current_schema()"
        " ORDER BY kcu.table_name, kcu.constraint_name");
    for (const auto& k : fks.GetArray()) {
        auto t = tables.find(jhlp::get<std::string>(k, "table_name"));
        if (t == tables.end()) continue;
        OrmRelation r;
        r.entity = t->first;
        r.field = jhlp::get<std::string>(k, "column_name");
        r.name = r.field;
        r.target = jhlp::get<std::string>(k, "target");
        r.target_field = jhlp::get<std::string>(k, "target_field");
        r.on_delete = on_delete_from(jhlp::get<std::string>(k, "delete_rule"));
        t->second.relations.push_back(r);
    }

    // secondary indexes only: primary keys and constraint-backed indexes are covered above
    jdoc idxs = run(conn,
        "SELECT t.relname AS table_name, i.relname AS index_name, ix.indisunique AS is_unique, a.attname AS column_name"
        " FROM pg_index ix"
        " JOIN pg_class t ON t.oid = ix.indrelid"
        " JOIN pg_class i ON i.oid = ix.indexrelid"
        " JOIN pg_namespace n ON n.oid = t.relnamespace"
        " CROSS JOIN LATERAL unnest(ix.indkey::int2[]) WITH ORDINALITY AS k(attnum, ord)"
        " JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = k.attnum"
        " WHERE n.nspname = current_schema() AND NOT ix.indisprimary"
        "  AND NOT EXISTS (SELECT 1 FROM pg_constraint c WHERE c.conindid = ix.indexrelid AND c.contype IN ('p', 'u', 'x'))"
        " ORDER BY t.relname, i.relname, k.ord");
    for (const auto& row : idxs.GetArray()) {
        auto t = tables.find(jhlp::get<std::string>(row, "table_name"));
        if (t == tables.end()) continue;
        const std::string iname = jhlp::get<std::string>(row, "index_name");
        OrmIndex* idx = index_of(t->second, iname);
        if (!idx) {
            OrmIndex fresh;
            fresh.index_name = iname;
            fresh.unique = jhlp::get<bool>(row, "is_unique");
            t->second.indexes.push_back(fresh);
            idx = &t->second.indexes.back();
        }
        idx->fields.push_back(jhlp::get<std::string>(row, "column_name"));
    }
    return finish(tables, Dialect::Postgres);
}

std::unique_ptr<Introspector> make_introspector(Dialect dialect) {
    if (dialect == Dialect::Postgres) return std::make_unique<PgIntrospector>();
    return std::make_unique<SqliteIntrospector>();
}

/* ---------- comparison ---------- */

namespace {

    struct Shape {
        std::string why;
        bool differ(const std::string& what) {
            if (why.empty()) why = what;
            return false;
        }
    };

    bool same_entity(const OrmSchema& a, const OrmSchema& b, const DDLVisitor& ddl, Shape& sh) {
        const std::string& e = a.name;
        if (a.fields.size() != b.fields.size()) return sh.differ(e + ": column count differs");
        for (const auto& fa : a.fields) {
            const OrmProp* fb = b.find(fa.name);
            const std::string loc = e + "." + fa.name;
            if (!fb) return sh.differ(loc + ": column missing");
            if (ddl.sql_type(fa) != ddl.sql_type(*fb)) {
                return sh.differ(loc + ": type " + ddl.sql_type(fa) + " vs " + ddl.sql_type(*fb));
            }
            if (fa.is_id != fb->is_id) return sh.differ(loc + ": identity differs");
            if (fa.required != fb->required) return sh.differ(loc + ": nullability differs");
            if (fa.is_unique != fb->is_unique) return sh.differ(loc + ": uniqueness differs");
        }

        if (a.relations.size() != b.relations.size()) return sh.differ(e + ": foreign key count differs");
        for (const auto& ra : a.relations) {
            const OrmRelation* rb = b.relation_on(ra.field);
            const std::string loc = e + "." + ra.field;
            if (!rb) return sh.differ(loc + ": foreign key missing");
            if (ra.target != rb->target || ra.target_field != rb->target_field) {
                return sh.differ(loc + ": references " + ra.target + " vs " + rb->target);
            }
            if (ra.on_delete != rb->on_delete) return sh.differ(loc + ": on delete differs");
        }

        const auto ia = a.physical_indexes();
        const auto ib = b.physical_indexes();
        if (ia.size() != ib.size()) return sh.differ(e + ": index count differs");
        for (const auto& x : ia) {
            auto y = std::find_if(ib.begin(), ib.end(), [&](const OrmIndex& i) { return i.index_name == x.index_name; });
            if (y == ib.end()) return sh.differ(e + ": index " + x.index_name + " missing");
            if (!x.same_definition(*y)) return sh.differ(e + ": index " + x.index_name + " differs");
        }
        return true;
    }

} // namespace

bool same_shape(const SchemaSnapshot& a, const SchemaSnapshot& b, Dialect dialect, std::string* why) {
    auto ddl = make_ddl_visitor(dialect);
    Shape sh;
    bool same = true;
    for (const auto& [name, s] : a.entities) {
        const OrmSchema* other = b.find(name);
        if (!other) {
            same = sh.differ("table " + name + " missing");
            break;
        }
        if (!same_entity(*s, *other, *ddl, sh)) {
            same = false;
            break;
        }
    }
    if (same) {
        for (const auto& [name, s] : b.entities) {
            if (!a.find(name)) {
                same = sh.differ("unexpected table " + name);
                break;
            }
        }
    }
    if (why) *why = sh.why;
    return same;
}

jdoc shape_json(const SchemaSnapshot& snapshot, Dialect dialect) {
    auto ddl = make_ddl_visitor(dialect);
    jdoc doc(json::kObjectType);
    auto& a = doc.GetAllocator();
    for (const auto& [name, s] : snapshot.entities) {
        jval entity(json::kObjectType);

        jval fields(json::kArrayType);
        for (const auto& f : s->fields) {
            jval o(json::kObjectType);
            jhlp::set(o, "name", f.name, a);
            jhlp::set(o, "type", ddl->sql_type(f), a);
            jhlp::set(o, "required", f.required, a);
            if (f.is_id) jhlp::set(o, "identity", true, a);
            if (f.is_unique) jhlp::set(o, "unique", true, a);
            fields.PushBack(o.Move(), a);
        }
        jhlp::set(entity, "fields", fields, a);

        jval rels(json::kArrayType);
        for (const auto& r : s->relations) {
            jval o(json::kObjectType);
            jhlp::set(o, "field", r.field, a);
            jhlp::set(o, "target", r.target + "." + r.target_field, a);
            jhlp::set(o, "onDelete", to_string(r.on_delete), a);
            rels.PushBack(o.Move(), a);
        }
        jhlp::set(entity, "relations", rels, a);

        jval idxs(json::kArrayType);
        for (const auto& idx : s->physical_indexes()) {
            jval o(json::kObjectType);
            jhlp::set(o, "name", idx.index_name, a);
            jhlp::set(o, "fields", join(idx.fields, ","), a);
            jhlp::set(o, "unique", idx.unique, a);
            idxs.PushBack(o.Move(), a);
        }
        jhlp::set(entity, "indexes", idxs, a);

        jhlp::set(doc, name, entity);
    }
    return doc;
}
