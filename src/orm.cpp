#include "orm.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include "lib.hpp"
#include "jsonhlp.hpp"

namespace {

    std::optional<PropType> lookup_type(const std::string& type) {
        if (type == "string"   ) return PropType::String   ;
        if (type == "integer"  ) return PropType::Integer  ;
        if (type == "number"   ) return PropType::Number   ;
        if (type == "boolean"  ) return PropType::Bool     ;
        if (type == "date"     ) return PropType::Date     ;
        if (type == "time"     ) return PropType::Time     ;
        if (type == "datetime" ) return PropType::Dt_Time  ;
        if (type == "timestamp") return PropType::Tm_Stamp ;
        if (type == "binary"   ) return PropType::Bin      ;
        if (type == "json"     ) return PropType::Json     ;
        return std::nullopt;
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    [[noreturn]] void fail(SchemaErrorKind kind, const std::string& location, const std::string& msg) {
        throw SchemaError(kind, location, msg);
    }

    void check_name(const std::string& name, const std::string& location) {
        if (!is_identifier(name)) {
            fail(SchemaErrorKind::InvalidName, location, "'" + name + "' is not a valid identifier");
        }
    }

    bool default_fits(const OrmProp& f) {
        using DK = DefaultKind;
        switch (f.default_kind) {
        case DK::None:
            return true;
        case DK::String:
            return f.type == PropType::String || f.type == PropType::Json || f.type == PropType::Bin
                || is_temporal(f.type);
        case DK::Boolean:
            return f.type == PropType::Bool || f.type == PropType::Json;
        case DK::Number:
            if (f.type == PropType::Integer) return f.default_value.find_first_of(".eE") == std::string::npos;
            return f.type == PropType::Number || f.type == PropType::Json;
        case DK::Raw:
            return f.default_value == VAL_NULL ? !f.required : f.type == PropType::Json;
        }
        return false;
    }

    void read_default(const jval& prop, OrmProp& field, const std::string& loc) {
        const jval* def = jhlp::find(prop, PROP_DEFAULT);
        const jval* gen = jhlp::find(prop, PROP_GENERATED);
        if (def && gen) {
            fail(SchemaErrorKind::InvalidDefault, loc, "'default' and 'generated' are exclusive");
        }
        if (def) {
            if (field.is_id) fail(SchemaErrorKind::InvalidDefault, loc, "identity fields take no default");
            field.policy = DefaultPolicy::Static;
            if (def->IsString()) {
                field.default_kind  = DefaultKind::String;
                field.default_value = def->GetString(); // unquoted text
            } else if (def->IsBool()) {
                field.default_kind  = DefaultKind::Boolean;
                field.default_value = def->GetBool() ? "true" : "false";
            } else if (def->IsNumber()) {
                field.default_kind  = DefaultKind::Number;
                field.default_value = jhlp::stringify(*def);
            } else if (def->IsNull()) {
                field.default_kind  = DefaultKind::Raw;
                field.default_value = VAL_NULL;
            } else {
                // arrays/objects are stored as JSON text
                field.default_kind  = DefaultKind::Raw;
                field.default_value = jhlp::stringify(*def);
            }
            if (!default_fits(field)) {
                fail(SchemaErrorKind::InvalidDefault, loc,
                    "default " + field.default_value + " does not fit type " + proptype(field.type));
            }
        }
        if (gen) {
            const std::string when = gen->IsString() ? lower(gen->GetString()) : "";
            if (when == "create") field.policy = DefaultPolicy::OnCreate;
            else if (when == "update") field.policy = DefaultPolicy::OnUpdate;
            else fail(SchemaErrorKind::InvalidDefault, loc, "'generated' must be \"create\" or \"update\"");
            if (field.is_id) fail(SchemaErrorKind::InvalidDefault, loc, "identity values are produced by 'idkind'");
            if (!is_temporal(field.type)) {
                fail(SchemaErrorKind::InvalidDefault, loc, "only date/time fields can be generated");
            }
        }
    }

    void read_identity(const jval& prop, OrmProp& field, const std::string& loc) {
        const std::string kind_str = lower(jhlp::get<std::string>(prop, PROP_ID_KIND));
        if (kind_str.empty()) {
            field.id_kind = field.type == PropType::String ? IdKind::Ulid : IdKind::DBSerial;
        } else if (kind_str == "dbserial") {
            field.id_kind = IdKind::DBSerial;
        } else if (kind_str == "ulid") {
            field.id_kind = IdKind::Ulid;
        } else if (kind_str == "snowflake") {
            field.id_kind = IdKind::Snowflake;
        } else {
            fail(SchemaErrorKind::InvalidDefault, loc, "unknown idkind '" + kind_str + "'");
        }
        const bool wants_int = field.id_kind != IdKind::Ulid;
        if (wants_int != (field.type == PropType::Integer) || (!wants_int && field.type != PropType::String)) {
            fail(SchemaErrorKind::InvalidDefault, loc,
                std::string("idkind ") + to_string(field.id_kind) + " does not fit type " + proptype(field.type));
        }
    }

    Cardinality read_cardinality(const std::string& kind, const std::string& loc) {
        const std::string k = lower(kind);
        if (k.empty() || k == "one-to-many") return Cardinality::OneToMany;
        if (k == "one-to-one") return Cardinality::OneToOne;
        if (k == "many-to-many") {
            fail(SchemaErrorKind::BadRelationTarget, loc,
                "many-to-many is declared as two one-to-many relations through a join entity");
        }
        fail(SchemaErrorKind::Malformed, loc, "unknown relation kind '" + kind + "'");
    }

    OnDelete read_on_delete(const std::string& action, const std::string& loc) {
        const std::string a = lower(action);
        if (a.empty() || a == "restrict") return OnDelete::Restrict;
        if (a == "cascade") return OnDelete::Cascade;
        if (a == "setnull" || a == "set-null") return OnDelete::SetNull;
        fail(SchemaErrorKind::Malformed, loc, "unknown onDelete action '" + action + "'");
    }

    std::shared_ptr<SchemaSnapshot> assemble(int version, std::string label, std::vector<OrmSchema> entities) {
        if (version <= 0) fail(SchemaErrorKind::Malformed, PROP_VERSION, "version must be a positive integer");

        auto snap = std::make_shared<SchemaSnapshot>();
        snap->version = version;
        snap->label = label.empty() ? "v" + std::to_string(version) : std::move(label);

        for (auto& e : entities) {
            check_name(e.name, e.name);
            if (e.name.rfind(RESERVED_PREFIX, 0) == 0) {
                fail(SchemaErrorKind::InvalidName, e.name, "names starting with " RESERVED_PREFIX " are reserved");
            }
            if (snap->entities.count(e.name)) {
                fail(SchemaErrorKind::DuplicateName, e.name, "entity declared twice");
            }
            snap->entities[e.name] = nullptr;
        }

        // resolve relation targets before freezing the entities
        std::map<std::string, std::set<std::string>> views; // entity -> names visible on it
        for (const auto& e : entities) {
            auto& names = views[e.name];
            for (const auto& f : e.fields) names.insert(f.name);
            for (const auto& r : e.relations) names.insert(r.name);
        }
        for (auto& e : entities) {
            for (auto& r : e.relations) {
                const std::string loc = e.name + "." + r.name;
                auto target = std::find_if(entities.begin(), entities.end(),
                    [&](const OrmSchema& t) { return t.name == r.target; });
                if (target == entities.end()) {
                    fail(SchemaErrorKind::BadRelationTarget, loc, "unknown target entity '" + r.target + "'");
                }
                const OrmProp& tid = target->idprop();
                const OrmProp* fk = e.find(r.field);
                if (fk->type != tid.type) {
                    fail(SchemaErrorKind::BadRelationTarget, loc,
                        "foreign key " + r.field + " is " + proptype(fk->type) + " but " + r.target + "."
                            + tid.name + " is " + proptype(tid.type));
                }
                r.entity = e.name;
                r.target_field = tid.name;
                if (!r.inverse.empty()) {
                    check_name(r.inverse, r.target + "." + r.inverse);
                    if (!views[r.target].insert(r.inverse).second) {
                        fail(SchemaErrorKind::DuplicateName, r.target + "." + r.inverse,
                            "view name already used on " + r.target);
                    }
                }
            }
        }
        for (auto& e : entities) {
            std::string name = e.name;
            snap->entities[name] = std::make_shared<const OrmSchema>(std::move(e));
        }
        return snap;
    }

} // namespace

bool OrmProp::same_definition(const OrmProp& o) const {
    return type == o.type
        && is_id == o.is_id
        && (!is_id || id_kind == o.id_kind)
        && required == o.required
        && policy == o.policy
        && default_kind == o.default_kind
        && default_value == o.default_value
        && is_unique == o.is_unique;
}

OrmIndex OrmRelation::support_index() const {
    OrmIndex idx;
    idx.index_name = constraint_name() + "_idx";
    idx.fields = { field };
    idx.unique = kind == Cardinality::OneToOne;
    return idx;
}

bool OrmRelation::same_definition(const OrmRelation& o) const {
    return field == o.field
        && target == o.target
        && target_field == o.target_field
        && kind == o.kind
        && on_delete == o.on_delete;
}

void OrmSchema::from_json(const jval& j, OrmSchema& schema) {
    if (!j.IsObject()) fail(SchemaErrorKind::Malformed, "<entity>", "entity definition must be an object");

    schema.name = jhlp::get<std::string>(j, PROP_NAME);
    if (schema.name.empty()) schema.name = jhlp::get<std::string>(j, PROP_TITLE);
    if (schema.name.empty()) fail(SchemaErrorKind::Malformed, "<entity>", "entity has no name");
    check_name(schema.name, schema.name);

    schema.fields.clear();
    schema.relations.clear();
    schema.indexes.clear();

    const jval* props = jhlp::find(j, PROP_PROPERTIES);
    if (!props || !props->IsObject() || props->MemberCount() == 0) {
        fail(SchemaErrorKind::Malformed, schema.name, "entity needs a non-empty 'properties' object");
    }

    std::set<std::string> required;
    if (const jval* reqs = jhlp::find(j, PROP_REQUIRED)) {
        if (!reqs->IsArray()) fail(SchemaErrorKind::Malformed, schema.name, "'required' must be an array");
        for (const auto& el : reqs->GetArray()) {
            if (!el.IsString()) fail(SchemaErrorKind::Malformed, schema.name, "'required' holds field names");
            required.insert(el.GetString());
        }
    }

    for (jit itprop = props->MemberBegin(); itprop != props->MemberEnd(); ++itprop) {
        OrmProp field;
        field.name = itprop->name.GetString();
        field.schema_name = schema.name;
        const std::string loc = schema.name + "." + field.name;
        check_name(field.name, loc);
        if (schema.find(field.name)) fail(SchemaErrorKind::DuplicateName, loc, "field declared twice");

        const jval& prop = itprop->value;
        if (!prop.IsObject()) fail(SchemaErrorKind::Malformed, loc, "field definition must be an object");
        const std::string type_name = jhlp::get<std::string>(prop, PROP_TYPE);
        if (type_name.empty()) fail(SchemaErrorKind::Malformed, loc, "field has no type");
        auto type = lookup_type(type_name);
        if (!type) fail(SchemaErrorKind::UnknownType, loc, "unknown type '" + type_name + "'");
        field.type = *type;

        field.required = required.count(field.name) > 0;
        field.is_id = jhlp::get<bool>(prop, PROP_ID_PROP);
        if (field.is_id) read_identity(prop, field, loc);
        field.is_indexed = jhlp::get<bool>(prop, PROP_INDEX);
        field.is_unique = jhlp::get<bool>(prop, PROP_UNIQUE);
        field.index_name = jhlp::get<std::string>(prop, PROP_INDEX_NAME);
        read_default(prop, field, loc);
        schema.fields.push_back(field);
    }

    for (const auto& r : required) {
        if (!schema.find(r)) fail(SchemaErrorKind::InvalidName, schema.name + "." + r, "required field is not declared");
    }

    // identity: exactly one, a field literally named "id" when none is flagged
    size_t ids = std::count_if(schema.fields.begin(), schema.fields.end(), [](const OrmProp& f) { return f.is_id; });
    if (ids > 1) fail(SchemaErrorKind::DuplicateIdentity, schema.name, "more than one identity field");
    if (ids == 0) {
        auto it = std::find_if(schema.fields.begin(), schema.fields.end(), [](const OrmProp& f) { return f.name == "id"; });
        if (it == schema.fields.end() || (it->type != PropType::Integer && it->type != PropType::String)) {
            fail(SchemaErrorKind::MissingIdentity, schema.name, "no identity field");
        }
        if (it->policy != DefaultPolicy::None) {
            fail(SchemaErrorKind::InvalidDefault, schema.name + ".id", "identity fields take no default");
        }
        it->is_id = true;
        it->id_kind = it->type == PropType::String ? IdKind::Ulid : IdKind::DBSerial;
    }
    for (auto& f : schema.fields) {
        if (f.is_id) {
            f.required = true;
            f.is_unique = false;
            f.is_indexed = false;
        }
    }

    std::set<std::string> index_names;
    auto add_index = [&](OrmIndex idx) {
        const std::string loc = schema.name + "." + idx.index_name;
        check_name(idx.index_name, loc);
        if (!index_names.insert(idx.index_name).second) fail(SchemaErrorKind::DuplicateName, loc, "index declared twice");
        schema.indexes.push_back(std::move(idx));
    };
    for (const auto& f : schema.fields) {
        if (!f.is_indexed) continue;
        OrmIndex idx;
        idx.index_name = f.index_name.empty() ? "idx_" + schema.name + "_" + f.name : f.index_name;
        idx.fields = { f.name };
        add_index(idx);
    }
    if (const jval* idxs = jhlp::find(j, PROP_INDEXES)) {
        if (!idxs->IsArray()) fail(SchemaErrorKind::Malformed, schema.name, "'indexes' must be an array");
        for (const auto& el : idxs->GetArray()) {
            OrmIndex index;
            const jval* flds = jhlp::find(el, PROP_FIELDS);
            if (!flds || !flds->IsArray() || flds->Empty()) {
                fail(SchemaErrorKind::Malformed, schema.name, "index needs a non-empty 'fields' array");
            }
            for (const auto& fld : flds->GetArray()) {
                if (!fld.IsString() || !schema.find(fld.GetString())) {
                    fail(SchemaErrorKind::InvalidName, schema.name,
                        "index field " + jhlp::val2str(fld) + " is not declared");
                }
                index.fields.push_back(fld.GetString());
            }
            index.unique = jhlp::get<bool>(el, PROP_UNIQUE);
            index.index_name = jhlp::get<std::string>(el, PROP_INDEX_NAME);
            if (index.index_name.empty()) index.index_name = "idx_" + schema.name + "_" + join(index.fields, "_");
            add_index(index);
        }
    }

    if (const jval* rels = jhlp::find(j, PROP_RELATIONS)) {
        if (!rels->IsArray()) fail(SchemaErrorKind::Malformed, schema.name, "'relations' must be an array");
        for (const auto& el : rels->GetArray()) {
            OrmRelation rel;
            rel.entity = schema.name;
            rel.name = jhlp::get<std::string>(el, PROP_NAME);
            rel.field = jhlp::get<std::string>(el, PROP_FIELD);
            rel.target = jhlp::get<std::string>(el, PROP_TARGET);
            rel.inverse = jhlp::get<std::string>(el, PROP_INVERSE);
            const std::string loc = schema.name + "." + rel.name;
            if (rel.name.empty() || rel.field.empty() || rel.target.empty()) {
                fail(SchemaErrorKind::Malformed, loc, "relation needs 'name', 'field' and 'target'");
            }
            check_name(rel.name, loc);
            rel.kind = read_cardinality(jhlp::get<std::string>(el, PROP_KIND), loc);
            rel.on_delete = read_on_delete(jhlp::get<std::string>(el, PROP_ON_DELETE), loc);

            const OrmProp* fk = schema.find(rel.field);
            if (!fk) fail(SchemaErrorKind::BadRelationTarget, loc, "foreign key field '" + rel.field + "' is not declared");
            if (fk->is_id) fail(SchemaErrorKind::BadRelationTarget, loc, "the identity cannot be a foreign key");
            if (rel.on_delete == OnDelete::SetNull && fk->required) {
                fail(SchemaErrorKind::BadRelationTarget, loc, "onDelete setnull needs an optional foreign key");
            }
            if (schema.find(rel.name)) fail(SchemaErrorKind::DuplicateName, loc, "relation name clashes with a field");
            for (const auto& other : schema.relations) {
                if (other.name == rel.name) fail(SchemaErrorKind::DuplicateName, loc, "relation declared twice");
                if (other.field == rel.field) {
                    fail(SchemaErrorKind::DuplicateName, loc, "field " + rel.field + " already backs relation " + other.name);
                }
            }
            schema.relations.push_back(rel);
        }
    }
}

const OrmProp* OrmSchema::find(const std::string& field) const {
    for (const auto& f : fields) {
        if (f.name == field) return &f;
    }
    return nullptr;
}

const OrmProp& OrmSchema::idprop() const {
    for (const auto& f : fields) {
        if (f.is_id) return f;
    }
    THROW("Schema: '%s' have no ID Prop", name.c_str());
}

const OrmRelation* OrmSchema::relation_on(const std::string& field) const {
    for (const auto& r : relations) {
        if (r.field == field) return &r;
    }
    return nullptr;
}

const OrmIndex* OrmSchema::find_index(const std::string& index_name) const {
    for (const auto& i : indexes) {
        if (i.index_name == index_name) return &i;
    }
    return nullptr;
}

std::vector<OrmIndex> OrmSchema::physical_indexes() const {
    std::vector<OrmIndex> out = indexes;
    for (const auto& r : relations) {
        out.push_back(r.support_index());
    }
    return out;
}

const OrmSchema* SchemaSnapshot::find(const std::string& entity) const {
    auto it = entities.find(entity);
    return it == entities.end() ? nullptr : it->second.get();
}

std::optional<RelationView> SchemaSnapshot::view(const std::string& entity, const std::string& name) const {
    const OrmSchema* e = find(entity);
    if (!e) return std::nullopt;
    for (const auto& r : e->relations) {
        if (r.name == name) return RelationView { &r, true, false };
    }
    for (const auto* r : inbound(entity)) {
        if (r->inverse == name) return RelationView { r, false, r->kind == Cardinality::OneToMany };
    }
    return std::nullopt;
}

std::vector<const OrmRelation*> SchemaSnapshot::inbound(const std::string& entity) const {
    std::vector<const OrmRelation*> out;
    for (const auto& kv : entities) {
        for (const auto& r : kv.second->relations) {
            if (r.target == entity) out.push_back(&r);
        }
    }
    return out;
}

std::shared_ptr<const SchemaSnapshot> SchemaSnapshot::parse(const std::string& text) {
    jdoc doc;
    std::string err;
    if (!jhlp::parse_str(text, doc, &err)) fail(SchemaErrorKind::Malformed, "<document>", err);
    if (!doc.IsObject()) fail(SchemaErrorKind::Malformed, "<document>", "definition must be a JSON object");

    const jval* ver = jhlp::find(doc, PROP_VERSION);
    if (!ver || !ver->IsInt()) fail(SchemaErrorKind::Malformed, PROP_VERSION, "missing integer 'version'");
    const jval* ents = jhlp::find(doc, PROP_ENTITIES);
    if (!ents || !ents->IsArray()) fail(SchemaErrorKind::Malformed, PROP_ENTITIES, "missing 'entities' array");

    std::vector<OrmSchema> entities;
    for (const auto& el : ents->GetArray()) {
        OrmSchema e;
        OrmSchema::from_json(el, e);
        entities.push_back(std::move(e));
    }
    auto snap = assemble(ver->GetInt(), jhlp::get<std::string>(doc, PROP_LABEL), std::move(entities));
    snap->source = text;
    return snap;
}

std::shared_ptr<const SchemaSnapshot> SchemaSnapshot::parse_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) fail(SchemaErrorKind::Malformed, path, "cannot open definition file");
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

PropType proptype(const std::string& type) {
    auto t = lookup_type(type);
    if (!t) THROW("Invalid type name: %s", type.c_str());
    return *t;
}

std::string proptype(PropType type) {
    if (type == PropType::String  ) return  "string"   ;
    if (type == PropType::Integer ) return  "integer"  ;
    if (type == PropType::Number  ) return  "number"   ;
    if (type == PropType::Bool    ) return  "boolean"  ;
    if (type == PropType::Date    ) return  "date"     ;
    if (type == PropType::Time    ) return  "time"     ;
    if (type == PropType::Dt_Time ) return  "datetime" ;
    if (type == PropType::Tm_Stamp) return  "timestamp";
    if (type == PropType::Bin     ) return  "binary"   ;
    if (type == PropType::Json    ) return  "json"     ;
    THROW("Invalid proptype value: %d", static_cast<int>(type));
}

bool is_temporal(PropType type) {
    return type == PropType::Date || type == PropType::Time || type == PropType::Dt_Time || type == PropType::Tm_Stamp;
}

const char* to_string(IdKind kind) {
    switch (kind) {
    case IdKind::DBSerial: return "dbserial";
    case IdKind::Ulid: return "ulid";
    case IdKind::Snowflake: return "snowflake";
    }
    return "dbserial";
}

const char* to_string(DefaultPolicy policy) {
    switch (policy) {
    case DefaultPolicy::None: return "none";
    case DefaultPolicy::Static: return "static";
    case DefaultPolicy::OnCreate: return "create";
    case DefaultPolicy::OnUpdate: return "update";
    }
    return "none";
}

const char* to_string(Cardinality kind) {
    return kind == Cardinality::OneToOne ? "one-to-one" : "one-to-many";
}

const char* to_string(OnDelete action) {
    switch (action) {
    case OnDelete::Restrict: return "restrict";
    case OnDelete::Cascade: return "cascade";
    case OnDelete::SetNull: return "setnull";
    }
    return "restrict";
}

const char* to_string(Dialect dialect) {
    return dialect == Dialect::Postgres ? "postgres" : "sqlite";
}

Dialect dialect_from(const std::string& name) {
    const std::string n = lower(name);
    if (n == "sqlite" || n == "sqlite3") return Dialect::SQLite;
    if (n == "postgres" || n == "postgresql" || n == "pg") return Dialect::Postgres;
    THROW("Unsupported dialect: %s", name.c_str());
}
