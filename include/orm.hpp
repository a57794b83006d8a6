#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "jsonhlp.hpp"

/****************** LITERAL CONSTS */
#define VAL_NULL        "NULL"
#define PROP_NAME       "name"
#define PROP_TITLE      "title"
#define PROP_VERSION    "version"
#define PROP_LABEL      "label"
#define PROP_ENTITIES   "entities"
#define PROP_PROPERTIES "properties"
#define PROP_INDEXES    "indexes"
#define PROP_RELATIONS  "relations"
#define PROP_DEFAULT    "default"
#define PROP_GENERATED  "generated"
#define PROP_REQUIRED   "required"
#define PROP_TYPE       "type"

#define PROP_INDEX      "index"
#define PROP_INDEX_NAME "indexName"
#define PROP_FIELDS     "fields"
#define PROP_UNIQUE     "unique"

#define PROP_ID_PROP    "idprop"
#define PROP_ID_KIND    "idkind"

#define PROP_FIELD      "field"
#define PROP_TARGET     "target"
#define PROP_INVERSE    "inverse"
#define PROP_KIND       "kind"
#define PROP_ON_DELETE  "onDelete"

// Names starting with this prefix belong to relmap's own bookkeeping tables.
#define RESERVED_PREFIX "_relmap"

enum class IdKind { DBSerial, Ulid, Snowflake };
enum class DefaultKind { None, String, Boolean, Number, Raw };
enum class DefaultPolicy { None, Static, OnCreate, OnUpdate };
enum class PropType { String, Integer, Number, Bool, Date, Time, Dt_Time, Tm_Stamp, Bin, Json };
enum class Dialect { SQLite, Postgres };
enum class Cardinality { OneToMany, OneToOne };
enum class OnDelete { Restrict, Cascade, SetNull };

struct OrmProp {
    std::string name; // prop/field name
    std::string schema_name; // entity the field belongs to
    PropType    type = PropType::String;
    bool        is_id = false; // identity of the entity
    IdKind      id_kind = IdKind::DBSerial; // how the identity value is produced
    bool        required = false; // NOT NULL
    DefaultPolicy policy = DefaultPolicy::None;
    std::string default_value; // Static policy only
    DefaultKind default_kind = DefaultKind::None;
    bool        is_indexed = false;
    bool        is_unique = false;
    std::string index_name; // name of the field-level index

    bool generated() const { return policy == DefaultPolicy::OnCreate || policy == DefaultPolicy::OnUpdate; }
    bool client_id() const { return is_id && id_kind != IdKind::DBSerial; }
    bool store_id() const { return is_id && id_kind == IdKind::DBSerial; }

    // everything a migration has to care about; names excluded
    bool same_definition(const OrmProp& o) const;
};

struct OrmIndex {
    std::string index_name;
    std::vector<std::string> fields;
    bool unique = false;

    bool same_definition(const OrmIndex& o) const { return fields == o.fields && unique == o.unique; }
};

struct OrmRelation {
    std::string name; // singleton view on the owning entity
    std::string entity; // owning entity
    std::string field; // foreign key field on the owning entity
    std::string target; // referenced entity
    std::string target_field; // identity of the target, resolved by the snapshot
    std::string inverse; // view on the target, may be empty
    Cardinality kind = Cardinality::OneToMany;
    OnDelete    on_delete = OnDelete::Restrict;

    std::string constraint_name() const { return "fk_" + entity + "_" + field; }
    // supporting index on the foreign key column
    OrmIndex support_index() const;
    bool same_definition(const OrmRelation& o) const;
};

class OrmSchema {
public:
    std::string name;
    std::vector<OrmProp> fields; // declaration order
    std::vector<OrmRelation> relations;
    std::vector<OrmIndex> indexes; // explicit + field-level

    const OrmProp* find(const std::string& field) const;
    const OrmProp& idprop() const;
    const OrmRelation* relation_on(const std::string& field) const;
    const OrmIndex* find_index(const std::string& index_name) const;
    // indexes plus the relation support indexes, as the store holds them
    std::vector<OrmIndex> physical_indexes() const;

    // Reads one entity definition. Throws SchemaError.
    static void from_json(const jval& j, OrmSchema& schema);
};

// How an entity sees one of its relations, from either side.
struct RelationView {
    const OrmRelation* rel = nullptr;
    bool forward = true; // declared on this entity, singleton
    bool collection = false; // inverse side of a one-to-many
};

class SchemaSnapshot {
public:
    int version = 0;
    std::string label;
    std::string source;
    std::map<std::string, std::shared_ptr<const OrmSchema>> entities; // by name

    const OrmSchema* find(const std::string& entity) const;
    std::optional<RelationView> view(const std::string& entity, const std::string& name) const;
    // relations owned by other entities that reference this one
    std::vector<const OrmRelation*> inbound(const std::string& entity) const;

    // Parse + validate a definition document. Throws SchemaError.
    static std::shared_ptr<const SchemaSnapshot> parse(const std::string& text);
    static std::shared_ptr<const SchemaSnapshot> parse_file(const std::string& path);
};

PropType proptype(const std::string& type);
std::string proptype(PropType type);
bool is_temporal(PropType type);

const char* to_string(IdKind kind);
const char* to_string(DefaultPolicy policy);
const char* to_string(Cardinality kind);
const char* to_string(OnDelete action);
const char* to_string(Dialect dialect);
Dialect dialect_from(const std::string& name);
