#pragma once
#include <memory>
#include <string>
#include "orm.hpp"
#include "sqlconnection.hpp"

/**
 * Re-derives the structural shape of a store from its catalog.
 *
 * The snapshot it gives holds what the store can tell: tables, columns and
 * their types, nullability, identity, single-column uniqueness, foreign keys
 * and secondary indexes. Defaults, relation view names and client-side id
 * generation are not visible and stay empty. Reserved tables are skipped.
 */
class Introspector {
public:
    virtual ~Introspector() = default;

    virtual Dialect dialect() const = 0;
    virtual std::shared_ptr<const SchemaSnapshot> inspect(SQLConnection& conn) const = 0;
};

class SqliteIntrospector : public Introspector {
public:
    Dialect dialect() const override { return Dialect::SQLite; }
    std::shared_ptr<const SchemaSnapshot> inspect(SQLConnection& conn) const override;

    // declared column type back to a field type
    static PropType field_type(const std::string& declared);
};

class PgIntrospector : public Introspector {
public:
    Dialect dialect() const override { return Dialect::Postgres; }
    std::shared_ptr<const SchemaSnapshot> inspect(SQLConnection& conn) const override;

    // information_schema data_type back to a field type
    static PropType field_type(const std::string& data_type);
};

std::unique_ptr<Introspector> make_introspector(Dialect dialect);

// Compares what the store holds for both snapshots; why gets the first difference.
bool same_shape(const SchemaSnapshot& a, const SchemaSnapshot& b, Dialect dialect, std::string* why = nullptr);

// Store-visible shape as a JSON document, entity by entity.
jdoc shape_json(const SchemaSnapshot& snapshot, Dialect dialect);
