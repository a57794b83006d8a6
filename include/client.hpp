#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "cancel.hpp"
#include "dbpool.hpp"
#include "dml_visitor.hpp"
#include "generators.hpp"
#include "orm.hpp"
#include "query.hpp"

class EntityClient;

/**
 * Typed access to the entities of one snapshot.
 *
 * Every call is validated against the snapshot before any statement is
 * sent. The pool-level calls lease a connection per call and run writes in
 * their own transaction; the SQLConnection& overloads run on the caller's
 * connection and join its transaction when one is open.
 *
 * Records are JSON objects keyed by field name; reads return an array.
 */
class Client {
public:
    Client(std::shared_ptr<const SchemaSnapshot> snapshot, std::shared_ptr<pool::IDbPool> pool, Dialect dialect);
    Client(std::shared_ptr<const SchemaSnapshot> snapshot, std::shared_ptr<pool::IDbPool> pool);

    // Throws ValidationError for an unknown entity.
    EntityClient entity(const std::string& name) const;

    const SchemaSnapshot& snapshot() const { return *snap_; }
    Dialect dialect() const { return dml_->dialect(); }

    jdoc create(const std::string& entity, const jval& payload, const CancelToken& cancel = CancelToken()) const;
    jdoc read(const std::string& entity, const Filter& filter = Filter(), const IncludeSet& include = {},
        const ReadOptions& options = ReadOptions()) const;
    jdoc update(const std::string& entity, const Filter& filter, const jval& payload,
        const CancelToken& cancel = CancelToken()) const;
    jdoc remove(const std::string& entity, const Filter& filter, const CancelToken& cancel = CancelToken()) const;
    jdoc upsert(const std::string& entity, const jval& payload, const CancelToken& cancel = CancelToken()) const;
    int64_t count(const std::string& entity, const Filter& filter = Filter(), const CancelToken& cancel = CancelToken()) const;
    // create/update/delete/upsert give the record, read an array, count {"count": n}
    jdoc execute(const QueryDesc& query) const;

    jdoc create(SQLConnection& conn, const std::string& entity, const jval& payload,
        const CancelToken& cancel = CancelToken()) const;
    jdoc read(SQLConnection& conn, const std::string& entity, const Filter& filter, const IncludeSet& include = {},
        const ReadOptions& options = ReadOptions()) const;
    jdoc update(SQLConnection& conn, const std::string& entity, const Filter& filter, const jval& payload,
        const CancelToken& cancel = CancelToken()) const;
    jdoc remove(SQLConnection& conn, const std::string& entity, const Filter& filter,
        const CancelToken& cancel = CancelToken()) const;
    jdoc upsert(SQLConnection& conn, const std::string& entity, const jval& payload,
        const CancelToken& cancel = CancelToken()) const;
    int64_t count(SQLConnection& conn, const std::string& entity, const Filter& filter,
        const CancelToken& cancel = CancelToken()) const;
    jdoc execute(SQLConnection& conn, const QueryDesc& query) const;

private:
    const OrmSchema& schema(const std::string& entity) const;
    void validate_filter(const OrmSchema& s, const Filter& filter) const;
    void validate_includes(const OrmSchema& s, const IncludeSet& include) const;
    // payload checked and completed with the values the client generates
    jdoc prepare_write(const OrmSchema& s, const jval& payload, bool creating) const;

    jdoc run_write(SQLConnection& conn, const OrmSchema& s, const DmlStmt& st, const jval* payload,
        const CancelToken& cancel) const;
    jdoc run_read(SQLConnection& conn, const OrmSchema& s, const DmlStmt& st, const CancelToken& cancel) const;
    void load_include(SQLConnection& conn, const OrmSchema& s, jdoc& records, const std::string& view,
        const CancelToken& cancel) const;
    [[noreturn]] void rethrow_constraint(const OrmSchema& s, const DbError& e, const jval* payload) const;

    std::shared_ptr<const SchemaSnapshot> snap_;
    std::shared_ptr<pool::IDbPool> pool_;
    std::unique_ptr<DMLVisitor> dml_;
    std::shared_ptr<ValueGenerator> gen_;
};

// The per-entity surface; valid while its Client lives.
class EntityClient {
public:
    EntityClient(const Client& client, std::string entity)
        : client_(client)
        , entity_(std::move(entity)) { }

    const std::string& name() const { return entity_; }

    jdoc create(const jval& payload, const CancelToken& cancel = CancelToken()) const {
        return client_.create(entity_, payload, cancel);
    }
    jdoc read(const Filter& filter = Filter(), const IncludeSet& include = {},
        const ReadOptions& options = ReadOptions()) const {
        return client_.read(entity_, filter, include, options);
    }
    jdoc update(const Filter& filter, const jval& payload, const CancelToken& cancel = CancelToken()) const {
        return client_.update(entity_, filter, payload, cancel);
    }
    jdoc remove(const Filter& filter, const CancelToken& cancel = CancelToken()) const {
        return client_.remove(entity_, filter, cancel);
    }
    jdoc upsert(const jval& payload, const CancelToken& cancel = CancelToken()) const {
        return client_.upsert(entity_, payload, cancel);
    }
    int64_t count(const Filter& filter = Filter(), const CancelToken& cancel = CancelToken()) const {
        return client_.count(entity_, filter, cancel);
    }

private:
    const Client& client_;
    std::string entity_;
};
