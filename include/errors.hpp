#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/*
  Error taxonomy.

  SchemaError      definition authoring, raised by parse; never past startup
  ApplyError       migration application; the transaction is rolled back
  ValidationError  query rejected against the schema before any round-trip
  ConstraintError  store reported a uniqueness / foreign-key / null violation
  NotFound         update or delete addressed no record
  Cancelled        caller cancelled a pending operation
  LedgerCorruption recorded migrations are not a prefix of the local history
  DbError          raw store failure, translated by Client and Migrator
*/

enum class SchemaErrorKind {
    DuplicateName,
    UnknownType,
    BadRelationTarget,
    MissingIdentity,
    DuplicateIdentity,
    InvalidDefault,
    InvalidName,
    Malformed
};

enum class ApplyErrorKind {
    DialectUnsupported,
    ConstraintViolation,
    ConnectionLost,
    DestructiveUnconfirmed,
    Cancelled,
    StatementFailed
};

enum class ConstraintKind { Unique, ForeignKey, NotNull, Check, Unknown };

enum class DbErrorKind { Constraint, Connection, Busy, Unsupported, Other };

const char* to_string(SchemaErrorKind kind);
const char* to_string(ApplyErrorKind kind);
const char* to_string(ConstraintKind kind);
const char* to_string(DbErrorKind kind);

class SchemaError : public std::runtime_error {
public:
    SchemaError(SchemaErrorKind kind, std::string location, const std::string& msg);

    SchemaErrorKind kind() const { return kind_; }
    const std::string& location() const { return location_; }

private:
    SchemaErrorKind kind_;
    std::string location_;
};

class ApplyError : public std::runtime_error {
public:
    ApplyError(ApplyErrorKind kind, std::string migration, std::vector<std::string> attempted,
        const std::string& msg);

    ApplyErrorKind kind() const { return kind_; }
    const std::string& migration() const { return migration_; }
    // statements sent to the store before the failure, the failing one last
    const std::vector<std::string>& attempted() const { return attempted_; }

private:
    ApplyErrorKind kind_;
    std::string migration_;
    std::vector<std::string> attempted_;
};

class ValidationError : public std::runtime_error {
public:
    ValidationError(std::string entity, std::string field, const std::string& msg);

    const std::string& entity() const { return entity_; }
    const std::string& field() const { return field_; }

private:
    std::string entity_;
    std::string field_;
};

class ConstraintError : public std::runtime_error {
public:
    ConstraintError(ConstraintKind kind, std::string entity, std::string field, std::string value,
        const std::string& msg);

    ConstraintKind kind() const { return kind_; }
    const std::string& entity() const { return entity_; }
    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    ConstraintKind kind_;
    std::string entity_;
    std::string field_;
    std::string value_;
};

class NotFound : public std::runtime_error {
public:
    NotFound(std::string entity, const std::string& msg)
        : std::runtime_error(msg)
        , entity_(std::move(entity)) { }

    const std::string& entity() const { return entity_; }

private:
    std::string entity_;
};

class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& msg)
        : std::runtime_error(msg) { }
};

class LedgerCorruption : public std::runtime_error {
public:
    LedgerCorruption(std::string migration, const std::string& msg)
        : std::runtime_error(msg)
        , migration_(std::move(migration)) { }

    const std::string& migration() const { return migration_; }

private:
    std::string migration_;
};

class DbError : public std::runtime_error {
public:
    DbError(DbErrorKind kind, const std::string& msg)
        : std::runtime_error(msg)
        , kind_(kind) { }

    DbErrorKind kind() const { return kind_; }

    // filled for DbErrorKind::Constraint when the store reports them
    ConstraintKind constraint = ConstraintKind::Unknown;
    std::string table;
    std::string column;
    std::string value;

private:
    DbErrorKind kind_;
};
