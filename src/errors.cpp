#include "errors.hpp"

const char* to_string(SchemaErrorKind kind) {
    switch (kind) {
    case SchemaErrorKind::DuplicateName: return "DuplicateName";
    case SchemaErrorKind::UnknownType: return "UnknownType";
    case SchemaErrorKind::BadRelationTarget: return "BadRelationTarget";
    case SchemaErrorKind::MissingIdentity: return "MissingIdentity";
    case SchemaErrorKind::DuplicateIdentity: return "DuplicateIdentity";
    case SchemaErrorKind::InvalidDefault: return "InvalidDefault";
    case SchemaErrorKind::InvalidName: return "InvalidName";
    case SchemaErrorKind::Malformed: return "Malformed";
    }
    return "Unknown";
}

const char* to_string(ApplyErrorKind kind) {
    switch (kind) {
    case ApplyErrorKind::DialectUnsupported: return "DialectUnsupported";
    case ApplyErrorKind::ConstraintViolation: return "ConstraintViolation";
    case ApplyErrorKind::ConnectionLost: return "ConnectionLost";
    case ApplyErrorKind::DestructiveUnconfirmed: return "DestructiveUnconfirmed";
    case ApplyErrorKind::Cancelled: return "Cancelled";
    case ApplyErrorKind::StatementFailed: return "StatementFailed";
    }
    return "Unknown";
}

const char* to_string(ConstraintKind kind) {
    switch (kind) {
    case ConstraintKind::Unique: return "unique";
    case ConstraintKind::ForeignKey: return "foreign-key";
    case ConstraintKind::NotNull: return "not-null";
    case ConstraintKind::Check: return "check";
    case ConstraintKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(DbErrorKind kind) {
    switch (kind) {
    case DbErrorKind::Constraint: return "constraint";
    case DbErrorKind::Connection: return "connection";
    case DbErrorKind::Busy: return "busy";
    case DbErrorKind::Unsupported: return "unsupported";
    case DbErrorKind::Other: return "other";
    }
    return "other";
}

SchemaError::SchemaError(SchemaErrorKind kind, std::string location, const std::string& msg)
    : std::runtime_error(std::string(to_string(kind)) + " at " + location + ": " + msg)
    , kind_(kind)
    , location_(std::move(location)) { }

ApplyError::ApplyError(ApplyErrorKind kind, std::string migration, std::vector<std::string> attempted,
    const std::string& msg)
    : std::runtime_error("migration " + migration + " failed (" + to_string(kind) + "): " + msg)
    , kind_(kind)
    , migration_(std::move(migration))
    , attempted_(std::move(attempted)) { }

ValidationError::ValidationError(std::string entity, std::string field, const std::string& msg)
    : std::runtime_error(field.empty() ? entity + ": " + msg : entity + "." + field + ": " + msg)
    , entity_(std::move(entity))
    , field_(std::move(field)) { }

ConstraintError::ConstraintError(ConstraintKind kind, std::string entity, std::string field,
    std::string value, const std::string& msg)
    : std::runtime_error(msg)
    , kind_(kind)
    , entity_(std::move(entity))
    , field_(std::move(field))
    , value_(std::move(value)) { }
