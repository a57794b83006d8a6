#include "sqlconnection.hpp"
#include "lib.hpp"

void SQLStatement::bind(int idx, const jval& value, const PropType& type) {

    // Null maps to NULL for every type
    if (value.IsNull()) { set_null(idx); return; }

    switch (type) {
        case PropType::String: {
            if (value.IsString()) { set_text(idx, std::string(value.GetString(), value.GetStringLength())); return; }
            THROW("bind %d: expected string", idx);
        }
        case PropType::Integer: {
            if (value.IsInt64 ()) { set_int64(idx, value.GetInt64()); return; }
            if (value.IsUint64()) { set_int64(idx, static_cast<int64_t>(value.GetUint64())); return; }
            THROW("bind %d: expected integer", idx);
        }
        case PropType::Number: {
            if (value.IsInt64 ()) { set_int64 (idx, value.GetInt64 ()); return; }
            if (value.IsNumber()) { set_double(idx, value.GetDouble()); return; }
            THROW("bind %d: expected number", idx);
        }
        case PropType::Bool: {
            if (value.IsBool()) { set_bool(idx, value.GetBool()); return; }
            if (value.IsInt ()) { set_bool(idx, value.GetInt() != 0); return; }
            THROW("bind %d: expected boolean", idx);
        }
        case PropType::Date:
        case PropType::Time:
        case PropType::Dt_Time:
        case PropType::Tm_Stamp: {
            if (value.IsString()) { set_datetime(idx, value.GetString()); return; }
            THROW("bind %d: expected ISO-8601 string for date/time", idx);
        }
        case PropType::Json: {
            // stored as JSON text, strings included, so reads parse back to the same value
            set_text(idx, jhlp::stringify(value));
            return;
        }
        case PropType::Bin: {
            if (value.IsString()) { set_encoded(idx, value.GetString()); return; }
            THROW("bind %d: expected binary as encoded string", idx);
        }
    }
    THROW("bind %d: unsupported declared type", idx);
}

PSQLConnection make_connection(Dialect dialect) {
    switch (dialect) {
    case Dialect::SQLite:
        return make_sqlite_connection();
    case Dialect::Postgres:
#if HAVE_POSTGRESQL
        return make_postgres_connection();
#else
        throw DbError(DbErrorKind::Unsupported, "PostgreSQL support not built in");
#endif
    }
    throw DbError(DbErrorKind::Unsupported, "Unsupported dialect");
}
