#pragma once
#include "orm.hpp"

#define LEDGER_TABLE RESERVED_PREFIX "_migrations"

// The migration ledger, declared in the same format as user entities.
static constexpr const char *LEDGER_JSON = R"JSON(
        {
            "name": "_relmap_migrations",
            "properties": {
                "seq": {
                    "type": "integer",
                    "idprop": true,
                    "idkind": "dbserial"
                },
                "name": {
                    "type": "string",
                    "unique": true
                },
                "checksum": {
                    "type": "string"
                },
                "applied_at": {
                    "type": "timestamp"
                }
            },
            "required": ["name", "checksum", "applied_at"]
        }
    )JSON";

// Parsed once; the reserved-name check only applies to user snapshots.
inline const OrmSchema& ledger_schema() {
    static const OrmSchema ledger = [] {
        jdoc doc;
        std::string err;
        if (!jhlp::parse_str(LEDGER_JSON, doc, &err)) THROW("ledger definition: %s", err.c_str());
        OrmSchema s;
        OrmSchema::from_json(doc, s);
        return s;
    }();
    return ledger;
}
