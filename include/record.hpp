#pragma once
#include "orm.hpp"

// Store rows come back with the store's own types (SQLite integers for
// booleans, JSON as text, Postgres numerics as text). These put them back
// into the JSON shape the schema declares.

jval coerce_value(const OrmProp& field, const jval& value, jdaloc& a);

// Only declared fields are copied, in declaration order.
jval coerce_row(const OrmSchema& schema, const jval& row, jdaloc& a);

// Type check of one caller value against its field; null is left to the caller.
bool value_fits(const OrmProp& field, const jval& value);
