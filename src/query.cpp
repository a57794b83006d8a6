#include "query.hpp"
#include <map>
#include "errors.hpp"

namespace {

    const std::map<std::string, CmpOp>& operators() {
        static const std::map<std::string, CmpOp> ops = {
            { "eq", CmpOp::Eq }, { "ne", CmpOp::Ne }, { "lt", CmpOp::Lt }, { "lte", CmpOp::Le },
            { "gt", CmpOp::Gt }, { "gte", CmpOp::Ge }, { "in", CmpOp::In }, { "isNull", CmpOp::IsNull },
        };
        return ops;
    }

    OrderBy order_term(const jval& v, const std::string& entity) {
        if (!v.IsString() || v.GetStringLength() == 0) {
            throw ValidationError(entity, "", "orderBy takes field names, '-' prefixed for descending");
        }
        std::string f = v.GetString();
        if (f[0] == '-') return { f.substr(1), true };
        return { f, false };
    }

} // namespace

const char* to_string(CmpOp op) {
    switch (op) {
    case CmpOp::Eq: return "eq";
    case CmpOp::Ne: return "ne";
    case CmpOp::Lt: return "lt";
    case CmpOp::Le: return "lte";
    case CmpOp::Gt: return "gt";
    case CmpOp::Ge: return "gte";
    case CmpOp::In: return "in";
    case CmpOp::IsNull: return "isNull";
    case CmpOp::NotNull: return "notNull";
    }
    return "unknown";
}

const char* to_string(QueryKind kind) {
    switch (kind) {
    case QueryKind::Create: return "create";
    case QueryKind::Read: return "read";
    case QueryKind::Update: return "update";
    case QueryKind::Delete: return "delete";
    case QueryKind::Upsert: return "upsert";
    case QueryKind::Count: return "count";
    }
    return "unknown";
}

Filter& Filter::is_null(const std::string& field) {
    terms_.push_back({ field, CmpOp::IsNull, std::make_shared<jdoc>() });
    return *this;
}

Filter& Filter::not_null(const std::string& field) {
    terms_.push_back({ field, CmpOp::NotNull, std::make_shared<jdoc>() });
    return *this;
}

Filter Filter::from_json(const jval& j, const std::string& entity) {
    Filter f;
    if (j.IsNull()) return f;
    if (!j.IsObject()) throw ValidationError(entity, "", "filter must be a JSON object");

    for (jit it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
        const std::string field = it->name.GetString();
        const jval& cond = it->value;
        if (cond.IsNull()) {
            f.is_null(field);
        } else if (!cond.IsObject()) {
            f.where(field, CmpOp::Eq, cond);
        } else {
            if (cond.MemberCount() == 0) throw ValidationError(entity, field, "empty condition object");
            for (jit op = cond.MemberBegin(); op != cond.MemberEnd(); ++op) {
                const std::string name = op->name.GetString();
                auto found = operators().find(name);
                if (found == operators().end()) {
                    throw ValidationError(entity, field, "unknown filter operator '" + name + "'");
                }
                const jval& v = op->value;
                switch (found->second) {
                case CmpOp::In:
                    if (!v.IsArray()) throw ValidationError(entity, field, "'in' takes an array");
                    f.where(field, CmpOp::In, v);
                    break;
                case CmpOp::IsNull:
                    if (!v.IsBool()) throw ValidationError(entity, field, "'isNull' takes a boolean");
                    if (v.GetBool()) f.is_null(field);
                    else f.not_null(field);
                    break;
                default:
                    f.where(field, found->second, v);
                    break;
                }
            }
        }
    }
    return f;
}

QueryDesc QueryDesc::from_json(const jval& j) {
    if (!j.IsObject()) throw ValidationError("", "", "query must be a JSON object");
    QueryDesc q;
    q.entity = jhlp::get<std::string>(j, "entity");
    if (q.entity.empty()) throw ValidationError("", "", "query has no 'entity'");

    static const std::map<std::string, QueryKind> kinds = {
        { "create", QueryKind::Create }, { "read", QueryKind::Read }, { "update", QueryKind::Update },
        { "delete", QueryKind::Delete }, { "upsert", QueryKind::Upsert }, { "count", QueryKind::Count },
    };
    const std::string op = jhlp::get<std::string>(j, "op", std::string("read"));
    auto k = kinds.find(op);
    if (k == kinds.end()) throw ValidationError(q.entity, "", "unknown query op '" + op + "'");
    q.kind = k->second;

    if (const jval* w = jhlp::find(j, "where")) q.filter = Filter::from_json(*w, q.entity);
    if (const jval* d = jhlp::find(j, "data")) q.payload = std::make_shared<jdoc>(jhlp::clone(*d));

    if (const jval* inc = jhlp::find(j, "include")) {
        if (!inc->IsArray()) throw ValidationError(q.entity, "", "'include' must be an array of view names");
        for (const auto& v : inc->GetArray()) {
            if (!v.IsString()) throw ValidationError(q.entity, "", "'include' must be an array of view names");
            q.include.push_back(v.GetString());
        }
    }
    if (const jval* ord = jhlp::find(j, "orderBy")) {
        if (ord->IsArray()) {
            for (const auto& v : ord->GetArray()) q.options.order_by.push_back(order_term(v, q.entity));
        } else {
            q.options.order_by.push_back(order_term(*ord, q.entity));
        }
    }
    if (const jval* lim = jhlp::find(j, "limit")) {
        if (!lim->IsInt64() || lim->GetInt64() < 0) throw ValidationError(q.entity, "", "'limit' must be a non-negative integer");
        q.options.limit = lim->GetInt64();
    }
    if (const jval* off = jhlp::find(j, "offset")) {
        if (!off->IsInt64() || off->GetInt64() < 0) throw ValidationError(q.entity, "", "'offset' must be a non-negative integer");
        q.options.offset = off->GetInt64();
    }
    return q;
}
