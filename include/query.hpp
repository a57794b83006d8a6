#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "cancel.hpp"
#include "jsonhlp.hpp"

enum class CmpOp { Eq, Ne, Lt, Le, Gt, Ge, In, IsNull, NotNull };

const char* to_string(CmpOp op);

struct Comparison {
    std::string field;
    CmpOp op = CmpOp::Eq;
    std::shared_ptr<const jdoc> value; // array for In, null document for the null tests
};

// Conjunction of field comparisons.
class Filter {
public:
    template <typename T>
    Filter& where(const std::string& field, CmpOp op, const T& value) {
        auto d = std::make_shared<jdoc>();
        jval v = jhlp::make(value, d->GetAllocator());
        static_cast<jval&>(*d).Swap(v);
        terms_.push_back({ field, op, std::move(d) });
        return *this;
    }

    template <typename T>
    Filter& eq(const std::string& field, const T& value) { return where(field, CmpOp::Eq, value); }

    template <typename T>
    Filter& in(const std::string& field, const std::vector<T>& values) {
        auto d = std::make_shared<jdoc>(json::kArrayType);
        for (const auto& v : values) d->PushBack(jhlp::make(v, d->GetAllocator()).Move(), d->GetAllocator());
        terms_.push_back({ field, CmpOp::In, std::move(d) });
        return *this;
    }

    Filter& is_null(const std::string& field);
    Filter& not_null(const std::string& field);

    const std::vector<Comparison>& terms() const { return terms_; }
    bool empty() const { return terms_.empty(); }

    // {"field": value} is equality, {"field": null} is-null,
    // {"field": {"gte": 1, "lt": 9}} one term per operator. Throws ValidationError.
    static Filter from_json(const jval& j, const std::string& entity = "");

private:
    std::vector<Comparison> terms_;
};

struct OrderBy {
    std::string field;
    bool desc = false;
};

struct ReadOptions {
    std::vector<OrderBy> order_by; // identity ascending when empty
    std::optional<int64_t> limit;
    int64_t offset = 0;
    CancelToken cancel;
};

// relation view names to load alongside the records
using IncludeSet = std::vector<std::string>;

enum class QueryKind { Create, Read, Update, Delete, Upsert, Count };

const char* to_string(QueryKind kind);

struct QueryDesc {
    std::string entity;
    QueryKind kind = QueryKind::Read;
    Filter filter;
    std::shared_ptr<jdoc> payload;
    IncludeSet include;
    ReadOptions options;

    // {"entity": "User", "op": "read", "where": {...}, "data": {...},
    //  "include": ["posts"], "orderBy": ["-name"], "limit": 10, "offset": 0}
    static QueryDesc from_json(const jval& j);
};
