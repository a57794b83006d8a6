#include "record.hpp"
#include <cstdlib>
#include "logging.hpp"

jval coerce_value(const OrmProp& f, const jval& v, jdaloc& a) {
    jval out;
    if (v.IsNull()) return out;

    switch (f.type) {
    case PropType::Integer:
        if (v.IsInt64()) out.SetInt64(v.GetInt64());
        else if (v.IsNumber()) out.SetInt64(static_cast<int64_t>(v.GetDouble()));
        else if (v.IsString()) out.SetInt64(std::strtoll(v.GetString(), nullptr, 10));
        else out.CopyFrom(v, a);
        return out;
    case PropType::Number:
        if (v.IsNumber()) out.CopyFrom(v, a);
        else if (v.IsString()) out.SetDouble(std::strtod(v.GetString(), nullptr));
        else out.CopyFrom(v, a);
        return out;
    case PropType::Bool:
        if (v.IsBool()) out.SetBool(v.GetBool());
        else if (v.IsNumber()) out.SetBool(v.GetDouble() != 0);
        else if (v.IsString()) {
            const std::string s = v.GetString();
            out.SetBool(s == "t" || s == "true" || s == "1");
        } else out.CopyFrom(v, a);
        return out;
    case PropType::Json:
        if (v.IsString()) {
            jdoc d;
            if (jhlp::parse_str(std::string(v.GetString(), v.GetStringLength()), d)) {
                out.CopyFrom(d, a);
                return out;
            }
            RELMAP_LOG_DEBUG("json column holds plain text", { obs::str_field("field", f.schema_name + "." + f.name) });
        }
        // numeric affinity may have turned JSON text into a number already
        out.CopyFrom(v, a);
        return out;
    default:
        if (v.IsString()) out.CopyFrom(v, a);
        else {
            const std::string s = jhlp::val2str(v);
            out.SetString(s.c_str(), static_cast<json::SizeType>(s.size()), a);
        }
        return out;
    }
}

jval coerce_row(const OrmSchema& schema, const jval& row, jdaloc& a) {
    jval out(json::kObjectType);
    for (const auto& f : schema.fields) {
        const jval* v = jhlp::find(row, f.name.c_str());
        jval name(f.name.c_str(), static_cast<json::SizeType>(f.name.size()), a);
        if (v) out.AddMember(name.Move(), coerce_value(f, *v, a).Move(), a);
        else out.AddMember(name.Move(), jval().Move(), a);
    }
    return out;
}

bool value_fits(const OrmProp& f, const jval& v) {
    switch (f.type) {
    case PropType::String:
    case PropType::Date:
    case PropType::Time:
    case PropType::Dt_Time:
    case PropType::Tm_Stamp:
    case PropType::Bin:
        return v.IsString();
    case PropType::Integer:
        return v.IsInt64();
    case PropType::Number:
        return v.IsNumber();
    case PropType::Bool:
        return v.IsBool();
    case PropType::Json:
        return true;
    }
    return false;
}
