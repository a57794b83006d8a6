#include "schemadiff.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include "lib.hpp"

namespace {

    std::string signature(const OrmProp& f) {
        std::ostringstream os;
        os << proptype(f.type);
        if (f.is_id) os << " id:" << to_string(f.id_kind);
        if (f.required) os << " required";
        if (f.is_unique) os << " unique";
        if (f.policy == DefaultPolicy::Static) {
            os << " default=" << (f.default_kind == DefaultKind::String ? qs(f.default_value) : f.default_value);
        } else if (f.generated()) {
            os << " generated=" << to_string(f.policy);
        }
        return os.str();
    }

    std::string index_signature(const OrmIndex& idx) {
        return "(" + join(idx.fields, ", ") + ")" + (idx.unique ? " unique" : "");
    }

    std::string relation_signature(const OrmRelation& r) {
        return r.field + " -> " + r.target + "." + r.target_field + " " + to_string(r.kind)
            + " on-delete=" + to_string(r.on_delete);
    }

    using EntityMap = std::map<std::string, std::shared_ptr<const OrmSchema>>;

    class Differ {
    public:
        Differ(const EntityMap& prev, const EntityMap& cur)
            : prev_(prev)
            , cur_(cur) { }

        DiffResult run() {
            for (const auto& [name, a] : cur_) {
                auto b = prev_.find(name);
                if (b == prev_.end()) created(a);
                else changed(b->second, a);
            }
            for (const auto& [name, b] : prev_) {
                if (!cur_.count(name)) dropped(b);
            }
            std::stable_sort(res_.ops.begin(), res_.ops.end(), [](const ChangeOp& x, const ChangeOp& y) {
                return std::tie(x.kind, x.entity, x.name) < std::tie(y.kind, y.entity, y.name);
            });
            return std::move(res_);
        }

    private:
        ChangeOp& push(OpKind kind, const std::shared_ptr<const OrmSchema>& b,
            const std::shared_ptr<const OrmSchema>& a, std::string name = "") {
            ChangeOp op;
            op.kind = kind;
            op.entity = a ? a->name : b->name;
            op.name = std::move(name);
            op.before = b;
            op.after = a;
            res_.ops.push_back(std::move(op));
            return res_.ops.back();
        }

        void warn(ChangeOp& op, const std::string& field, const std::string& reason) {
            op.destructive = true;
            res_.warnings.push_back({ op.entity, field, reason });
        }

        void created(const std::shared_ptr<const OrmSchema>& a) {
            push(OpKind::CreateEntity, nullptr, a);
            for (const auto& idx : a->indexes) {
                push(OpKind::CreateIndex, nullptr, a, idx.index_name).index = idx;
            }
            for (const auto& r : a->relations) {
                push(OpKind::AddRelation, nullptr, a, r.constraint_name()).relation = r;
            }
        }

        void dropped(const std::shared_ptr<const OrmSchema>& b) {
            warn(push(OpKind::DropEntity, b, nullptr), "", "entity " + b->name + " and its rows are dropped");
            for (const auto& r : b->relations) {
                push(OpKind::DropRelation, b, nullptr, r.constraint_name()).relation = r;
            }
        }

        void changed(const std::shared_ptr<const OrmSchema>& b, const std::shared_ptr<const OrmSchema>& a) {
            std::set<std::string> altered;
            for (const auto& f : a->fields) {
                const OrmProp* fb = b->find(f.name);
                if (!fb) {
                    push(OpKind::AddField, b, a, f.name).field_after = f;
                    continue;
                }
                if (fb->same_definition(f)) continue;
                altered.insert(f.name);
                ChangeOp& op = push(OpKind::AlterField, b, a, f.name);
                op.field_before = *fb;
                op.field_after = f;
                if (fb->type != f.type && !safe_widening(fb->type, f.type)) {
                    warn(op, f.name, "type " + proptype(fb->type) + " -> " + proptype(f.type)
                            + " may not convert existing values");
                }
                if (!fb->required && f.required && f.policy != DefaultPolicy::Static) {
                    warn(op, f.name, "optional -> required without a default fails on existing nulls");
                }
            }
            for (const auto& f : b->fields) {
                if (a->find(f.name)) continue;
                ChangeOp& op = push(OpKind::DropField, b, a, f.name);
                op.field_before = f;
                warn(op, f.name, "column " + f.name + " and its values are dropped");
            }

            for (const auto& idx : b->indexes) {
                const OrmIndex* ia = a->find_index(idx.index_name);
                if (!ia || !ia->same_definition(idx)) push(OpKind::DropIndex, b, a, idx.index_name).index = idx;
            }
            for (const auto& idx : a->indexes) {
                const OrmIndex* ib = b->find_index(idx.index_name);
                if (!ib || !ib->same_definition(idx)) push(OpKind::CreateIndex, b, a, idx.index_name).index = idx;
            }

            // relations after fields: a constraint whose column changed is recreated
            for (const auto& rb : b->relations) {
                const OrmRelation* ra = a->relation_on(rb.field);
                const bool keep = ra && ra->same_definition(rb) && !altered.count(rb.field) && !target_changed(rb);
                if (keep) continue;
                push(OpKind::DropRelation, b, a, rb.constraint_name()).relation = rb;
                if (ra) push(OpKind::AddRelation, b, a, ra->constraint_name()).relation = *ra;
            }
            for (const auto& ra : a->relations) {
                if (!b->relation_on(ra.field)) push(OpKind::AddRelation, b, a, ra.constraint_name()).relation = ra;
            }
        }

        bool target_changed(const OrmRelation& r) const {
            auto tb = prev_.find(r.target);
            auto ta = cur_.find(r.target);
            if (tb == prev_.end() || ta == cur_.end()) return true;
            return !tb->second->idprop().same_definition(ta->second->idprop());
        }

        const EntityMap& prev_;
        const EntityMap& cur_;
        DiffResult res_;
    };

} // namespace

const char* to_string(OpKind kind) {
    switch (kind) {
    case OpKind::DropRelation: return "drop-relation";
    case OpKind::DropIndex: return "drop-index";
    case OpKind::CreateEntity: return "create-entity";
    case OpKind::AddField: return "add-field";
    case OpKind::AlterField: return "alter-field";
    case OpKind::DropField: return "drop-field";
    case OpKind::DropEntity: return "drop-entity";
    case OpKind::CreateIndex: return "create-index";
    case OpKind::AddRelation: return "add-relation";
    }
    return "unknown";
}

std::string ChangeOp::describe() const {
    std::ostringstream os;
    os << to_string(kind) << " " << entity;
    if (!name.empty()) os << "." << name;
    switch (kind) {
    case OpKind::AddField:
        os << " " << signature(*field_after);
        break;
    case OpKind::AlterField:
        os << " " << signature(*field_before) << " => " << signature(*field_after);
        break;
    case OpKind::CreateIndex:
        os << " " << index_signature(*index);
        break;
    case OpKind::AddRelation:
        os << " " << relation_signature(*relation);
        break;
    default:
        break;
    }
    if (destructive) os << " [destructive]";
    return os.str();
}

std::string render(const std::vector<ChangeOp>& ops) {
    std::ostringstream os;
    for (const auto& op : ops) {
        os << op.describe() << "\n";
    }
    return os.str();
}

std::string checksum(const std::vector<ChangeOp>& ops) {
    return fnv1a_hex(render(ops));
}

std::string DiffResult::render() const {
    return ::render(ops);
}

std::string DiffResult::checksum() const {
    return ::checksum(ops);
}

DiffResult diff(const SchemaSnapshot* previous, const SchemaSnapshot& current) {
    static const EntityMap EMPTY;
    Differ d(previous ? previous->entities : EMPTY, current.entities);
    return d.run();
}

bool safe_widening(PropType from, PropType to) {
    using P = PropType;
    if (from == to) return true;
    switch (from) {
    case P::Integer: return to == P::Number || to == P::String;
    case P::Number: return to == P::String;
    case P::Bool: return to == P::Integer || to == P::Number || to == P::String;
    case P::Date: return to == P::Dt_Time || to == P::Tm_Stamp || to == P::String;
    case P::Time: return to == P::String;
    case P::Dt_Time: return to == P::Tm_Stamp || to == P::String;
    case P::Tm_Stamp: return to == P::String;
    case P::Json: return to == P::String;
    default: return false;
    }
}
