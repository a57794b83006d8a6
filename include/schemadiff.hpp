#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "orm.hpp"

// Declaration order is the application order of the phases.
enum class OpKind {
    DropRelation,
    DropIndex,
    CreateEntity,
    AddField,
    AlterField,
    DropField,
    DropEntity,
    CreateIndex,
    AddRelation
};

const char* to_string(OpKind kind);

/**
 * One structural delta between two snapshots.
 *
 * before/after hold the whole entity as declared in the previous/current
 * snapshot (null on the side where it does not exist), so a dialect that has
 * to rebuild a table can do it from the op alone.
 */
struct ChangeOp {
    OpKind kind = OpKind::CreateEntity;
    std::string entity;
    std::string name; // field, index or constraint name; empty for entity ops
    std::shared_ptr<const OrmSchema> before;
    std::shared_ptr<const OrmSchema> after;
    std::optional<OrmProp> field_before;
    std::optional<OrmProp> field_after;
    std::optional<OrmRelation> relation;
    std::optional<OrmIndex> index;
    bool destructive = false;

    // Stable one-line rendering; the migration checksum is computed from it.
    std::string describe() const;
};

struct DestructiveChange {
    std::string entity;
    std::string field;
    std::string reason;
};

struct DiffResult {
    std::vector<ChangeOp> ops;
    std::vector<DestructiveChange> warnings;

    bool empty() const { return ops.empty(); }
    bool destructive() const { return !warnings.empty(); }
    std::string render() const;
    std::string checksum() const;
};

// previous == nullptr diffs against the empty schema.
DiffResult diff(const SchemaSnapshot* previous, const SchemaSnapshot& current);

std::string render(const std::vector<ChangeOp>& ops);
std::string checksum(const std::vector<ChangeOp>& ops);

// true when every value of `from` survives conversion to `to`
bool safe_widening(PropType from, PropType to);
