#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "orm.hpp"
#include "schemadiff.hpp"

/**
 * SchemaHistory
 *  - Keeps every authored snapshot, ascending by version
 *  - Never replaces a version; a new one must be strictly newer
 *  - Derives the named migrations between consecutive versions
 *
 * The derivation is deterministic: the same snapshots always give the same
 * names, operations and checksums, which is what the ledger is verified against.
 */
struct Migration {
    std::string name; // "0002_add_posts"
    std::shared_ptr<const SchemaSnapshot> from; // null for the first version
    std::shared_ptr<const SchemaSnapshot> to;
    DiffResult diff;
    std::string checksum;
};

class SchemaHistory {
public:
    // Throws when the version is not strictly greater than the newest one.
    void add(std::shared_ptr<const SchemaSnapshot> snapshot);

    bool empty() const { return versions_.empty(); }
    std::size_t size() const { return versions_.size(); }
    std::shared_ptr<const SchemaSnapshot> current() const;
    std::shared_ptr<const SchemaSnapshot> previous() const;

    std::vector<Migration> migrations() const;

    // Every *.json in dir, ordered by the version they declare. Throws SchemaError.
    static SchemaHistory load_dir(const std::string& dir);

    static std::string migration_name(const SchemaSnapshot& snapshot);

private:
    std::map<int, std::shared_ptr<const SchemaSnapshot>> versions_;
};
