#include "schemahistory.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include "lib.hpp"
#include "logging.hpp"

#define ER_MSG1 "Snapshot version %d already exists"
#define ER_MSG2 "Snapshot version %d must be greater than the newest version %d"

void SchemaHistory::add(std::shared_ptr<const SchemaSnapshot> snapshot) {
    if (!snapshot) THROW("SchemaHistory::add: null snapshot");
    const int v = snapshot->version;
    if (versions_.count(v)) THROW(ER_MSG1, v);
    // versions are ordered, rbegin() is the newest
    if (!versions_.empty() && v <= versions_.rbegin()->first) {
        THROW(ER_MSG2, v, versions_.rbegin()->first);
    }
    versions_.emplace(v, std::move(snapshot));
}

std::shared_ptr<const SchemaSnapshot> SchemaHistory::current() const {
    return versions_.empty() ? nullptr : versions_.rbegin()->second;
}

std::shared_ptr<const SchemaSnapshot> SchemaHistory::previous() const {
    if (versions_.size() < 2) return nullptr;
    return std::next(versions_.rbegin())->second;
}

std::string SchemaHistory::migration_name(const SchemaSnapshot& snapshot) {
    std::string label;
    for (unsigned char c : snapshot.label) {
        label += std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
    }
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%04d_", snapshot.version);
    return prefix + label;
}

std::vector<Migration> SchemaHistory::migrations() const {
    std::vector<Migration> out;
    std::shared_ptr<const SchemaSnapshot> from;
    for (const auto& [version, snap] : versions_) {
        Migration m;
        m.name = migration_name(*snap);
        m.from = from;
        m.to = snap;
        m.diff = diff(from.get(), *snap);
        m.checksum = m.diff.checksum();
        out.push_back(std::move(m));
        from = snap;
    }
    return out;
}

SchemaHistory SchemaHistory::load_dir(const std::string& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw SchemaError(SchemaErrorKind::Malformed, dir, "schema directory does not exist");
    }
    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());

    std::vector<std::shared_ptr<const SchemaSnapshot>> snaps;
    for (const auto& f : files) snaps.push_back(SchemaSnapshot::parse_file(f));
    std::sort(snaps.begin(), snaps.end(), [](const auto& a, const auto& b) { return a->version < b->version; });

    SchemaHistory h;
    for (auto& s : snaps) {
        if (h.versions_.count(s->version)) {
            throw SchemaError(SchemaErrorKind::DuplicateName, dir,
                "version " + std::to_string(s->version) + " is declared by more than one file");
        }
        h.add(s);
    }
    RELMAP_LOG_DEBUG("schema history loaded",
        { obs::str_field("dir", dir), obs::int_field("versions", static_cast<int64_t>(h.size())) });
    return h;
}
