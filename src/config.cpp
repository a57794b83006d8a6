#include "config.hpp"
#include <cstdlib>
#include <set>
#include "lib.hpp"

namespace {

    const std::set<std::string> LOG_LEVELS = { "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off" };

    std::string env(const char* name) {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    }

    void check_level(const std::string& level) {
        if (!LOG_LEVELS.count(level)) THROW("config: unknown log_level '%s'", level.c_str());
    }

    int64_t positive(const jval& j, const char* key, int64_t fallback) {
        const jval* v = jhlp::find(j, key);
        if (!v) return fallback;
        if (!v->IsInt64() || v->GetInt64() <= 0) THROW("config: '%s' must be a positive integer", key);
        return v->GetInt64();
    }

    std::string text(const jval& j, const char* key, const std::string& fallback) {
        const jval* v = jhlp::find(j, key);
        if (!v) return fallback;
        if (!v->IsString()) THROW("config: '%s' must be a string", key);
        return v->GetString();
    }

} // namespace

Config Config::from_json(const jval& j) {
    if (!j.IsObject()) THROW("config: document must be a JSON object");
    Config c;
    c.dialect = dialect_from(text(j, "dialect", to_string(c.dialect)));
    c.dsn = text(j, "dsn", c.dsn);
    if (c.dsn.empty()) THROW("config: 'dsn' is empty");
    c.pool_size = static_cast<size_t>(positive(j, "pool_size", static_cast<int64_t>(c.pool_size)));
    c.acquire_timeout = std::chrono::milliseconds(positive(j, "acquire_timeout_ms", c.acquire_timeout.count()));
    c.schema_dir = text(j, "schema_dir", c.schema_dir);
    c.log_level = text(j, "log_level", c.log_level);
    check_level(c.log_level);
    c.log_pattern = text(j, "log_pattern", c.log_pattern);
    if (const jval* v = jhlp::find(j, "confirm_destructive")) {
        if (!v->IsBool()) THROW("config: 'confirm_destructive' must be true or false");
        c.confirm_destructive = v->GetBool();
    }
    return c;
}

Config Config::load(const std::string& path) {
    jdoc doc;
    std::string err;
    if (!jhlp::parse_file(path, doc, &err)) THROW("config: cannot read %s: %s", path.c_str(), err.c_str());
    return from_json(doc);
}

void Config::apply_env() {
    const std::string d = env("RELMAP_DIALECT");
    if (!d.empty()) dialect = dialect_from(d);
    const std::string dsn_env = env("RELMAP_DSN");
    if (!dsn_env.empty()) dsn = dsn_env;
    const std::string dir = env("RELMAP_SCHEMA_DIR");
    if (!dir.empty()) schema_dir = dir;
    const std::string level = env("RELMAP_LOG_LEVEL");
    if (!level.empty()) {
        check_level(level);
        log_level = level;
    }
}
