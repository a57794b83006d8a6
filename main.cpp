#include <iostream>
#include <string>
#include <vector>
#include "client.hpp"
#include "config.hpp"
#include "dbpool.hpp"
#include "introspect.hpp"
#include "logging.hpp"
#include "migrator.hpp"
#include "schemahistory.hpp"

static void Usage() {
    std::cout << "Usage:\n"
              << "  relmap [-c config.json] plan\n"
              << "  relmap [-c config.json] migrate [--confirm]\n"
              << "  relmap [-c config.json] status\n"
              << "  relmap [-c config.json] verify\n"
              << "  relmap [-c config.json] inspect\n"
              << "  relmap [-c config.json] query '<json>'\n";
}

static void PrintStatements(const std::vector<std::string>& stmts) {
    for (const auto& s : stmts) std::cout << "  " << s << ";\n";
}

static int Run(const Config& cfg, const std::string& cmd, const std::vector<std::string>& args) {
    auto db = make_pool(cfg.dialect, cfg.dsn, cfg.pool_size, cfg.acquire_timeout);
    Migrator migrator(cfg.dialect);

    if (cmd == "inspect") {
        auto shape = pool::with_conn(*db, pool::DbIntent::Read,
            [&](SQLConnection& c) { return make_introspector(cfg.dialect)->inspect(c); });
        std::cout << jhlp::stringify(shape_json(*shape, cfg.dialect), true) << "\n";
        SchemaHistory local = SchemaHistory::load_dir(cfg.schema_dir);
        if (!local.empty()) {
            std::string why;
            if (same_shape(*local.current(), *shape, cfg.dialect, &why)) {
                std::cout << "store matches version " << local.current()->version << "\n";
            } else {
                std::cout << "store differs from version " << local.current()->version << ": " << why << "\n";
            }
        }
        return 0;
    }

    SchemaHistory local = SchemaHistory::load_dir(cfg.schema_dir);
    if (local.empty()) {
        std::cerr << "no schema versions in " << cfg.schema_dir << "\n";
        return 1;
    }

    if (cmd == "plan") {
        auto pending = pool::with_conn(*db, pool::DbIntent::Read,
            [&](SQLConnection& c) { return migrator.pending(c, local); });
        if (pending.empty()) std::cout << "nothing to apply\n";
        for (const auto& m : pending) {
            std::cout << m.name << " (" << m.checksum << ")\n" << m.diff.render();
            for (const auto& w : m.diff.warnings) {
                std::cout << "  ! " << w.entity << (w.field.empty() ? "" : "." + w.field) << ": " << w.reason << "\n";
            }
            PrintStatements(migrator.plan(m.diff.ops));
        }
        return 0;
    }

    if (cmd == "migrate") {
        ApplyOptions opts;
        opts.confirm_destructive = cfg.confirm_destructive;
        for (const auto& a : args) {
            if (a == "--confirm") opts.confirm_destructive = true;
        }
        auto results = pool::with_conn(*db, pool::DbIntent::Write,
            [&](SQLConnection& c) { return migrator.migrate(c, local, opts); });
        for (const auto& r : results) {
            std::cout << (r.applied ? "applied " : "skipped ") << r.record.name << "\n";
        }
        if (results.empty()) std::cout << "schema is up to date\n";
        return 0;
    }

    if (cmd == "status") {
        auto recorded = pool::with_conn(*db, pool::DbIntent::Read,
            [&](SQLConnection& c) { return migrator.history(c); });
        for (const auto& r : recorded) {
            std::cout << r.seq << "  " << r.name << "  " << r.checksum << "  " << r.applied_at << "\n";
        }
        const auto migrations = local.migrations();
        for (size_t i = recorded.size(); i < migrations.size(); ++i) {
            std::cout << "-  " << migrations[i].name << "  pending\n";
        }
        return 0;
    }

    if (cmd == "verify") {
        pool::with_conn(*db, pool::DbIntent::Read, [&](SQLConnection& c) { migrator.verify(c, local); });
        std::cout << "ledger matches the local history\n";
        return 0;
    }

    if (cmd == "query") {
        if (args.empty()) {
            Usage();
            return 1;
        }
        jdoc q;
        std::string err;
        if (!jhlp::parse_str(args.front(), q, &err)) {
            std::cerr << "invalid query json: " << err << "\n";
            return 1;
        }
        Client client(local.current(), db, cfg.dialect);
        std::cout << jhlp::stringify(client.execute(QueryDesc::from_json(q)), true) << "\n";
        return 0;
    }

    Usage();
    return 1;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-c" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "-h" || a == "--help") {
            Usage();
            return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) {
        Usage();
        return 1;
    }
    const std::string cmd = args.front();
    args.erase(args.begin());

    // outlives the handlers below so their messages are flushed too
    obs::LoggingScope logging;
    try {
        Config cfg = config_path.empty() ? Config() : Config::load(config_path);
        cfg.apply_env();
        obs::init_logging(cfg.log_level, cfg.log_pattern);
        return Run(cfg, cmd, args);
    } catch (const LedgerCorruption& e) {
        RELMAP_LOG_ERROR("ledger does not match the local history",
            { obs::str_field("migration", e.migration()), obs::str_field("error", e.what()) });
        std::cerr << "ledger corruption: " << e.what() << "\n";
        return 2;
    } catch (const ApplyError& e) {
        std::cerr << "migration " << e.migration() << " failed (" << to_string(e.kind()) << "): " << e.what() << "\n";
        if (!e.attempted().empty()) {
            std::cerr << "attempted:\n";
            for (const auto& s : e.attempted()) std::cerr << "  " << s << ";\n";
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
