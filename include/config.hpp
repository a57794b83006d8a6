#pragma once
#include <chrono>
#include <string>
#include "jsonhlp.hpp"
#include "orm.hpp"

/*
  Runtime settings of the command line tool.

  Read from a JSON file; RELMAP_DIALECT, RELMAP_DSN, RELMAP_SCHEMA_DIR and
  RELMAP_LOG_LEVEL override the file. Invalid values throw std::runtime_error.
*/
struct Config {
    Dialect dialect = Dialect::SQLite;
    std::string dsn = "relmap.db";
    size_t pool_size = 1;
    std::chrono::milliseconds acquire_timeout { 1500 };
    std::string schema_dir = "schema";
    std::string log_level = "info";
    std::string log_pattern;
    bool confirm_destructive = false;

    static Config load(const std::string& path);
    static Config from_json(const jval& j);
    // environment takes precedence over whatever was loaded
    void apply_env();
};
