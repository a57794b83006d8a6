#pragma once
#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>
#include "orm.hpp"
#include "sqlconnection.hpp"

// A SQLite file under the temp directory, removed with its WAL files.
class TempDb {
public:
    explicit TempDb(const std::string& tag = "db") {
        static std::atomic<int> counter { 0 };
        path_ = (std::filesystem::temp_directory_path()
            / ("relmap_test_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".db"))
                    .string();
        remove_files();
    }
    ~TempDb() { remove_files(); }

    TempDb(const TempDb&) = delete;
    TempDb& operator=(const TempDb&) = delete;

    const std::string& path() const { return path_; }

    PSQLConnection open() const {
        auto conn = make_sqlite_connection();
        conn->connect(path_);
        return conn;
    }

private:
    void remove_files() {
        std::error_code ec;
        for (const char* suffix : { "", "-wal", "-shm", "-journal" }) std::filesystem::remove(path_ + suffix, ec);
    }

    std::string path_;
};

// A scratch directory under the temp directory, removed recursively.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "dir") {
        static std::atomic<int> counter { 0 };
        path_ = std::filesystem::temp_directory_path()
            / ("relmap_test_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

namespace fixtures {

// User only.
inline const char* USERS_V1 = R"({
  "version": 1,
  "label": "init",
  "entities": [
    { "name": "User",
      "properties": {
        "id":    { "type": "integer", "idprop": true },
        "email": { "type": "string", "unique": true },
        "name":  { "type": "string" }
      },
      "required": ["email"] }
  ]
})";

// Adds Post, pointing at User.
inline const char* POSTS_V2 = R"({
  "version": 2,
  "label": "add posts",
  "entities": [
    { "name": "User",
      "properties": {
        "id":    { "type": "integer", "idprop": true },
        "email": { "type": "string", "unique": true },
        "name":  { "type": "string" }
      },
      "required": ["email"] },
    { "name": "Post",
      "properties": {
        "id":         { "type": "integer", "idprop": true },
        "title":      { "type": "string" },
        "authorId":   { "type": "integer" },
        "published":  { "type": "boolean", "default": false },
        "created_at": { "type": "timestamp", "generated": "create" },
        "updated_at": { "type": "timestamp", "generated": "update" }
      },
      "required": ["title", "authorId", "published", "created_at", "updated_at"],
      "relations": [
        { "name": "author", "field": "authorId", "target": "User", "inverse": "posts", "onDelete": "restrict" }
      ] }
  ]
})";

// Drops User.name, adds a profile with a one-to-one link and a ULID-keyed tag entity.
inline const char* PROFILES_V3 = R"({
  "version": 3,
  "label": "profiles",
  "entities": [
    { "name": "User",
      "properties": {
        "id":    { "type": "integer", "idprop": true },
        "email": { "type": "string", "unique": true }
      },
      "required": ["email"] },
    { "name": "Post",
      "properties": {
        "id":         { "type": "integer", "idprop": true },
        "title":      { "type": "string" },
        "authorId":   { "type": "integer" },
        "published":  { "type": "boolean", "default": false },
        "created_at": { "type": "timestamp", "generated": "create" },
        "updated_at": { "type": "timestamp", "generated": "update" }
      },
      "required": ["title", "authorId", "published", "created_at", "updated_at"],
      "relations": [
        { "name": "author", "field": "authorId", "target": "User", "inverse": "posts", "onDelete": "restrict" }
      ] },
    { "name": "Profile",
      "properties": {
        "id":     { "type": "integer", "idprop": true },
        "userId": { "type": "integer" },
        "bio":    { "type": "string", "default": "" },
        "prefs":  { "type": "json" }
      },
      "required": ["userId"],
      "relations": [
        { "name": "user", "field": "userId", "target": "User", "inverse": "profile",
          "kind": "one-to-one", "onDelete": "cascade" }
      ] },
    { "name": "Tag",
      "properties": {
        "id":    { "type": "string", "idprop": true, "idkind": "ulid" },
        "label": { "type": "string", "index": true }
      },
      "required": ["label"] }
  ]
})";

} // namespace fixtures
