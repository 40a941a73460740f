#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace trajectory::db::sqlite {

struct SqliteOptions {
  std::string   path;
  bool          wal_mode        = true;
  std::uint32_t busy_timeout_ms = 5000;
};

/*
  Owned prepared statement. Empty when preparation failed.
*/
class Statement {
 public:
  Statement() = default;
  explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, &sqlite3_finalize) {}

  sqlite3_stmt* get() const {
    return stmt_.get();
  }

  explicit operator bool() const {
    return static_cast<bool>(stmt_);
  }

 private:
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_{nullptr, &sqlite3_finalize};
};

// Write paths inspect sqlite3_errcode() themselves after an empty result.
Statement TryPrepare(sqlite3* db, const std::string& sql);

// Throws std::runtime_error carrying the sqlite message.
Statement Prepare(sqlite3* db, const std::string& sql);

/*
  Owns one sqlite3 connection opened in serialized mode. The parent
  directory of a file database is created on open.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  void Exec(const std::string& sql);

  const std::string& Path() const {
    return options_.path;
  }

  const SqliteOptions& options() const {
    return options_;
  }

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace trajectory::db::sqlite
