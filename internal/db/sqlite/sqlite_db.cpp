#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace trajectory::db::sqlite {

namespace {

bool IsFileDatabase(const std::string& path) {
  return !path.empty() && path != ":memory:" && path.rfind("file:", 0) != 0;
}

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

Statement TryPrepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return Statement();
  }
  return Statement(stmt);
}

Statement Prepare(sqlite3* db, const std::string& sql) {
  auto stmt = TryPrepare(db, sql);
  if (!stmt) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return stmt;
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("sqlite: database path is empty");
  }
  if (IsFileDatabase(options_.path)) {
    EnsureParentDirectory(options_.path);
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(options_.path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite: " + msg);
  }
}

void SqliteDB::Configure() {
  // ignored by in-memory databases
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout_ms)) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace trajectory::db::sqlite
