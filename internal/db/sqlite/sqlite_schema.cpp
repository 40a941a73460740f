#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "sqlite_tx.hpp"

namespace trajectory::db::sqlite {

namespace {

int StoredSchemaVersion(SqliteDB& db) {
  auto st = Prepare(db.Handle(), "SELECT COALESCE(MAX(version), 0) FROM trajectory_schema_migrations;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite schema version: ") + sqlite3_errmsg(db.Handle()));
  }
  return sqlite3_column_int(st.get(), 0);
}

} // namespace

void BootstrapSchema(const std::shared_ptr<SqliteDB>& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS trajectory_schema_migrations ("
      " version INTEGER PRIMARY KEY,"
      " applied_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS runs ("
      " id TEXT PRIMARY KEY,"
      " experiment_id TEXT NOT NULL,"
      " network BLOB NOT NULL,"
      " seed INTEGER NOT NULL,"
      " initial_prompt TEXT NOT NULL,"
      " max_length INTEGER NOT NULL,"
      " state INTEGER NOT NULL,"
      " stop_kind INTEGER,"
      " loop_length INTEGER,"
      " error TEXT);",

      "CREATE TABLE IF NOT EXISTS invocations ("
      " id TEXT PRIMARY KEY,"
      " run_id TEXT NOT NULL REFERENCES runs(id) ON DELETE CASCADE,"
      " sequence_number INTEGER NOT NULL,"
      " model TEXT NOT NULL,"
      " modality INTEGER NOT NULL,"
      " seed INTEGER NOT NULL,"
      " input_invocation_id TEXT,"
      " output_text TEXT,"
      " output_image BLOB,"
      " started_at_us INTEGER NOT NULL,"
      " completed_at_us INTEGER NOT NULL,"
      " UNIQUE (run_id, sequence_number));",

      "CREATE TABLE IF NOT EXISTS embeddings ("
      " id TEXT PRIMARY KEY,"
      " invocation_id TEXT NOT NULL REFERENCES invocations(id) ON DELETE CASCADE,"
      " embedding_model TEXT NOT NULL,"
      " vector BLOB NOT NULL,"
      " started_at_us INTEGER NOT NULL,"
      " completed_at_us INTEGER NOT NULL,"
      " UNIQUE (invocation_id, embedding_model));",

      "CREATE TABLE IF NOT EXISTS persistence_diagrams ("
      " id TEXT PRIMARY KEY,"
      " run_id TEXT NOT NULL REFERENCES runs(id) ON DELETE CASCADE,"
      " embedding_model TEXT NOT NULL,"
      " generators BLOB NOT NULL,"
      " started_at_us INTEGER NOT NULL,"
      " completed_at_us INTEGER NOT NULL,"
      " UNIQUE (run_id, embedding_model));",

      "CREATE INDEX IF NOT EXISTS idx_runs_experiment ON runs(experiment_id);",
      "CREATE INDEX IF NOT EXISTS idx_embeddings_model ON embeddings(embedding_model);",

      "INSERT OR IGNORE INTO trajectory_schema_migrations(version, applied_at_ms)"
      " VALUES (" + std::to_string(kSchemaVersion) + ", CAST(strftime('%s','now') AS INTEGER) * 1000);",
  };

  db->Exec(kBootstrapSql.front());
  const int stored = StoredSchemaVersion(*db);
  if (stored > kSchemaVersion) {
    throw std::runtime_error("sqlite schema version " + std::to_string(stored) + " of " + db->Path() + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }

  SqliteTransaction tx(db);
  for (std::size_t i = 1; i < kBootstrapSql.size(); ++i) {
    db->Exec(kBootstrapSql[i]);
  }
  tx.Commit();
}

} // namespace trajectory::db::sqlite
