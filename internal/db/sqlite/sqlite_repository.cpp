#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <variant>

#include "internal/db/codec/blob_codec.hpp"

namespace trajectory::db::sqlite {

using trajectory::db::ErrorCode;
using trajectory::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
    } else {
        BindText(st, idx, s);
    }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBlob(sqlite3_stmt* st, int idx, const codec::Bytes& bytes) {
    // zero-length blobs must not bind as NULL
    static const std::uint8_t kEmpty = 0;
    sqlite3_bind_blob(st, idx, bytes.empty() ? &kEmpty : bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
    BindI64(st, idx, util::ToUnixMicros(tp));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

const std::uint8_t* ColBlob(sqlite3_stmt* st, int col, std::size_t& size) {
    const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(st, col));
    size             = static_cast<std::size_t>(sqlite3_column_bytes(st, col));
    return data;
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
    return util::FromUnixMicros(ColI64(st, col));
}

// Column order: id, experiment_id, network, seed, initial_prompt, max_length,
//               state, stop_kind, loop_length, error
constexpr const char* kRunColumns = "id,experiment_id,network,seed,initial_prompt,max_length,state,stop_kind,loop_length,error";

model::Run ReadRun(sqlite3_stmt* st) {
    model::Run r;
    r.id            = ColText(st, 0);
    r.experiment_id = ColText(st, 1);

    std::size_t size = 0;
    const auto* data = ColBlob(st, 2, size);
    r.network        = codec::DecodeStrings(data, size);

    r.seed           = ColI64(st, 3);
    r.initial_prompt = ColText(st, 4);
    r.max_length     = static_cast<std::uint32_t>(ColI64(st, 5));
    r.state          = static_cast<model::RunState>(ColI64(st, 6));
    if (!ColIsNull(st, 7)) {
        model::StopReason reason;
        reason.kind        = static_cast<model::StopKind>(ColI64(st, 7));
        reason.loop_length = static_cast<std::uint32_t>(ColI64(st, 8));
        r.stop_reason      = reason;
    }
    if (!ColIsNull(st, 9)) {
        r.error = ColText(st, 9);
    }
    return r;
}

// Column order: id, run_id, sequence_number, model, modality, seed,
//               input_invocation_id, output_text, output_image,
//               started_at_us, completed_at_us
constexpr const char* kInvocationColumns =
    "id,run_id,sequence_number,model,modality,seed,input_invocation_id,output_text,output_image,started_at_us,completed_at_us";

model::Invocation ReadInvocation(sqlite3_stmt* st) {
    model::Invocation r;
    r.id                  = ColText(st, 0);
    r.run_id              = ColText(st, 1);
    r.sequence_number     = static_cast<std::uint32_t>(ColI64(st, 2));
    r.model               = ColText(st, 3);
    r.modality            = static_cast<model::Modality>(ColI64(st, 4));
    r.seed                = ColI64(st, 5);
    r.input_invocation_id = ColText(st, 6);
    if (!ColIsNull(st, 7)) {
        r.output = ColText(st, 7);
    } else if (!ColIsNull(st, 8)) {
        std::size_t size = 0;
        const auto* data = ColBlob(st, 8, size);
        r.output         = codec::DecodeImage(data, size);
    }
    r.started_at   = ColTime(st, 9);
    r.completed_at = ColTime(st, 10);
    return r;
}

model::Embedding ReadEmbedding(sqlite3_stmt* st) {
    model::Embedding r;
    r.id              = ColText(st, 0);
    r.invocation_id   = ColText(st, 1);
    r.embedding_model = ColText(st, 2);

    std::size_t size = 0;
    const auto* data = ColBlob(st, 3, size);
    r.vector         = codec::DecodeVector(data, size);

    r.started_at   = ColTime(st, 4);
    r.completed_at = ColTime(st, 5);
    return r;
}

model::PersistenceDiagram ReadDiagram(sqlite3_stmt* st) {
    model::PersistenceDiagram r;
    r.id              = ColText(st, 0);
    r.run_id          = ColText(st, 1);
    r.embedding_model = ColText(st, 2);

    std::size_t size = 0;
    const auto* data = ColBlob(st, 3, size);
    r.dimensions     = codec::DecodeDiagram(data, size);

    r.started_at   = ColTime(st, 4);
    r.completed_at = ColTime(st, 5);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (sqlite3_extended_errcode(db)) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::Run& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO runs(id,experiment_id,network,seed,initial_prompt,max_length,state,stop_kind,loop_length,error) "
        "VALUES(?,?,?,?,?,?,?,?,?,?);";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.experiment_id);
    BindBlob(st.get(), 3, codec::EncodeStrings(r.network));
    BindI64(st.get(), 4, r.seed);
    BindText(st.get(), 5, r.initial_prompt);
    BindI64(st.get(), 6, r.max_length);
    BindI64(st.get(), 7, static_cast<std::int64_t>(r.state));
    if (r.stop_reason) {
        BindI64(st.get(), 8, static_cast<std::int64_t>(r.stop_reason->kind));
        BindI64(st.get(), 9, r.stop_reason->loop_length);
    } else {
        sqlite3_bind_null(st.get(), 8);
        sqlite3_bind_null(st.get(), 9);
    }
    if (r.error) {
        BindText(st.get(), 10, *r.error);
    } else {
        sqlite3_bind_null(st.get(), 10);
    }

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateRunOutcome(Transaction& t, const model::Run& r) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE runs SET state=?,stop_kind=?,loop_length=?,error=? WHERE id=?;";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st.get(), 1, static_cast<std::int64_t>(r.state));
    if (r.stop_reason) {
        BindI64(st.get(), 2, static_cast<std::int64_t>(r.stop_reason->kind));
        BindI64(st.get(), 3, r.stop_reason->loop_length);
    } else {
        sqlite3_bind_null(st.get(), 2);
        sqlite3_bind_null(st.get(), 3);
    }
    if (r.error) {
        BindText(st.get(), 4, *r.error);
    } else {
        sqlite3_bind_null(st.get(), 4);
    }
    BindText(st.get(), 5, r.id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "run " + r.id);
    }
    return result;
}

std::optional<model::Run> SqliteRepository::GetRun(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kRunColumns + " FROM runs WHERE id=?;";
    auto       st  = Prepare(db, sql);
    BindText(st.get(), 1, id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    auto run        = ReadRun(st.get());
    run.invocations = ListInvocations(t, id);
    return run;
}

std::vector<model::Run> SqliteRepository::ListRuns(Transaction& t) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kRunColumns + " FROM runs ORDER BY id;";
    auto       st  = Prepare(db, sql);

    std::vector<model::Run> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadRun(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Invocations
// ------------------------------------------------------------------

Result SqliteRepository::InsertInvocation(Transaction& t, const model::Invocation& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO invocations(id,run_id,sequence_number,model,modality,seed,input_invocation_id,"
        "output_text,output_image,started_at_us,completed_at_us) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.run_id);
    BindI64(st.get(), 3, r.sequence_number);
    BindText(st.get(), 4, r.model);
    BindI64(st.get(), 5, static_cast<std::int64_t>(r.modality));
    BindI64(st.get(), 6, r.seed);
    BindOptionalText(st.get(), 7, r.input_invocation_id);

    sqlite3_bind_null(st.get(), 8);
    sqlite3_bind_null(st.get(), 9);
    if (r.output) {
        if (const auto* text = std::get_if<std::string>(&*r.output)) {
            BindText(st.get(), 8, *text);
        } else {
            BindBlob(st.get(), 9, codec::EncodeImage(std::get<model::Image>(*r.output)));
        }
    }

    BindTime(st.get(), 10, r.started_at);
    BindTime(st.get(), 11, r.completed_at);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::Invocation> SqliteRepository::ListInvocations(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    const auto sql = std::string("SELECT ") + kInvocationColumns + " FROM invocations WHERE run_id=? ORDER BY sequence_number;";
    auto       st  = Prepare(db, sql);
    BindText(st.get(), 1, run_id);

    std::vector<model::Invocation> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadInvocation(st.get()));
    }
    return out;
}

std::uint64_t SqliteRepository::CountInvocations(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT COUNT(*) FROM invocations WHERE run_id=?;");
    BindText(st.get(), 1, run_id);

    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return static_cast<std::uint64_t>(ColI64(st.get(), 0));
}

// ------------------------------------------------------------------
// Embeddings
// ------------------------------------------------------------------

Result SqliteRepository::InsertEmbedding(Transaction& t, const model::Embedding& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO embeddings(id,invocation_id,embedding_model,vector,started_at_us,completed_at_us) "
        "VALUES(?,?,?,?,?,?);";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.invocation_id);
    BindText(st.get(), 3, r.embedding_model);
    BindBlob(st.get(), 4, codec::EncodeVector(r.vector));
    BindTime(st.get(), 5, r.started_at);
    BindTime(st.get(), 6, r.completed_at);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::Embedding> SqliteRepository::ListEmbeddings(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT e.id,e.invocation_id,e.embedding_model,e.vector,e.started_at_us,e.completed_at_us "
        "FROM embeddings e JOIN invocations i ON i.id = e.invocation_id "
        "WHERE i.run_id=? ORDER BY i.sequence_number, e.embedding_model;";

    auto st = Prepare(db, sql);
    BindText(st.get(), 1, run_id);

    std::vector<model::Embedding> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadEmbedding(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Persistence diagrams
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPersistenceDiagram(Transaction& t, const model::PersistenceDiagram& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO persistence_diagrams(id,run_id,embedding_model,generators,started_at_us,completed_at_us) "
        "VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(run_id,embedding_model) DO UPDATE SET "
        "id=excluded.id,generators=excluded.generators,"
        "started_at_us=excluded.started_at_us,completed_at_us=excluded.completed_at_us;";

    auto st = TryPrepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.run_id);
    BindText(st.get(), 3, r.embedding_model);
    BindBlob(st.get(), 4, codec::EncodeDiagram(r.dimensions));
    BindTime(st.get(), 5, r.started_at);
    BindTime(st.get(), 6, r.completed_at);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::PersistenceDiagram> SqliteRepository::ListPersistenceDiagrams(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT id,run_id,embedding_model,generators,started_at_us,completed_at_us "
        "FROM persistence_diagrams WHERE run_id=? ORDER BY embedding_model;";

    auto st = Prepare(db, sql);
    BindText(st.get(), 1, run_id);

    std::vector<model::PersistenceDiagram> out;
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
        out.push_back(ReadDiagram(st.get()));
    }
    return out;
}

} // namespace trajectory::db::sqlite
