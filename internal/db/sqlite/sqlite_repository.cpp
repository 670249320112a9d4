#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace registry::db::sqlite {

using registry::db::ErrorCode;
using registry::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    if (!t) return "";
    return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Reads have no Result channel; a failed prepare or step is a backend fault.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

static void ThrowIfStepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc == SQLITE_ROW || rc == SQLITE_DONE) return;
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite step: " + msg);
}

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

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
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
// Registry state
// ------------------------------------------------------------------

std::optional<model::RegistryStateRecord>
SqliteRepository::GetRegistryState(Transaction& t) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT last_asset_id,administrator FROM registry_state WHERE id=1;");

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::RegistryStateRecord r;
    r.last_asset_id = ColU64(st, 0);
    r.administrator = ColText(st, 1);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::PutRegistryState(Transaction& t, const model::RegistryStateRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO registry_state(id,last_asset_id,administrator) VALUES(1,?,?) "
        "ON CONFLICT(id) DO UPDATE SET last_asset_id=excluded.last_asset_id, administrator=excluded.administrator;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.last_asset_id);
    BindText(st, 2, r.administrator);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceTags(sqlite3* db, const model::AssetRecord& r) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM asset_tags WHERE asset_id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.asset_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_prepare_v2(db, "INSERT INTO asset_tags(asset_id,position,tag) VALUES(?,?,?);", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (size_t i = 0; i < r.tags.size(); ++i) {
        BindU64(st, 1, r.asset_id);
        BindU64(st, 2, i);
        BindText(st, 3, r.tags[i]);

        rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

Result SqliteRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO assets(asset_id,name,owner,size_bytes,created_at,description) VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.asset_id);
    BindText(st, 2, r.name);
    BindText(st, 3, r.owner);
    BindU64(st, 4, r.size_bytes);
    BindU64(st, 5, r.created_at);
    BindText(st, 6, r.description);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    return ReplaceTags(db, r);
}

std::optional<model::AssetRecord>
SqliteRepository::GetAsset(Transaction& t, uint64_t asset_id) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT asset_id,name,owner,size_bytes,created_at,description FROM assets WHERE asset_id=?;");
    BindU64(st, 1, asset_id);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::AssetRecord r;
    r.asset_id = ColU64(st, 0);
    r.name = ColText(st, 1);
    r.owner = ColText(st, 2);
    r.size_bytes = ColU64(st, 3);
    r.created_at = ColU64(st, 4);
    r.description = ColText(st, 5);
    sqlite3_finalize(st);

    st = PrepareOrThrow(db, "SELECT tag FROM asset_tags WHERE asset_id=? ORDER BY position;");
    BindU64(st, 1, asset_id);

    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        r.tags.push_back(ColText(st, 0));
    }
    ThrowIfStepFailed(db, st, rc);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
    auto* db = TX(t).Handle();

    // created_at is immutable and never rewritten.
    const char* sql =
        "UPDATE assets SET name=?,owner=?,size_bytes=?,description=? WHERE asset_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.name);
    BindText(st, 2, r.owner);
    BindU64(st, 3, r.size_bytes);
    BindText(st, 4, r.description);
    BindU64(st, 5, r.asset_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(r.asset_id));

    return ReplaceTags(db, r);
}

Result SqliteRepository::DeleteAsset(Transaction& t, uint64_t asset_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM assets WHERE asset_id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, asset_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(asset_id));

    return Result::Ok();
}

// ------------------------------------------------------------------
// Access control list
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAccess(Transaction& t, const model::AccessRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO asset_access(asset_id,principal,read_enabled) VALUES(?,?,?) "
        "ON CONFLICT(asset_id,principal) DO UPDATE SET read_enabled=excluded.read_enabled;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.asset_id);
    BindText(st, 2, r.principal);
    sqlite3_bind_int(st, 3, r.read_enabled ? 1 : 0);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::AccessRecord>
SqliteRepository::GetAccess(Transaction& t, uint64_t asset_id, const std::string& principal) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, "SELECT asset_id,principal,read_enabled FROM asset_access WHERE asset_id=? AND principal=?;");
    BindU64(st, 1, asset_id);
    BindText(st, 2, principal);

    int rc = sqlite3_step(st);
    ThrowIfStepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::AccessRecord r;
    r.asset_id = ColU64(st, 0);
    r.principal = ColText(st, 1);
    r.read_enabled = sqlite3_column_int(st, 2) != 0;

    sqlite3_finalize(st);
    return r;
}

} // namespace registry::db::sqlite
