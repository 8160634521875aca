#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace doccache::db::sqlite {

using doccache::db::ErrorCode;
using doccache::db::Result;

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    const int   n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

std::size_t SqliteRepository::MaxParametersPerQuery() const {
    // Passing a negative value queries the limit without changing it.
    return static_cast<std::size_t>(sqlite3_limit(db_->Handle(), SQLITE_LIMIT_VARIABLE_NUMBER, -1));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

sqlite3_stmt* SqliteRepository::PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    const int     rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        util::ThrowIfDbError(Translate(db, rc), "sqlite prepare");
    }
    return st;
}

std::vector<model::RemoteDocumentRecord> SqliteRepository::CollectRows(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::RemoteDocumentRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back({ColBlob(st, 0), ColBlob(st, 1)});
    }
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    util::ThrowIfDbError(result, "read remote documents");
    return out;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRemoteDocument(Transaction& t, const model::RemoteDocumentRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_REMOTE_DOCUMENT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, r.path);
    BindBlob(st, 2, r.contents);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

Result SqliteRepository::DeleteRemoteDocument(Transaction& t, const std::string& path) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_REMOTE_DOCUMENT, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, path);

    int rc = sqlite3_step(st);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::RemoteDocumentRecord>
SqliteRepository::GetRemoteDocument(Transaction& t, const std::string& path) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_REMOTE_DOCUMENT);

    BindBlob(st, 1, path);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(st);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        auto result = Translate(db, rc);
        sqlite3_finalize(st);
        util::ThrowIfDbError(result, "get remote document");
    }

    model::RemoteDocumentRecord r{ColBlob(st, 0), ColBlob(st, 1)};
    sqlite3_finalize(st);
    return r;
}

std::vector<model::RemoteDocumentRecord>
SqliteRepository::GetRemoteDocuments(Transaction& t, const std::vector<std::string>& paths) {
    if (paths.empty()) return {};

    auto* db = TX(t).Handle();

    std::string placeholders;
    placeholders.reserve(paths.size() * 3);
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) placeholders += ", ";
        placeholders += "?";
    }

    const std::string query = std::string(sql::SELECT_REMOTE_DOCUMENTS_IN_PREFIX) + placeholders + sql::SELECT_REMOTE_DOCUMENTS_IN_SUFFIX;
    auto* st = PrepareOrThrow(db, query);

    int bind_idx = 1;
    for (const auto& path : paths) {
        BindBlob(st, bind_idx++, path);
    }

    return CollectRows(db, st);
}

std::vector<model::RemoteDocumentRecord>
SqliteRepository::ScanRemoteDocuments(Transaction& t, const std::string& start, const std::optional<std::string>& end) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, end.has_value() ? sql::SCAN_REMOTE_DOCUMENTS : sql::SCAN_REMOTE_DOCUMENTS_UNBOUNDED);

    BindBlob(st, 1, start);
    if (end.has_value()) {
        BindBlob(st, 2, *end);
    }

    return CollectRows(db, st);
}

}
