#pragma once

namespace doccache::db::sql {

/*
  Canonical SQL for the remote_documents table.

  path is a BLOB so comparisons are memcmp, matching EncodedPath order.
  Every path argument must be bound with sqlite3_bind_blob: a TEXT value
  never compares equal to a BLOB.
*/

static constexpr const char* CREATE_REMOTE_DOCUMENTS =
    "CREATE TABLE IF NOT EXISTS remote_documents"
    " (path BLOB PRIMARY KEY, contents BLOB NOT NULL);";

static constexpr const char* UPSERT_REMOTE_DOCUMENT =
    "INSERT OR REPLACE INTO remote_documents(path,contents) VALUES(?,?);";

static constexpr const char* DELETE_REMOTE_DOCUMENT =
    "DELETE FROM remote_documents WHERE path=?;";

static constexpr const char* SELECT_REMOTE_DOCUMENT =
    "SELECT path,contents FROM remote_documents WHERE path=?;";

// Batched lookup: PREFIX + "?, ?, ..." + SUFFIX
static constexpr const char* SELECT_REMOTE_DOCUMENTS_IN_PREFIX =
    "SELECT path,contents FROM remote_documents WHERE path IN (";

static constexpr const char* SELECT_REMOTE_DOCUMENTS_IN_SUFFIX =
    ") ORDER BY path;";

static constexpr const char* SCAN_REMOTE_DOCUMENTS =
    "SELECT path,contents FROM remote_documents"
    " WHERE path >= ? AND path < ? ORDER BY path;";

static constexpr const char* SCAN_REMOTE_DOCUMENTS_UNBOUNDED =
    "SELECT path,contents FROM remote_documents"
    " WHERE path >= ? ORDER BY path;";

}
