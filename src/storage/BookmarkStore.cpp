#include "storage/BookmarkStore.hpp"
#include "utils/Logger.hpp"
#include <glib.h>
#include <glib/gstdio.h>
#include <sqlite3.h>
#include <memory>

namespace NewsDesk {

const char* toString(StoreError::Kind kind) {
    switch (kind) {
        case StoreError::Kind::None: return "none";
        case StoreError::Kind::InitFailure: return "init failure";
        case StoreError::Kind::IOFailure: return "I/O failure";
    }
    return "unknown";
}

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr prepare(sqlite3* db, const char* sql, int& rc) {
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        stmt = nullptr;
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// The connection is shared between threads, so the message comes from this
// call's own result code rather than the connection's last error
StoreError ioFailure(int rc, const char* operation) {
    std::string message = std::string(operation) + ": " + sqlite3_errstr(rc);
    LOG_ERROR("Bookmark store {}", message);
    return {StoreError::Kind::IOFailure, message};
}

}

BookmarkStore::BookmarkStore(const std::string& path) : path_(path) {}

BookmarkStore::~BookmarkStore() {
    if (db_) sqlite3_close_v2(db_);
}

StoreError BookmarkStore::ensureOpen(sqlite3*& db) {
    std::lock_guard<std::mutex> lock(initMutex_);
    if (!db_) {
        StoreError err = openDatabase();
        if (err.kind != StoreError::Kind::None) return err;
    }
    db = db_;
    return {};
}

// Called with initMutex_ held
StoreError BookmarkStore::openDatabase() {
    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0755);
    g_free(dir);

    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close_v2(handle);
        LOG_ERROR("Cannot open bookmark database {}: {}", path_, message);
        return {StoreError::Kind::InitFailure, message};
    }
    sqlite3_busy_timeout(handle, 5000);

    int version = -1;
    {
        auto stmt = prepare(handle, "PRAGMA user_version", rc);
        if (stmt && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt.get(), 0);
        }
    }

    std::string message;
    if (version < 0) {
        message = sqlite3_errmsg(handle);
    } else if (version != 0 && version != kSchemaVersion) {
        message = "unsupported schema version " + std::to_string(version);
    } else if (version == 0) {
        StoreError err = createSchema(handle);
        if (err.kind != StoreError::Kind::None) message = err.message;
    }

    if (!message.empty()) {
        sqlite3_close_v2(handle);
        LOG_ERROR("Cannot initialize bookmark database {}: {}", path_, message);
        return {StoreError::Kind::InitFailure, message};
    }

    db_ = handle;
    ++initCount_;
    LOG_INFO("Opened bookmark database {}", path_);
    return {};
}

StoreError BookmarkStore::createSchema(sqlite3* db) {
    // The table and the version marker are written together
    static const char* kSchema =
        "BEGIN IMMEDIATE;"
        "CREATE TABLE IF NOT EXISTS bookmarks("
        "url TEXT PRIMARY KEY, title TEXT, description TEXT, "
        "imageUrl TEXT, publishedAt TEXT, source TEXT);"
        "PRAGMA user_version = 1;"
        "COMMIT;";

    char* errmsg = nullptr;
    if (sqlite3_exec(db, kSchema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "schema creation failed";
        sqlite3_free(errmsg);
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        return {StoreError::Kind::InitFailure, message};
    }
    LOG_INFO("Created bookmark schema version {}", kSchemaVersion);
    return {};
}

StoreStatus BookmarkStore::add(const Article& article) {
    StoreStatus status;
    if (article.url.empty()) {
        status.error = {StoreError::Kind::IOFailure, "invalid article: empty url"};
        return status;
    }
    sqlite3* db = nullptr;
    status.error = ensureOpen(db);
    if (!db) return status;

    int rc;
    auto stmt = prepare(db,
        "INSERT INTO bookmarks(url, title, description, imageUrl, publishedAt, source) "
        "VALUES(?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(url) DO UPDATE SET title = excluded.title, description = excluded.description, "
        "imageUrl = excluded.imageUrl, publishedAt = excluded.publishedAt, source = excluded.source", rc);
    if (!stmt) { status.error = ioFailure(rc, "add"); return status; }

    bindText(stmt.get(), 1, article.url);
    bindText(stmt.get(), 2, article.title);
    bindText(stmt.get(), 3, article.description);
    bindText(stmt.get(), 4, article.imageUrl);
    bindText(stmt.get(), 5, article.publishedAt);
    bindText(stmt.get(), 6, article.source);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        status.error = ioFailure(rc, "add");
        return status;
    }
    LOG_DEBUG("Bookmarked {}", article.url);
    status.success = true;
    return status;
}

StoreStatus BookmarkStore::remove(const std::string& url) {
    StoreStatus status;
    sqlite3* db = nullptr;
    status.error = ensureOpen(db);
    if (!db) return status;

    int rc;
    auto stmt = prepare(db, "DELETE FROM bookmarks WHERE url = ?", rc);
    if (!stmt) { status.error = ioFailure(rc, "remove"); return status; }
    bindText(stmt.get(), 1, url);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        status.error = ioFailure(rc, "remove");
        return status;
    }
    status.success = true;
    return status;
}

BookmarkLookup BookmarkStore::isBookmarked(const std::string& url) {
    BookmarkLookup lookup;
    sqlite3* db = nullptr;
    lookup.error = ensureOpen(db);
    if (!db) return lookup;

    int rc;
    auto stmt = prepare(db, "SELECT 1 FROM bookmarks WHERE url = ? LIMIT 1", rc);
    if (!stmt) { lookup.error = ioFailure(rc, "lookup"); return lookup; }
    bindText(stmt.get(), 1, url);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        lookup.error = ioFailure(rc, "lookup");
        return lookup;
    }
    lookup.bookmarked = (rc == SQLITE_ROW);
    lookup.success = true;
    return lookup;
}

BookmarkList BookmarkStore::list() {
    BookmarkList result;
    sqlite3* db = nullptr;
    result.error = ensureOpen(db);
    if (!db) return result;

    int rc;
    auto stmt = prepare(db,
        "SELECT title, description, url, imageUrl, publishedAt, source FROM bookmarks ORDER BY rowid", rc);
    if (!stmt) { result.error = ioFailure(rc, "list"); return result; }

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Article article;
        article.title = columnText(stmt.get(), 0);
        article.description = columnText(stmt.get(), 1);
        article.url = columnText(stmt.get(), 2);
        article.imageUrl = columnText(stmt.get(), 3);
        article.publishedAt = columnText(stmt.get(), 4);
        article.source = columnText(stmt.get(), 5);
        result.articles.push_back(std::move(article));
    }
    if (rc != SQLITE_DONE) {
        result.articles.clear();
        result.error = ioFailure(rc, "list");
        return result;
    }
    result.success = true;
    return result;
}

BookmarkCount BookmarkStore::count() {
    BookmarkCount result;
    sqlite3* db = nullptr;
    result.error = ensureOpen(db);
    if (!db) return result;

    int rc;
    auto stmt = prepare(db, "SELECT COUNT(*) FROM bookmarks", rc);
    if (stmt) rc = sqlite3_step(stmt.get());
    if (!stmt || rc != SQLITE_ROW) {
        result.error = ioFailure(rc, "count");
        return result;
    }
    result.count = static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    result.success = true;
    return result;
}

}
