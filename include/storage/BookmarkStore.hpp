#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include "models/Article.hpp"

struct sqlite3;

namespace NewsDesk {

struct StoreError {
    enum class Kind {
        None,
        InitFailure,  // database could not be opened or created
        IOFailure     // read or write failed on an open database
    };
    Kind kind = Kind::None;
    std::string message;
};

const char* toString(StoreError::Kind kind);

struct StoreStatus {
    bool success = false;
    StoreError error;
};

struct BookmarkLookup {
    bool success = false;
    bool bookmarked = false;
    StoreError error;
};

struct BookmarkList {
    bool success = false;
    std::vector<Article> articles;  // insertion order
    StoreError error;
};

struct BookmarkCount {
    bool success = false;
    size_t count = 0;
    StoreError error;
};

// Saved articles in a single SQLite file, keyed by url. The database is opened
// on first use; concurrent first use opens it exactly once. Every operation is
// one auto-committed statement, so all of them are safe to call from any thread.
class BookmarkStore {
public:
    static constexpr int kSchemaVersion = 1;

    explicit BookmarkStore(const std::string& path);
    ~BookmarkStore();

    BookmarkStore(const BookmarkStore&) = delete;
    BookmarkStore& operator=(const BookmarkStore&) = delete;

    StoreStatus add(const Article& article);
    StoreStatus remove(const std::string& url);
    BookmarkLookup isBookmarked(const std::string& url);
    BookmarkList list();
    BookmarkCount count();

    unsigned initializationCount() const { return initCount_.load(); }

private:
    StoreError ensureOpen(sqlite3*& db);
    StoreError openDatabase();
    StoreError createSchema(sqlite3* db);

    std::string path_;
    std::mutex initMutex_;
    sqlite3* db_ = nullptr;
    std::atomic<unsigned> initCount_{0};
};

}
