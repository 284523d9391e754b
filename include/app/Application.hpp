#pragma once

#include <gio/gio.h>
#include <memory>
#include <string>
#include <vector>

namespace NewsDesk {

class Config;
class HttpClient;
class NewsService;
class FeedController;
class BookmarkStore;
struct FeedState;

// Headless front end: parses the command line, drives the feed and the
// bookmark store, and prints results. Feed states are marshalled back onto
// the main loop before anything is printed.
class Application {
public:
    explicit Application(Config& config);
    ~Application();

    int run(int argc, char* argv[]);

private:
    static int onCommandLine(GApplication* app, GApplicationCommandLine* cmdline, gpointer userData);

    int dispatch(const std::vector<std::string>& args, GApplicationCommandLine* cmdline);
    int showCategories();
    int startFeed(const std::string& command, const std::string& argument, int bookmarkIndex,
                  GApplicationCommandLine* cmdline);
    int showBookmarks();
    int removeBookmark(const std::string& url);
    void onFeedState(const FeedState& state);
    int finishFeed(const FeedState& state);
    void printUsage() const;

    Config& config_;
    GApplication* app_;
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<NewsService> news_;
    std::unique_ptr<BookmarkStore> bookmarks_;
    std::unique_ptr<FeedController> feed_;

    GApplicationCommandLine* pendingCommand_ = nullptr;
    int pendingBookmark_ = 0;
    int exitStatus_ = 0;
    bool verbose_ = false;
};

} // namespace NewsDesk
