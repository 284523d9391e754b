#include "app/Application.hpp"
#include "services/FeedController.hpp"
#include "services/NewsService.hpp"
#include "storage/BookmarkStore.hpp"
#include "utils/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include <cstdlib>
#include <iostream>

namespace NewsDesk {

Application::Application(Config& config) : config_(config), app_(nullptr) {
    app_ = g_application_new("org.newsdesk.cli",
                             static_cast<GApplicationFlags>(G_APPLICATION_HANDLES_COMMAND_LINE |
                                                            G_APPLICATION_NON_UNIQUE));
    g_signal_connect(app_, "command-line", G_CALLBACK(onCommandLine), this);

    http_ = std::make_unique<HttpClient>();
    news_ = std::make_unique<NewsService>(*http_, config_.getNewsApiSettings());
    bookmarks_ = std::make_unique<BookmarkStore>(config_.getDatabasePath());
    feed_ = std::make_unique<FeedController>(*news_);
    feed_->subscribe([this](const FeedState& state) { onFeedState(state); });
}

Application::~Application() {
    // Joins in-flight requests before the service they use goes away
    feed_.reset();
    if (pendingCommand_) g_object_unref(pendingCommand_);
    if (app_) {
        g_object_unref(app_);
    }
}

int Application::run(int argc, char* argv[]) {
    int status = g_application_run(app_, argc, argv);
    return status != 0 ? status : exitStatus_;
}

int Application::onCommandLine(GApplication* /*app*/, GApplicationCommandLine* cmdline, gpointer userData) {
    auto* self = static_cast<Application*>(userData);
    gint argc = 0;
    gchar** argv = g_application_command_line_get_arguments(cmdline, &argc);
    std::vector<std::string> args;
    for (gint i = 1; i < argc; i++) args.emplace_back(argv[i]);
    g_strfreev(argv);

    int status = self->dispatch(args, cmdline);
    if (status != 0) self->exitStatus_ = status;
    return status;
}

int Application::dispatch(const std::vector<std::string>& args, GApplicationCommandLine* cmdline) {
    std::vector<std::string> positional;
    int bookmarkIndex = 0;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose_ = true;
            Logger::setLevel(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--bookmark" || arg.rfind("--bookmark=", 0) == 0) {
            std::string value;
            if (arg == "--bookmark") {
                if (i + 1 >= args.size()) { printUsage(); return 1; }
                value = args[++i];
            } else {
                value = arg.substr(std::string("--bookmark=").size());
            }
            bookmarkIndex = std::atoi(value.c_str());
            if (bookmarkIndex <= 0) {
                std::cerr << "Invalid bookmark index: " << value << std::endl;
                return 1;
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = positional[0];
    if (command == "categories") return showCategories();
    if (command == "bookmarks") return showBookmarks();
    if (command == "remove") {
        if (positional.size() < 2) { printUsage(); return 1; }
        return removeBookmark(positional[1]);
    }
    if (command == "headlines") {
        std::string category = positional.size() > 1 ? positional[1] : config_.getDefaultCategory();
        if (!config_.hasCategory(category)) {
            std::cerr << "Unknown category: " << category << std::endl;
            return 1;
        }
        return startFeed(command, category, bookmarkIndex, cmdline);
    }
    if (command == "search") {
        std::string query;
        for (size_t i = 1; i < positional.size(); i++) {
            if (!query.empty()) query += ' ';
            query += positional[i];
        }
        if (query.empty()) { printUsage(); return 1; }
        return startFeed(command, query, bookmarkIndex, cmdline);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

int Application::showCategories() {
    for (const auto& c : config_.getCategories()) {
        std::cout << c << (c == config_.getDefaultCategory() ? " (default)" : "") << "\n";
    }
    return 0;
}

int Application::startFeed(const std::string& command, const std::string& argument, int bookmarkIndex,
                           GApplicationCommandLine* cmdline) {
    // Kept alive until the feed settles on the main loop
    g_application_hold(app_);
    pendingCommand_ = G_APPLICATION_COMMAND_LINE(g_object_ref(cmdline));
    pendingBookmark_ = bookmarkIndex;

    if (command == "search") {
        feed_->requestSearch(argument);
    } else {
        feed_->requestHeadlines(argument);
    }
    return 0;
}

void Application::onFeedState(const FeedState& state) {
    if (state.status != FeedState::Status::Loaded && state.status != FeedState::Status::Error) return;

    struct Delivery {
        Application* app;
        FeedState state;
    };
    g_idle_add(+[](gpointer data) -> gboolean {
        auto* d = static_cast<Delivery*>(data);
        d->app->finishFeed(d->state);
        delete d;
        return G_SOURCE_REMOVE;
    }, new Delivery{this, state});
}

int Application::finishFeed(const FeedState& state) {
    int status = 0;

    if (state.status == FeedState::Status::Error) {
        std::cout << state.message << "\n";
        if (verbose_) {
            std::cerr << "  (" << toString(state.error.kind);
            if (state.error.kind == FetchError::Kind::Upstream) std::cerr << " " << state.error.status;
            std::cerr << ": " << state.error.message << ")" << std::endl;
        }
        status = 1;
    } else if (state.articles.empty()) {
        std::cout << "No news available\n";
    } else {
        for (size_t i = 0; i < state.articles.size(); i++) {
            const auto& a = state.articles[i];
            auto lookup = bookmarks_->isBookmarked(a.url);
            if (!lookup.success) {
                LOG_WARN("Bookmark lookup failed for {}: {}", a.url, lookup.error.message);
            }
            std::cout << i + 1 << ". " << (lookup.bookmarked ? "[*] " : "[ ] ")
                      << (a.title.empty() ? "(no title)" : a.title);
            if (!a.source.empty()) std::cout << " - " << a.source;
            if (!a.publishedAt.empty()) std::cout << " (" << a.displayDate() << ")";
            std::cout << "\n    " << a.url << "\n";
        }

        if (pendingBookmark_ > 0) {
            if (static_cast<size_t>(pendingBookmark_) > state.articles.size()) {
                std::cerr << "No article number " << pendingBookmark_ << std::endl;
                status = 1;
            } else {
                const auto& a = state.articles[pendingBookmark_ - 1];
                auto result = bookmarks_->add(a);
                if (result.success) {
                    std::cout << "Bookmarked: " << a.title << "\n";
                } else {
                    std::cerr << "Failed to save bookmark: " << result.error.message << std::endl;
                    status = 1;
                }
            }
        }
    }
    std::cout.flush();

    if (status != 0) exitStatus_ = status;
    if (pendingCommand_) {
        g_object_unref(pendingCommand_);
        pendingCommand_ = nullptr;
    }
    pendingBookmark_ = 0;
    g_application_release(app_);
    return status;
}

int Application::showBookmarks() {
    auto result = bookmarks_->list();
    if (!result.success) {
        std::cerr << "Failed to load bookmarks: " << result.error.message << std::endl;
        return 1;
    }
    if (result.articles.empty()) {
        std::cout << "No bookmarks\n";
        return 0;
    }
    for (const auto& a : result.articles) {
        std::cout << (a.title.empty() ? "(no title)" : a.title);
        if (!a.source.empty()) std::cout << " - " << a.source;
        if (!a.publishedAt.empty()) std::cout << " (" << a.displayDate() << ")";
        std::cout << "\n    " << a.url << "\n";
    }
    auto total = bookmarks_->count();
    if (total.success) std::cout << total.count << " bookmark(s)\n";
    return 0;
}

int Application::removeBookmark(const std::string& url) {
    auto result = bookmarks_->remove(url);
    if (!result.success) {
        std::cerr << "Failed to remove bookmark: " << result.error.message << std::endl;
        return 1;
    }
    std::cout << "Removed: " << url << "\n";
    return 0;
}

void Application::printUsage() const {
    std::cout << "Usage: newsdesk [--verbose] COMMAND\n"
                 "\n"
                 "Commands:\n"
                 "  categories                          List headline categories\n"
                 "  headlines [CATEGORY] [--bookmark N] Show top headlines\n"
                 "  search QUERY [--bookmark N]         Search all articles\n"
                 "  bookmarks                           List saved articles\n"
                 "  remove URL                          Remove a saved article\n";
}

} // namespace NewsDesk
