#pragma once
#include <cstdint>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "services/NewsService.hpp"

namespace NewsDesk {

struct FeedState {
    enum class Status {
        Idle,
        Loading,
        Loaded,
        Error
    };
    Status status = Status::Idle;
    std::vector<Article> articles;  // Loaded only
    std::string message;            // Error only, user-presentable
    FetchError error;               // Error only, for diagnostics
    uint64_t requestId = 0;         // request that produced this state, 0 for Idle
};

const char* toString(FeedState::Status status);

/*
 * Owns the current feed. Every request moves the feed to Loading and runs the
 * NewsService call through the dispatcher; only the completion of the most
 * recently issued request may replace the state, so a slow older request can
 * never clobber a newer result.
 *
 * Listeners are called without any controller lock held, one notification at
 * a time and in publication order. A listener may issue a request; its states
 * are delivered once the current notification returns.
 */
class FeedController {
public:
    using Listener = std::function<void(const FeedState&)>;
    using Task = std::function<void()>;
    using Dispatcher = std::function<void(Task)>;

    // An empty dispatcher runs each request on its own detached thread
    explicit FeedController(NewsService& service, Dispatcher dispatcher = nullptr);
    ~FeedController();

    FeedController(const FeedController&) = delete;
    FeedController& operator=(const FeedController&) = delete;

    uint64_t requestHeadlines(const std::optional<std::string>& category);
    uint64_t requestSearch(const std::string& query);

    FeedState state() const;

    int subscribe(Listener listener);
    void unsubscribe(int token);

    // Default-dispatcher threads that have not finished yet
    size_t activeWorkers() const;

private:
    uint64_t beginRequest();
    void complete(uint64_t requestId, FeedResponse response, const std::string& failureMessage);
    void publish(const FeedState& state, uint64_t revision);
    void dispatch(Task task);
    void workerFinished();

    NewsService& service_;
    Dispatcher dispatcher_;

    mutable std::mutex stateMutex_;
    FeedState state_;
    uint64_t latestRequestId_ = 0;
    uint64_t revision_ = 0;

    std::mutex listenerMutex_;
    std::map<int, Listener> listeners_;
    int nextToken_ = 1;

    std::mutex deliveryMutex_;
    std::map<uint64_t, FeedState> pending_;  // keyed by revision
    uint64_t deliveredRevision_ = 0;
    bool delivering_ = false;

    mutable std::mutex workerMutex_;
    std::condition_variable workersDone_;
    size_t activeWorkers_ = 0;
};

}
